#pragma once
/** @file  LocateResult.hpp
 *  @brief Location / timezone results and the read-side variants handed to callers.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

// 3rd-party headers
#include <nlohmann/json.hpp>

namespace geoedge {
  namespace protocols {

    /**
 * @struct LocationResult
 * @brief Coordinates plus the provider's raw reverse-geocode result list.
 *
 *  * `placeData` is null when the geocoder returned nothing.
 *  * Replaced wholesale by the next successful cycle.
 */
    struct LocationResult {
      double latitude{ 0.0 };
      double longitude{ 0.0 };
      nlohmann::json placeData{}; ///< opaque, never interpreted here
      std::int64_t acquiredAt{ 0 }; ///< unix seconds, agent side only
    };

    struct TimezoneResult {
      std::int64_t epochTime{ 0 }; ///< local wall-clock seconds
      int gmtOffsetSeconds{ 0 };
      std::string offsetLabel;    ///< e.g. "GMT-7"
      std::string localDateLabel; ///< "YYYY-MM-DD HH:MM:SS"
    };

    /// The "error" side of an accessor read.
    struct ReadError {
      std::string error;
    };

    using LocationReading = std::variant<LocationResult, ReadError>;
    using TimezoneReading = std::variant<TimezoneResult, ReadError>;

    //---wire form---------------------------------------------------------
    nlohmann::json toJson(const TimezoneResult& tz);
    std::optional<TimezoneResult> timezoneFromJson(const nlohmann::json& payload);

    /// Builds the locate-result payload; a missing timezone is sent as null.
    nlohmann::json makeLocatePayload(const LocationResult& location,
                                     const std::optional<TimezoneResult>& tz);

    /// Reads latitude/longitude/placeData out of a locate-result payload.
    std::optional<LocationResult> locationFromJson(const nlohmann::json& payload);

  } // namespace protocols
} // namespace geoedge
