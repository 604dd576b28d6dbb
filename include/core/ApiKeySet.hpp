#pragma once
/** @file  ApiKeySet.hpp
 *  @brief Provider credentials and endpoints, fixed at construction.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include <nlohmann/json_fwd.hpp>

namespace geoedge::core {

  /**
 * @class ApiKeySet
 * @brief One key per provider endpoint; a single key may fill all three slots.
 *
 *  * Immutable once built.
 *  * Construction throws `std::invalid_argument` on an empty key, since no
 *    provider call could ever succeed without it.
 */
  class ApiKeySet {
  public:
    explicit ApiKeySet(const std::string& sharedKey);
    ApiKeySet(std::string geolocationKey, std::string geocodingKey, std::string timezoneKey);

    /// Reads `"apiKey": "<key>"` or `"apiKeys": {geolocation, geocoding, timezone}`.
    static ApiKeySet fromJson(const nlohmann::json& config);

    const std::string& geolocationKey() const { return geolocation_; }
    const std::string& geocodingKey() const { return geocoding_; }
    const std::string& timezoneKey() const { return timezone_; }

  private:
    std::string geolocation_;
    std::string geocoding_;
    std::string timezone_;
  };

  /// Base URLs of the three provider APIs; overridable from the config file.
  struct ProviderEndpoints {
    std::string geolocation{ "https://www.googleapis.com/geolocation/v1/geolocate" };
    std::string geocoding{ "https://maps.googleapis.com/maps/api/geocode/json" };
    std::string timezone{ "https://maps.googleapis.com/maps/api/timezone/json" };
  };

} // namespace geoedge::core
