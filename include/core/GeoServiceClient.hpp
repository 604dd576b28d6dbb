#pragma once
/** @file  GeoServiceClient.hpp
 *  @brief Geolocation / Geocoding / Timezone provider calls with typed replies.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

// 3rd-party headers
#include <nlohmann/json.hpp>

// GeoEdge headers
#include "core/ApiKeySet.hpp"
#include "io/HttpClient.hpp"
#include "protocols/NetworkObservation.hpp"

namespace geoedge {
  namespace core {

    /**
 * @struct ProviderReply
 * @brief One provider response, already picked apart.
 *
 *  * `body` is std::nullopt when the payload was not valid JSON (or there was
 *    no HTTP response at all, see `transportError`).
 *  * `providerCode` / `providerReason` come from `error.code` and
 *    `error.errors[0].reason` when the provider sent an error object.
 */
    struct ProviderReply {
      int httpStatus{ 0 };
      std::optional<nlohmann::json> body;
      std::optional<int> providerCode;
      std::string providerReason;
      std::string transportError;

      bool hasProviderError() const { return providerCode.has_value() || !providerReason.empty(); }
    };

    class GeoServiceClient {
    public:
      using ReplyHandler = std::function<void(const ProviderReply&)>;

      GeoServiceClient(io::HttpClient& http, ApiKeySet keys, ProviderEndpoints endpoints = {});

      //---public API-------------------------------------------------------
      void geolocate(const protocols::ObservationList& observations, ReplyHandler handler);
      void geocode(double latitude, double longitude, ReplyHandler handler);
      void timezone(double latitude, double longitude, std::int64_t timestamp,
                    ReplyHandler handler);

      //---request / reply shaping (exposed for tests)-----------------------
      static nlohmann::json buildGeolocationBody(const protocols::ObservationList& observations);
      io::HttpRequest geolocationRequest(const protocols::ObservationList& observations) const;
      io::HttpRequest geocodeRequest(double latitude, double longitude) const;
      io::HttpRequest timezoneRequest(double latitude, double longitude,
                                      std::int64_t timestamp) const;
      static ProviderReply parseReply(const io::HttpReply& reply);

    private:
      void dispatch(const io::HttpRequest& req, ReplyHandler handler);

      io::HttpClient& http_;
      const ApiKeySet keys_;
      const ProviderEndpoints endpoints_;
    };

  } // namespace core
} // namespace geoedge
