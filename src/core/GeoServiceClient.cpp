/* @file GeoServiceClient.cpp
 * @brief builds provider URLs/bodies and turns raw HTTP replies into ProviderReply
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cctype>
#include <cstdio>
#include <string>

// GeoEdge headers
#include "core/GeoServiceClient.hpp"

using namespace geoedge::core;
using geoedge::protocols::ObservationList;

namespace {

  std::string urlEncode(const std::string& in) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    out.reserve(in.size());
    for (unsigned char c : in) {
      if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
        out += static_cast<char>(c);
      } else {
        out += '%';
        out += kHex[c >> 4];
        out += kHex[c & 0x0F];
      }
    }
    return out;
  }

  std::string formatLatLng(double latitude, double longitude) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.7f,%.7f", latitude, longitude);
    return buf;
  }

} // namespace

GeoServiceClient::GeoServiceClient(io::HttpClient& http, ApiKeySet keys,
                                   ProviderEndpoints endpoints)
    : http_(http), keys_(std::move(keys)), endpoints_(std::move(endpoints)) {}

void GeoServiceClient::geolocate(const ObservationList& observations, ReplyHandler handler) {
  dispatch(geolocationRequest(observations), std::move(handler));
}

void GeoServiceClient::geocode(double latitude, double longitude, ReplyHandler handler) {
  dispatch(geocodeRequest(latitude, longitude), std::move(handler));
}

void GeoServiceClient::timezone(double latitude, double longitude, std::int64_t timestamp,
                                ReplyHandler handler) {
  dispatch(timezoneRequest(latitude, longitude, timestamp), std::move(handler));
}

nlohmann::json GeoServiceClient::buildGeolocationBody(const ObservationList& observations) {
  auto aps = nlohmann::json::array();
  for (const auto& obs : observations) {
    aps.push_back({ { "macAddress", protocols::formatBssid(obs.bssid) },
                    { "signalStrength", std::to_string(obs.signalStrengthDbm) } });
  }
  return { { "wifiAccessPoints", aps } };
}

geoedge::io::HttpRequest
GeoServiceClient::geolocationRequest(const ObservationList& observations) const {
  io::HttpRequest req;
  req.method = io::HttpMethod::Post;
  req.url = endpoints_.geolocation + "?key=" + urlEncode(keys_.geolocationKey());
  req.body = buildGeolocationBody(observations).dump();
  return req;
}

geoedge::io::HttpRequest GeoServiceClient::geocodeRequest(double latitude,
                                                          double longitude) const {
  io::HttpRequest req;
  req.url = endpoints_.geocoding + "?latlng=" + formatLatLng(latitude, longitude) +
            "&key=" + urlEncode(keys_.geocodingKey());
  return req;
}

geoedge::io::HttpRequest GeoServiceClient::timezoneRequest(double latitude, double longitude,
                                                           std::int64_t timestamp) const {
  io::HttpRequest req;
  req.url = endpoints_.timezone + "?location=" + formatLatLng(latitude, longitude) +
            "&timestamp=" + std::to_string(timestamp) + "&key=" + urlEncode(keys_.timezoneKey());
  return req;
}

ProviderReply GeoServiceClient::parseReply(const io::HttpReply& raw) {
  ProviderReply reply;
  reply.httpStatus = raw.status;
  reply.transportError = raw.transportError;
  if (raw.status == 0)
    return reply;

  auto doc = nlohmann::json::parse(raw.body, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded())
    return reply;

  // {"error":{"code":403,"errors":[{"reason":"dailyLimitExceeded"}]}}
  if (doc.is_object()) {
    auto err = doc.find("error");
    if (err != doc.end() && err->is_object()) {
      if (auto code = err->find("code"); code != err->end() && code->is_number_integer())
        reply.providerCode = code->get<int>();
      if (auto errors = err->find("errors");
          errors != err->end() && errors->is_array() && !errors->empty()) {
        const auto& first = (*errors)[0];
        if (first.is_object()) {
          if (auto reason = first.find("reason"); reason != first.end() && reason->is_string())
            reply.providerReason = reason->get<std::string>();
        }
      }
      if (!reply.providerCode)
        reply.providerCode = raw.status;
    }
  }
  reply.body = std::move(doc);
  return reply;
}

void GeoServiceClient::dispatch(const io::HttpRequest& req, ReplyHandler handler) {
  http_.request(req, [handler = std::move(handler)](io::HttpReply raw) {
    handler(parseReply(raw));
  });
}
