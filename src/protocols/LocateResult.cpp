/* @file LocateResult.cpp
 * @brief JSON codec for the locate-result and timezone-result payloads.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "protocols/LocateResult.hpp"

namespace geoedge {
  namespace protocols {

    nlohmann::json toJson(const TimezoneResult& tz) {
      return { { "time", tz.epochTime },
               { "gmtOffset", tz.gmtOffsetSeconds },
               { "gmtOffsetStr", tz.offsetLabel },
               { "date", tz.localDateLabel } };
    }

    std::optional<TimezoneResult> timezoneFromJson(const nlohmann::json& payload) {
      if (!payload.is_object())
        return std::nullopt;

      auto time = payload.find("time");
      auto offset = payload.find("gmtOffset");
      auto label = payload.find("gmtOffsetStr");
      auto date = payload.find("date");
      if (time == payload.end() || !time->is_number_integer() || offset == payload.end() ||
          !offset->is_number_integer() || label == payload.end() || !label->is_string() ||
          date == payload.end() || !date->is_string())
        return std::nullopt;

      TimezoneResult tz;
      tz.epochTime = time->get<std::int64_t>();
      tz.gmtOffsetSeconds = offset->get<int>();
      tz.offsetLabel = label->get<std::string>();
      tz.localDateLabel = date->get<std::string>();
      return tz;
    }

    nlohmann::json makeLocatePayload(const LocationResult& location,
                                     const std::optional<TimezoneResult>& tz) {
      return { { "latitude", location.latitude },
               { "longitude", location.longitude },
               { "placeData", location.placeData },
               { "timezoneData", tz ? toJson(*tz) : nlohmann::json() } };
    }

    std::optional<LocationResult> locationFromJson(const nlohmann::json& payload) {
      if (!payload.is_object())
        return std::nullopt;

      auto lat = payload.find("latitude");
      auto lng = payload.find("longitude");
      if (lat == payload.end() || !lat->is_number() || lng == payload.end() || !lng->is_number())
        return std::nullopt;

      LocationResult location;
      location.latitude = lat->get<double>();
      location.longitude = lng->get<double>();
      if (auto place = payload.find("placeData"); place != payload.end())
        location.placeData = *place;
      return location;
    }

  } // namespace protocols
} // namespace geoedge
