/* @file TimezoneFormat.cpp
 * @brief offset and local-date labels
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdio>
#include <cstdlib>
#include <ctime>

// GeoEdge headers
#include "core/TimezoneFormat.hpp"

namespace geoedge::core {

  std::string formatOffsetLabel(int gmtOffsetSeconds) {
    const int hours = gmtOffsetSeconds / 3600;
    return std::string("GMT") + (hours < 0 ? "-" : "+") + std::to_string(std::abs(hours));
  }

  std::string formatDateLabel(std::int64_t epochTime) {
    const std::time_t t = static_cast<std::time_t>(epochTime);
    std::tm tm{};
    if (gmtime_r(&t, &tm) == nullptr)
      return {};

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d", tm.tm_year + 1900,
                  tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec);
    return buf;
  }

  protocols::TimezoneResult makeTimezoneResult(std::int64_t now, int rawOffset, int dstOffset) {
    protocols::TimezoneResult tz;
    tz.gmtOffsetSeconds = rawOffset + dstOffset;
    tz.epochTime = now + tz.gmtOffsetSeconds;
    tz.offsetLabel = formatOffsetLabel(tz.gmtOffsetSeconds);
    tz.localDateLabel = formatDateLabel(tz.epochTime);
    return tz;
  }

} // namespace geoedge::core
