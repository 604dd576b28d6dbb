#pragma once
/** @file  TimezoneFormat.hpp
 *  @brief Turns a provider's raw/DST offsets into a TimezoneResult.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <string>

#include "protocols/LocateResult.hpp"

namespace geoedge::core {

  /// "GMT+H" / "GMT-H"; hours truncated toward zero.
  std::string formatOffsetLabel(int gmtOffsetSeconds);

  /// "YYYY-MM-DD HH:MM:SS" of `epochTime` read as UTC.
  std::string formatDateLabel(std::int64_t epochTime);

  /// epochTime = now + rawOffset + dstOffset, labels derived from it.
  protocols::TimezoneResult makeTimezoneResult(std::int64_t now, int rawOffset, int dstOffset);

} // namespace geoedge::core
