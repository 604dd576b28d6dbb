#pragma once
/** @file  LocateState.hpp
 *  @brief Per-node phase of the locate cycle.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>

namespace geoedge {
  namespace core {

    enum class LocateState : std::uint8_t {
      Idle,
      AwaitingScan,
      AwaitingGeolocation,
      AwaitingPlace,
      AwaitingTimezone,
      Done,
      Failed
    };

    inline const char* toString(LocateState s) {
      switch (s) {
      case LocateState::Idle:
        return "Idle";
      case LocateState::AwaitingScan:
        return "AwaitingScan";
      case LocateState::AwaitingGeolocation:
        return "AwaitingGeolocation";
      case LocateState::AwaitingPlace:
        return "AwaitingPlace";
      case LocateState::AwaitingTimezone:
        return "AwaitingTimezone";
      case LocateState::Done:
        return "Done";
      case LocateState::Failed:
        return "Failed";
      default:
        return "Unknown";
      }
    }

  } // namespace core
} // namespace geoedge
