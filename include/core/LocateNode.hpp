#pragma once
/** @file  LocateNode.hpp
 *  @brief Common interface of the agent and device halves of a locate cycle.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>

#include "core/LocateState.hpp"
#include "protocols/LocateResult.hpp"

namespace geoedge::core {

  /**
 * @class LocateNode
 * @brief What the host application can do on either node.
 *
 *  * Runs on the node's event loop; no method is thread-safe.
 *  * `locate()` while a cycle is in flight is silently ignored.
 *  * Completion callbacks take no arguments; read results via the accessors.
 */
  class LocateNode {
  public:
    using Callback = std::function<void()>;

    virtual ~LocateNode() = default;

    virtual void locate(bool usePrevious = true, Callback onComplete = {}) = 0;

    /// Timezone-only refresh for the current location; never restarts a locate cycle.
    virtual void refreshTimezone(Callback onComplete = {}) = 0;

    virtual protocols::LocationReading getLocation() const = 0;
    virtual protocols::TimezoneReading getTimezone() const = 0;

    virtual LocateState state() const = 0;
  };

  namespace messages {
    inline constexpr const char* kLocating = "Location lookup in progress";
    inline constexpr const char* kNeverLocated = "Location not yet determined";
    inline constexpr const char* kNoNetworks = "No WiFi networks available";
    inline constexpr const char* kTimezonePending = "Timezone lookup in progress";
    inline constexpr const char* kTimezoneUnknown = "Timezone not yet determined";
    inline constexpr const char* kTimezoneNeedsLocation = "Timezone lookup needs a location fix";
  } // namespace messages

} // namespace geoedge::core
