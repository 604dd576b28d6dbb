#pragma once
/** @file  Scheduler.hpp
 *  @brief Delayed-task and wall-clock seams (retry back-off, timezone timestamps).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstdint>
#include <functional>

namespace geoedge {
  namespace io {

    class Scheduler {
    public:
      virtual ~Scheduler() = default;

      /// Run `task` on the event loop once `delay` has elapsed.
      virtual void schedule(std::chrono::seconds delay, std::function<void()> task) = 0;
    };

    class Clock {
    public:
      virtual ~Clock() = default;

      virtual std::int64_t now() const = 0; ///< unix seconds
      virtual int localHour() const = 0;    ///< 0..23, host local time
    };

  } // namespace io
} // namespace geoedge
