/* @file ErrorMonitor.cpp
 * @brief de-duplicating escalation of operator-visible faults
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>

// GeoEdge headers
#include "core/ErrorMonitor.hpp"

namespace geoedge {
  namespace core {

    void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
      std::lock_guard<std::mutex> lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) {
      std::function<void(const std::string&)> escalate;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!rememberIfNew(message))
          return;
        escalate = escalation_;
      }
      // escalate outside the lock
      if (escalate)
        escalate(message);
    }

    std::size_t ErrorMonitor::failureCount() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return seen_.size();
    }

    bool ErrorMonitor::rememberIfNew(const std::string& message) {
      if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
        return false;
      seen_.push_back(message);
      return true;
    }

  } // namespace core
} // namespace geoedge
