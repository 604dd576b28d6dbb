#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Operator-facing fault sink (credential rejections, provider surprises).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace geoedge::core {

  /**
 * @class ErrorMonitor
 * @brief Subsystems call `notifyFailure()`; we call the registered
 *        escalation callback exactly once per unique message.
 *
 * * Thread-safe (mutex-protected vector).
 * * Debounces duplicate failures so a retry loop doesn't spam the operator.
 */
  class ErrorMonitor {
  public:
    ErrorMonitor() = default;
    virtual ~ErrorMonitor() = default;

    /// Register a lambda that surfaces a fault to the operator.
    void registerEscalation(std::function<void(const std::string&)> cb);

    /// Called by subsystems on fault; will forward to the escalation callback.
    virtual void notifyFailure(const std::string& message);

    /// Number of distinct failures seen so far.
    std::size_t failureCount() const;

  private:
    bool rememberIfNew(const std::string& message);

    std::function<void(const std::string&)> escalation_{};
    std::vector<std::string> seen_; ///< de-dupe list
    mutable std::mutex mtx_;
  };

} // namespace geoedge::core
