/* @file AsioScheduler.cpp
 * @brief steady_timer backed retry scheduling and system wall clock
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <ctime>
#include <memory>

// 3rd-party headers
#include <boost/asio/steady_timer.hpp>

// GeoEdge headers
#include "io/AsioScheduler.hpp"

using namespace geoedge::io;

void AsioScheduler::schedule(std::chrono::seconds delay, std::function<void()> task) {
  // the handler keeps its timer alive until it fires
  auto timer = std::make_shared<boost::asio::steady_timer>(io_, delay);
  timer->async_wait([timer, task = std::move(task)](const boost::system::error_code& ec) {
    if (!ec && task)
      task();
  });
}

std::int64_t AsioScheduler::now() const {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

int AsioScheduler::localHour() const {
  const std::time_t t = std::time(nullptr);
  std::tm tm{};
  if (localtime_r(&t, &tm) == nullptr)
    return 0;
  return tm.tm_hour;
}
