#pragma once
/** @file  AsioScheduler.hpp
 *  @brief Scheduler + Clock on a boost::asio::io_context.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <boost/asio/io_context.hpp>

#include "io/Scheduler.hpp"

namespace geoedge::io {

  class AsioScheduler : public Scheduler, public Clock {
  public:
    explicit AsioScheduler(boost::asio::io_context& io) : io_(io) {}

    void schedule(std::chrono::seconds delay, std::function<void()> task) override;

    std::int64_t now() const override;
    int localHour() const override;

  private:
    boost::asio::io_context& io_;
  };

} // namespace geoedge::io
