#pragma once
/** @file  Logger.hpp
 *  @brief Tagged diagnostic lines ("[EdgeAgent] ...") with a debug switch.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <iostream>
#include <mutex>
#include <string_view>

namespace geoedge {
  namespace core {

    /**
 * @class Logger
 * @brief Writes one line per event to an ostream (std::cerr by default).
 *
 *  * `debug()` is dropped unless the node was configured with `debug: true`.
 *  * `info()` / `error()` are always written.
 *  * Lock-protected: the scan worker thread may log while the loop runs.
 */
    class Logger {

    public:
      explicit Logger(bool debugEnabled = false, std::ostream& sink = std::cerr)
          : sink_(sink), debug_(debugEnabled) {}
      ~Logger() = default;

      // --- public API ---
      void debug(std::string_view tag, std::string_view msg);
      void info(std::string_view tag, std::string_view msg);
      void error(std::string_view tag, std::string_view msg);

      bool debugEnabled() const { return debug_; }

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void write(std::string_view level, std::string_view tag, std::string_view msg);

      std::ostream& sink_;
      bool debug_{ false };
      std::mutex mtx_;
    };

  } // namespace core
} // namespace geoedge
