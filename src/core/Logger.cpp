/* @file Logger.cpp
 * @brief line writer behind core::Logger
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "core/Logger.hpp"

using namespace geoedge::core;

void Logger::debug(std::string_view tag, std::string_view msg) {
  if (!debug_)
    return;
  write("", tag, msg);
}

void Logger::info(std::string_view tag, std::string_view msg) { write("", tag, msg); }

void Logger::error(std::string_view tag, std::string_view msg) { write("Error: ", tag, msg); }

void Logger::write(std::string_view level, std::string_view tag, std::string_view msg) {
  std::lock_guard<std::mutex> lock(mtx_);
  sink_ << '[' << tag << "] " << level << msg << '\n';
  sink_.flush();
}
