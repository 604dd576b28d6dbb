#pragma once
/** @file  Message.hpp
 *  @brief Cross-node envelope: one topic + one JSON payload per serial line.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>

// 3rd-party headers
#include <nlohmann/json.hpp>

namespace geoedge {
  namespace protocols {

    namespace topic {
      inline constexpr const char* kRequestScan = "request-scan";         ///< agent → device
      inline constexpr const char* kScanResult = "scan-result";           ///< device → agent
      inline constexpr const char* kLocateResult = "locate-result";       ///< agent → device
      inline constexpr const char* kRequestTimezone = "request-timezone"; ///< device → agent
      inline constexpr const char* kTimezoneResult = "timezone-result";   ///< agent → device
    } // namespace topic

    struct Message {
      std::string topic;
      nlohmann::json payload;

      /// Compact single-line JSON; SerialChannel appends the CRLF.
      std::string toWire() const {
        return nlohmann::json{ { "topic", topic }, { "payload", payload } }.dump();
      }

      static std::optional<Message> fromWire(const std::string& line) {
        auto doc = nlohmann::json::parse(line, nullptr, /*allow_exceptions=*/false);
        if (doc.is_discarded() || !doc.is_object())
          return std::nullopt;

        auto it = doc.find("topic");
        if (it == doc.end() || !it->is_string())
          return std::nullopt;

        Message msg;
        msg.topic = it->get<std::string>();
        if (auto p = doc.find("payload"); p != doc.end())
          msg.payload = std::move(*p);
        return msg;
      }
    };

  } // namespace protocols
} // namespace geoedge
