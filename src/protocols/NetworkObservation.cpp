/* @file NetworkObservation.cpp
 * @brief BSSID text conversion and scan-result payload codec.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cctype>
#include <cstdio>
#include <utility>

// 3rd-party headers
#include <nlohmann/json.hpp>

// GeoEdge headers
#include "protocols/NetworkObservation.hpp"

namespace geoedge {
  namespace protocols {

    namespace {
      int hexValue(char c) {
        if (c >= '0' && c <= '9')
          return c - '0';
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        if (c >= 'A' && c <= 'F')
          return c - 'A' + 10;
        return -1;
      }
    } // namespace

    std::string formatBssid(const Bssid& bssid) {
      char out[18];
      std::snprintf(out, sizeof(out), "%02X:%02X:%02X:%02X:%02X:%02X", bssid[0], bssid[1],
                    bssid[2], bssid[3], bssid[4], bssid[5]);
      return out;
    }

    std::optional<Bssid> parseBssid(const std::string& text) {
      // six octets, five separators
      if (text.size() != 17)
        return std::nullopt;

      Bssid bssid{};
      for (std::size_t i = 0; i < bssid.size(); ++i) {
        const std::size_t pos = i * 3;
        const int hi = hexValue(text[pos]);
        const int lo = hexValue(text[pos + 1]);
        if (hi < 0 || lo < 0)
          return std::nullopt;
        if (i < 5 && text[pos + 2] != ':')
          return std::nullopt;
        bssid[i] = static_cast<std::uint8_t>((hi << 4) | lo);
      }
      return bssid;
    }

    nlohmann::json toJson(const ObservationList& observations) {
      auto out = nlohmann::json::array();
      for (const auto& obs : observations)
        out.push_back({ { "bssid", formatBssid(obs.bssid) }, { "rssi", obs.signalStrengthDbm } });
      return out;
    }

    std::optional<ObservationList> observationsFromJson(const nlohmann::json& payload) {
      if (!payload.is_array())
        return std::nullopt;

      ObservationList observations;
      observations.reserve(payload.size());
      for (const auto& entry : payload) {
        if (!entry.is_object() || !entry.contains("bssid") || !entry.contains("rssi"))
          return std::nullopt;
        const auto& bssidField = entry["bssid"];
        const auto& rssiField = entry["rssi"];
        if (!bssidField.is_string() || !rssiField.is_number_integer())
          return std::nullopt;

        auto bssid = parseBssid(bssidField.get<std::string>());
        if (!bssid)
          return std::nullopt;
        observations.push_back({ *bssid, rssiField.get<int>() });
      }
      return observations;
    }

    const char* toString(ScanInitiator initiator) {
      switch (initiator) {
      case ScanInitiator::Device:
        return "device";
      case ScanInitiator::Agent:
        return "agent";
      }
      return "unknown";
    }

    nlohmann::json makeScanPayload(const ObservationList& observations, ScanInitiator initiator) {
      return { { "observations", toJson(observations) }, { "initiator", toString(initiator) } };
    }

    std::optional<ScanReport> scanReportFromJson(const nlohmann::json& payload) {
      if (!payload.is_object() || !payload.contains("observations") ||
          !payload.contains("initiator") || !payload["initiator"].is_string())
        return std::nullopt;

      auto observations = observationsFromJson(payload["observations"]);
      if (!observations)
        return std::nullopt;

      const auto initiator = payload["initiator"].get<std::string>();
      if (initiator == toString(ScanInitiator::Device))
        return ScanReport{ std::move(*observations), ScanInitiator::Device };
      if (initiator == toString(ScanInitiator::Agent))
        return ScanReport{ std::move(*observations), ScanInitiator::Agent };
      return std::nullopt;
    }

  } // namespace protocols
} // namespace geoedge
