#pragma once
/** @file  NetworkObservation.hpp
 *  @brief One scanned WiFi access point (BSSID + RSSI) and its wire form.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// 3rd-party headers
#include <nlohmann/json_fwd.hpp>

namespace geoedge {
  namespace protocols {

    using Bssid = std::array<std::uint8_t, 6>;

    struct NetworkObservation {
      Bssid bssid{};
      int signalStrengthDbm{ 0 };
    };

    using ObservationList = std::vector<NetworkObservation>;

    /// "AA:BB:CC:DD:EE:FF" (upper-case, colon delimited).
    std::string formatBssid(const Bssid& bssid);

    /// Accepts upper or lower case hex; std::nullopt on anything else.
    std::optional<Bssid> parseBssid(const std::string& text);

    /// `[{"bssid":"AA:..","rssi":-60}, ...]` as carried on the scan-result topic.
    nlohmann::json toJson(const ObservationList& observations);

    /// std::nullopt if the payload is not an array of well-formed entries.
    std::optional<ObservationList> observationsFromJson(const nlohmann::json& payload);

    /// Which node asked for the scan a scan-result carries.
    enum class ScanInitiator { Device, Agent };

    const char* toString(ScanInitiator initiator);

    struct ScanReport {
      ObservationList observations;
      ScanInitiator initiator{ ScanInitiator::Agent };
    };

    /// `{"observations":[...],"initiator":"device"|"agent"}`
    nlohmann::json makeScanPayload(const ObservationList& observations, ScanInitiator initiator);

    std::optional<ScanReport> scanReportFromJson(const nlohmann::json& payload);

  } // namespace protocols
} // namespace geoedge
