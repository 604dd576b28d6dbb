#pragma once
/** @file  EdgeDevice.hpp
 *  @brief Edge-node side: scans WiFi for the agent and keeps replicas of its results.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/LocateNode.hpp"
#include "protocols/NetworkObservation.hpp"

namespace geoedge {
  namespace io {
    class Transport;
    class WifiScanner;
  } // namespace io

  namespace core {

    class Logger;

    struct DeviceState {
      LocateState phase{ LocateState::Idle };

      std::optional<protocols::ObservationList> cachedScan; ///< last non-empty scan
      bool scanInFlight{ false };

      // replicas of agent-owned data
      std::optional<protocols::LocationResult> location;
      std::string locationError;
      std::optional<protocols::TimezoneResult> timezone;
      std::string timezoneError;

      LocateNode::Callback onComplete{};

      bool timezoneRequested{ false };
      LocateNode::Callback onTimezone{};
    };

    /**
 * @class EdgeDevice
 * @brief Pure relay towards the agent plus a read-only replica for the host app.
 *
 *  * `locate()` scans (or reuses the cache) and forwards to the agent, then
 *    waits for the agent's locate-result.
 *  * An agent's request-scan triggers the same scan without a local callback.
 */
    class EdgeDevice : public LocateNode {
    public:
      EdgeDevice(io::Transport& transport, io::WifiScanner& scanner, Logger& log);
      ~EdgeDevice() override = default;

      void locate(bool usePrevious = true, Callback onComplete = {}) override;
      void refreshTimezone(Callback onComplete = {}) override;
      protocols::LocationReading getLocation() const override;
      protocols::TimezoneReading getTimezone() const override;
      LocateState state() const override { return state_.phase; }

      const DeviceState& snapshot() const { return state_; }

      EdgeDevice(const EdgeDevice&) = delete;
      EdgeDevice& operator=(const EdgeDevice&) = delete;

    private:
      void scan();
      void forwardScan(const protocols::ObservationList& observations);

      void handleScanRequest();
      void handleLocateResult(const nlohmann::json& payload);
      void handleTimezoneResult(const nlohmann::json& payload);

      io::Transport& transport_;
      io::WifiScanner& scanner_;
      Logger& log_;

      DeviceState state_{};
    };

  } // namespace core
} // namespace geoedge
