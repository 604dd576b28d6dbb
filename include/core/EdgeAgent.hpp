#pragma once
/** @file  EdgeAgent.hpp
 *  @brief Relay-node side: drives geolocate → geocode → timezone and owns the results.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

// 3rd-party headers
#include <nlohmann/json_fwd.hpp>

// GeoEdge headers
#include "core/LocateNode.hpp"
#include "core/RetryPolicy.hpp"
#include "protocols/NetworkObservation.hpp"

namespace geoedge {
  namespace io {
    class Transport;
    class Scheduler;
    class Clock;
  } // namespace io

  namespace core {

    class ErrorMonitor;
    class GeoServiceClient;
    class Logger;
    struct ProviderReply;

    /// Where the timezone side channel stands.
    enum class TimezoneRequest : std::uint8_t {
      None,
      Requesting,   ///< own provider call (or its retry) outstanding
      AwaitingCycle ///< piggybacking on the running locate cycle
    };

    /**
 * @struct AgentState
 * @brief Everything the agent mutates after construction, in one place.
 */
    struct AgentState {
      LocateState phase{ LocateState::Idle };

      std::optional<protocols::ObservationList> cachedObservations; ///< last non-empty scan
      protocols::ObservationList cycleObservations;
      protocols::LocationResult pending; ///< built up by the running cycle

      std::optional<protocols::LocationResult> location;
      std::string locationError; ///< reason of the last failed cycle
      std::optional<protocols::TimezoneResult> timezone;
      std::string timezoneError;

      LocateNode::Callback onComplete{};

      TimezoneRequest timezoneRequest{ TimezoneRequest::None };
      bool timezoneStageDeferred{ false }; ///< stage 3 waits for the side request
      LocateNode::Callback onTimezone{};
    };

    /**
 * @class EdgeAgent
 * @brief Authoritative locate state machine.
 *
 *  * One cycle at a time; provider stages run strictly in order.
 *  * Transient provider failures re-arm the failing stage on the Scheduler.
 *  * Terminal failures end the cycle; credential and unclassified errors are
 *    escalated through ErrorMonitor.
 *  * Every cycle ends with a locate-result push to the device.
 */
    class EdgeAgent : public LocateNode {
    public:
      EdgeAgent(io::Transport& transport, GeoServiceClient& geo, io::Scheduler& scheduler,
                const io::Clock& clock, Logger& log, std::shared_ptr<ErrorMonitor> errMonitor);
      ~EdgeAgent() override = default;

      //---LocateNode-------------------------------------------------------
      void locate(bool usePrevious = true, Callback onComplete = {}) override;
      void refreshTimezone(Callback onComplete = {}) override;
      protocols::LocationReading getLocation() const override;
      protocols::TimezoneReading getTimezone() const override;
      LocateState state() const override { return state_.phase; }

      const AgentState& snapshot() const { return state_; }

      EdgeAgent(const EdgeAgent&) = delete;
      EdgeAgent& operator=(const EdgeAgent&) = delete;

    private:
      //---transport handlers-------------------------------------------------
      void handleScanResult(const nlohmann::json& payload);
      void handleTimezoneRequest();

      //---pipeline-----------------------------------------------------------
      void startPipeline(const protocols::ObservationList& observations);
      void requestGeolocation();
      void onGeolocation(const ProviderReply& reply);
      void requestPlace();
      void onPlace(const ProviderReply& reply);
      void requestTimezoneStage();
      void onTimezoneStage(const ProviderReply& reply);

      //---timezone side channel----------------------------------------------
      void requestSideTimezone();
      void onSideTimezone(const ProviderReply& reply);

      //---shared helpers-----------------------------------------------------
      RetryDecision screen(const char* stage, const ProviderReply& reply,
                           std::function<void()> retry);
      std::string describeFailure(const char* stage, const ProviderReply& reply,
                                  ErrorClass error) const;
      void applyTimezoneBody(const nlohmann::json& body);
      void recordTimezoneFailure(ErrorClass error, const std::string& reason);
      void finishCycle();
      void failCycle(ErrorClass error, const std::string& reason);
      void settleCycle();
      void completeTimezoneRequest();
      void pushTimezone();

      io::Transport& transport_;
      GeoServiceClient& geo_;
      io::Scheduler& scheduler_;
      const io::Clock& clock_;
      Logger& log_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;

      AgentState state_{};
    };

  } // namespace core
} // namespace geoedge
