/* @file EdgeDevice.cpp
 * @brief edge-node scan relay and result replica
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>
#include <utility>

// 3rd-party headers
#include <nlohmann/json.hpp>

// GeoEdge headers
#include "core/EdgeDevice.hpp"
#include "core/Logger.hpp"
#include "io/Transport.hpp"
#include "io/WifiScanner.hpp"
#include "protocols/Message.hpp"

using namespace geoedge::core;
using geoedge::protocols::ObservationList;
using geoedge::protocols::ScanInitiator;
namespace topic = geoedge::protocols::topic;

namespace {
  constexpr const char* kTag = "EdgeDevice";

  std::string errorField(const nlohmann::json& payload) {
    if (!payload.is_object())
      return {};
    auto it = payload.find("error");
    if (it == payload.end() || !it->is_string())
      return {};
    return it->get<std::string>();
  }
} // namespace

EdgeDevice::EdgeDevice(io::Transport& transport, io::WifiScanner& scanner, Logger& log)
    : transport_(transport), scanner_(scanner), log_(log) {
  transport_.onMessage(topic::kRequestScan, [this](const nlohmann::json&) { handleScanRequest(); });
  transport_.onMessage(topic::kLocateResult,
                       [this](const nlohmann::json& payload) { handleLocateResult(payload); });
  transport_.onMessage(topic::kTimezoneResult,
                       [this](const nlohmann::json& payload) { handleTimezoneResult(payload); });
}

void EdgeDevice::locate(bool usePrevious, Callback onComplete) {
  if (state_.phase != LocateState::Idle) {
    log_.debug(kTag, std::string("locate() ignored, cycle in ") + toString(state_.phase));
    return;
  }

  state_.onComplete = std::move(onComplete);
  state_.phase = LocateState::AwaitingScan;

  if (usePrevious && state_.cachedScan) {
    forwardScan(*state_.cachedScan);
    return;
  }
  scan();
}

void EdgeDevice::refreshTimezone(Callback onComplete) {
  if (state_.timezoneRequested) {
    log_.debug(kTag, "refreshTimezone() ignored, request already pending");
    return;
  }
  state_.timezoneRequested = true;
  state_.onTimezone = std::move(onComplete);
  transport_.send(topic::kRequestTimezone, true);
}

geoedge::protocols::LocationReading EdgeDevice::getLocation() const {
  if (state_.phase != LocateState::Idle)
    return protocols::ReadError{ messages::kLocating };
  if (!state_.locationError.empty())
    return protocols::ReadError{ state_.locationError };
  if (!state_.location)
    return protocols::ReadError{ messages::kNeverLocated };
  return *state_.location;
}

geoedge::protocols::TimezoneReading EdgeDevice::getTimezone() const {
  if (state_.timezoneRequested)
    return protocols::ReadError{ messages::kTimezonePending };
  if (state_.timezone)
    return *state_.timezone;
  return protocols::ReadError{ state_.timezoneError.empty() ? messages::kTimezoneUnknown
                                                            : state_.timezoneError };
}

void EdgeDevice::scan() {
  if (state_.scanInFlight)
    return;

  state_.scanInFlight = true;
  scanner_.requestScan([this](ObservationList observations) {
    state_.scanInFlight = false;
    log_.debug(kTag, "scan found " + std::to_string(observations.size()) + " networks");
    if (!observations.empty())
      state_.cachedScan = observations;
    forwardScan(observations);
  });
}

void EdgeDevice::forwardScan(const ObservationList& observations) {
  // A scan that feeds a local locate() is ours even when the agent also asked for it.
  const bool ownCycle = state_.phase == LocateState::AwaitingScan;
  transport_.send(topic::kScanResult,
                  protocols::makeScanPayload(observations, ownCycle ? ScanInitiator::Device
                                                                    : ScanInitiator::Agent));
  if (ownCycle)
    state_.phase = LocateState::AwaitingGeolocation;
}

void EdgeDevice::handleScanRequest() {
  log_.debug(kTag, "agent requested a scan");
  scan();
}

void EdgeDevice::handleLocateResult(const nlohmann::json& payload) {
  if (auto error = errorField(payload); !error.empty()) {
    state_.locationError = error;
  } else if (auto location = protocols::locationFromJson(payload)) {
    state_.location = std::move(*location);
    state_.locationError.clear();

    std::optional<protocols::TimezoneResult> tz;
    if (auto it = payload.find("timezoneData"); it != payload.end())
      tz = protocols::timezoneFromJson(*it);
    if (tz) {
      state_.timezone = std::move(*tz);
      state_.timezoneError.clear();
    } else {
      state_.timezone.reset();
      state_.timezoneError = "Timezone unavailable for the last location";
    }
  } else {
    log_.error(kTag, "malformed locate-result payload");
    state_.locationError = "Malformed locate-result from agent";
  }

  state_.phase = LocateState::Idle;

  auto done = std::move(state_.onComplete);
  state_.onComplete = nullptr;
  if (done)
    done();
}

void EdgeDevice::handleTimezoneResult(const nlohmann::json& payload) {
  if (auto tz = protocols::timezoneFromJson(payload)) {
    state_.timezone = std::move(*tz);
    state_.timezoneError.clear();
  } else {
    auto error = errorField(payload);
    state_.timezone.reset();
    state_.timezoneError = error.empty() ? "Malformed timezone-result from agent" : error;
  }

  if (!state_.timezoneRequested)
    return;

  state_.timezoneRequested = false;
  auto done = std::move(state_.onTimezone);
  state_.onTimezone = nullptr;
  if (done)
    done();
}
