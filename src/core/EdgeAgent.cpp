/* @file EdgeAgent.cpp
 * @brief relay-node locate cycle: scan hand-off, provider pipeline, retries, side channel
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <string>
#include <utility>

// 3rd-party headers
#include <nlohmann/json.hpp>

// GeoEdge headers
#include "core/EdgeAgent.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/GeoServiceClient.hpp"
#include "core/Logger.hpp"
#include "core/TimezoneFormat.hpp"
#include "io/Scheduler.hpp"
#include "io/Transport.hpp"
#include "protocols/Message.hpp"

using namespace geoedge::core;
using geoedge::protocols::ObservationList;
using geoedge::protocols::ScanInitiator;
namespace topic = geoedge::protocols::topic;

namespace {
  constexpr const char* kTag = "EdgeAgent";
} // namespace

EdgeAgent::EdgeAgent(io::Transport& transport, GeoServiceClient& geo, io::Scheduler& scheduler,
                     const io::Clock& clock, Logger& log,
                     std::shared_ptr<ErrorMonitor> errMonitor)
    : transport_(transport), geo_(geo), scheduler_(scheduler), clock_(clock), log_(log),
      errorMonitor_(std::move(errMonitor)) {
  assert(errorMonitor_ && "[EdgeAgent] error monitor is nullptr");

  transport_.onMessage(topic::kScanResult,
                       [this](const nlohmann::json& payload) { handleScanResult(payload); });
  transport_.onMessage(topic::kRequestTimezone,
                       [this](const nlohmann::json&) { handleTimezoneRequest(); });
}

// -------------------------------------------------------------------
// public API
// -------------------------------------------------------------------
void EdgeAgent::locate(bool usePrevious, Callback onComplete) {
  if (state_.phase != LocateState::Idle) {
    log_.debug(kTag, std::string("locate() ignored, cycle in ") + toString(state_.phase));
    return;
  }

  state_.onComplete = std::move(onComplete);

  if (usePrevious && state_.cachedObservations) {
    log_.debug(kTag, "reusing cached scan");
    startPipeline(*state_.cachedObservations);
    return;
  }

  state_.phase = LocateState::AwaitingScan;
  transport_.send(topic::kRequestScan, true);
}

void EdgeAgent::refreshTimezone(Callback onComplete) {
  if (state_.timezoneRequest != TimezoneRequest::None) {
    log_.debug(kTag, "refreshTimezone() ignored, request already pending");
    return;
  }

  if (state_.phase != LocateState::Idle) {
    // the running cycle will produce a fresh timezone anyway
    state_.timezoneRequest = TimezoneRequest::AwaitingCycle;
    state_.onTimezone = std::move(onComplete);
    return;
  }

  if (!state_.location) {
    state_.timezoneError = messages::kTimezoneNeedsLocation;
    pushTimezone();
    if (onComplete)
      onComplete();
    return;
  }

  state_.timezoneRequest = TimezoneRequest::Requesting;
  state_.onTimezone = std::move(onComplete);
  requestSideTimezone();
}

geoedge::protocols::LocationReading EdgeAgent::getLocation() const {
  if (state_.phase != LocateState::Idle)
    return protocols::ReadError{ messages::kLocating };
  if (!state_.locationError.empty())
    return protocols::ReadError{ state_.locationError };
  if (!state_.location)
    return protocols::ReadError{ messages::kNeverLocated };
  return *state_.location;
}

geoedge::protocols::TimezoneReading EdgeAgent::getTimezone() const {
  if (state_.phase == LocateState::AwaitingTimezone ||
      state_.timezoneRequest == TimezoneRequest::Requesting)
    return protocols::ReadError{ messages::kTimezonePending };
  if (state_.timezone)
    return *state_.timezone;
  return protocols::ReadError{ state_.timezoneError.empty() ? messages::kTimezoneUnknown
                                                            : state_.timezoneError };
}

// -------------------------------------------------------------------
// transport handlers
// -------------------------------------------------------------------
void EdgeAgent::handleScanResult(const nlohmann::json& payload) {
  auto report = protocols::scanReportFromJson(payload);
  if (!report) {
    log_.error(kTag, "malformed scan-result payload, treating as empty");
    report.emplace();
  }
  const auto& observations = report->observations;

  if (!observations.empty())
    state_.cachedObservations = observations;

  if (state_.phase == LocateState::Idle && report->initiator != ScanInitiator::Device) {
    log_.debug(kTag, "scan-result cached, no cycle is waiting for it");
    return;
  }
  if (state_.phase != LocateState::Idle && state_.phase != LocateState::AwaitingScan) {
    log_.debug(kTag, "scan-result cached, cycle already past the scan");
    return;
  }

  // Idle here means the device started the cycle; no local callback is registered.
  if (observations.empty() && !state_.cachedObservations) {
    failCycle(ErrorClass::NoNetworksAvailable, messages::kNoNetworks);
    return;
  }

  startPipeline(*state_.cachedObservations);
}

void EdgeAgent::handleTimezoneRequest() { refreshTimezone(); }

// -------------------------------------------------------------------
// pipeline: geolocate -> geocode -> timezone
// -------------------------------------------------------------------
void EdgeAgent::startPipeline(const ObservationList& observations) {
  state_.cycleObservations = observations;
  state_.pending = protocols::LocationResult{};
  log_.debug(kTag, "locating with " + std::to_string(observations.size()) + " networks");
  requestGeolocation();
}

void EdgeAgent::requestGeolocation() {
  state_.phase = LocateState::AwaitingGeolocation;
  geo_.geolocate(state_.cycleObservations,
                 [this](const ProviderReply& reply) { onGeolocation(reply); });
}

void EdgeAgent::onGeolocation(const ProviderReply& reply) {
  const auto decision = screen("Geolocation", reply, [this] { requestGeolocation(); });
  if (decision.action == RetryDecision::Action::Retry)
    return;
  if (decision.action == RetryDecision::Action::Fail) {
    failCycle(decision.error, describeFailure("Geolocation", reply, decision.error));
    return;
  }

  const auto& body = *reply.body;
  const auto loc = body.is_object() ? body.find("location") : body.end();
  if (loc == body.end() || !loc->is_object() || !loc->contains("lat") ||
      !loc->contains("lng") || !(*loc)["lat"].is_number() || !(*loc)["lng"].is_number()) {
    failCycle(ErrorClass::UnclassifiedProviderError,
              "Geolocation: reply carries no location (HTTP " +
                  std::to_string(reply.httpStatus) + ")");
    return;
  }

  state_.pending.latitude = (*loc)["lat"].get<double>();
  state_.pending.longitude = (*loc)["lng"].get<double>();
  state_.pending.acquiredAt = clock_.now();
  requestPlace();
}

void EdgeAgent::requestPlace() {
  state_.phase = LocateState::AwaitingPlace;
  geo_.geocode(state_.pending.latitude, state_.pending.longitude,
               [this](const ProviderReply& reply) { onPlace(reply); });
}

void EdgeAgent::onPlace(const ProviderReply& reply) {
  const auto decision = screen("Geocoding", reply, [this] { requestPlace(); });
  if (decision.action == RetryDecision::Action::Retry)
    return;
  if (decision.action == RetryDecision::Action::Fail) {
    failCycle(decision.error, describeFailure("Geocoding", reply, decision.error));
    return;
  }

  // no results is not an error; placeData just stays null
  const auto& body = *reply.body;
  if (body.is_object()) {
    auto results = body.find("results");
    if (results != body.end() && results->is_array() && !results->empty())
      state_.pending.placeData = *results;
  }
  requestTimezoneStage();
}

void EdgeAgent::requestTimezoneStage() {
  state_.phase = LocateState::AwaitingTimezone;
  if (state_.timezoneRequest == TimezoneRequest::Requesting) {
    state_.timezoneStageDeferred = true;
    log_.debug(kTag, "timezone stage waits for the pending side request");
    return;
  }
  geo_.timezone(state_.pending.latitude, state_.pending.longitude, clock_.now(),
                [this](const ProviderReply& reply) { onTimezoneStage(reply); });
}

void EdgeAgent::onTimezoneStage(const ProviderReply& reply) {
  const auto decision = screen("Timezone", reply, [this] { requestTimezoneStage(); });
  if (decision.action == RetryDecision::Action::Retry)
    return;
  // the location stands even when the timezone lookup is refused
  if (decision.action == RetryDecision::Action::Fail)
    recordTimezoneFailure(decision.error, describeFailure("Timezone", reply, decision.error));
  else
    applyTimezoneBody(*reply.body);
  finishCycle();
}

// -------------------------------------------------------------------
// timezone side channel
// -------------------------------------------------------------------
void EdgeAgent::requestSideTimezone() {
  geo_.timezone(state_.location->latitude, state_.location->longitude, clock_.now(),
                [this](const ProviderReply& reply) { onSideTimezone(reply); });
}

void EdgeAgent::onSideTimezone(const ProviderReply& reply) {
  const auto decision = screen("Timezone", reply, [this] { requestSideTimezone(); });
  if (decision.action == RetryDecision::Action::Retry)
    return;

  if (decision.action == RetryDecision::Action::Fail)
    recordTimezoneFailure(decision.error, describeFailure("Timezone", reply, decision.error));
  else
    applyTimezoneBody(*reply.body);

  const bool resumeStage = state_.timezoneStageDeferred;
  state_.timezoneStageDeferred = false;
  completeTimezoneRequest();

  if (resumeStage && state_.phase == LocateState::AwaitingTimezone)
    requestTimezoneStage();
}

// -------------------------------------------------------------------
// helpers
// -------------------------------------------------------------------
RetryDecision EdgeAgent::screen(const char* stage, const ProviderReply& reply,
                                std::function<void()> retry) {
  const auto decision = classify(reply, clock_.localHour());
  if (decision.action == RetryDecision::Action::Retry) {
    log_.info(kTag, std::string(stage) + ": " + toString(decision.error) + " (HTTP " +
                        std::to_string(reply.httpStatus) + "), retrying in " +
                        std::to_string(decision.delay.count()) + "s");
    scheduler_.schedule(decision.delay, std::move(retry));
  }
  return decision;
}

std::string EdgeAgent::describeFailure(const char* stage, const ProviderReply& reply,
                                       ErrorClass error) const {
  std::string msg = std::string(stage) + ": " + toString(error) + " (HTTP " +
                    std::to_string(reply.httpStatus);
  if (reply.providerCode)
    msg += ", code " + std::to_string(*reply.providerCode);
  if (!reply.providerReason.empty())
    msg += ", " + reply.providerReason;
  msg += ")";
  if (error == ErrorClass::CredentialError)
    msg += " - check the configured API key";
  return msg;
}

void EdgeAgent::applyTimezoneBody(const nlohmann::json& body) {
  std::string status = "missing";
  if (body.is_object()) {
    if (auto it = body.find("status"); it != body.end() && it->is_string())
      status = it->get<std::string>();
  }

  if (status == "OK") {
    auto raw = body.find("rawOffset");
    auto dst = body.find("dstOffset");
    if (raw != body.end() && raw->is_number() && dst != body.end() && dst->is_number()) {
      state_.timezone = makeTimezoneResult(clock_.now(), static_cast<int>(raw->get<double>()),
                                           static_cast<int>(dst->get<double>()));
      state_.timezoneError.clear();
      return;
    }
    status = "OK without offsets";
  }

  state_.timezone.reset();
  state_.timezoneError = "Timezone lookup returned status " + status;
  log_.info(kTag, state_.timezoneError);
}

void EdgeAgent::recordTimezoneFailure(ErrorClass error, const std::string& reason) {
  log_.error(kTag, reason);
  if (error == ErrorClass::CredentialError || error == ErrorClass::UnclassifiedProviderError)
    errorMonitor_->notifyFailure(reason);
  state_.timezone.reset();
  state_.timezoneError = reason;
}

void EdgeAgent::finishCycle() {
  state_.location = state_.pending;
  state_.locationError.clear();
  state_.phase = LocateState::Done;

  log_.debug(kTag, "located at " + std::to_string(state_.location->latitude) + "," +
                       std::to_string(state_.location->longitude));
  transport_.send(topic::kLocateResult,
                  protocols::makeLocatePayload(*state_.location, state_.timezone));
  settleCycle();
}

void EdgeAgent::failCycle(ErrorClass error, const std::string& reason) {
  state_.phase = LocateState::Failed;
  state_.locationError = reason;

  log_.error(kTag, reason);
  if (error == ErrorClass::CredentialError || error == ErrorClass::UnclassifiedProviderError)
    errorMonitor_->notifyFailure(reason);

  transport_.send(topic::kLocateResult, nlohmann::json{ { "error", reason } });
  settleCycle();
}

void EdgeAgent::settleCycle() {
  state_.phase = LocateState::Idle;

  // clear before invoking: the callback may start the next cycle
  auto done = std::move(state_.onComplete);
  state_.onComplete = nullptr;

  if (state_.timezoneRequest == TimezoneRequest::AwaitingCycle)
    completeTimezoneRequest();

  if (done)
    done();
}

void EdgeAgent::completeTimezoneRequest() {
  state_.timezoneRequest = TimezoneRequest::None;
  pushTimezone();

  auto done = std::move(state_.onTimezone);
  state_.onTimezone = nullptr;
  if (done)
    done();
}

void EdgeAgent::pushTimezone() {
  if (state_.timezone) {
    transport_.send(topic::kTimezoneResult, protocols::toJson(*state_.timezone));
    return;
  }
  transport_.send(topic::kTimezoneResult,
                  nlohmann::json{ { "error", state_.timezoneError.empty()
                                                 ? messages::kTimezoneUnknown
                                                 : state_.timezoneError } });
}
