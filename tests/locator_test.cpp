// GeoEdge-Prod headers
#include "core/EdgeAgent.hpp"
#include "core/EdgeDevice.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/GeoServiceClient.hpp"
#include "core/Locator.hpp"
#include "core/Logger.hpp"
#include "protocols/Message.hpp"

// GeoEdge-Fake headers
#include "FakeHttpClient.hpp"
#include "FakeScheduler.hpp"
#include "FakeTransport.hpp"
#include "FakeWifiScanner.hpp"
#include "ProviderBodies.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>

namespace geoedge::test {

  using core::LocateState;
  using core::Locator;
  using protocols::LocationResult;
  using protocols::ReadError;
  using protocols::TimezoneResult;

  /// Agent and device wired back to back over a loopback transport pair.
  class LocatorTest : public ::testing::Test {
  protected:
    void SetUp() override {
      FakeTransport::link(agentLink, deviceLink);
      errorMonitor = std::make_shared<core::ErrorMonitor>();
      errorMonitor->registerEscalation([this](const std::string& msg) { escalated.push_back(msg); });

      geo = std::make_unique<core::GeoServiceClient>(http, core::ApiKeySet("k1", "k2", "k3"));
      agent = std::make_unique<Locator>(std::make_unique<core::EdgeAgent>(
          agentLink, *geo, scheduler, scheduler, log, errorMonitor));
      device = std::make_unique<Locator>(
          std::make_unique<core::EdgeDevice>(deviceLink, scanner, log));
    }

    void pump() { FakeTransport::pump(agentLink, deviceLink); }

    void answerPipeline() {
      http.respond(200, kGeolocateOk);
      http.respond(200, kGeocodeOk);
      http.respond(200, kTimezoneOk);
      pump();
    }

    std::ostringstream logSink;
    core::Logger log{ false, logSink };
    FakeTransport agentLink;
    FakeTransport deviceLink;
    FakeHttpClient http;
    FakeScheduler scheduler;
    FakeWifiScanner scanner;
    std::shared_ptr<core::ErrorMonitor> errorMonitor;
    std::vector<std::string> escalated;
    std::unique_ptr<core::GeoServiceClient> geo;
    std::unique_ptr<Locator> agent;
    std::unique_ptr<Locator> device;
  };

  TEST_F(LocatorTest, ctor_RejectsMissingHalf) {
    EXPECT_THROW(Locator(std::unique_ptr<core::EdgeAgent>{}), std::invalid_argument);
    EXPECT_THROW(Locator(std::unique_ptr<core::EdgeDevice>{}), std::invalid_argument);
  }

  TEST_F(LocatorTest, role_MatchesOwnedHalf) {
    EXPECT_EQ(agent->role(), core::Role::Agent);
    EXPECT_NE(agent->agent(), nullptr);
    EXPECT_EQ(agent->device(), nullptr);
    EXPECT_EQ(device->role(), core::Role::Device);
    EXPECT_NE(device->device(), nullptr);
  }

  TEST_F(LocatorTest, agentInitiated_BothNodesConverge) {
    int agentDone = 0;
    agent->locate(true, [&agentDone] { ++agentDone; });
    pump(); // request-scan reaches the device

    ASSERT_EQ(scanner.scans_requested, 1);
    scanner.complete(twoNetworks());
    pump(); // scan-result reaches the agent

    EXPECT_EQ(agent->state(), LocateState::AwaitingGeolocation);
    answerPipeline();

    EXPECT_EQ(agentDone, 1);
    const auto a = agent->getLocation();
    const auto d = device->getLocation();
    ASSERT_TRUE(std::holds_alternative<LocationResult>(a));
    ASSERT_TRUE(std::holds_alternative<LocationResult>(d));
    EXPECT_DOUBLE_EQ(std::get<LocationResult>(d).latitude, std::get<LocationResult>(a).latitude);
    EXPECT_EQ(std::get<LocationResult>(d).placeData, std::get<LocationResult>(a).placeData);

    const auto tz = device->getTimezone();
    ASSERT_TRUE(std::holds_alternative<TimezoneResult>(tz));
    EXPECT_EQ(std::get<TimezoneResult>(tz).offsetLabel, "GMT-7");
  }

  TEST_F(LocatorTest, deviceInitiated_CallbackFiresOnAgentResult) {
    int deviceDone = 0;
    device->locate(true, [&deviceDone] { ++deviceDone; });
    scanner.complete(twoNetworks());
    pump();

    EXPECT_EQ(device->state(), LocateState::AwaitingGeolocation);
    EXPECT_EQ(agent->state(), LocateState::AwaitingGeolocation);
    answerPipeline();

    EXPECT_EQ(deviceDone, 1);
    EXPECT_EQ(device->state(), LocateState::Idle);
    EXPECT_TRUE(std::holds_alternative<LocationResult>(device->getLocation()));
  }

  TEST_F(LocatorTest, crossedLocates_RunPipelineOnce) {
    device->locate();
    scanner.complete(twoNetworks());
    pump();
    answerPipeline();
    ASSERT_EQ(agent->state(), LocateState::Idle);
    const auto requestsBefore = http.history.size();

    int agentDone = 0;
    int deviceDone = 0;
    agent->locate(false, [&agentDone] { ++agentDone; }); // asks the device for a fresh scan
    device->locate(true, [&deviceDone] { ++deviceDone; }); // sends its cached scan
    pump();

    ASSERT_EQ(scanner.waiting.size(), 1u);
    answerPipeline();
    EXPECT_EQ(agentDone, 1);
    EXPECT_EQ(deviceDone, 1);

    // the fresh scan the agent asked for lands after its cycle is over
    scanner.complete({ twoNetworks().front() });
    pump();

    EXPECT_EQ(http.history.size(), requestsBefore + 3);
    EXPECT_TRUE(http.pending.empty());
    EXPECT_EQ(agent->state(), LocateState::Idle);
    EXPECT_EQ(device->state(), LocateState::Idle);
    EXPECT_EQ(agentLink.count(protocols::topic::kLocateResult), 2u);

    const auto& cached = agent->agent()->snapshot().cachedObservations;
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(cached->size(), 1u);
  }

  TEST_F(LocatorTest, timezoneKeyRejected_LocationStillReachesDevice) {
    int deviceDone = 0;
    device->locate(true, [&deviceDone] { ++deviceDone; });
    scanner.complete(twoNetworks());
    pump();

    http.respond(200, kGeolocateOk);
    http.respond(200, kGeocodeOk);
    http.respond(400, kKeyInvalid);
    pump();

    EXPECT_EQ(deviceDone, 1);
    EXPECT_TRUE(std::holds_alternative<LocationResult>(agent->getLocation()));
    EXPECT_TRUE(std::holds_alternative<LocationResult>(device->getLocation()));
    EXPECT_TRUE(std::holds_alternative<ReadError>(device->getTimezone()));
    ASSERT_EQ(escalated.size(), 1u);
    EXPECT_NE(escalated[0].find("Timezone: CredentialError"), std::string::npos);
  }

  TEST_F(LocatorTest, noNetworks_DeviceSeesAgentFailure) {
    int deviceDone = 0;
    device->locate(true, [&deviceDone] { ++deviceDone; });
    scanner.complete({});
    pump();

    EXPECT_EQ(deviceDone, 1);
    const auto d = device->getLocation();
    ASSERT_TRUE(std::holds_alternative<ReadError>(d));
    EXPECT_EQ(std::get<ReadError>(d).error, core::messages::kNoNetworks);
    EXPECT_TRUE(escalated.empty());
  }

  TEST_F(LocatorTest, badCredentials_EscalatedOnceAcrossCycles) {
    for (int i = 0; i < 2; ++i) {
      agent->locate(false);
      pump();
      scanner.complete(twoNetworks());
      pump();
      http.respond(400, kKeyInvalid);
      pump();
    }

    EXPECT_EQ(escalated.size(), 1u);
    EXPECT_EQ(errorMonitor->failureCount(), 1u);
    EXPECT_TRUE(std::holds_alternative<ReadError>(device->getLocation()));
  }

  TEST_F(LocatorTest, deviceTimezoneRefresh_RoundTripsThroughAgent) {
    agent->locate();
    pump();
    scanner.complete(twoNetworks());
    pump();
    answerPipeline();

    int done = 0;
    scheduler.nowSeconds += 86400;
    device->refreshTimezone([&done] { ++done; });
    pump();

    ASSERT_EQ(http.pending.size(), 1u);
    EXPECT_NE(http.lastRequest().url.find("timestamp=1700086400"), std::string::npos);
    EXPECT_NE(http.lastRequest().url.find("key=k3"), std::string::npos);
    http.respond(200, kTimezoneOk);
    pump();

    EXPECT_EQ(done, 1);
    const auto tz = device->getTimezone();
    ASSERT_TRUE(std::holds_alternative<TimezoneResult>(tz));
    EXPECT_EQ(std::get<TimezoneResult>(tz).epochTime, 1700086400 - 25200);
  }

  TEST_F(LocatorTest, transientFailure_DeviceKeepsWaitingUntilRetrySucceeds) {
    int deviceDone = 0;
    device->locate(true, [&deviceDone] { ++deviceDone; });
    scanner.complete(twoNetworks());
    pump();

    http.fail("resolve: Host not found");
    pump();
    EXPECT_EQ(deviceDone, 0);
    EXPECT_EQ(device->state(), LocateState::AwaitingGeolocation);

    ASSERT_TRUE(scheduler.runNext());
    answerPipeline();

    EXPECT_EQ(deviceDone, 1);
    EXPECT_TRUE(std::holds_alternative<LocationResult>(device->getLocation()));
  }

} // namespace geoedge::test
