// GeoEdge-Prod headers
#include "core/EdgeDevice.hpp"
#include "core/Logger.hpp"
#include "protocols/Message.hpp"

// GeoEdge-Fake headers
#include "FakeTransport.hpp"
#include "FakeWifiScanner.hpp"
#include "ProviderBodies.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <sstream>

namespace geoedge::test {

  using core::EdgeDevice;
  using core::LocateState;
  using protocols::LocationResult;
  using protocols::ReadError;
  using protocols::TimezoneResult;
  namespace topic = protocols::topic;

  class EdgeDeviceTest : public ::testing::Test {
  protected:
    nlohmann::json agentResult() const {
      protocols::LocationResult loc;
      loc.latitude = 37.1;
      loc.longitude = -122.1;
      loc.placeData = nlohmann::json::parse(kGeocodeOk)["results"];

      protocols::TimezoneResult tz;
      tz.epochTime = 1699974800;
      tz.gmtOffsetSeconds = -25200;
      tz.offsetLabel = "GMT-7";
      tz.localDateLabel = "2023-11-14 15:13:20";
      return protocols::makeLocatePayload(loc, tz);
    }

    std::ostringstream logSink;
    core::Logger log{ true, logSink };
    FakeTransport transport;
    FakeWifiScanner scanner;
    EdgeDevice device{ transport, scanner, log };
    int completions = 0;
  };

  TEST_F(EdgeDeviceTest, locate_ScansAndForwardsToAgent) {
    device.locate(true, [this] { ++completions; });

    EXPECT_EQ(scanner.scans_requested, 1);
    EXPECT_EQ(device.state(), LocateState::AwaitingScan);

    scanner.complete(twoNetworks());

    const auto* sent = transport.last(topic::kScanResult);
    ASSERT_NE(sent, nullptr);
    EXPECT_EQ(sent->payload["initiator"], "device");
    const auto& observations = sent->payload["observations"];
    ASSERT_EQ(observations.size(), 2u);
    EXPECT_EQ(observations[0]["bssid"], "00:11:22:33:44:55");
    EXPECT_EQ(observations[0]["rssi"], -48);
    EXPECT_EQ(device.state(), LocateState::AwaitingGeolocation);
    EXPECT_EQ(completions, 0);
  }

  TEST_F(EdgeDeviceTest, locateResult_ReplicatesAgentData) {
    device.locate(true, [this] { ++completions; });
    scanner.complete(twoNetworks());

    ASSERT_TRUE(transport.inject(topic::kLocateResult, agentResult()));

    EXPECT_EQ(device.state(), LocateState::Idle);
    EXPECT_EQ(completions, 1);

    const auto location = device.getLocation();
    ASSERT_TRUE(std::holds_alternative<LocationResult>(location));
    EXPECT_DOUBLE_EQ(std::get<LocationResult>(location).latitude, 37.1);
    EXPECT_DOUBLE_EQ(std::get<LocationResult>(location).longitude, -122.1);
    EXPECT_EQ(std::get<LocationResult>(location).placeData[0]["formatted_address"],
              "1 Infinite Loop, Cupertino");

    const auto tz = device.getTimezone();
    ASSERT_TRUE(std::holds_alternative<TimezoneResult>(tz));
    EXPECT_EQ(std::get<TimezoneResult>(tz).offsetLabel, "GMT-7");
    EXPECT_EQ(std::get<TimezoneResult>(tz).localDateLabel, "2023-11-14 15:13:20");
  }

  TEST_F(EdgeDeviceTest, locate_IgnoredWhileCycleInFlight) {
    int second = 0;
    device.locate(true, [this] { ++completions; });
    device.locate(true, [&second] { ++second; });

    EXPECT_EQ(scanner.scans_requested, 1);
    scanner.complete(twoNetworks());
    transport.inject(topic::kLocateResult, agentResult());

    EXPECT_EQ(completions, 1);
    EXPECT_EQ(second, 0);
  }

  TEST_F(EdgeDeviceTest, locate_ReusesCachedScan) {
    device.locate();
    scanner.complete(twoNetworks());
    transport.inject(topic::kLocateResult, agentResult());

    device.locate(true);

    EXPECT_EQ(scanner.scans_requested, 1);
    EXPECT_EQ(transport.count(topic::kScanResult), 2u);
    EXPECT_EQ(transport.last(topic::kScanResult)->payload["initiator"], "device");
    EXPECT_EQ(device.state(), LocateState::AwaitingGeolocation);
  }

  TEST_F(EdgeDeviceTest, locate_FreshScanWhenUsePreviousFalse) {
    device.locate();
    scanner.complete(twoNetworks());
    transport.inject(topic::kLocateResult, agentResult());

    device.locate(false);

    EXPECT_EQ(scanner.scans_requested, 2);
  }

  TEST_F(EdgeDeviceTest, emptyScan_IsForwardedButNotCached) {
    device.locate();
    scanner.complete({});

    const auto* sent = transport.last(topic::kScanResult);
    ASSERT_NE(sent, nullptr);
    EXPECT_TRUE(sent->payload["observations"].is_array());
    EXPECT_TRUE(sent->payload["observations"].empty());
    EXPECT_FALSE(device.snapshot().cachedScan.has_value());
  }

  TEST_F(EdgeDeviceTest, requestScan_FromAgentScansWithoutLocalCycle) {
    ASSERT_TRUE(transport.inject(topic::kRequestScan, true));
    EXPECT_EQ(scanner.scans_requested, 1);

    scanner.complete(twoNetworks());

    EXPECT_EQ(transport.count(topic::kScanResult), 1u);
    EXPECT_EQ(transport.last(topic::kScanResult)->payload["initiator"], "agent");
    EXPECT_EQ(device.state(), LocateState::Idle);

    // agent pushes the result of the cycle it started
    transport.inject(topic::kLocateResult, agentResult());
    EXPECT_TRUE(std::holds_alternative<LocationResult>(device.getLocation()));
    EXPECT_EQ(completions, 0);
  }

  TEST_F(EdgeDeviceTest, requestScan_WhileScanningDoesNotStackScans) {
    device.locate();
    transport.inject(topic::kRequestScan, true);

    EXPECT_EQ(scanner.scans_requested, 1);
  }

  TEST_F(EdgeDeviceTest, requestScan_FinishingAfterLocalCycleIsTaggedForAgent) {
    device.locate();
    scanner.complete(twoNetworks());
    transport.inject(topic::kLocateResult, agentResult());

    // agent asks for a scan, then a cached local cycle ends before it completes
    transport.inject(topic::kRequestScan, true);
    device.locate(true);
    transport.inject(topic::kLocateResult, agentResult());
    ASSERT_EQ(device.state(), LocateState::Idle);
    ASSERT_EQ(scanner.scans_requested, 2);

    scanner.complete(twoNetworks());

    ASSERT_EQ(transport.count(topic::kScanResult), 3u);
    EXPECT_EQ(transport.last(topic::kScanResult)->payload["initiator"], "agent");
  }

  TEST_F(EdgeDeviceTest, locateResult_ErrorIsReportedToCaller) {
    device.locate(true, [this] { ++completions; });
    scanner.complete({});
    transport.inject(topic::kLocateResult, nlohmann::json{ { "error", "No WiFi networks available" } });

    EXPECT_EQ(completions, 1);
    const auto location = device.getLocation();
    ASSERT_TRUE(std::holds_alternative<ReadError>(location));
    EXPECT_EQ(std::get<ReadError>(location).error, "No WiFi networks available");
  }

  TEST_F(EdgeDeviceTest, locateResult_WithoutTimezoneLeavesTimezoneUnset) {
    device.locate();
    scanner.complete(twoNetworks());

    auto payload = agentResult();
    payload["timezoneData"] = nullptr;
    transport.inject(topic::kLocateResult, payload);

    EXPECT_TRUE(std::holds_alternative<LocationResult>(device.getLocation()));
    EXPECT_TRUE(std::holds_alternative<ReadError>(device.getTimezone()));
  }

  TEST_F(EdgeDeviceTest, locateResult_MalformedPayloadStillEndsCycle) {
    device.locate(true, [this] { ++completions; });
    scanner.complete(twoNetworks());
    transport.inject(topic::kLocateResult, "garbage");

    EXPECT_EQ(device.state(), LocateState::Idle);
    EXPECT_EQ(completions, 1);
    EXPECT_TRUE(std::holds_alternative<ReadError>(device.getLocation()));
  }

  TEST_F(EdgeDeviceTest, getLocation_ReportsLocatingDuringCycle) {
    auto before = device.getLocation();
    ASSERT_TRUE(std::holds_alternative<ReadError>(before));
    EXPECT_EQ(std::get<ReadError>(before).error, core::messages::kNeverLocated);

    device.locate();
    auto during = device.getLocation();
    ASSERT_TRUE(std::holds_alternative<ReadError>(during));
    EXPECT_EQ(std::get<ReadError>(during).error, core::messages::kLocating);
  }

  TEST_F(EdgeDeviceTest, refreshTimezone_AsksAgentAndWaits) {
    int done = 0;
    device.refreshTimezone([&done] { ++done; });
    device.refreshTimezone([&done] { done += 100; });

    EXPECT_EQ(transport.count(topic::kRequestTimezone), 1u);
    auto pending = device.getTimezone();
    ASSERT_TRUE(std::holds_alternative<ReadError>(pending));
    EXPECT_EQ(std::get<ReadError>(pending).error, core::messages::kTimezonePending);

    transport.inject(topic::kTimezoneResult, agentResult()["timezoneData"]);

    EXPECT_EQ(done, 1);
    const auto tz = device.getTimezone();
    ASSERT_TRUE(std::holds_alternative<TimezoneResult>(tz));
    EXPECT_EQ(std::get<TimezoneResult>(tz).gmtOffsetSeconds, -25200);
  }

  TEST_F(EdgeDeviceTest, timezoneResult_ErrorReplacesReplica) {
    device.refreshTimezone();
    transport.inject(topic::kTimezoneResult,
                     nlohmann::json{ { "error", core::messages::kTimezoneNeedsLocation } });

    const auto tz = device.getTimezone();
    ASSERT_TRUE(std::holds_alternative<ReadError>(tz));
    EXPECT_EQ(std::get<ReadError>(tz).error, core::messages::kTimezoneNeedsLocation);
  }

} // namespace geoedge::test
