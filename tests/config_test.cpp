// GeoEdge-Prod headers
#include "core/ApiKeySet.hpp"
#include "core/ConfigLoader.hpp"
#include "core/NodeConfig.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>
#include <unistd.h>

namespace geoedge::test {

  using core::ApiKeySet;
  using core::ConfigLoader;
  using core::NodeConfig;
  using core::Role;

  // ---- ApiKeySet -----------------------------------------------------------------

  TEST(ApiKeySet, sharedKeyFillsAllSlots) {
    ApiKeySet keys("abc");
    EXPECT_EQ(keys.geolocationKey(), "abc");
    EXPECT_EQ(keys.geocodingKey(), "abc");
    EXPECT_EQ(keys.timezoneKey(), "abc");
  }

  TEST(ApiKeySet, emptyKeyIsRejectedAtConstruction) {
    EXPECT_THROW(ApiKeySet(""), std::invalid_argument);
    EXPECT_THROW(ApiKeySet("a", "", "c"), std::invalid_argument);
  }

  TEST(ApiKeySet, fromJsonReadsEitherForm) {
    auto single = ApiKeySet::fromJson(nlohmann::json{ { "apiKey", "one" } });
    EXPECT_EQ(single.timezoneKey(), "one");

    auto split = ApiKeySet::fromJson(nlohmann::json::parse(
        R"({"apiKeys":{"geolocation":"g","geocoding":"c","timezone":"t"}})"));
    EXPECT_EQ(split.geolocationKey(), "g");
    EXPECT_EQ(split.geocodingKey(), "c");
    EXPECT_EQ(split.timezoneKey(), "t");
  }

  TEST(ApiKeySet, fromJsonRejectsMissingOrMistypedKeys) {
    EXPECT_THROW(ApiKeySet::fromJson(nlohmann::json::object()), std::invalid_argument);
    EXPECT_THROW(ApiKeySet::fromJson(nlohmann::json{ { "apiKey", 42 } }), std::invalid_argument);
    EXPECT_THROW(ApiKeySet::fromJson(nlohmann::json::parse(R"({"apiKeys":{"geolocation":"g"}})")),
                 std::invalid_argument);
    EXPECT_THROW(ApiKeySet::fromJson(nlohmann::json{ { "apiKey", "" } }), std::invalid_argument);
  }

  // ---- NodeConfig ------------------------------------------------------------------

  TEST(NodeConfig, deviceDefaults) {
    const auto cfg = NodeConfig::fromJson(nlohmann::json{ { "role", "device" } });
    EXPECT_EQ(cfg.role, Role::Device);
    EXPECT_FALSE(cfg.keys.has_value());
    EXPECT_FALSE(cfg.debug);
    EXPECT_EQ(cfg.serialDevice, "/dev/ttyUSB0");
    EXPECT_EQ(cfg.baud, 115200);
    EXPECT_EQ(cfg.wifiInterface, "wlan0");
  }

  TEST(NodeConfig, agentNeedsKeys) {
    EXPECT_THROW(NodeConfig::fromJson(nlohmann::json{ { "role", "agent" } }),
                 std::invalid_argument);

    const auto cfg = NodeConfig::fromJson(nlohmann::json::parse(R"({
      "role": "agent",
      "apiKey": "secret",
      "debug": true,
      "serialDevice": "/dev/ttyAMA0",
      "baud": 57600,
      "endpoints": { "timezone": "https://localhost:8443/tz" }
    })"));
    EXPECT_EQ(cfg.role, Role::Agent);
    ASSERT_TRUE(cfg.keys.has_value());
    EXPECT_EQ(cfg.keys->geocodingKey(), "secret");
    EXPECT_TRUE(cfg.debug);
    EXPECT_EQ(cfg.serialDevice, "/dev/ttyAMA0");
    EXPECT_EQ(cfg.baud, 57600);
    EXPECT_EQ(cfg.endpoints.timezone, "https://localhost:8443/tz");
    EXPECT_EQ(cfg.endpoints.geocoding, core::ProviderEndpoints{}.geocoding);
  }

  TEST(NodeConfig, rejectsSchemaViolations) {
    EXPECT_THROW(NodeConfig::fromJson(nlohmann::json::array()), std::invalid_argument);
    EXPECT_THROW(NodeConfig::fromJson(nlohmann::json::object()), std::invalid_argument);
    EXPECT_THROW(NodeConfig::fromJson(nlohmann::json{ { "role", "relay" } }),
                 std::invalid_argument);
    EXPECT_THROW(NodeConfig::fromJson(nlohmann::json{ { "role", "device" }, { "baud", "fast" } }),
                 std::invalid_argument);
    EXPECT_THROW(NodeConfig::fromJson(nlohmann::json{ { "role", "device" }, { "serialDevice", "" } }),
                 std::invalid_argument);
    EXPECT_THROW(NodeConfig::fromJson(nlohmann::json{ { "role", "device" }, { "endpoints", 3 } }),
                 std::invalid_argument);
  }

  TEST(NodeConfig, wifiInterfaceMustBeAPlainName) {
    EXPECT_NO_THROW(NodeConfig::fromJson(
        nlohmann::json{ { "role", "device" }, { "wifiInterface", "wlp2s0" } }));
    EXPECT_THROW(NodeConfig::fromJson(
                     nlohmann::json{ { "role", "device" }, { "wifiInterface", "wlan0; reboot" } }),
                 std::invalid_argument);
    EXPECT_THROW(NodeConfig::fromJson(
                     nlohmann::json{ { "role", "device" }, { "wifiInterface", "" } }),
                 std::invalid_argument);
  }

  TEST(NodeConfig, roleNames) {
    EXPECT_STREQ(core::toString(Role::Agent), "agent");
    EXPECT_STREQ(core::toString(Role::Device), "device");
  }

  // ---- ConfigLoader ----------------------------------------------------------------

  class ConfigLoaderTest : public ::testing::Test {
  protected:
    void TearDown() override {
      if (!path.empty())
        std::remove(path.c_str());
    }

    void writeConfig(const std::string& text) {
      char tmpl[] = "/tmp/geoedge-config-XXXXXX";
      const int fd = mkstemp(tmpl);
      ASSERT_GE(fd, 0);
      close(fd);
      path = tmpl;
      std::ofstream(path) << text;
    }

    std::string path;
  };

  TEST_F(ConfigLoaderTest, loadsNodeConfigFromFile) {
    writeConfig(R"({"role":"device","wifiInterface":"wlan1"})");

    const auto cfg = ConfigLoader(path).loadNodeConfig();
    EXPECT_EQ(cfg.role, Role::Device);
    EXPECT_EQ(cfg.wifiInterface, "wlan1");
  }

  TEST_F(ConfigLoaderTest, missingFileThrowsRuntimeError) {
    EXPECT_THROW(ConfigLoader("/nonexistent/geoedge.json").load(), std::runtime_error);
  }

  TEST_F(ConfigLoaderTest, invalidJsonThrowsRuntimeError) {
    writeConfig("{ role: device");
    EXPECT_THROW(ConfigLoader(path).load(), std::runtime_error);
  }

  TEST_F(ConfigLoaderTest, schemaErrorSurfacesAsInvalidArgument) {
    writeConfig(R"({"role":"agent"})");
    EXPECT_THROW(ConfigLoader(path).loadNodeConfig(), std::invalid_argument);
  }

} // namespace geoedge::test
