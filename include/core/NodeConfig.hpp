#pragma once
/** @file  NodeConfig.hpp
 *  @brief Validated per-node settings (role, credentials, link, scan interface).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/ApiKeySet.hpp"

namespace geoedge::core {

  enum class Role { Agent, Device };

  inline const char* toString(Role r) { return r == Role::Agent ? "agent" : "device"; }

  struct NodeConfig {
    Role role{ Role::Device };
    std::optional<ApiKeySet> keys; ///< always set for Role::Agent
    ProviderEndpoints endpoints{};
    bool debug{ false };
    std::string serialDevice{ "/dev/ttyUSB0" };
    int baud{ 115200 };
    std::string wifiInterface{ "wlan0" }; ///< device only

    /// Throws `std::invalid_argument` describing the first schema violation.
    static NodeConfig fromJson(const nlohmann::json& doc);
  };

} // namespace geoedge::core
