/* @file ConfigLoader.cpp
 * @brief config file loading and node schema validation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

// 3rd-party headers
#include <nlohmann/json.hpp>

// GeoEdge headers
#include "core/ConfigLoader.hpp"
#include "core/NodeConfig.hpp"

namespace geoedge {
  namespace core {

    namespace {
      template <typename T>
      std::optional<T> optionalField(const nlohmann::json& doc, const char* name) {
        auto it = doc.find(name);
        if (it == doc.end() || it->is_null())
          return std::nullopt;
        try {
          return it->get<T>();
        } catch (const nlohmann::json::type_error&) {
          throw std::invalid_argument(std::string("[NodeConfig] field '") + name +
                                      "' has the wrong type");
        }
      }

      // interface name is spliced into the iw command line
      bool isInterfaceName(const std::string& name) {
        return !name.empty() && name.size() < 16 &&
               std::all_of(name.begin(), name.end(), [](unsigned char c) {
                 return std::isalnum(c) || c == '-' || c == '_' || c == '.';
               });
      }
    } // namespace

    ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

    nlohmann::json ConfigLoader::load() const {
      std::ifstream in(path_);
      if (!in)
        throw std::runtime_error("[ConfigLoader] cannot open " + path_);

      try {
        return nlohmann::json::parse(in);
      } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("[ConfigLoader] " + path_ + ": " + e.what());
      }
    }

    NodeConfig ConfigLoader::loadNodeConfig() const { return NodeConfig::fromJson(load()); }

    NodeConfig NodeConfig::fromJson(const nlohmann::json& doc) {
      if (!doc.is_object())
        throw std::invalid_argument("[NodeConfig] configuration is not a JSON object");

      NodeConfig cfg;
      const auto role = optionalField<std::string>(doc, "role");
      if (!role)
        throw std::invalid_argument("[NodeConfig] missing 'role'");
      if (*role == "agent")
        cfg.role = Role::Agent;
      else if (*role == "device")
        cfg.role = Role::Device;
      else
        throw std::invalid_argument("[NodeConfig] unknown role '" + *role + "'");

      if (cfg.role == Role::Agent)
        cfg.keys = ApiKeySet::fromJson(doc);

      cfg.debug = optionalField<bool>(doc, "debug").value_or(false);
      cfg.serialDevice = optionalField<std::string>(doc, "serialDevice").value_or(cfg.serialDevice);
      cfg.baud = optionalField<int>(doc, "baud").value_or(cfg.baud);
      cfg.wifiInterface =
          optionalField<std::string>(doc, "wifiInterface").value_or(cfg.wifiInterface);

      if (cfg.serialDevice.empty())
        throw std::invalid_argument("[NodeConfig] 'serialDevice' is empty");
      if (cfg.role == Role::Device && !isInterfaceName(cfg.wifiInterface))
        throw std::invalid_argument("[NodeConfig] invalid 'wifiInterface' " + cfg.wifiInterface);

      if (auto ep = doc.find("endpoints"); ep != doc.end()) {
        if (!ep->is_object())
          throw std::invalid_argument("[NodeConfig] 'endpoints' must be an object");
        cfg.endpoints.geolocation =
            optionalField<std::string>(*ep, "geolocation").value_or(cfg.endpoints.geolocation);
        cfg.endpoints.geocoding =
            optionalField<std::string>(*ep, "geocoding").value_or(cfg.endpoints.geocoding);
        cfg.endpoints.timezone =
            optionalField<std::string>(*ep, "timezone").value_or(cfg.endpoints.timezone);
      }
      return cfg;
    }

  } // namespace core
} // namespace geoedge
