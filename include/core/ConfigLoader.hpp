#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads the node configuration (JSON) from the host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include <nlohmann/json_fwd.hpp>

namespace geoedge::core {

  struct NodeConfig;

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and hands the parsed object to the caller.
 *
 *  * No caching: every call to `load()` re-reads the file.
 *  * Schema validation lives in NodeConfig::fromJson.
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on the host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file into a nlohmann::json object or throw `std::runtime_error`.
    nlohmann::json load() const;

    /// load() + NodeConfig::fromJson(); throws `std::invalid_argument` on schema errors.
    NodeConfig loadNodeConfig() const;

  private:
    std::string path_;
  };

} // namespace geoedge::core
