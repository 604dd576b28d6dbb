/* @file ApiKeySet.cpp
 * @brief key validation for the provider credentials
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// 3rd-party headers
#include <nlohmann/json.hpp>

// GeoEdge headers
#include "core/ApiKeySet.hpp"

using namespace geoedge::core;

namespace {
  std::string requireKey(std::string key, const char* slot) {
    if (key.empty())
      throw std::invalid_argument(std::string("[ApiKeySet] empty API key for ") + slot);
    return key;
  }

  std::string keyField(const nlohmann::json& table, const char* slot) {
    auto it = table.find(slot);
    if (it == table.end() || !it->is_string())
      throw std::invalid_argument(std::string("[ApiKeySet] apiKeys.") + slot +
                                  " missing or not a string");
    return it->get<std::string>();
  }
} // namespace

ApiKeySet::ApiKeySet(const std::string& sharedKey)
    : ApiKeySet(sharedKey, sharedKey, sharedKey) {}

ApiKeySet::ApiKeySet(std::string geolocationKey, std::string geocodingKey,
                     std::string timezoneKey)
    : geolocation_(requireKey(std::move(geolocationKey), "geolocation")),
      geocoding_(requireKey(std::move(geocodingKey), "geocoding")),
      timezone_(requireKey(std::move(timezoneKey), "timezone")) {}

ApiKeySet ApiKeySet::fromJson(const nlohmann::json& config) {
  if (!config.is_object())
    throw std::invalid_argument("[ApiKeySet] configuration is not a JSON object");

  if (auto table = config.find("apiKeys"); table != config.end()) {
    if (!table->is_object())
      throw std::invalid_argument("[ApiKeySet] apiKeys must be an object");
    return ApiKeySet(keyField(*table, "geolocation"), keyField(*table, "geocoding"),
                     keyField(*table, "timezone"));
  }

  auto single = config.find("apiKey");
  if (single == config.end())
    throw std::invalid_argument("[ApiKeySet] no apiKey or apiKeys in configuration");
  if (!single->is_string())
    throw std::invalid_argument("[ApiKeySet] apiKey must be a string");
  return ApiKeySet(single->get<std::string>());
}
