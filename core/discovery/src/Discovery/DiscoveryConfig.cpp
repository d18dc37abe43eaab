/**
 * @file DiscoveryConfig.cpp
 * @brief ConfigManager -> DiscoveryConfig 변환
 */

#include "Discovery/DiscoveryConfig.h"
#include "Common/Constants.h"
#include "Logging/LogManager.h"
#include "Utils/ConfigManager.h"

#include <algorithm>

namespace HomeLens::Discovery {

namespace {

int ReadBoundedInt(ConfigManager &config, const std::string &key,
                   int default_value, int min_value, int max_value) {
  std::string raw = config.get(key);
  if (raw.empty())
    return default_value;

  int value = config.getInt(key, min_value - 1);
  if (value < min_value || value > max_value) {
    LogManager::getInstance().Warn("Invalid {}='{}', using default {}", key,
                                   raw, default_value);
    return default_value;
  }
  return value;
}

} // namespace

DiscoveryConfig DiscoveryConfig::FromConfigManager() {
  auto &config = ConfigManager::getInstance();
  DiscoveryConfig result;

  int timeout_sec = ReadBoundedInt(config, "DISCOVERY_TIMEOUT_SEC",
                                   Constants::DEFAULT_DISCOVERY_TIMEOUT_SEC, 1,
                                   Constants::MAX_DISCOVERY_TIMEOUT_SEC);
  result.discovery_timeout = std::chrono::seconds(timeout_sec);

  result.enable_parallel_discovery = config.getBool("DISCOVERY_PARALLEL", true);

  // 0 이면 캐시 비활성화
  int cache_sec = ReadBoundedInt(config, "DISCOVERY_CACHE_DURATION_SEC",
                                 Constants::DEFAULT_CACHE_DURATION_SEC, 0,
                                 24 * 3600);
  result.cache_duration = std::chrono::seconds(cache_sec);

  auto protocols = config.getList(
      "DISCOVERY_PROTOCOLS", std::string(Constants::DEFAULT_PROTOCOL_LIST));
  for (auto &protocol : protocols) {
    std::transform(protocol.begin(), protocol.end(), protocol.begin(),
                   ::tolower);
  }
  if (!protocols.empty())
    result.default_protocols = protocols;

  result.pattern_file = config.get("DISCOVERY_PATTERN_FILE");
  result.capture_file = config.get("DISCOVERY_CAPTURE_FILE");
  return result;
}

nlohmann::json DiscoveryConfig::toJson() const {
  nlohmann::json j;
  j["discovery_timeout_ms"] = discovery_timeout.count();
  j["enable_parallel_discovery"] = enable_parallel_discovery;
  j["cache_duration_sec"] = cache_duration.count();
  j["default_protocols"] = default_protocols;
  j["pattern_file"] = pattern_file;
  j["capture_file"] = capture_file;
  return j;
}

} // namespace HomeLens::Discovery
