#pragma once

#ifndef HOMELENS_DISCOVERY_CONFIG_H
#define HOMELENS_DISCOVERY_CONFIG_H

/**
 * @file DiscoveryConfig.h
 * @brief 탐색 엔진 설정 (ConfigManager DISCOVERY_* 키에서 로드)
 * @author HomeLens Development Team
 * @date 2026-10-12
 */

#include "Common/Enums.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace HomeLens::Discovery {

struct DiscoveryConfig {
  std::chrono::milliseconds discovery_timeout{std::chrono::seconds(30)};
  bool enable_parallel_discovery = true;
  std::chrono::seconds cache_duration{300};
  std::vector<std::string> default_protocols{"mdns", "upnp", "dhcp",
                                             "bluetooth", "zigbee"};
  std::string pattern_file;
  std::string capture_file;

  Enums::DiscoveryMode GetMode() const {
    return enable_parallel_discovery ? Enums::DiscoveryMode::PARALLEL
                                     : Enums::DiscoveryMode::SEQUENTIAL;
  }

  /**
   * @brief ConfigManager 에서 읽기. 잘못된 값은 기본값 + WARN 로그.
   */
  static DiscoveryConfig FromConfigManager();

  nlohmann::json toJson() const;
};

} // namespace HomeLens::Discovery

#endif // HOMELENS_DISCOVERY_CONFIG_H
