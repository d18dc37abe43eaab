#pragma once

#ifndef HOMELENS_DISCOVERY_DEVICE_PATTERN_REGISTRY_H
#define HOMELENS_DISCOVERY_DEVICE_PATTERN_REGISTRY_H

/**
 * @file DevicePatternRegistry.h
 * @brief 디바이스 패턴 테이블 (선언 순서 유지 = 동점 시 우선순위)
 * @author HomeLens Development Team
 * @date 2026-10-12
 */

#include "Discovery/DiscoveryTypes.h"

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace HomeLens::Discovery {

class DevicePatternRegistry {
public:
  DevicePatternRegistry() = default;

  /**
   * @brief 내장 패턴 (hue, nest, ring, sonos, roku, tesla) 이 등록된 레지스트리
   */
  static std::shared_ptr<DevicePatternRegistry> CreateDefault();
  static std::vector<DevicePattern> BuiltinPatterns();

  /**
   * @brief 같은 id 가 있으면 그 자리에서 교체, 없으면 뒤에 추가
   */
  void RegisterPattern(DevicePattern pattern);
  bool RemovePattern(const std::string &pattern_id);

  std::optional<DevicePattern> GetPattern(const std::string &pattern_id) const;
  std::vector<DevicePattern> GetPatterns() const;
  size_t Size() const;

  /**
   * @brief JSON 카탈로그 로드 ({"patterns": {"id": {...}}} 또는 {"id": {...}})
   * @return 실패 시 false (기존 테이블 유지)
   */
  bool LoadFromFile(const std::string &path);
  bool LoadFromJson(const json &catalogue);

private:
  mutable std::shared_mutex mutex_;
  std::vector<DevicePattern> patterns_;
};

} // namespace HomeLens::Discovery

#endif // HOMELENS_DISCOVERY_DEVICE_PATTERN_REGISTRY_H
