#pragma once

#ifndef HOMELENS_DISCOVERY_PATTERN_MATCHER_H
#define HOMELENS_DISCOVERY_PATTERN_MATCHER_H

/**
 * @file PatternMatcher.h
 * @brief DiscoveryResult 와 DevicePattern 테이블 점수 비교
 * @author HomeLens Development Team
 * @date 2026-10-12
 *
 * 점수 (최대 1.0):
 *   +0.4  제조사 키워드가 manufacturer 또는 name 에 포함
 *   +0.3  모델 키워드가 model 또는 name 에 포함
 *   +0.3  properties 에 패턴의 mDNS 서비스 / UPnP 타입 문자열 존재
 * 0.3 초과인 최고 점수 패턴만 채택 (동점이면 먼저 선언된 패턴)
 */

#include "Discovery/DevicePatternRegistry.h"
#include "Discovery/DiscoveryTypes.h"

#include <memory>
#include <optional>

namespace HomeLens::Discovery {

class PatternMatcher {
public:
  explicit PatternMatcher(std::shared_ptr<const DevicePatternRegistry> patterns);

  std::optional<PatternMatch> Match(const DiscoveryResult &result) const;

  /**
   * @brief 매치가 있으면 pattern_match 와 confidence_score 설정
   * @return 매치 여부
   */
  bool Apply(EnrichedDiscoveryResult &enriched) const;

  static double ScorePattern(const DiscoveryResult &result,
                             const DevicePattern &pattern);

  static bool HasServiceEvidence(const json &properties,
                                 const std::string &service);

private:
  std::shared_ptr<const DevicePatternRegistry> patterns_;
};

} // namespace HomeLens::Discovery

#endif // HOMELENS_DISCOVERY_PATTERN_MATCHER_H
