#pragma once

#ifndef HOMELENS_DISCOVERY_ENTITY_CORRELATOR_H
#define HOMELENS_DISCOVERY_ENTITY_CORRELATOR_H

/**
 * @file EntityCorrelator.h
 * @brief 프로토콜 간 동일 디바이스 추정 및 정보 병합
 * @author HomeLens Development Team
 * @date 2026-10-12
 *
 * 그룹화는 seed 기준 1-hop 이다. A~B, B~C 이고 A!~C 이면 C 는 A 그룹에
 * 들어가지 않는다 (이행적 병합 없음). 입력 순서가 결과를 결정한다.
 */

#include "Discovery/DiscoveryTypes.h"

#include <map>
#include <string>
#include <vector>

namespace HomeLens::Discovery {

class EntityCorrelator {
public:
  /**
   * @brief 입력 순서대로 seed 를 잡아 그룹 생성
   * @return seed 순서의 그룹 목록 (키는 모두 유일)
   */
  std::vector<CorrelationGroup>
  Correlate(const std::vector<DiscoveryResult> &results) const;

  /**
   * @brief 그룹 정보를 반영한 보강 결과 (입력과 같은 순서/개수)
   */
  std::vector<EnrichedDiscoveryResult>
  Enrich(const std::vector<DiscoveryResult> &results,
         const std::vector<CorrelationGroup> &groups) const;

  static EnrichedDiscoveryResult
  MergeDeviceInformation(const DiscoveryResult &member,
                         const CorrelationGroup &group);

  /**
   * @brief 두 결과가 같은 물리 디바이스로 보이는지
   * @details ip 일치 -> mac 일치(대소문자 무시) -> 이름 유사도 > 0.8
   *          -> 제조사+모델 일치 순으로 판단
   */
  static bool AreRelated(const DiscoveryResult &a, const DiscoveryResult &b);

  /**
   * @brief 소문자 공백 분리 단어 집합의 Jaccard 유사도 (0.0 ~ 1.0)
   */
  static double CalculateNameSimilarity(const std::string &a,
                                        const std::string &b);

  static std::string GenerateCorrelationKey(const DiscoveryResult &result);

  static std::map<std::string, CorrelationGroup>
  ToMap(const std::vector<CorrelationGroup> &groups);

  static bool IsPlaceholderName(const std::string &name);
};

} // namespace HomeLens::Discovery

#endif // HOMELENS_DISCOVERY_ENTITY_CORRELATOR_H
