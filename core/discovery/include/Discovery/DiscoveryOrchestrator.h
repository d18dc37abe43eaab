#pragma once

#ifndef DISCOVERY_ORCHESTRATOR_H
#define DISCOVERY_ORCHESTRATOR_H

/**
 * @file DiscoveryOrchestrator.h
 * @brief 전체 프로토콜 탐색 사이클 (어댑터 -> 정규화 -> 상관 -> 패턴 -> 캐시)
 * @author HomeLens Development Team
 * @date 2026-10-12
 */

#include "Discovery/AdapterTaskGroup.h"
#include "Discovery/DevicePatternRegistry.h"
#include "Discovery/DiscoveryAdapterRegistry.h"
#include "Discovery/DiscoveryCache.h"
#include "Discovery/DiscoveryConfig.h"
#include "Discovery/EntityCorrelator.h"
#include "Discovery/PatternMatcher.h"
#include "Discovery/ResultNormalizer.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace HomeLens::Discovery {

class DiscoveryOrchestrator {
public:
    DiscoveryOrchestrator(DiscoveryConfig config,
                          std::shared_ptr<DiscoveryAdapterRegistry> adapters,
                          std::shared_ptr<const DevicePatternRegistry> patterns);

    DiscoveryOrchestrator(const DiscoveryOrchestrator&) = delete;
    DiscoveryOrchestrator& operator=(const DiscoveryOrchestrator&) = delete;

    /**
     * @brief 요청한 프로토콜 전체 탐색
     * @param protocols 비어 있으면 설정의 default_protocols
     * @return 요청 순서의 프로토콜별 결과. 실패/타임아웃/미등록 프로토콜은 빈 목록.
     * @details 유효한 캐시에 요청한 프로토콜이 모두 있으면 캐시에서 반환한다.
     *          예외를 던지지 않으며 discovery_timeout + 여유 시간 안에 반환한다.
     */
    ProtocolResultMap DiscoverAll(const std::vector<std::string>& protocols = {});

    /**
     * @brief 어댑터 결과를 정규화/상관/패턴 단계로 처리 (캐시는 건드리지 않음)
     */
    ProtocolResultMap ProcessOutcomes(const std::vector<AdapterOutcome>& outcomes,
                                      Timestamp observed_at) const;

    /**
     * @brief 캐시에서 디바이스 조회 후 mdns/upnp 어댑터 상세 정보 첨부
     */
    std::optional<EnrichedDiscoveryResult> GetDeviceDetails(const std::string& device_id,
                                                            const std::string& discovery_method);

    DiscoveryStatistics GetDiscoveryStatistics() const;
    void ClearCache();

    std::vector<AdapterOutcome> GetLastOutcomes() const;
    uint64_t GetScanCount() const { return scan_count_.load(); }
    const DiscoveryConfig& GetConfig() const { return config_; }
    const DiscoveryCache& GetCache() const { return cache_; }

    /**
     * @brief 소문자/공백 정리, 중복 제거 (첫 등장 순서 유지)
     */
    static std::vector<std::string> NormalizeProtocolList(const std::vector<std::string>& protocols);

private:
    std::vector<AdapterOutcome> RunAdapters(const std::vector<std::string>& protocols);
    void LogOutcome(const AdapterOutcome& outcome) const;

    static std::optional<ProtocolResultMap> SelectProtocols(const ProtocolResultMap& cached,
                                                            const std::vector<std::string>& protocols);

    DiscoveryConfig config_;
    std::shared_ptr<DiscoveryAdapterRegistry> adapters_;
    std::shared_ptr<const DevicePatternRegistry> patterns_;

    ResultNormalizer normalizer_;
    EntityCorrelator correlator_;
    PatternMatcher matcher_;
    DiscoveryCache cache_;

    mutable std::mutex outcomes_mutex_;
    std::vector<AdapterOutcome> last_outcomes_;
    std::atomic<uint64_t> scan_count_{0};
};

} // namespace HomeLens::Discovery

#endif // DISCOVERY_ORCHESTRATOR_H
