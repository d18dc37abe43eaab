#pragma once

#ifndef AUTO_DISCOVERY_SERVICE_H
#define AUTO_DISCOVERY_SERVICE_H

/**
 * @file AutoDiscoveryService.h
 * @brief 탐색 엔진 외부 진입점 (전체 탐색 / 통합 탐색 / 상세 / 통계 / 캐시)
 * @author HomeLens Development Team
 * @date 2026-10-12
 *
 * 인스턴스마다 자신의 어댑터 레지스트리, 패턴 테이블, 캐시를 가진다.
 */

#include "Discovery/DiscoveryOrchestrator.h"
#include "Discovery/TargetedDiscoveryService.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace HomeLens::Discovery {

class AutoDiscoveryService {
public:
    explicit AutoDiscoveryService(DiscoveryConfig config);
    AutoDiscoveryService(DiscoveryConfig config,
                         std::shared_ptr<DiscoveryAdapterRegistry> adapters,
                         std::shared_ptr<DevicePatternRegistry> patterns);

    /**
     * @brief ConfigManager 설정 + 패턴 카탈로그 + 캡처 파일 어댑터로 구성
     */
    static std::unique_ptr<AutoDiscoveryService> CreateFromConfig();

    ProtocolResultMap DiscoverAllProtocols(const std::vector<std::string>& target_protocols = {});

    std::vector<EnrichedDiscoveryResult>
    DiscoverForIntegration(const std::string& integration_id,
                           std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    std::optional<EnrichedDiscoveryResult> GetDeviceDetails(const std::string& device_id,
                                                            const std::string& discovery_method);

    DiscoveryStatistics GetDiscoveryStatistics() const;
    void ClearCache();

    DiscoveryAdapterRegistry& GetAdapterRegistry() { return *adapters_; }
    DevicePatternRegistry& GetPatternRegistry() { return *patterns_; }
    DiscoveryOrchestrator& GetOrchestrator() { return orchestrator_; }
    const DiscoveryConfig& GetConfig() const { return orchestrator_.GetConfig(); }

private:
    std::shared_ptr<DiscoveryAdapterRegistry> adapters_;
    std::shared_ptr<DevicePatternRegistry> patterns_;
    DiscoveryOrchestrator orchestrator_;
    TargetedDiscoveryService targeted_;
};

} // namespace HomeLens::Discovery

#endif // AUTO_DISCOVERY_SERVICE_H
