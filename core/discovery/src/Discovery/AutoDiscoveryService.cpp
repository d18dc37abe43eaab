/**
 * @file AutoDiscoveryService.cpp
 * @brief 탐색 엔진 진입점 구현
 */

#include "Discovery/AutoDiscoveryService.h"
#include "Discovery/Adapters/ReplayDiscoveryAdapter.h"
#include "Logging/LogManager.h"

namespace HomeLens::Discovery {

AutoDiscoveryService::AutoDiscoveryService(DiscoveryConfig config)
    : AutoDiscoveryService(std::move(config), nullptr, nullptr) {}

AutoDiscoveryService::AutoDiscoveryService(DiscoveryConfig config,
                                           std::shared_ptr<DiscoveryAdapterRegistry> adapters,
                                           std::shared_ptr<DevicePatternRegistry> patterns)
    : adapters_(adapters ? std::move(adapters) : std::make_shared<DiscoveryAdapterRegistry>()),
      patterns_(patterns ? std::move(patterns) : DevicePatternRegistry::CreateDefault()),
      orchestrator_(config, adapters_, patterns_),
      targeted_(config, adapters_, patterns_) {}

std::unique_ptr<AutoDiscoveryService> AutoDiscoveryService::CreateFromConfig() {
    auto config = DiscoveryConfig::FromConfigManager();
    auto service = std::make_unique<AutoDiscoveryService>(config);

    if (!config.pattern_file.empty()) {
        // 실패해도 내장 패턴은 유지된다
        service->GetPatternRegistry().LoadFromFile(config.pattern_file);
    }

    if (!config.capture_file.empty()) {
        auto replay_adapters = ReplayDiscoveryAdapter::LoadCaptureFile(config.capture_file);
        for (auto& adapter : replay_adapters) {
            service->GetAdapterRegistry().RegisterAdapter(adapter);
        }
        LogManager::getInstance().Info("AutoDiscoveryService - {} replay adapters from {}",
                                       replay_adapters.size(), config.capture_file);
    }

    LogManager::getInstance().Info("AutoDiscoveryService - ready: " + config.toJson().dump());
    return service;
}

ProtocolResultMap AutoDiscoveryService::DiscoverAllProtocols(const std::vector<std::string>& target_protocols) {
    return orchestrator_.DiscoverAll(target_protocols);
}

std::vector<EnrichedDiscoveryResult>
AutoDiscoveryService::DiscoverForIntegration(const std::string& integration_id,
                                             std::optional<std::chrono::milliseconds> timeout) {
    return targeted_.DiscoverForIntegration(integration_id, timeout);
}

std::optional<EnrichedDiscoveryResult>
AutoDiscoveryService::GetDeviceDetails(const std::string& device_id, const std::string& discovery_method) {
    return orchestrator_.GetDeviceDetails(device_id, discovery_method);
}

DiscoveryStatistics AutoDiscoveryService::GetDiscoveryStatistics() const {
    return orchestrator_.GetDiscoveryStatistics();
}

void AutoDiscoveryService::ClearCache() {
    orchestrator_.ClearCache();
}

} // namespace HomeLens::Discovery
