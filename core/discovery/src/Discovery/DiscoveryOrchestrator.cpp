/**
 * @file DiscoveryOrchestrator.cpp
 * @brief 탐색 사이클 구현
 */

#include "Discovery/DiscoveryOrchestrator.h"
#include "Common/Constants.h"
#include "Logging/LogManager.h"

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace HomeLens::Discovery {

namespace {

std::string TrimLower(const std::string& text) {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    auto last = text.find_last_not_of(" \t\r\n");
    std::string result = text.substr(first, last - first + 1);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool SupportsDetailLookup(const std::string& protocol) {
    return protocol == Constants::PROTOCOL_MDNS || protocol == Constants::PROTOCOL_UPNP;
}

} // namespace

DiscoveryOrchestrator::DiscoveryOrchestrator(DiscoveryConfig config,
                                             std::shared_ptr<DiscoveryAdapterRegistry> adapters,
                                             std::shared_ptr<const DevicePatternRegistry> patterns)
    : config_(std::move(config)),
      adapters_(adapters ? std::move(adapters) : std::make_shared<DiscoveryAdapterRegistry>()),
      patterns_(patterns ? std::move(patterns) : DevicePatternRegistry::CreateDefault()),
      matcher_(patterns_),
      cache_(config_.cache_duration) {}

std::vector<std::string>
DiscoveryOrchestrator::NormalizeProtocolList(const std::vector<std::string>& protocols) {
    std::vector<std::string> result;
    std::unordered_set<std::string> seen;
    for (const auto& raw : protocols) {
        std::string protocol = TrimLower(raw);
        if (protocol.empty() || !seen.insert(protocol).second) continue;
        result.push_back(protocol);
    }
    return result;
}

std::optional<ProtocolResultMap>
DiscoveryOrchestrator::SelectProtocols(const ProtocolResultMap& cached,
                                       const std::vector<std::string>& protocols) {
    ProtocolResultMap selected;
    for (const auto& protocol : protocols) {
        if (!cached.Contains(protocol)) return std::nullopt;
        selected.Set(protocol, cached.At(protocol));
    }
    return selected;
}

// =============================================================================
// 전체 탐색
// =============================================================================

ProtocolResultMap DiscoveryOrchestrator::DiscoverAll(const std::vector<std::string>& protocols) {
    auto requested = NormalizeProtocolList(protocols.empty() ? config_.default_protocols : protocols);

    if (auto cached = cache_.GetIfValid()) {
        if (auto selected = SelectProtocols(*cached, requested)) {
            LogManager::getInstance().Info("Discovery - serving {} devices from cache",
                                           selected->TotalDevices());
            return *selected;
        }
        LogManager::getInstance().Debug("Discovery - cache does not cover the requested protocols, rescanning");
    }

    LogManager::getInstance().Info("Discovery - starting {} scan of {} protocols (timeout {}ms)",
                                   Enums::DiscoveryModeToString(config_.GetMode()),
                                   requested.size(), config_.discovery_timeout.count());

    auto started = std::chrono::steady_clock::now();
    auto observed_at = Clock::now();
    auto outcomes = RunAdapters(requested);
    scan_count_++;

    ProtocolResultMap results;
    try {
        results = ProcessOutcomes(outcomes, observed_at);
    } catch (const std::exception& e) {
        // 파이프라인 단계 오류는 빈 결과로 격하
        LogManager::getInstance().Error("Discovery - result processing failed: " + std::string(e.what()));
        results = ProtocolResultMap{};
        for (const auto& outcome : outcomes) {
            results.Set(outcome.protocol, {});
        }
    }

    bool any_success = requested.empty() ||
                       std::any_of(outcomes.begin(), outcomes.end(),
                                   [](const AdapterOutcome& o) { return o.IsSuccess(); });
    if (any_success) {
        // TTL 은 처리 완료 시점부터
        cache_.Update(results);
    } else {
        LogManager::getInstance().Warn("Discovery - no adapter succeeded, keeping previous cache");
    }

    {
        std::lock_guard<std::mutex> lock(outcomes_mutex_);
        last_outcomes_ = outcomes;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    LogManager::getInstance().Info("Discovery - cycle finished: {} devices across {} protocols in {}ms",
                                   results.TotalDevices(), results.Size(), elapsed.count());
    return results;
}

std::vector<AdapterOutcome> DiscoveryOrchestrator::RunAdapters(const std::vector<std::string>& protocols) {
    AdapterTaskGroup group(config_.discovery_timeout, config_.GetMode());

    for (const auto& protocol : protocols) {
        auto adapter = adapters_->GetAdapter(protocol);
        if (!adapter) {
            LogManager::getInstance().Warn("Discovery - unknown protocol requested: " + protocol);
            group.AddUnknown(protocol);
            continue;
        }
        group.AddTask(protocol, [adapter](const CancellationToken& token) {
            return adapter->Discover(token);
        });
    }

    auto outcomes = group.Run();
    for (const auto& outcome : outcomes) {
        LogOutcome(outcome);
    }
    return outcomes;
}

void DiscoveryOrchestrator::LogOutcome(const AdapterOutcome& outcome) const {
    auto& logger = LogManager::getInstance();
    switch (outcome.status) {
    case Enums::AdapterStatus::SUCCESS:
        logger.logAdapter(outcome.protocol, LogLevel::DEBUG,
                          "found " + std::to_string(outcome.records.size()) + " records in " +
                              std::to_string(outcome.elapsed.count()) + "ms");
        break;
    case Enums::AdapterStatus::FAILED:
        logger.logAdapter(outcome.protocol, LogLevel::LOG_ERROR,
                          "adapter failed: " + outcome.error_message);
        break;
    case Enums::AdapterStatus::TIMED_OUT:
    case Enums::AdapterStatus::CANCELLED:
        logger.logAdapter(outcome.protocol, LogLevel::WARN,
                          Enums::AdapterStatusToString(outcome.status) + ": " + outcome.error_message);
        break;
    case Enums::AdapterStatus::UNKNOWN_PROTOCOL:
        break; // RunAdapters 에서 이미 기록
    }
}

// =============================================================================
// 파이프라인
// =============================================================================

ProtocolResultMap DiscoveryOrchestrator::ProcessOutcomes(const std::vector<AdapterOutcome>& outcomes,
                                                         Timestamp observed_at) const {
    ProtocolResultMap results;
    std::vector<DiscoveryResult> flat;

    for (const auto& outcome : outcomes) {
        results.Set(outcome.protocol, {});
        if (!outcome.IsSuccess()) continue;
        auto normalized = normalizer_.NormalizeAll(outcome.records, outcome.protocol, observed_at);
        flat.insert(flat.end(), std::make_move_iterator(normalized.begin()),
                    std::make_move_iterator(normalized.end()));
    }

    auto groups = correlator_.Correlate(flat);
    auto enriched = correlator_.Enrich(flat, groups);

    size_t matched = 0;
    for (auto& entry : enriched) {
        if (matcher_.Apply(entry)) matched++;
        std::string protocol = entry.device.discovery_method;
        results.Append(protocol, std::move(entry));
    }

    LogManager::getInstance().Debug("Discovery - {} results, {} correlation groups, {} pattern matches",
                                    flat.size(), groups.size(), matched);
    return results;
}

// =============================================================================
// 조회 / 통계
// =============================================================================

std::optional<EnrichedDiscoveryResult>
DiscoveryOrchestrator::GetDeviceDetails(const std::string& device_id, const std::string& discovery_method) {
    auto cached = cache_.FindDevice(device_id);
    if (!cached) {
        LogManager::getInstance().Debug("Discovery - device not in cache: " + device_id);
        return std::nullopt;
    }

    const auto& ip = cached->device.ip_address;
    if (!ip || !SupportsDetailLookup(discovery_method)) return cached;

    auto adapter = adapters_->GetAdapter(discovery_method);
    if (!adapter) return cached;

    auto token = CancellationToken::WithTimeout(std::chrono::seconds(Constants::DETAIL_LOOKUP_TIMEOUT_SEC));
    auto future = LaunchDetached([adapter, address = *ip, token, discovery_method]() -> std::optional<json> {
        try {
            return adapter->GetDeviceInfo(address, token);
        } catch (const std::exception& e) {
            LogManager::getInstance().logAdapter(discovery_method, LogLevel::LOG_ERROR,
                                                 "device info lookup failed: " + std::string(e.what()));
            return std::nullopt;
        } catch (...) {
            LogManager::getInstance().logAdapter(discovery_method, LogLevel::LOG_ERROR,
                                                 "device info lookup failed: unknown exception");
            return std::nullopt;
        }
    });

    auto deadline = *token.Deadline() + Constants::DEADLINE_EPSILON;
    if (future.wait_until(deadline) != std::future_status::ready) {
        token.Cancel();
        LogManager::getInstance().logAdapter(discovery_method, LogLevel::WARN,
                                             "device info lookup timed out for " + *ip);
        return cached;
    }

    auto info = future.get();
    if (info) cached->additional_info = std::move(*info);
    return cached;
}

DiscoveryStatistics DiscoveryOrchestrator::GetDiscoveryStatistics() const {
    return cache_.BuildStatistics();
}

void DiscoveryOrchestrator::ClearCache() {
    cache_.Clear();
    LogManager::getInstance().Info("Discovery - cache cleared");
}

std::vector<AdapterOutcome> DiscoveryOrchestrator::GetLastOutcomes() const {
    std::lock_guard<std::mutex> lock(outcomes_mutex_);
    return last_outcomes_;
}

} // namespace HomeLens::Discovery
