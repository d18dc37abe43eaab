#include "Discovery/TargetedDiscoveryService.h"
#include "Common/Constants.h"
#include "Discovery/AdapterTaskGroup.h"
#include "Discovery/EntityCorrelator.h"
#include "Logging/LogManager.h"

#include <algorithm>
#include <cctype>

namespace HomeLens::Discovery {

namespace {

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return text;
}

bool ContainsAny(const std::string& text, const std::vector<std::string>& keywords) {
    for (const auto& keyword : keywords) {
        std::string lowered = ToLower(keyword);
        if (!lowered.empty() && text.find(lowered) != std::string::npos) return true;
    }
    return false;
}

} // namespace

TargetedDiscoveryService::TargetedDiscoveryService(DiscoveryConfig config,
                                                   std::shared_ptr<DiscoveryAdapterRegistry> adapters,
                                                   std::shared_ptr<const DevicePatternRegistry> patterns)
    : config_(std::move(config)),
      adapters_(adapters ? std::move(adapters) : std::make_shared<DiscoveryAdapterRegistry>()),
      patterns_(patterns ? std::move(patterns) : DevicePatternRegistry::CreateDefault()),
      matcher_(patterns_) {}

std::vector<ServiceDescriptor> TargetedDiscoveryService::BuildDescriptors(const DevicePattern& pattern) {
    std::vector<ServiceDescriptor> descriptors;
    if (!pattern.mdns_service.empty())
        descriptors.push_back(ServiceDescriptor::MdnsService(pattern.mdns_service));
    if (!pattern.upnp_device_type.empty())
        descriptors.push_back(ServiceDescriptor::UpnpDeviceType(pattern.upnp_device_type));
    if (!pattern.default_ports.empty())
        descriptors.push_back(ServiceDescriptor::TcpPorts(pattern.default_ports));
    return descriptors;
}

std::string TargetedDiscoveryService::PreferredProtocol(const ServiceDescriptor& descriptor) {
    switch (descriptor.type) {
    case Enums::ServiceDescriptorType::MDNS_SERVICE:
        return std::string(Constants::PROTOCOL_MDNS);
    case Enums::ServiceDescriptorType::UPNP_DEVICE_TYPE:
        return std::string(Constants::PROTOCOL_UPNP);
    case Enums::ServiceDescriptorType::TCP_PORTS:
        return std::string(Constants::PROTOCOL_DHCP);
    }
    return "";
}

bool TargetedDiscoveryService::DeviceMatchesPattern(const RawDeviceRecord& raw, const DevicePattern& pattern) {
    if (!pattern.HasKeywords()) return true;

    std::string text = ToLower(raw.dump());
    if (!pattern.manufacturer_keywords.empty())
        return ContainsAny(text, pattern.manufacturer_keywords);
    return ContainsAny(text, pattern.model_keywords);
}

std::pair<std::string, std::shared_ptr<IDiscoveryAdapter>>
TargetedDiscoveryService::ResolveAdapter(const ServiceDescriptor& descriptor) const {
    std::string preferred = PreferredProtocol(descriptor);
    auto adapter = adapters_->GetAdapter(preferred);
    if (adapter && adapter->SupportsService(descriptor)) return {preferred, adapter};
    return adapters_->FindServiceAdapter(descriptor);
}

std::vector<EnrichedDiscoveryResult>
TargetedDiscoveryService::DiscoverForIntegration(const std::string& pattern_id,
                                                 std::optional<std::chrono::milliseconds> timeout) {
    auto pattern = patterns_->GetPattern(pattern_id);
    if (!pattern) {
        LogManager::getInstance().Warn("TargetedDiscovery - unknown integration pattern: " + pattern_id);
        return {};
    }

    auto effective_timeout = timeout.value_or(config_.discovery_timeout);
    if (effective_timeout.count() <= 0) effective_timeout = config_.discovery_timeout;

    AdapterTaskGroup group(effective_timeout, config_.GetMode());
    for (const auto& descriptor : BuildDescriptors(*pattern)) {
        auto resolved = ResolveAdapter(descriptor);
        std::shared_ptr<IDiscoveryAdapter> adapter = resolved.second;
        if (!adapter) {
            LogManager::getInstance().Debug("TargetedDiscovery - no adapter supports " + descriptor.ToString());
            continue;
        }
        group.AddTask(resolved.first, [adapter, descriptor](const CancellationToken& token) {
            return adapter->DiscoverService(descriptor, token);
        });
    }

    if (group.GetTaskCount() == 0) {
        LogManager::getInstance().Info("TargetedDiscovery - pattern '{}' has no locally discoverable services",
                                       pattern_id);
        return {};
    }

    auto observed_at = Clock::now();
    std::vector<EnrichedDiscoveryResult> devices;
    for (const auto& outcome : group.Run()) {
        if (!outcome.IsSuccess()) {
            LogManager::getInstance().logAdapter(outcome.protocol, LogLevel::WARN,
                                                 "targeted scan for '" + pattern_id + "' " +
                                                     Enums::AdapterStatusToString(outcome.status) + ": " +
                                                     outcome.error_message);
            continue;
        }
        for (const auto& raw : outcome.records) {
            if (!DeviceMatchesPattern(raw, *pattern)) continue;

            EnrichedDiscoveryResult enriched;
            enriched.device = normalizer_.Normalize(raw, outcome.protocol, observed_at);
            enriched.correlation_key = EntityCorrelator::GenerateCorrelationKey(enriched.device);
            matcher_.Apply(enriched);
            devices.push_back(std::move(enriched));
        }
    }

    LogManager::getInstance().Info("TargetedDiscovery - '{}' found {} devices", pattern_id, devices.size());
    return devices;
}

} // namespace HomeLens::Discovery
