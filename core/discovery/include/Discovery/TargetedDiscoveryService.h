#pragma once

#ifndef TARGETED_DISCOVERY_SERVICE_H
#define TARGETED_DISCOVERY_SERVICE_H

#include "Discovery/DevicePatternRegistry.h"
#include "Discovery/DiscoveryAdapterRegistry.h"
#include "Discovery/DiscoveryConfig.h"
#include "Discovery/PatternMatcher.h"
#include "Discovery/ResultNormalizer.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace HomeLens::Discovery {

/**
 * @brief Runs only the scans implied by one integration pattern.
 *
 * mdns_service -> mDNS service browse, upnp_device_type -> UPnP type search,
 * default_ports -> port scan. Each scan goes to the adapter registered for
 * that transport (or the first adapter that supports the descriptor) and all
 * scans share one deadline. Results are not cached.
 */
class TargetedDiscoveryService {
public:
    TargetedDiscoveryService(DiscoveryConfig config,
                             std::shared_ptr<DiscoveryAdapterRegistry> adapters,
                             std::shared_ptr<const DevicePatternRegistry> patterns);

    /**
     * @param pattern_id Integration pattern id ("hue", "sonos", ...)
     * @param timeout Overrides the configured discovery timeout
     * @return Matching devices; empty for unknown patterns or when nothing answers
     */
    std::vector<EnrichedDiscoveryResult>
    DiscoverForIntegration(const std::string& pattern_id,
                           std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    static std::vector<ServiceDescriptor> BuildDescriptors(const DevicePattern& pattern);

    /**
     * @brief Protocol that normally serves a descriptor (mdns / upnp / dhcp)
     */
    static std::string PreferredProtocol(const ServiceDescriptor& descriptor);

    /**
     * @brief Keyword containment on the lowercased raw record text.
     * Manufacturer keywords, when declared, are required; otherwise model
     * keywords are required; a pattern without keywords accepts everything.
     */
    static bool DeviceMatchesPattern(const RawDeviceRecord& raw, const DevicePattern& pattern);

private:
    std::pair<std::string, std::shared_ptr<IDiscoveryAdapter>>
    ResolveAdapter(const ServiceDescriptor& descriptor) const;

    DiscoveryConfig config_;
    std::shared_ptr<DiscoveryAdapterRegistry> adapters_;
    std::shared_ptr<const DevicePatternRegistry> patterns_;
    ResultNormalizer normalizer_;
    PatternMatcher matcher_;
};

} // namespace HomeLens::Discovery

#endif // TARGETED_DISCOVERY_SERVICE_H
