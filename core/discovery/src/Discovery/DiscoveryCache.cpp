#include "Discovery/DiscoveryCache.h"

#include <mutex>

namespace HomeLens {
namespace Discovery {

DiscoveryCache::DiscoveryCache(std::chrono::seconds cache_duration)
    : cache_duration_(cache_duration) {}

bool DiscoveryCache::IsValidUnlocked(Timestamp now) const {
    if (!snapshot_ || cache_duration_.count() <= 0) return false;
    return now - snapshot_->last_discovery_time < cache_duration_;
}

bool DiscoveryCache::IsValid() const {
    return IsValid(Clock::now());
}

bool DiscoveryCache::IsValid(Timestamp now) const {
    std::shared_lock<std::shared_mutex> lock(cache_mutex_);
    return IsValidUnlocked(now);
}

std::optional<ProtocolResultMap> DiscoveryCache::GetIfValid() const {
    std::shared_lock<std::shared_mutex> lock(cache_mutex_);
    if (!IsValidUnlocked(Clock::now())) return std::nullopt;
    return snapshot_->results;
}

ProtocolResultMap DiscoveryCache::Get() const {
    std::shared_lock<std::shared_mutex> lock(cache_mutex_);
    return snapshot_ ? snapshot_->results : ProtocolResultMap{};
}

void DiscoveryCache::Update(const ProtocolResultMap& results) {
    Update(results, Clock::now());
}

void DiscoveryCache::Update(const ProtocolResultMap& results, Timestamp discovered_at) {
    // 락 밖에서 새 스냅샷 구성 후 교체
    auto snapshot = std::make_shared<Snapshot>();
    snapshot->results = results;
    snapshot->last_discovery_time = discovered_at;
    for (const auto& [protocol, devices] : results) {
        for (const auto& device : devices) {
            snapshot->devices[device.device.device_id] = device;
        }
    }

    std::unique_lock<std::shared_mutex> lock(cache_mutex_);
    snapshot_ = std::move(snapshot);
}

void DiscoveryCache::Clear() {
    std::unique_lock<std::shared_mutex> lock(cache_mutex_);
    snapshot_.reset();
}

std::optional<EnrichedDiscoveryResult> DiscoveryCache::FindDevice(const std::string& device_id) const {
    std::shared_lock<std::shared_mutex> lock(cache_mutex_);
    if (!snapshot_) return std::nullopt;
    auto it = snapshot_->devices.find(device_id);
    if (it == snapshot_->devices.end()) return std::nullopt;
    return it->second;
}

std::optional<Timestamp> DiscoveryCache::GetLastDiscoveryTime() const {
    std::shared_lock<std::shared_mutex> lock(cache_mutex_);
    if (!snapshot_) return std::nullopt;
    return snapshot_->last_discovery_time;
}

size_t DiscoveryCache::GetDeviceCount() const {
    std::shared_lock<std::shared_mutex> lock(cache_mutex_);
    return snapshot_ ? snapshot_->devices.size() : 0;
}

DiscoveryStatistics DiscoveryCache::BuildStatistics() const {
    return BuildStatistics(Clock::now());
}

DiscoveryStatistics DiscoveryCache::BuildStatistics(Timestamp now) const {
    std::shared_ptr<const Snapshot> snapshot;
    DiscoveryStatistics stats;
    {
        std::shared_lock<std::shared_mutex> lock(cache_mutex_);
        snapshot = snapshot_;
        stats.cache_valid = IsValidUnlocked(now);
    }
    if (!snapshot) return stats;

    stats.cached_devices = snapshot->devices.size();
    stats.last_discovery = snapshot->last_discovery_time;
    stats.cache_age_seconds =
        std::chrono::duration<double>(now - snapshot->last_discovery_time).count();

    for (const auto& [device_id, entry] : snapshot->devices) {
        const auto& device = entry.device;
        stats.discovery_methods[device.discovery_method]++;
        if (device.device_type && !device.device_type->empty()) stats.device_types[*device.device_type]++;
        if (device.manufacturer && !device.manufacturer->empty()) stats.manufacturers[*device.manufacturer]++;
    }
    return stats;
}

} // namespace Discovery
} // namespace HomeLens
