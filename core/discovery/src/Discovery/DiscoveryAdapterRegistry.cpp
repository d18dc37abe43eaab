#include "Discovery/DiscoveryAdapterRegistry.h"
#include "Logging/LogManager.h"

namespace HomeLens::Discovery {

void DiscoveryAdapterRegistry::RegisterAdapter(std::shared_ptr<IDiscoveryAdapter> adapter) {
    if (!adapter) return;
    std::string protocol = adapter->GetProtocolName();
    RegisterAdapter(protocol, std::move(adapter));
}

void DiscoveryAdapterRegistry::RegisterAdapter(const std::string& protocol,
                                               std::shared_ptr<IDiscoveryAdapter> adapter) {
    if (!adapter || protocol.empty()) return;

    std::lock_guard<std::mutex> lock(registry_mutex_);
    for (auto& entry : adapters_) {
        if (entry.first == protocol) {
            entry.second = std::move(adapter);
            LogManager::getInstance().Debug("DiscoveryAdapterRegistry - Replaced adapter: " + protocol);
            return;
        }
    }
    adapters_.emplace_back(protocol, std::move(adapter));
    LogManager::getInstance().Debug("DiscoveryAdapterRegistry - Registered adapter: " + protocol);
}

void DiscoveryAdapterRegistry::UnregisterAdapter(const std::string& protocol) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    for (auto it = adapters_.begin(); it != adapters_.end(); ++it) {
        if (it->first == protocol) {
            adapters_.erase(it);
            LogManager::getInstance().Debug("DiscoveryAdapterRegistry - Unregistered adapter: " + protocol);
            return;
        }
    }
    LogManager::getInstance().Warn("DiscoveryAdapterRegistry - Attempted to unregister unknown adapter: " + protocol);
}

std::shared_ptr<IDiscoveryAdapter> DiscoveryAdapterRegistry::GetAdapter(const std::string& protocol) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    for (const auto& entry : adapters_) {
        if (entry.first == protocol) return entry.second;
    }
    return nullptr;
}

bool DiscoveryAdapterRegistry::HasAdapter(const std::string& protocol) const {
    return GetAdapter(protocol) != nullptr;
}

std::vector<std::string> DiscoveryAdapterRegistry::GetProtocolNames() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    std::vector<std::string> names;
    names.reserve(adapters_.size());
    for (const auto& entry : adapters_) {
        names.push_back(entry.first);
    }
    return names;
}

std::pair<std::string, std::shared_ptr<IDiscoveryAdapter>>
DiscoveryAdapterRegistry::FindServiceAdapter(const ServiceDescriptor& descriptor) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    for (const auto& entry : adapters_) {
        if (entry.second->SupportsService(descriptor)) {
            return entry;
        }
    }
    return {"", nullptr};
}

void DiscoveryAdapterRegistry::ForEachAdapter(
    std::function<void(const std::string&, std::shared_ptr<IDiscoveryAdapter>)> callback) const {
    std::vector<std::pair<std::string, std::shared_ptr<IDiscoveryAdapter>>> snapshot;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        snapshot = adapters_;
    }
    for (const auto& entry : snapshot) {
        callback(entry.first, entry.second);
    }
}

size_t DiscoveryAdapterRegistry::GetAdapterCount() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return adapters_.size();
}

} // namespace HomeLens::Discovery
