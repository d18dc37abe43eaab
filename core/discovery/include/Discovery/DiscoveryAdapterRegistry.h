#pragma once

#ifndef DISCOVERY_ADAPTER_REGISTRY_H
#define DISCOVERY_ADAPTER_REGISTRY_H

#include "Discovery/IDiscoveryAdapter.h"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace HomeLens::Discovery {

/**
 * @brief Thread-safe storage of protocol adapters keyed by protocol name.
 *
 * Responsibilities:
 * - Registration order is preserved (used when no protocol list is given)
 * - Lookup by protocol name
 * - Lookup of the first adapter that supports a targeted service descriptor
 */
class DiscoveryAdapterRegistry {
public:
    DiscoveryAdapterRegistry() = default;
    ~DiscoveryAdapterRegistry() = default;

    DiscoveryAdapterRegistry(const DiscoveryAdapterRegistry&) = delete;
    DiscoveryAdapterRegistry& operator=(const DiscoveryAdapterRegistry&) = delete;

    /**
     * @brief Registers an adapter under its own GetProtocolName().
     */
    void RegisterAdapter(std::shared_ptr<IDiscoveryAdapter> adapter);

    /**
     * @brief Registers an adapter under an explicit protocol name.
     * An existing adapter with the same name is replaced in place.
     */
    void RegisterAdapter(const std::string& protocol, std::shared_ptr<IDiscoveryAdapter> adapter);

    void UnregisterAdapter(const std::string& protocol);

    /**
     * @return Adapter, or nullptr if the protocol is not registered.
     */
    std::shared_ptr<IDiscoveryAdapter> GetAdapter(const std::string& protocol) const;

    bool HasAdapter(const std::string& protocol) const;

    std::vector<std::string> GetProtocolNames() const;

    /**
     * @brief First adapter (registration order) that supports the descriptor.
     */
    std::pair<std::string, std::shared_ptr<IDiscoveryAdapter>>
    FindServiceAdapter(const ServiceDescriptor& descriptor) const;

    void ForEachAdapter(std::function<void(const std::string&, std::shared_ptr<IDiscoveryAdapter>)> callback) const;

    size_t GetAdapterCount() const;

private:
    mutable std::mutex registry_mutex_;
    std::vector<std::pair<std::string, std::shared_ptr<IDiscoveryAdapter>>> adapters_;
};

} // namespace HomeLens::Discovery

#endif // DISCOVERY_ADAPTER_REGISTRY_H
