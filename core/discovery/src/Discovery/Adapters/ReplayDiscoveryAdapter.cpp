#include "Discovery/Adapters/ReplayDiscoveryAdapter.h"
#include "Common/Constants.h"
#include "Logging/LogManager.h"

#include <algorithm>
#include <fstream>

namespace HomeLens::Discovery {

namespace {

bool ContainsString(const json& record, const std::string& value) {
    if (value.empty()) return false;
    if (record.contains(value)) return true;
    for (const auto& field : record) {
        if (field.is_string() && field.get_ref<const std::string&>() == value) return true;
        if (field.is_array()) {
            for (const auto& item : field) {
                if (item.is_string() && item.get_ref<const std::string&>() == value) return true;
            }
        }
    }
    return false;
}

bool HasAnyPort(const json& record, const std::vector<int>& ports) {
    auto matches = [&ports](const json& value) {
        return value.is_number_integer() &&
               std::find(ports.begin(), ports.end(), value.get<int>()) != ports.end();
    };
    if (record.contains("port") && matches(record.at("port"))) return true;
    if (record.contains("open_ports") && record.at("open_ports").is_array()) {
        for (const auto& port : record.at("open_ports")) {
            if (matches(port)) return true;
        }
    }
    return false;
}

} // namespace

ReplayDiscoveryAdapter::ReplayDiscoveryAdapter(std::string protocol, std::vector<RawDeviceRecord> records,
                                               std::chrono::milliseconds scan_delay)
    : protocol_(std::move(protocol)), records_(std::move(records)), scan_delay_(scan_delay) {}

// =============================================================================
// 캡처 파일 로딩
// =============================================================================

std::vector<std::shared_ptr<ReplayDiscoveryAdapter>>
ReplayDiscoveryAdapter::LoadCaptureFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LogManager::getInstance().Error("ReplayDiscoveryAdapter - cannot open capture file: " + path);
        return {};
    }

    json capture = json::parse(file, nullptr, false);
    if (capture.is_discarded()) {
        LogManager::getInstance().Error("ReplayDiscoveryAdapter - malformed capture file: " + path);
        return {};
    }
    return FromCaptureJson(capture);
}

std::vector<std::shared_ptr<ReplayDiscoveryAdapter>>
ReplayDiscoveryAdapter::FromCaptureJson(const json& capture) {
    std::vector<std::shared_ptr<ReplayDiscoveryAdapter>> adapters;
    if (!capture.is_object()) return adapters;

    for (auto it = capture.begin(); it != capture.end(); ++it) {
        const json& entry = it.value();
        std::vector<RawDeviceRecord> records;
        std::chrono::milliseconds delay{0};

        if (entry.is_array()) {
            records = entry.get<std::vector<RawDeviceRecord>>();
        } else if (entry.is_object() && entry.contains("devices") && entry.at("devices").is_array()) {
            records = entry.at("devices").get<std::vector<RawDeviceRecord>>();
            auto delay_it = entry.find("delay_ms");
            if (delay_it != entry.end() && delay_it->is_number_integer() && delay_it->get<int64_t>() > 0) {
                delay = std::chrono::milliseconds(delay_it->get<int64_t>());
            }
        } else {
            LogManager::getInstance().Warn("ReplayDiscoveryAdapter - skipping capture entry: " + it.key());
            continue;
        }
        adapters.push_back(std::make_shared<ReplayDiscoveryAdapter>(it.key(), std::move(records), delay));
    }
    return adapters;
}

// =============================================================================
// 탐색
// =============================================================================

std::vector<RawDeviceRecord> ReplayDiscoveryAdapter::Discover(const CancellationToken& token) {
    if (scan_delay_.count() > 0 && !token.WaitFor(scan_delay_)) {
        LogManager::getInstance().logAdapter(protocol_, LogLevel::DEBUG, "replay cancelled during scan delay");
        return {};
    }
    if (token.IsCancelled()) return {};
    return records_;
}

bool ReplayDiscoveryAdapter::SupportsService(const ServiceDescriptor& descriptor) const {
    switch (descriptor.type) {
    case Enums::ServiceDescriptorType::MDNS_SERVICE:
        return protocol_ == Constants::PROTOCOL_MDNS;
    case Enums::ServiceDescriptorType::UPNP_DEVICE_TYPE:
        return protocol_ == Constants::PROTOCOL_UPNP;
    case Enums::ServiceDescriptorType::TCP_PORTS:
        return protocol_ == Constants::PROTOCOL_DHCP;
    }
    return false;
}

bool ReplayDiscoveryAdapter::RecordMatches(const RawDeviceRecord& record, const ServiceDescriptor& descriptor) {
    if (!record.is_object()) return false;
    if (descriptor.type == Enums::ServiceDescriptorType::TCP_PORTS) {
        return HasAnyPort(record, descriptor.ports);
    }
    return ContainsString(record, descriptor.value);
}

std::vector<RawDeviceRecord> ReplayDiscoveryAdapter::DiscoverService(const ServiceDescriptor& descriptor,
                                                                     const CancellationToken& token) {
    auto records = Discover(token);
    std::vector<RawDeviceRecord> matched;
    for (auto& record : records) {
        if (RecordMatches(record, descriptor)) matched.push_back(std::move(record));
    }
    return matched;
}

std::optional<json> ReplayDiscoveryAdapter::GetDeviceInfo(const std::string& ip_address,
                                                          const CancellationToken& token) {
    if (token.IsCancelled()) return std::nullopt;
    for (const auto& record : records_) {
        if (!record.is_object()) continue;
        for (const char* key : {"ip", "ip_address"}) {
            auto it = record.find(key);
            if (it != record.end() && it->is_string() && it->get_ref<const std::string&>() == ip_address) {
                // 캡처에 details 가 있으면 그것을, 없으면 레코드 전체
                if (record.contains("details") && record.at("details").is_object()) return record.at("details");
                return record;
            }
        }
    }
    return std::nullopt;
}

} // namespace HomeLens::Discovery
