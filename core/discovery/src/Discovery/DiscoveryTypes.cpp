/**
 * @file DiscoveryTypes.cpp
 * @brief 탐색 공통 타입 JSON 직렬화
 * @author HomeLens Development Team
 * @date 2026-10-12
 */

#include "Discovery/DiscoveryTypes.h"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace HomeLens::Discovery {

namespace {

void SetOptional(json &j, const char *key,
                 const std::optional<std::string> &value) {
  j[key] = value ? json(*value) : json(nullptr);
}

json CountsToJson(const std::map<std::string, int> &counts) {
  json j = json::object();
  for (const auto &[key, count] : counts) {
    j[key] = count;
  }
  return j;
}

} // namespace

std::string ToIsoString(const Timestamp &tp) {
  auto time_t_value = Clock::to_time_t(tp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch()) %
            1000;
  if (ms.count() < 0) {
    ms += std::chrono::milliseconds(1000);
  }

  std::tm tm_buf{};
#ifdef _WIN32
  gmtime_s(&tm_buf, &time_t_value);
#else
  gmtime_r(&time_t_value, &tm_buf);
#endif

  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.'
      << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
  return oss.str();
}

// =============================================================================
// DevicePattern
// =============================================================================

json DevicePattern::toJson() const {
  json j;
  j["pattern_id"] = pattern_id;
  j["manufacturer_keywords"] = manufacturer_keywords;
  j["model_keywords"] = model_keywords;
  j["mdns_service"] = mdns_service.empty() ? json(nullptr) : json(mdns_service);
  j["upnp_device_type"] =
      upnp_device_type.empty() ? json(nullptr) : json(upnp_device_type);
  j["default_ports"] = default_ports;
  j["cloud_discovery"] = cloud_discovery;
  j["local_discovery"] = local_discovery;
  return j;
}

DevicePattern DevicePattern::fromJson(const std::string &id, const json &j) {
  DevicePattern pattern;
  pattern.pattern_id = id;
  if (j.contains("manufacturer_keywords"))
    pattern.manufacturer_keywords =
        j.at("manufacturer_keywords").get<std::vector<std::string>>();
  if (j.contains("model_keywords"))
    pattern.model_keywords = j.at("model_keywords").get<std::vector<std::string>>();
  if (j.contains("mdns_service") && !j.at("mdns_service").is_null())
    pattern.mdns_service = j.at("mdns_service").get<std::string>();
  if (j.contains("upnp_device_type") && !j.at("upnp_device_type").is_null())
    pattern.upnp_device_type = j.at("upnp_device_type").get<std::string>();
  if (j.contains("default_ports"))
    pattern.default_ports = j.at("default_ports").get<std::vector<int>>();
  pattern.cloud_discovery = j.value("cloud_discovery", false);
  pattern.local_discovery = j.value("local_discovery", false);
  return pattern;
}

json PatternMatch::toJson() const {
  json j;
  j["pattern_id"] = pattern_id;
  j["confidence"] = confidence;
  j["pattern"] = matched_pattern.toJson();
  return j;
}

// =============================================================================
// DiscoveryResult / EnrichedDiscoveryResult
// =============================================================================

json DiscoveryResult::toJson() const {
  json j;
  j["device_id"] = device_id;
  j["name"] = name;
  SetOptional(j, "device_type", device_type);
  SetOptional(j, "manufacturer", manufacturer);
  SetOptional(j, "model", model);
  SetOptional(j, "ip_address", ip_address);
  SetOptional(j, "mac_address", mac_address);
  j["discovery_method"] = discovery_method;
  j["properties"] = properties;
  j["discovered_at"] = ToIsoString(discovered_at);
  j["last_seen"] = ToIsoString(last_seen);
  j["confidence_score"] = confidence_score;
  return j;
}

json EnrichedDiscoveryResult::toJson() const {
  json j = device.toJson();
  j["correlation_key"] = correlation_key;
  if (!correlated_protocols.empty()) {
    j["correlated_protocols"] = correlated_protocols;
  }
  if (correlation_confidence) {
    j["correlation_confidence"] = *correlation_confidence;
  }
  if (pattern_match) {
    j["pattern_match"] = pattern_match->toJson();
  }
  if (additional_info) {
    j["additional_info"] = *additional_info;
  }
  return j;
}

json AdapterOutcome::toJson() const {
  json j;
  j["protocol"] = protocol;
  j["status"] = Enums::AdapterStatusToString(status);
  j["record_count"] = records.size();
  j["elapsed_ms"] = elapsed.count();
  if (!error_message.empty()) {
    j["error"] = error_message;
  }
  return j;
}

// =============================================================================
// ProtocolResultMap
// =============================================================================

void ProtocolResultMap::Set(const std::string &protocol, Devices devices) {
  for (auto &entry : entries_) {
    if (entry.first == protocol) {
      entry.second = std::move(devices);
      return;
    }
  }
  entries_.emplace_back(protocol, std::move(devices));
}

void ProtocolResultMap::Append(const std::string &protocol,
                               EnrichedDiscoveryResult device) {
  for (auto &entry : entries_) {
    if (entry.first == protocol) {
      entry.second.push_back(std::move(device));
      return;
    }
  }
  entries_.emplace_back(protocol, Devices{std::move(device)});
}

bool ProtocolResultMap::Contains(const std::string &protocol) const {
  for (const auto &entry : entries_) {
    if (entry.first == protocol)
      return true;
  }
  return false;
}

const ProtocolResultMap::Devices &
ProtocolResultMap::At(const std::string &protocol) const {
  for (const auto &entry : entries_) {
    if (entry.first == protocol)
      return entry.second;
  }
  throw std::out_of_range("no discovery results for protocol: " + protocol);
}

std::vector<std::string> ProtocolResultMap::Protocols() const {
  std::vector<std::string> names;
  names.reserve(entries_.size());
  for (const auto &entry : entries_) {
    names.push_back(entry.first);
  }
  return names;
}

size_t ProtocolResultMap::TotalDevices() const {
  size_t total = 0;
  for (const auto &entry : entries_) {
    total += entry.second.size();
  }
  return total;
}

nlohmann::ordered_json ProtocolResultMap::toJson() const {
  nlohmann::ordered_json j = nlohmann::ordered_json::object();
  for (const auto &[protocol, devices] : entries_) {
    auto arr = nlohmann::ordered_json::array();
    for (const auto &device : devices) {
      arr.push_back(nlohmann::ordered_json(device.toJson()));
    }
    j[protocol] = std::move(arr);
  }
  return j;
}

// =============================================================================
// DiscoveryStatistics
// =============================================================================

json DiscoveryStatistics::toJson() const {
  json j;
  j["cached_devices"] = cached_devices;
  j["last_discovery"] =
      last_discovery ? json(ToIsoString(*last_discovery)) : json(nullptr);
  j["cache_age_seconds"] =
      cache_age_seconds ? json(*cache_age_seconds) : json(nullptr);
  j["cache_valid"] = cache_valid;
  j["discovery_methods"] = CountsToJson(discovery_methods);
  j["device_types"] = CountsToJson(device_types);
  j["manufacturers"] = CountsToJson(manufacturers);
  return j;
}

} // namespace HomeLens::Discovery
