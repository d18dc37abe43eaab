/**
 * @file DevicePatternRegistry.cpp
 * @brief 내장 패턴 정의 및 JSON 카탈로그 로딩
 */

#include "Discovery/DevicePatternRegistry.h"
#include "Logging/LogManager.h"

#include <fstream>
#include <mutex>

namespace HomeLens::Discovery {

std::vector<DevicePattern> DevicePatternRegistry::BuiltinPatterns() {
  std::vector<DevicePattern> patterns;

  DevicePattern hue;
  hue.pattern_id = "hue";
  hue.mdns_service = "_hue._tcp.local.";
  hue.upnp_device_type = "urn:philips-com:device:bridge";
  hue.manufacturer_keywords = {"philips", "hue"};
  hue.model_keywords = {"bridge", "hue"};
  hue.default_ports = {80, 443, 1900};
  patterns.push_back(hue);

  DevicePattern nest;
  nest.pattern_id = "nest";
  nest.manufacturer_keywords = {"nest", "google"};
  nest.model_keywords = {"thermostat", "protect", "cam"};
  nest.cloud_discovery = true;
  patterns.push_back(nest);

  DevicePattern ring;
  ring.pattern_id = "ring";
  ring.upnp_device_type = "urn:ring-com:device";
  ring.manufacturer_keywords = {"ring"};
  ring.model_keywords = {"doorbell", "camera", "chime"};
  ring.cloud_discovery = true;
  patterns.push_back(ring);

  DevicePattern sonos;
  sonos.pattern_id = "sonos";
  sonos.mdns_service = "_sonos._tcp.local.";
  sonos.upnp_device_type = "urn:smartspeaker-audio:device";
  sonos.manufacturer_keywords = {"sonos"};
  sonos.model_keywords = {"play", "beam", "arc", "sub", "one", "five"};
  sonos.default_ports = {1400, 1443};
  patterns.push_back(sonos);

  DevicePattern roku;
  roku.pattern_id = "roku";
  roku.mdns_service = "_roku-rcp._tcp.local.";
  roku.manufacturer_keywords = {"roku"};
  roku.model_keywords = {"ultra", "express", "premiere", "stick"};
  roku.default_ports = {8060, 8443};
  patterns.push_back(roku);

  DevicePattern tesla;
  tesla.pattern_id = "tesla";
  tesla.manufacturer_keywords = {"tesla"};
  tesla.model_keywords = {"powerwall", "solar", "gateway"};
  tesla.cloud_discovery = true;
  tesla.local_discovery = true;
  tesla.default_ports = {443};
  patterns.push_back(tesla);

  return patterns;
}

std::shared_ptr<DevicePatternRegistry> DevicePatternRegistry::CreateDefault() {
  auto registry = std::make_shared<DevicePatternRegistry>();
  for (auto &pattern : BuiltinPatterns()) {
    registry->RegisterPattern(std::move(pattern));
  }
  return registry;
}

void DevicePatternRegistry::RegisterPattern(DevicePattern pattern) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  for (auto &existing : patterns_) {
    if (existing.pattern_id == pattern.pattern_id) {
      existing = std::move(pattern);
      return;
    }
  }
  patterns_.push_back(std::move(pattern));
}

bool DevicePatternRegistry::RemovePattern(const std::string &pattern_id) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  for (auto it = patterns_.begin(); it != patterns_.end(); ++it) {
    if (it->pattern_id == pattern_id) {
      patterns_.erase(it);
      return true;
    }
  }
  return false;
}

std::optional<DevicePattern>
DevicePatternRegistry::GetPattern(const std::string &pattern_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  for (const auto &pattern : patterns_) {
    if (pattern.pattern_id == pattern_id)
      return pattern;
  }
  return std::nullopt;
}

std::vector<DevicePattern> DevicePatternRegistry::GetPatterns() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return patterns_;
}

size_t DevicePatternRegistry::Size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return patterns_.size();
}

// =============================================================================
// JSON 카탈로그
// =============================================================================

bool DevicePatternRegistry::LoadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    LogManager::getInstance().Warn("DevicePatternRegistry - cannot open pattern file: " + path);
    return false;
  }

  json catalogue = json::parse(file, nullptr, false);
  if (catalogue.is_discarded()) {
    LogManager::getInstance().Error("DevicePatternRegistry - malformed JSON in " + path);
    return false;
  }

  if (!LoadFromJson(catalogue)) {
    LogManager::getInstance().Error("DevicePatternRegistry - invalid pattern catalogue: " + path);
    return false;
  }
  LogManager::getInstance().Info("DevicePatternRegistry - loaded pattern catalogue {} ({} patterns)",
                                 path, Size());
  return true;
}

bool DevicePatternRegistry::LoadFromJson(const json &catalogue) {
  if (!catalogue.is_object() && !catalogue.is_array())
    return false;
  const json &entries = (catalogue.is_object() && catalogue.contains("patterns"))
                            ? catalogue.at("patterns")
                            : catalogue;

  // 모두 파싱된 뒤에만 반영
  // 배열 형식은 선언 순서를 유지하고, 객체 형식은 키 이름 순서가 된다
  std::vector<DevicePattern> parsed;
  try {
    if (entries.is_array()) {
      for (const auto &entry : entries) {
        if (!entry.is_object() || !entry.contains("pattern_id"))
          return false;
        parsed.push_back(
            DevicePattern::fromJson(entry.at("pattern_id").get<std::string>(), entry));
      }
    } else if (entries.is_object()) {
      for (auto it = entries.begin(); it != entries.end(); ++it) {
        if (!it.value().is_object())
          return false;
        parsed.push_back(DevicePattern::fromJson(it.key(), it.value()));
      }
    } else {
      return false;
    }
  } catch (const json::exception &e) {
    LogManager::getInstance().Error("DevicePatternRegistry - pattern parse error: " +
                                    std::string(e.what()));
    return false;
  }

  for (auto &pattern : parsed) {
    RegisterPattern(std::move(pattern));
  }
  return true;
}

} // namespace HomeLens::Discovery
