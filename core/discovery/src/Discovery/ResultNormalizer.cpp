/**
 * @file ResultNormalizer.cpp
 * @brief Raw 레코드 정규화 구현
 */

#include "Discovery/ResultNormalizer.h"
#include "Common/Constants.h"

#include <cstring>

namespace HomeLens::Discovery {

namespace {

// nullptr 종료 별칭 목록
const char *const kIdKeys[] = {"id", "device_id", nullptr};
const char *const kNameKeys[] = {"name", "device_name", nullptr};
const char *const kTypeKeys[] = {"type", "device_type", nullptr};
const char *const kManufacturerKeys[] = {"manufacturer", "vendor", nullptr};
const char *const kModelKeys[] = {"model", "model_name", nullptr};
const char *const kIpKeys[] = {"ip", "ip_address", nullptr};
const char *const kMacKeys[] = {"mac", "mac_address", nullptr};

const char *const *const kAllAliasLists[] = {
    kIdKeys, kNameKeys, kTypeKeys, kManufacturerKeys,
    kModelKeys, kIpKeys, kMacKeys};

// 스칼라만 문자열로 사용 (빈 문자열 포함). null / 객체 / 배열은 "없음"
std::optional<std::string> ScalarToString(const json &value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_number() || value.is_boolean()) {
    return value.dump();
  }
  return std::nullopt;
}

} // namespace

bool ResultNormalizer::IsRecognizedKey(const std::string &key) {
  for (const auto *aliases : kAllAliasLists) {
    for (auto it = aliases; *it != nullptr; ++it) {
      if (key == *it)
        return true;
    }
  }
  return false;
}

std::optional<std::string>
ResultNormalizer::ReadField(const RawDeviceRecord &raw,
                            const char *const *aliases) {
  for (auto it = aliases; *it != nullptr; ++it) {
    auto found = raw.find(*it);
    if (found == raw.end())
      continue;
    auto value = ScalarToString(*found);
    if (value)
      return value;
  }
  return std::nullopt;
}

DiscoveryResult ResultNormalizer::Normalize(const RawDeviceRecord &raw,
                                            const std::string &protocol) const {
  return Normalize(raw, protocol, Clock::now());
}

DiscoveryResult ResultNormalizer::Normalize(const RawDeviceRecord &raw,
                                            const std::string &protocol,
                                            Timestamp observed_at) const {
  static const json kEmptyObject = json::object();
  const json &record = raw.is_object() ? raw : kEmptyObject;

  DiscoveryResult result;
  result.discovery_method = protocol;
  result.device_id = ReadField(record, kIdKeys)
                         .value_or(std::string(Constants::UNKNOWN_DEVICE_ID));
  result.name = ReadField(record, kNameKeys)
                    .value_or(std::string(Constants::UNKNOWN_DEVICE_NAME));
  result.device_type = ReadField(record, kTypeKeys);
  result.manufacturer = ReadField(record, kManufacturerKeys);
  result.model = ReadField(record, kModelKeys);
  result.ip_address = ReadField(record, kIpKeys);
  result.mac_address = ReadField(record, kMacKeys);

  result.properties = json::object();
  for (auto it = record.begin(); it != record.end(); ++it) {
    if (!IsRecognizedKey(it.key())) {
      result.properties[it.key()] = it.value();
    }
  }

  result.discovered_at = observed_at;
  result.last_seen = observed_at;
  result.confidence_score = 0.0;
  return result;
}

std::vector<DiscoveryResult>
ResultNormalizer::NormalizeAll(const std::vector<RawDeviceRecord> &records,
                               const std::string &protocol,
                               Timestamp observed_at) const {
  std::vector<DiscoveryResult> results;
  results.reserve(records.size());
  for (const auto &raw : records) {
    results.push_back(Normalize(raw, protocol, observed_at));
  }
  return results;
}

} // namespace HomeLens::Discovery
