#pragma once

#ifndef HOMELENS_DISCOVERY_TYPES_H
#define HOMELENS_DISCOVERY_TYPES_H

/**
 * @file DiscoveryTypes.h
 * @brief 탐색 파이프라인 공통 타입 (Raw 레코드, 정규화 결과, 상관 그룹, 패턴)
 * @author HomeLens Development Team
 * @date 2026-10-12
 */

#include "Common/Enums.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace HomeLens::Discovery {

using json = nlohmann::json;
using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

/**
 * @brief 프로토콜 어댑터가 돌려주는 원본 레코드
 * @details 프로토콜마다 키 이름이 다르다 (id/device_id, ip/ip_address ...).
 *          ResultNormalizer 외에는 내용을 해석하지 않는다.
 */
using RawDeviceRecord = json;

std::string ToIsoString(const Timestamp &tp);

// =============================================================================
// 디바이스 패턴 (정적 시그니처)
// =============================================================================
struct DevicePattern {
  std::string pattern_id;
  std::vector<std::string> manufacturer_keywords;
  std::vector<std::string> model_keywords;
  std::string mdns_service;     // "_hue._tcp.local."
  std::string upnp_device_type; // "urn:philips-com:device:bridge"
  std::vector<int> default_ports;
  bool cloud_discovery = false;
  bool local_discovery = false;

  bool HasKeywords() const {
    return !manufacturer_keywords.empty() || !model_keywords.empty();
  }

  json toJson() const;

  /**
   * @brief JSON 객체에서 패턴 생성
   * @throws nlohmann::json::exception 타입이 맞지 않는 필드
   */
  static DevicePattern fromJson(const std::string &id, const json &j);
};

struct PatternMatch {
  std::string pattern_id;
  double confidence = 0.0;
  DevicePattern matched_pattern;

  json toJson() const;
};

// =============================================================================
// 정규화된 탐색 결과 (생성 후 불변, 보강은 복사본으로)
// =============================================================================
struct DiscoveryResult {
  std::string device_id;
  std::string name;
  std::string discovery_method;
  std::optional<std::string> device_type;
  std::optional<std::string> manufacturer;
  std::optional<std::string> model;
  std::optional<std::string> ip_address;
  std::optional<std::string> mac_address;
  json properties = json::object();
  Timestamp discovered_at{};
  Timestamp last_seen{};
  double confidence_score = 0.0;

  json toJson() const;
};

/**
 * @brief 상관관계/패턴 정보가 붙은 결과 (외부로 나가는 형태)
 */
struct EnrichedDiscoveryResult {
  DiscoveryResult device;
  std::string correlation_key;

  // 그룹 멤버가 2개 이상일 때만 채워진다
  std::vector<std::string> correlated_protocols;
  std::optional<double> correlation_confidence;

  std::optional<PatternMatch> pattern_match;
  std::optional<json> additional_info;

  json toJson() const;
};

// =============================================================================
// 상관 그룹 - 하나의 물리 디바이스로 추정되는 결과 묶음
// =============================================================================
struct CorrelationGroup {
  std::string correlation_key;
  std::vector<DiscoveryResult> members;     // members[0] == seed
  std::vector<size_t> member_indices;       // 입력 목록 기준 인덱스

  size_t Size() const { return members.size(); }
};

// =============================================================================
// 어댑터 1회 실행 결과 (Result<[Raw], AdapterError>)
// =============================================================================
struct AdapterOutcome {
  std::string protocol;
  Enums::AdapterStatus status = Enums::AdapterStatus::SUCCESS;
  std::vector<RawDeviceRecord> records;
  std::string error_message;
  std::chrono::milliseconds elapsed{0};

  bool IsSuccess() const { return status == Enums::AdapterStatus::SUCCESS; }

  static AdapterOutcome Failure(const std::string &protocol,
                                Enums::AdapterStatus status,
                                const std::string &message) {
    AdapterOutcome outcome;
    outcome.protocol = protocol;
    outcome.status = status;
    outcome.error_message = message;
    return outcome;
  }

  json toJson() const;
};

// =============================================================================
// 프로토콜별 결과 맵 (요청 순서 유지)
// =============================================================================
class ProtocolResultMap {
public:
  using Devices = std::vector<EnrichedDiscoveryResult>;
  using Entry = std::pair<std::string, Devices>;
  using const_iterator = std::vector<Entry>::const_iterator;

  /**
   * @brief 프로토콜 항목 설정 (이미 있으면 위치 유지하고 교체)
   */
  void Set(const std::string &protocol, Devices devices);
  void Append(const std::string &protocol, EnrichedDiscoveryResult device);

  bool Contains(const std::string &protocol) const;

  /**
   * @throws std::out_of_range 없는 프로토콜
   */
  const Devices &At(const std::string &protocol) const;

  std::vector<std::string> Protocols() const;
  size_t Size() const { return entries_.size(); }
  bool Empty() const { return entries_.empty(); }
  size_t TotalDevices() const;

  const_iterator begin() const { return entries_.begin(); }
  const_iterator end() const { return entries_.end(); }

  nlohmann::ordered_json toJson() const;

private:
  std::vector<Entry> entries_;
};

// =============================================================================
// 탐색 통계
// =============================================================================
struct DiscoveryStatistics {
  size_t cached_devices = 0;
  std::optional<Timestamp> last_discovery;
  std::optional<double> cache_age_seconds;
  bool cache_valid = false;
  std::map<std::string, int> discovery_methods;
  std::map<std::string, int> device_types;
  std::map<std::string, int> manufacturers;

  json toJson() const;
};

} // namespace HomeLens::Discovery

#endif // HOMELENS_DISCOVERY_TYPES_H
