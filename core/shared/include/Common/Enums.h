// core/shared/include/Common/Enums.h
#ifndef HOMELENS_COMMON_ENUMS_H
#define HOMELENS_COMMON_ENUMS_H

#include <cstdint>
#include <string>

// =============================================================================
// 시스템 헤더 매크로 충돌 방지 - 반드시 enum 정의 전에!
// =============================================================================
#ifdef _WIN32
#ifdef ERROR
#undef ERROR
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#endif

#ifdef INFO
#undef INFO
#endif

#ifdef DEBUG
#undef DEBUG
#endif

#ifdef WARN
#undef WARN
#endif

namespace HomeLens {
namespace Enums {

// =========================================================================
// 로그 레벨 (LogLib::LogLevel 과 1:1 대응)
// =========================================================================
enum class LogLevel : uint8_t {
  TRACE = 0,
  DEBUG = 1,
  INFO = 2,
  WARN = 3,
  LOG_ERROR = 4,
  LOG_FATAL = 5,
  OFF = 255
};

// =========================================================================
// 어댑터 1회 실행 결과 상태
// =========================================================================
enum class AdapterStatus : uint8_t {
  SUCCESS = 0,
  FAILED = 1,           // 어댑터 내부 예외
  TIMED_OUT = 2,        // 전역 데드라인 초과 (결과 폐기)
  CANCELLED = 3,        // 시작 전에 취소됨
  UNKNOWN_PROTOCOL = 4  // 등록되지 않은 프로토콜
};

// =========================================================================
// 실행 모드
// =========================================================================
enum class DiscoveryMode : uint8_t {
  PARALLEL = 0,
  SEQUENTIAL = 1
};

// =========================================================================
// 타겟 탐색 서술자 종류
// =========================================================================
enum class ServiceDescriptorType : uint8_t {
  MDNS_SERVICE = 0,     // "_hue._tcp.local."
  UPNP_DEVICE_TYPE = 1, // "urn:philips-com:device:bridge"
  TCP_PORTS = 2         // [80, 443, 1900]
};

// =========================================================================
// 문자열 변환
// =========================================================================
inline std::string AdapterStatusToString(AdapterStatus status) {
  switch (status) {
  case AdapterStatus::SUCCESS:
    return "SUCCESS";
  case AdapterStatus::FAILED:
    return "FAILED";
  case AdapterStatus::TIMED_OUT:
    return "TIMED_OUT";
  case AdapterStatus::CANCELLED:
    return "CANCELLED";
  case AdapterStatus::UNKNOWN_PROTOCOL:
    return "UNKNOWN_PROTOCOL";
  default:
    return "UNKNOWN";
  }
}

inline std::string DiscoveryModeToString(DiscoveryMode mode) {
  return mode == DiscoveryMode::PARALLEL ? "PARALLEL" : "SEQUENTIAL";
}

inline std::string ServiceDescriptorTypeToString(ServiceDescriptorType type) {
  switch (type) {
  case ServiceDescriptorType::MDNS_SERVICE:
    return "MDNS_SERVICE";
  case ServiceDescriptorType::UPNP_DEVICE_TYPE:
    return "UPNP_DEVICE_TYPE";
  case ServiceDescriptorType::TCP_PORTS:
    return "TCP_PORTS";
  default:
    return "UNKNOWN";
  }
}

} // namespace Enums
} // namespace HomeLens

#endif // HOMELENS_COMMON_ENUMS_H
