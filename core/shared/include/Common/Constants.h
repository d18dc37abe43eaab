// core/shared/include/Common/Constants.h
#ifndef HOMELENS_COMMON_CONSTANTS_H
#define HOMELENS_COMMON_CONSTANTS_H

/**
 * @file Constants.h
 * @brief HomeLens 탐색 관련 상수 정의
 * @author HomeLens Development Team
 * @date 2026-10-12
 * @details
 * - ConfigManager 기본값과 알고리즘 가중치를 한 곳에서 관리
 * - 타입 안전한 constexpr 사용
 */

#include <chrono>
#include <cstdint>
#include <string_view>

namespace HomeLens {
namespace Constants {

// =========================================================================
// 시간 관련 상수
// =========================================================================
constexpr int DEFAULT_DISCOVERY_TIMEOUT_SEC = 30;   // 전역 데드라인
constexpr int DEFAULT_CACHE_DURATION_SEC = 300;     // 5분 캐시
constexpr int DETAIL_LOOKUP_TIMEOUT_SEC = 5;        // get_device_info 제한
constexpr int MAX_DISCOVERY_TIMEOUT_SEC = 3600;

// 데드라인 이후 결과 수집에 허용하는 스케줄링 여유
constexpr std::chrono::milliseconds DEADLINE_EPSILON{50};

// =========================================================================
// 프로토콜 이름
// =========================================================================
constexpr std::string_view PROTOCOL_MDNS = "mdns";
constexpr std::string_view PROTOCOL_UPNP = "upnp";
constexpr std::string_view PROTOCOL_DHCP = "dhcp";
constexpr std::string_view PROTOCOL_BLUETOOTH = "bluetooth";
constexpr std::string_view PROTOCOL_ZIGBEE = "zigbee";

constexpr std::string_view DEFAULT_PROTOCOL_LIST = "mdns,upnp,dhcp,bluetooth,zigbee";

// =========================================================================
// 정규화 기본값
// =========================================================================
constexpr std::string_view UNKNOWN_DEVICE_NAME = "Unknown Device";
constexpr std::string_view UNKNOWN_DEVICE_ID = "unknown";
constexpr std::string_view UNKNOWN_SLUG = "unknown";

// =========================================================================
// 상관관계 / 패턴 매칭 가중치
// =========================================================================
constexpr double NAME_SIMILARITY_THRESHOLD = 0.8;    // Jaccard > 0.8
constexpr double CORRELATION_WEIGHT_PER_MEMBER = 0.3;
constexpr double MAX_CONFIDENCE = 1.0;

constexpr double PATTERN_MANUFACTURER_WEIGHT = 0.4;
constexpr double PATTERN_MODEL_WEIGHT = 0.3;
constexpr double PATTERN_SERVICE_WEIGHT = 0.3;
constexpr double PATTERN_MATCH_THRESHOLD = 0.3;      // score > 0.3 만 채택

} // namespace Constants
} // namespace HomeLens

#endif // HOMELENS_COMMON_CONSTANTS_H
