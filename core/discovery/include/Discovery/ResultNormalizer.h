#pragma once

#ifndef HOMELENS_DISCOVERY_RESULT_NORMALIZER_H
#define HOMELENS_DISCOVERY_RESULT_NORMALIZER_H

/**
 * @file ResultNormalizer.h
 * @brief 프로토콜별 Raw 레코드 -> DiscoveryResult 변환
 * @author HomeLens Development Team
 * @date 2026-10-12
 *
 * 필드 별칭 (먼저 나온 키 우선, 빈 문자열도 값으로 취급):
 *   device_id    <- id, device_id
 *   name         <- name, device_name
 *   device_type  <- type, device_type
 *   manufacturer <- manufacturer, vendor
 *   model        <- model, model_name
 *   ip_address   <- ip, ip_address
 *   mac_address  <- mac, mac_address
 * 인식하지 못한 키는 properties 에 그대로 보존한다.
 * 어떤 입력에도 예외를 던지지 않는다.
 */

#include "Discovery/DiscoveryTypes.h"

#include <string>
#include <vector>

namespace HomeLens::Discovery {

class ResultNormalizer {
public:
  DiscoveryResult Normalize(const RawDeviceRecord &raw,
                            const std::string &protocol) const;

  DiscoveryResult Normalize(const RawDeviceRecord &raw,
                            const std::string &protocol,
                            Timestamp observed_at) const;

  std::vector<DiscoveryResult>
  NormalizeAll(const std::vector<RawDeviceRecord> &records,
               const std::string &protocol, Timestamp observed_at) const;

  static bool IsRecognizedKey(const std::string &key);

private:
  static std::optional<std::string> ReadField(const RawDeviceRecord &raw,
                                              const char *const *aliases);
};

} // namespace HomeLens::Discovery

#endif // HOMELENS_DISCOVERY_RESULT_NORMALIZER_H
