#pragma once

#ifndef HOMELENS_DISCOVERY_IDISCOVERY_ADAPTER_H
#define HOMELENS_DISCOVERY_IDISCOVERY_ADAPTER_H

/**
 * @file IDiscoveryAdapter.h
 * @brief 프로토콜별 탐색 어댑터 인터페이스
 * @author HomeLens Development Team
 * @date 2026-10-12
 *
 * 어댑터는 한 번의 스캔 결과를 RawDeviceRecord 목록으로 돌려준다.
 * 실패는 예외로 알려도 되지만 오케스트레이터가 모두 흡수한다.
 */

#include "Common/Enums.h"
#include "Discovery/CancellationToken.h"
#include "Discovery/DiscoveryTypes.h"

#include <optional>
#include <string>
#include <vector>

namespace HomeLens::Discovery {

/**
 * @brief 타겟 탐색 서술자 (mDNS 서비스 / UPnP 디바이스 타입 / TCP 포트)
 */
struct ServiceDescriptor {
  Enums::ServiceDescriptorType type = Enums::ServiceDescriptorType::MDNS_SERVICE;
  std::string value;
  std::vector<int> ports;

  static ServiceDescriptor MdnsService(const std::string &service) {
    return {Enums::ServiceDescriptorType::MDNS_SERVICE, service, {}};
  }
  static ServiceDescriptor UpnpDeviceType(const std::string &device_type) {
    return {Enums::ServiceDescriptorType::UPNP_DEVICE_TYPE, device_type, {}};
  }
  static ServiceDescriptor TcpPorts(const std::vector<int> &ports) {
    return {Enums::ServiceDescriptorType::TCP_PORTS, "", ports};
  }

  std::string ToString() const {
    std::string text = Enums::ServiceDescriptorTypeToString(type) + "(";
    if (type == Enums::ServiceDescriptorType::TCP_PORTS) {
      for (size_t i = 0; i < ports.size(); ++i) {
        text += (i ? "," : "") + std::to_string(ports[i]);
      }
    } else {
      text += value;
    }
    return text + ")";
  }
};

class IDiscoveryAdapter {
public:
  virtual ~IDiscoveryAdapter() = default;

  virtual std::string GetProtocolName() const = 0;

  /**
   * @brief 전체 스캔
   * @param token 데드라인/취소 신호. 취소 후 반환한 데이터는 폐기된다.
   */
  virtual std::vector<RawDeviceRecord> Discover(const CancellationToken &token) = 0;

  // ==========================================================================
  // 선택 기능 (기본 구현: 지원 안 함)
  // ==========================================================================

  virtual bool SupportsService(const ServiceDescriptor & /*descriptor*/) const {
    return false;
  }

  virtual std::vector<RawDeviceRecord>
  DiscoverService(const ServiceDescriptor & /*descriptor*/,
                  const CancellationToken & /*token*/) {
    return {};
  }

  /**
   * @brief IP 기준 상세 정보 조회 (get_device_details 에서 사용)
   */
  virtual std::optional<json> GetDeviceInfo(const std::string & /*ip_address*/,
                                            const CancellationToken & /*token*/) {
    return std::nullopt;
  }
};

} // namespace HomeLens::Discovery

#endif // HOMELENS_DISCOVERY_IDISCOVERY_ADAPTER_H
