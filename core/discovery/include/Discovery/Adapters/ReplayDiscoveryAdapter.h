#pragma once

#ifndef REPLAY_DISCOVERY_ADAPTER_H
#define REPLAY_DISCOVERY_ADAPTER_H

/**
 * @file ReplayDiscoveryAdapter.h
 * @brief 캡처 파일에 기록된 Raw 레코드를 다시 내보내는 어댑터
 * @author HomeLens Development Team
 * @date 2026-10-12
 *
 * 캡처 파일 형식:
 * {
 *   "mdns":   [ {...}, {...} ],
 *   "zigbee": { "delay_ms": 500, "devices": [ {...} ] }
 * }
 * 항목 값이 배열이면 지연 없이, 객체면 delay_ms 만큼 (취소 가능) 대기 후 반환.
 */

#include "Discovery/IDiscoveryAdapter.h"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace HomeLens::Discovery {

class ReplayDiscoveryAdapter : public IDiscoveryAdapter {
public:
    ReplayDiscoveryAdapter(std::string protocol, std::vector<RawDeviceRecord> records,
                           std::chrono::milliseconds scan_delay = std::chrono::milliseconds(0));

    /**
     * @return 프로토콜별 어댑터 (파일 순서). 읽기/파싱 실패 시 빈 목록.
     */
    static std::vector<std::shared_ptr<ReplayDiscoveryAdapter>> LoadCaptureFile(const std::string& path);
    static std::vector<std::shared_ptr<ReplayDiscoveryAdapter>> FromCaptureJson(const json& capture);

    std::string GetProtocolName() const override { return protocol_; }
    std::vector<RawDeviceRecord> Discover(const CancellationToken& token) override;

    bool SupportsService(const ServiceDescriptor& descriptor) const override;
    std::vector<RawDeviceRecord> DiscoverService(const ServiceDescriptor& descriptor,
                                                 const CancellationToken& token) override;

    std::optional<json> GetDeviceInfo(const std::string& ip_address,
                                      const CancellationToken& token) override;

    size_t GetRecordCount() const { return records_.size(); }

private:
    static bool RecordMatches(const RawDeviceRecord& record, const ServiceDescriptor& descriptor);

    std::string protocol_;
    std::vector<RawDeviceRecord> records_;
    std::chrono::milliseconds scan_delay_;
};

} // namespace HomeLens::Discovery

#endif // REPLAY_DISCOVERY_ADAPTER_H
