#ifndef DISCOVERY_CACHE_H
#define DISCOVERY_CACHE_H

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>

#include "Discovery/DiscoveryTypes.h"

namespace HomeLens {
namespace Discovery {

/**
 * @brief 한 번의 탐색 사이클 전체를 보관하는 TTL 캐시
 *
 * - Update() 는 스냅샷을 통째로 교체한다 (부분 갱신 없음)
 * - cache_duration 이 0 이면 IsValid() 는 항상 false
 * - 오케스트레이터 인스턴스마다 하나씩 소유 (전역 공유 없음)
 */
class DiscoveryCache {
public:
    explicit DiscoveryCache(std::chrono::seconds cache_duration);

    bool IsValid() const;
    bool IsValid(Timestamp now) const;

    /**
     * @brief 유효한 경우에만 마지막 사이클 결과 반환 (검사와 조회가 원자적)
     */
    std::optional<ProtocolResultMap> GetIfValid() const;

    /**
     * @brief 유효성과 무관하게 마지막 사이클 결과 (비어 있으면 빈 맵)
     */
    ProtocolResultMap Get() const;

    void Update(const ProtocolResultMap& results);
    void Update(const ProtocolResultMap& results, Timestamp discovered_at);

    void Clear();

    std::optional<EnrichedDiscoveryResult> FindDevice(const std::string& device_id) const;

    std::optional<Timestamp> GetLastDiscoveryTime() const;
    size_t GetDeviceCount() const;
    std::chrono::seconds GetCacheDuration() const { return cache_duration_; }

    DiscoveryStatistics BuildStatistics() const;
    DiscoveryStatistics BuildStatistics(Timestamp now) const;

private:
    struct Snapshot {
        ProtocolResultMap results;
        std::map<std::string, EnrichedDiscoveryResult> devices; // device_id -> 마지막 기록
        Timestamp last_discovery_time;
    };

    bool IsValidUnlocked(Timestamp now) const;

    const std::chrono::seconds cache_duration_;
    mutable std::shared_mutex cache_mutex_;
    std::shared_ptr<const Snapshot> snapshot_;
};

} // namespace Discovery
} // namespace HomeLens

#endif
