#pragma once

#ifndef ADAPTER_TASK_GROUP_H
#define ADAPTER_TASK_GROUP_H

/**
 * @file AdapterTaskGroup.h
 * @brief 데드라인이 있는 어댑터 작업 묶음 실행기
 * @author HomeLens Development Team
 * @date 2026-10-12
 *
 * - PARALLEL: 모든 작업을 동시에 시작, 하나의 절대 데드라인까지 수집
 * - SEQUENTIAL: 요청 순서대로 하나씩 실행, 남은 시간만큼만 대기
 * - 데드라인을 넘긴 작업은 TIMED_OUT, 늦게 도착한 데이터는 폐기
 * - 작업 예외는 FAILED 로 변환 (다른 작업에 영향 없음)
 */

#include "Common/Enums.h"
#include "Discovery/CancellationToken.h"
#include "Discovery/DiscoveryTypes.h"

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace HomeLens::Discovery {

/**
 * @brief 작업을 분리된 스레드에서 실행하고 future 반환
 * @details std::async 의 future 는 소멸 시 작업 완료를 기다리므로
 *          데드라인 이후 호출자를 붙잡지 않도록 packaged_task 를 사용한다.
 */
template <typename Fn>
std::future<std::invoke_result_t<Fn>> LaunchDetached(Fn &&fn) {
    using Result = std::invoke_result_t<Fn>;
    auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
    auto future = task->get_future();
    std::thread([task]() { (*task)(); }).detach();
    return future;
}

using AdapterJob = std::function<std::vector<RawDeviceRecord>(const CancellationToken &)>;

class AdapterTaskGroup {
public:
    AdapterTaskGroup(std::chrono::milliseconds timeout, Enums::DiscoveryMode mode);

    /**
     * @brief 작업 추가 (결과는 추가 순서대로 반환)
     */
    void AddTask(const std::string &protocol, AdapterJob job);

    /**
     * @brief 등록되지 않은 프로토콜 자리 표시 (UNKNOWN_PROTOCOL 결과)
     */
    void AddUnknown(const std::string &protocol);

    /**
     * @brief 모든 작업 실행. 데드라인 + 여유 시간 이상 블록하지 않는다.
     */
    std::vector<AdapterOutcome> Run();

    /**
     * @brief 외부 취소. 아직 완료되지 않은 작업은 CANCELLED.
     */
    void Cancel() { token_.Cancel(); }

    const CancellationToken &Token() const { return token_; }
    size_t GetTaskCount() const { return tasks_.size(); }

private:
    struct Task {
        std::string protocol;
        AdapterJob job; // 비어 있으면 UNKNOWN_PROTOCOL
    };

    static AdapterOutcome ExecuteJob(const std::string &protocol, const AdapterJob &job,
                                     const CancellationToken &token);

    std::vector<AdapterOutcome> RunParallel();
    std::vector<AdapterOutcome> RunSequential();

    AdapterOutcome Collect(const std::string &protocol, std::future<AdapterOutcome> &future,
                           CancellationToken::SteadyClock::time_point deadline);

    std::chrono::milliseconds timeout_;
    Enums::DiscoveryMode mode_;
    CancellationToken token_;
    std::vector<Task> tasks_;
};

} // namespace HomeLens::Discovery

#endif // ADAPTER_TASK_GROUP_H
