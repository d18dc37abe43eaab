/**
 * @file AdapterTaskGroup.cpp
 * @brief 어댑터 작업 묶음 실행기 구현
 */

#include "Discovery/AdapterTaskGroup.h"
#include "Common/Constants.h"
#include "Logging/LogManager.h"

namespace HomeLens::Discovery {

using SteadyClock = CancellationToken::SteadyClock;

AdapterTaskGroup::AdapterTaskGroup(std::chrono::milliseconds timeout, Enums::DiscoveryMode mode)
    : timeout_(timeout), mode_(mode) {}

void AdapterTaskGroup::AddTask(const std::string &protocol, AdapterJob job) {
    tasks_.push_back({protocol, std::move(job)});
}

void AdapterTaskGroup::AddUnknown(const std::string &protocol) {
    tasks_.push_back({protocol, nullptr});
}

std::vector<AdapterOutcome> AdapterTaskGroup::Run() {
    // 토큰 데드라인은 Run 시점부터
    token_.SetDeadline(SteadyClock::now() + timeout_);

    auto outcomes = (mode_ == Enums::DiscoveryMode::PARALLEL) ? RunParallel() : RunSequential();

    // 남은 작업에 취소 통지 (늦은 결과는 이미 폐기됨)
    token_.Cancel();
    return outcomes;
}

AdapterOutcome AdapterTaskGroup::ExecuteJob(const std::string &protocol, const AdapterJob &job,
                                            const CancellationToken &token) {
    auto started = SteadyClock::now();
    AdapterOutcome outcome;
    outcome.protocol = protocol;

    try {
        outcome.records = job(token);
        outcome.status = Enums::AdapterStatus::SUCCESS;
    } catch (const std::exception &e) {
        outcome.status = Enums::AdapterStatus::FAILED;
        outcome.error_message = e.what();
        outcome.records.clear();
    } catch (...) {
        outcome.status = Enums::AdapterStatus::FAILED;
        outcome.error_message = "unknown adapter exception";
        outcome.records.clear();
    }

    // 취소 이후 반환된 부분 결과는 사용하지 않는다
    if (outcome.IsSuccess() && token.IsCancelled()) {
        outcome.status = Enums::AdapterStatus::TIMED_OUT;
        outcome.error_message = "adapter returned after cancellation";
        outcome.records.clear();
    }

    outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - started);
    return outcome;
}

AdapterOutcome AdapterTaskGroup::Collect(const std::string &protocol, std::future<AdapterOutcome> &future,
                                         SteadyClock::time_point deadline) {
    auto status = future.wait_until(deadline + Constants::DEADLINE_EPSILON);
    if (status == std::future_status::ready) {
        return future.get();
    }

    auto outcome = AdapterOutcome::Failure(protocol, Enums::AdapterStatus::TIMED_OUT,
                                           "deadline of " + std::to_string(timeout_.count()) + "ms exceeded");
    outcome.elapsed = timeout_;
    return outcome;
}

std::vector<AdapterOutcome> AdapterTaskGroup::RunParallel() {
    auto deadline = *token_.Deadline();
    std::vector<std::future<AdapterOutcome>> futures;
    futures.reserve(tasks_.size());

    for (const auto &task : tasks_) {
        if (!task.job) {
            futures.emplace_back();
            continue;
        }
        CancellationToken token = token_;
        futures.push_back(LaunchDetached(
            [protocol = task.protocol, job = task.job, token]() { return ExecuteJob(protocol, job, token); }));
    }

    std::vector<AdapterOutcome> outcomes;
    outcomes.reserve(tasks_.size());
    for (size_t i = 0; i < tasks_.size(); ++i) {
        if (!tasks_[i].job) {
            outcomes.push_back(AdapterOutcome::Failure(tasks_[i].protocol, Enums::AdapterStatus::UNKNOWN_PROTOCOL,
                                                       "no adapter registered"));
            continue;
        }
        outcomes.push_back(Collect(tasks_[i].protocol, futures[i], deadline));
    }
    return outcomes;
}

std::vector<AdapterOutcome> AdapterTaskGroup::RunSequential() {
    auto deadline = *token_.Deadline();
    std::vector<AdapterOutcome> outcomes;
    outcomes.reserve(tasks_.size());

    for (const auto &task : tasks_) {
        if (!task.job) {
            outcomes.push_back(AdapterOutcome::Failure(task.protocol, Enums::AdapterStatus::UNKNOWN_PROTOCOL,
                                                       "no adapter registered"));
            continue;
        }
        if (token_.IsCancelled()) {
            bool expired = SteadyClock::now() >= deadline;
            outcomes.push_back(AdapterOutcome::Failure(
                task.protocol, expired ? Enums::AdapterStatus::TIMED_OUT : Enums::AdapterStatus::CANCELLED,
                expired ? "deadline reached before adapter started" : "cancelled before adapter started"));
            continue;
        }

        CancellationToken token = token_;
        auto future = LaunchDetached(
            [protocol = task.protocol, job = task.job, token]() { return ExecuteJob(protocol, job, token); });
        outcomes.push_back(Collect(task.protocol, future, deadline));
    }
    return outcomes;
}

} // namespace HomeLens::Discovery
