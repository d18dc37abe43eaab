#pragma once

#ifndef HOMELENS_DISCOVERY_CANCELLATION_TOKEN_H
#define HOMELENS_DISCOVERY_CANCELLATION_TOKEN_H

/**
 * @file CancellationToken.h
 * @brief 어댑터 협조적 취소 토큰 (공유 상태, 복사 가능)
 * @author HomeLens Development Team
 * @date 2026-10-12
 *
 * 어댑터는 긴 스캔 루프에서 IsCancelled() 를 확인하거나 WaitFor() 로
 * 대기해야 한다. 데드라인이 지나면 자동으로 취소 상태가 된다.
 */

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

namespace HomeLens::Discovery {

class CancellationToken {
public:
  using SteadyClock = std::chrono::steady_clock;

  CancellationToken() : state_(std::make_shared<State>()) {}

  static CancellationToken WithDeadline(SteadyClock::time_point deadline) {
    CancellationToken token;
    token.SetDeadline(deadline);
    return token;
  }

  static CancellationToken WithTimeout(std::chrono::milliseconds timeout) {
    return WithDeadline(SteadyClock::now() + timeout);
  }

  void Cancel() const {
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      state_->cancelled = true;
    }
    state_->cv.notify_all();
  }

  /**
   * @brief 같은 공유 상태에 데드라인 지정 (다른 스레드의 Cancel 과 경쟁하지 않음)
   */
  void SetDeadline(SteadyClock::time_point deadline) const {
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      state_->deadline = deadline;
    }
    state_->cv.notify_all();
  }

  bool IsCancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return isCancelledUnlocked();
  }

  std::optional<SteadyClock::time_point> Deadline() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->deadline;
  }

  /**
   * @brief 취소/데드라인 전까지 duration 동안 대기
   * @return 대기를 끝까지 마쳤으면 true, 중간에 취소되면 false
   */
  bool WaitFor(std::chrono::milliseconds duration) const {
    auto until = SteadyClock::now() + duration;
    std::unique_lock<std::mutex> lock(state_->mutex);
    if (state_->deadline && *state_->deadline < until) {
      state_->cv.wait_until(lock, *state_->deadline,
                            [this] { return state_->cancelled; });
      return false;
    }
    bool cancelled = state_->cv.wait_until(
        lock, until, [this] { return isCancelledUnlocked(); });
    return !cancelled;
  }

private:
  struct State {
    mutable std::mutex mutex;
    std::condition_variable cv;
    bool cancelled = false;
    std::optional<SteadyClock::time_point> deadline;
  };

  bool isCancelledUnlocked() const {
    return state_->cancelled ||
           (state_->deadline && SteadyClock::now() >= *state_->deadline);
  }

  std::shared_ptr<State> state_;
};

} // namespace HomeLens::Discovery

#endif // HOMELENS_DISCOVERY_CANCELLATION_TOKEN_H
