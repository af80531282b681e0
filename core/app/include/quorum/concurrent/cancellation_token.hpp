#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace quorum {

// -----------------------------------------------------------------------------
// CancellationToken — cooperative cancellation for long-running order tasks
// -----------------------------------------------------------------------------
//
// @brief  Shared flag plus an interruptible sleep. The execution retry loop
//         checks isCancelled() before every venue call and sleeps its
//         backoff through waitFor(), so requestCancel() takes effect without
//         waiting out the remaining delay.
//
// @details
// Tokens are cheap handles onto shared state: copies observe the same flag.
// A default-constructed token is never cancelled unless requestCancel() is
// called on it or on one of its copies.
//
// The wait uses the same stop-condition-variable pattern as
// EventLoopThread::run(): a predicate re-checked after every wakeup so a
// spurious wakeup cannot end the sleep early.
//
// Thread model:
//   requestCancel() may be called from any thread (shutdown path, risk
//   supersession). isCancelled() and waitFor() are called by the task that
//   owns the order.
// -----------------------------------------------------------------------------
class CancellationToken {
 public:
  CancellationToken() : state_(std::make_shared<State>()) {}

  // Sets the flag and wakes any waiter. Idempotent.
  void requestCancel() const {
    {
      std::lock_guard lock(state_->mutex);
      state_->cancelled.store(true);
    }
    state_->cv.notify_all();
  }

  bool isCancelled() const { return state_->cancelled.load(); }

  // -------------------------------------------------------------------------
  // waitFor(duration)
  // -------------------------------------------------------------------------
  // @brief  Sleeps for `duration` unless cancelled first.
  //
  // @return true if the token was cancelled (before or during the wait),
  //         false if the full duration elapsed.
  // -------------------------------------------------------------------------
  template <typename Rep, typename Period>
  bool waitFor(std::chrono::duration<Rep, Period> duration) const {
    std::unique_lock lock(state_->mutex);
    return state_->cv.wait_for(lock, duration,
                               [this] { return state_->cancelled.load(); });
  }

 private:
  struct State {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::condition_variable cv;
  };

  std::shared_ptr<State> state_;
};

}  // namespace quorum
