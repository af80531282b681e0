#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace quorum {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: Unbounded multi-producer / multi-consumer FIFO used at every
// thread boundary in the engine (agent runners → proposal buffer, audit loop,
// instrument lanes, notification dispatcher, IPC telemetry).
//
// Thread model: All methods are thread-safe. pop_for() blocks the caller for
// at most the given timeout, so worker loops can re-check their stop flag
// without a busy-wait.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  // Non-copyable, non-movable: owns a mutex and a condition variable.
  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // Appends one item and wakes one waiting consumer. Never blocks beyond the
  // short critical section, so producers (agents, the venue path) are never
  // held up by a slow consumer.
  // -------------------------------------------------------------------------
  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
  }

  // Blocking pop: waits until an item is available.
  T pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return !queue_.empty(); });
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // pop_for(timeout)
  // -------------------------------------------------------------------------
  // Waits up to `timeout` for an item. Returns std::nullopt on timeout or
  // when wake() was called with the queue still empty. Worker loops use this
  // instead of pop() so a stop request is observed within one timeout.
  // -------------------------------------------------------------------------
  template <typename Rep, typename Period>
  std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);
    condition_.wait_for(lock, timeout,
                        [this] { return !queue_.empty() || woken_; });
    woken_ = false;
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Removes and returns every queued item in FIFO order.
  std::vector<T> drain() {
    std::lock_guard lock(mutex_);
    std::vector<T> items;
    items.reserve(queue_.size());
    for (auto& item : queue_) {
      items.push_back(std::move(item));
    }
    queue_.clear();
    return items;
  }

  // Interrupts any consumer blocked in pop_for() so it can re-check its
  // stop flag immediately.
  void wake() {
    {
      std::lock_guard lock(mutex_);
      woken_ = true;
    }
    condition_.notify_all();
  }

  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::deque<T> queue_;
  bool woken_{false};
};

}  // namespace quorum
