#pragma once

#include "quorum/concurrent/thread_safe_queue.hpp"
#include "quorum/events/event.hpp"
#include "quorum/notification/i_notification_sink.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace quorum {

// -----------------------------------------------------------------------------
// NotificationDispatcher
// -----------------------------------------------------------------------------
//
// @brief  Decouples operator notifications from the trading path.
//
// @details
// dispatch() only enqueues. A dedicated thread delivers each notification to
// every registered sink in registration order. A sink that throws a
// std::exception is logged to std::cerr and counted in failedCount(); the
// remaining sinks still receive the notification.
//
// fromEvent() is the notification policy: which audit events become
// operator messages and at what severity.
//
//   RiskRejectionEvent        Warning   rejection
//   ExecutionResultEvent      Info when Filled, Critical for
//                             InvariantViolation, Warning otherwise
//   InvariantViolationEvent   Critical  invariant
//
// Everything else produces no notification.
//
// Thread model:
//   addSink() before start(). dispatch() from any thread. stop() delivers
//   what is still queued, then joins.
// -----------------------------------------------------------------------------
class NotificationDispatcher {
 public:
  NotificationDispatcher() = default;
  ~NotificationDispatcher();

  NotificationDispatcher(const NotificationDispatcher&) = delete;
  NotificationDispatcher& operator=(const NotificationDispatcher&) = delete;

  void addSink(std::shared_ptr<INotificationSink> sink);

  void start();
  void stop();

  void dispatch(Notification notification);

  std::uint64_t deliveredCount() const { return delivered_.load(); }
  std::uint64_t failedCount() const { return failed_.load(); }

  static std::optional<Notification> fromEvent(const Event& event);

 private:
  void run();
  void deliver(const Notification& notification);

  std::mutex sinks_mutex_;
  std::vector<std::shared_ptr<INotificationSink>> sinks_;

  ThreadSafeQueue<Notification> queue_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> delivered_{0};
  std::atomic<std::uint64_t> failed_{0};
  std::thread thread_;
};

}  // namespace quorum
