#include "quorum/notification/notification_dispatcher.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <sstream>
#include <type_traits>

namespace quorum {

namespace {

constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(50);

}  // namespace

NotificationDispatcher::~NotificationDispatcher() { stop(); }

void NotificationDispatcher::addSink(std::shared_ptr<INotificationSink> sink) {
  std::lock_guard lock(sinks_mutex_);
  sinks_.push_back(std::move(sink));
}

void NotificationDispatcher::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void NotificationDispatcher::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  queue_.wake();
  thread_.join();
}

void NotificationDispatcher::dispatch(Notification notification) {
  queue_.push(std::move(notification));
}

void NotificationDispatcher::run() {
  while (running_.load()) {
    auto notification = queue_.pop_for(kIdleWaitTimeout);
    if (notification) {
      deliver(*notification);
    }
  }
  for (const auto& notification : queue_.drain()) {
    deliver(notification);
  }
}

void NotificationDispatcher::deliver(const Notification& notification) {
  std::vector<std::shared_ptr<INotificationSink>> sinks;
  {
    std::lock_guard lock(sinks_mutex_);
    sinks = sinks_;
  }
  for (const auto& sink : sinks) {
    try {
      sink->notify(notification);
      delivered_.fetch_add(1);
    } catch (const std::exception& ex) {
      failed_.fetch_add(1);
      std::cerr << "[NotificationDispatcher] sink failed for '"
                << notification.title << "': " << ex.what() << "\n";
    }
  }
}

std::optional<Notification> NotificationDispatcher::fromEvent(
    const Event& event) {
  return std::visit(
      [](const auto& e) -> std::optional<Notification> {
        using T = std::decay_t<decltype(e)>;
        Notification n;
        if constexpr (std::is_same_v<T, RiskRejectionEvent>) {
          const auto& decision = e.rejection.decision;
          n.severity = Severity::Warning;
          n.category = "rejection";
          n.title = std::string(domain::toString(e.rejection.reason)) + " " +
                    domain::toString(decision.side) + " " + decision.instrument;
          n.body = e.rejection.detail + " | " + decision.rationale;
          n.created_at = e.timestamp_ms;
          return n;
        } else if constexpr (std::is_same_v<T, ExecutionResultEvent>) {
          const auto& r = e.result;
          std::ostringstream title;
          title << domain::toString(r.state) << " " << domain::toString(r.side)
                << " " << r.filled_quantity << "/" << r.requested_quantity << " "
                << r.instrument << " on " << r.venue;
          if (r.state == domain::ExecutionState::Filled) {
            n.severity = Severity::Info;
            title << " @ " << r.average_fill_price;
          } else if (r.reason == domain::ExecutionFailureReason::InvariantViolation) {
            n.severity = Severity::Critical;
          } else {
            n.severity = Severity::Warning;
          }
          n.category = "execution";
          n.title = title.str();
          n.body = std::string(domain::toString(r.reason)) + ": " + r.rationale;
          n.created_at = e.timestamp_ms;
          return n;
        } else if constexpr (std::is_same_v<T, InvariantViolationEvent>) {
          n.severity = Severity::Critical;
          n.category = "invariant";
          n.title = e.component + " invariant violated (order " +
                    std::to_string(e.order_id) + ")";
          n.body = e.detail;
          n.created_at = e.timestamp_ms;
          return n;
        } else {
          return std::nullopt;
        }
      },
      event);
}

}  // namespace quorum
