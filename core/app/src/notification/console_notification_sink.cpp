#include "quorum/notification/console_notification_sink.hpp"

#include "quorum/time/time_utils.hpp"

#include <iostream>

namespace quorum {

ConsoleNotificationSink::ConsoleNotificationSink() : out_(std::cout) {}

ConsoleNotificationSink::ConsoleNotificationSink(std::ostream& out)
    : out_(out) {}

void ConsoleNotificationSink::notify(const Notification& notification) {
  std::lock_guard lock(mutex_);
  out_ << "[Notification] " << ms_to_iso8601(notification.created_at) << " "
       << toString(notification.severity) << " " << notification.category
       << ": " << notification.title;
  if (!notification.body.empty()) {
    out_ << " | " << notification.body;
  }
  out_ << std::endl;
}

}  // namespace quorum
