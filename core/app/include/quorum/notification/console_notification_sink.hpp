#pragma once

#include "quorum/notification/i_notification_sink.hpp"

#include <iosfwd>
#include <mutex>

namespace quorum {

// Writes notifications to a stream (std::cout by default), one line each.
class ConsoleNotificationSink final : public INotificationSink {
 public:
  ConsoleNotificationSink();
  explicit ConsoleNotificationSink(std::ostream& out);

  void notify(const Notification& notification) override;

 private:
  std::ostream& out_;
  std::mutex mutex_;
};

}  // namespace quorum
