#pragma once

#include "quorum/domain/types.hpp"

#include <string>

namespace quorum {

enum class Severity {
  Info,
  Warning,
  Critical,
};

inline const char* toString(Severity severity) {
  switch (severity) {
    case Severity::Info:     return "INFO";
    case Severity::Warning:  return "WARNING";
    case Severity::Critical: return "CRITICAL";
  }
  return "UNKNOWN";
}

// One operator-facing message.
struct Notification {
  Severity severity{Severity::Info};
  std::string category;  // "execution", "rejection", "invariant", "system"
  std::string title;
  std::string body;
  domain::TimestampMs created_at{0};
};

// -----------------------------------------------------------------------------
// INotificationSink — outbound operator channel (chat bot, e-mail, console)
// -----------------------------------------------------------------------------
// notify() may block on I/O and may throw std::exception; the
// NotificationDispatcher calls it from its own thread and absorbs failures.
// -----------------------------------------------------------------------------
class INotificationSink {
 public:
  virtual ~INotificationSink() = default;
  virtual void notify(const Notification& notification) = 0;
};

}  // namespace quorum
