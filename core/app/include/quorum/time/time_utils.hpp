#pragma once

#include "quorum/domain/types.hpp"

#include <cstdio>
#include <ctime>
#include <string>

namespace quorum {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
// The domain model carries epoch milliseconds; this renders them for log
// lines and notifications.
// Stateless, safe from any thread.
// -----------------------------------------------------------------------------

// ISO-8601 UTC rendering with millisecond precision, e.g.
// "2024-03-01T12:00:00.250Z".
inline std::string ms_to_iso8601(domain::TimestampMs ms) {
  std::time_t seconds = static_cast<std::time_t>(ms / 1000);
  long millis = static_cast<long>(ms % 1000);
  if (millis < 0) {
    millis += 1000;
    --seconds;
  }
  std::tm utc{};
  gmtime_r(&seconds, &utc);
  char date[32];
  std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);
  char out[48];
  std::snprintf(out, sizeof(out), "%s.%03ldZ", date, millis);
  return out;
}

}  // namespace quorum
