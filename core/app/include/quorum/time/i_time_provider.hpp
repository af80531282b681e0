#pragma once

#include "quorum/domain/types.hpp"

namespace quorum {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract time source
// -----------------------------------------------------------------------------
//
// @brief  Abstracts "current time" away from std::chrono::system_clock so
//         every time-dependent decision (snapshot staleness, daily loss reset,
//         cycle boundaries) is testable with an injected clock.
//
// @details
//   - LiveTimeProvider       → system_clock, used by the running engine.
//   - SimulationTimeProvider → a value set explicitly by tests and replays.
//
// Time is epoch milliseconds (UTC), the same unit carried by every domain
// timestamp and by the JSON ticks arriving over ZeroMQ.
//
// Thread-safety contract:
//   Implementations must be safe for concurrent reads. Writers synchronize
//   with readers internally.
//
// Ownership:
//   Components hold a const reference; the orchestrator (or the test) owns
//   the provider and keeps it alive for longer than its users.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Epoch milliseconds. Pure read, callable from any thread.
  virtual domain::TimestampMs now_ms() const = 0;
};

}  // namespace quorum
