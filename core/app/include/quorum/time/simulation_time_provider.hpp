#pragma once

#include "quorum/time/i_time_provider.hpp"

#include <atomic>

namespace quorum {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" is whatever the owner last set.
//
// @details
// Tests use it to step across the daily loss reset boundary, to age market
// snapshots past the staleness threshold, and to stamp proposals relative to
// a cycle boundary without sleeping.
//
// Thread model:
//   std::atomic<int64_t>; advance_time() and now_ms() may race freely.
//   Monotonicity is the caller's responsibility.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  explicit SimulationTimeProvider(domain::TimestampMs start_ms = 0)
      : current_time_ms_(start_ms) {}

  domain::TimestampMs now_ms() const override;

  // Sets the clock to new_time_ms.
  void advance_time(domain::TimestampMs new_time_ms);

  // Moves the clock forward by delta_ms.
  void advance_by(domain::TimestampMs delta_ms);

 private:
  std::atomic<domain::TimestampMs> current_time_ms_;
};

}  // namespace quorum
