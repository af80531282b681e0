#pragma once

#include "quorum/domain/types.hpp"

#include <cstdint>

namespace quorum {

// -----------------------------------------------------------------------------
// Trading-day arithmetic for the daily loss breaker
// -----------------------------------------------------------------------------
//
// @details
// A trading day starts at `reset_hour_utc`:00:00.000 UTC and lasts 24 hours.
// trading_day_index() numbers those days from the epoch, so two timestamps
// belong to the same trading day exactly when their indices are equal. The
// instant of the boundary itself already belongs to the new day.
//
// Example with reset_hour_utc = 0:
//   2024-03-01T23:59:59.999Z → day N
//   2024-03-02T00:00:00.000Z → day N + 1
// -----------------------------------------------------------------------------

constexpr domain::TimestampMs kMillisPerHour = 3'600'000;
constexpr domain::TimestampMs kMillisPerDay = 24 * kMillisPerHour;

// Floor division, correct for timestamps before the epoch as well.
inline std::int64_t trading_day_index(domain::TimestampMs now_ms,
                                      int reset_hour_utc) {
  const domain::TimestampMs shifted =
      now_ms - static_cast<domain::TimestampMs>(reset_hour_utc) * kMillisPerHour;
  std::int64_t day = shifted / kMillisPerDay;
  if (shifted % kMillisPerDay < 0) {
    --day;
  }
  return day;
}

// Epoch ms at which the trading day *after* the one containing now_ms begins.
inline domain::TimestampMs next_trading_day_start(domain::TimestampMs now_ms,
                                                  int reset_hour_utc) {
  return (trading_day_index(now_ms, reset_hour_utc) + 1) * kMillisPerDay +
         static_cast<domain::TimestampMs>(reset_hour_utc) * kMillisPerHour;
}

}  // namespace quorum
