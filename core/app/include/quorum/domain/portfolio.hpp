#pragma once

#include "quorum/domain/types.hpp"

#include <cstdint>
#include <map>
#include <string>

namespace quorum {
namespace domain {

// One open position. At most one exists per (instrument, venue).
struct OpenPosition {
  std::string instrument;
  std::string venue;
  Side side{Side::Buy};
  double quantity{0.0};
  double entry_price{0.0};
  TimestampMs opened_at{0};
};

// Key used by PortfolioSnapshot::open_positions.
inline std::string positionKey(const std::string& instrument,
                               const std::string& venue) {
  return instrument + "@" + venue;
}

// -----------------------------------------------------------------------------
// PortfolioSnapshot — immutable view of capital and exposure
// -----------------------------------------------------------------------------
//
// @brief  The single authoritative portfolio state, published by
//         PortfolioStore as std::shared_ptr<const PortfolioSnapshot>.
//
// @details
// Readers (risk validation, agents, IPC queries) hold the pointer for as
// long as they need a consistent view. The store never mutates a published
// snapshot; every fill builds a new one with version + 1.
//
// Invariants:
//   * available_capital >= 0
//   * at most one entry per positionKey(instrument, venue)
//
// trading_day is the index of the trading day daily_realized_pnl belongs
// to (see time/daily_boundary.hpp). A snapshot whose trading_day is older
// than the current one carries a stale daily counter that counts as zero.
// -----------------------------------------------------------------------------
struct PortfolioSnapshot {
  double total_capital{0.0};
  double available_capital{0.0};
  std::map<std::string, OpenPosition> open_positions;
  double daily_realized_pnl{0.0};
  double total_realized_pnl{0.0};
  std::int64_t trading_day{0};
  std::uint64_t version{0};
  TimestampMs updated_at{0};

  const OpenPosition* findPosition(const std::string& instrument,
                                   const std::string& venue) const {
    auto it = open_positions.find(positionKey(instrument, venue));
    return it == open_positions.end() ? nullptr : &it->second;
  }

  // First open position on `instrument` across all venues, or nullptr.
  const OpenPosition* findAnyPosition(const std::string& instrument) const {
    for (const auto& entry : open_positions) {
      if (entry.second.instrument == instrument) {
        return &entry.second;
      }
    }
    return nullptr;
  }
};

}  // namespace domain
}  // namespace quorum
