#pragma once

#include "quorum/domain/order.hpp"
#include "quorum/domain/portfolio.hpp"
#include "quorum/time/i_time_provider.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <utility>

namespace quorum {

// Outcome of PortfolioStore::applyFill().
enum class FillOutcome {
  Applied,             // new snapshot published
  Duplicate,           // (order_id, fill_seq) already applied; no change
  InvariantViolation,  // fill refused; portfolio unchanged
};

inline const char* toString(FillOutcome outcome) {
  switch (outcome) {
    case FillOutcome::Applied:            return "Applied";
    case FillOutcome::Duplicate:          return "Duplicate";
    case FillOutcome::InvariantViolation: return "InvariantViolation";
  }
  return "Unknown";
}

struct FillApplication {
  FillOutcome outcome{FillOutcome::Applied};
  std::shared_ptr<const domain::PortfolioSnapshot> snapshot;
  double realized_pnl{0.0};
  bool position_closed{false};
  std::string detail;
};

// -----------------------------------------------------------------------------
// PortfolioStore
// -----------------------------------------------------------------------------
//
// @brief  Single-writer owner of the portfolio. Every fill goes through
//         applyFill(), which builds a new immutable PortfolioSnapshot and
//         swaps it in atomically.
//
// @details
// Capital accounting:
//   * Opening or adding to a position reserves quantity * price from
//     available_capital.
//   * Closing returns the reserved cost (quantity * entry_price) plus the
//     realized PnL to available_capital; total_capital moves by the PnL.
//   * A fill that crosses through zero closes the position and opens the
//     remainder on the other side.
//
// Idempotence:
//   (order_id, fill_seq) is recorded for every applied fill. Re-applying the
//   same key returns FillOutcome::Duplicate without touching state, so a
//   retried status poll that reports a fill again is harmless. The keys of an
//   order are dropped by forgetOrder() once it is terminal.
//
// Invariant enforcement:
//   A fill that would drive available_capital below zero, that carries a
//   non-positive quantity or price, or that is reduce_only but would open or
//   flip a position, is refused with FillOutcome::InvariantViolation. The
//   previous snapshot stays current.
//
// Daily PnL:
//   daily_realized_pnl belongs to snapshot.trading_day. The first write on a
//   new trading day (clock.now_ms(), boundary at daily_reset_hour_utc) zeroes
//   the counter before applying the fill.
//
// Thread model:
//   std::shared_mutex around the current snapshot pointer. snapshot() takes
//   a shared lock and returns the shared_ptr; applyFill() holds the unique
//   lock for the whole read-modify-swap. The update listener runs after that
//   lock is released, on the writer's thread, under listener_mutex_ which is
//   acquired before the release: notifications are delivered one at a time
//   and in version order.
//
// Ownership:
//   Owned by the Orchestrator. The ExecutionCoordinator and RiskValidator
//   path borrow it by reference; readers keep snapshots alive via
//   shared_ptr for as long as they need them.
// -----------------------------------------------------------------------------
class PortfolioStore {
 public:
  using UpdateListener =
      std::function<void(std::shared_ptr<const domain::PortfolioSnapshot>)>;

  PortfolioStore(double initial_capital, const ITimeProvider& clock,
                 int daily_reset_hour_utc = 0);

  PortfolioStore(const PortfolioStore&) = delete;
  PortfolioStore& operator=(const PortfolioStore&) = delete;
  PortfolioStore(PortfolioStore&&) = delete;
  PortfolioStore& operator=(PortfolioStore&&) = delete;

  std::shared_ptr<const domain::PortfolioSnapshot> snapshot() const;

  FillApplication applyFill(const domain::Fill& fill);

  // Replaces the current state with a previously persisted snapshot. Used at
  // startup before any fill is applied. Returns false (state unchanged) if
  // the snapshot violates an invariant.
  bool hydrate(const domain::PortfolioSnapshot& restored);

  // Releases the idempotency keys of a terminal order.
  void forgetOrder(domain::OrderId order_id);

  // The listener must not call back into this store.
  void setUpdateListener(UpdateListener listener);

  bool hasApplied(domain::OrderId order_id, std::uint32_t fill_seq) const;
  std::size_t appliedFillCount() const;

 private:
  static constexpr double kEpsilon = 1e-9;

  // Applies `fill` to `next`; returns a non-empty error on violation.
  std::string applyToSnapshot(domain::PortfolioSnapshot& next,
                              const domain::Fill& fill,
                              double& realized_pnl,
                              bool& position_closed) const;

  const ITimeProvider& clock_;
  const int daily_reset_hour_utc_;

  mutable std::shared_mutex mutex_;
  std::shared_ptr<const domain::PortfolioSnapshot> current_;
  std::set<std::pair<domain::OrderId, std::uint32_t>> applied_;

  std::mutex listener_mutex_;
  UpdateListener listener_;
};

}  // namespace quorum
