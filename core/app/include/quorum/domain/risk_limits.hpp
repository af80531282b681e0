#pragma once

namespace quorum {
namespace domain {

// -----------------------------------------------------------------------------
// RiskLimits — engine-wide risk thresholds
// -----------------------------------------------------------------------------
//
// @brief  Immutable collection of risk parameters applied by RiskValidator to
//         every Candidate Decision.
//
// @details
// All fractions are relative to PortfolioSnapshot::total_capital:
//
//   max_position_size_fraction  cap on a single order's notional.
//   max_daily_loss_fraction     the daily loss breaker trips when
//                               daily_realized_pnl <= -fraction * capital.
//   stop_loss_fraction          distance of the stop level from the
//                               reference price.
//   take_profit_fraction        distance of the take-profit level.
//
// min_tradable_quantity is the smallest quantity a venue will accept; a
// clamped order below it is rejected as SizeTooSmall.
//
// daily_reset_hour_utc is the hour (0..23, UTC) at which the daily loss
// counter resets. See time/daily_boundary.hpp.
//
// Thread model:
//   Plain data with value semantics. Loaded once by the configuration layer
//   and copied into the orchestrator; never mutated afterwards.
// -----------------------------------------------------------------------------
struct RiskLimits {
  double max_position_size_fraction{0.10};
  double max_daily_loss_fraction{0.05};
  double stop_loss_fraction{0.02};
  double take_profit_fraction{0.05};
  double min_tradable_quantity{1e-8};
  int daily_reset_hour_utc{0};
};

}  // namespace domain
}  // namespace quorum
