#pragma once

#include "quorum/domain/order.hpp"
#include "quorum/domain/portfolio.hpp"
#include "quorum/domain/proposal.hpp"
#include "quorum/domain/rejection.hpp"
#include "quorum/domain/risk_limits.hpp"

#include <string>
#include <variant>

namespace quorum {

using ValidationResult = std::variant<domain::ApprovedOrder, domain::Rejection>;

// -----------------------------------------------------------------------------
// RiskValidator
// -----------------------------------------------------------------------------
//
// @brief  Turns a Candidate Decision into either an Approved Order or a
//         Rejection, against one immutable PortfolioSnapshot.
//
// @details
// Checks run in this order and stop at the first failure:
//
//   1. Position sizing   notional clamped to max_position_size_fraction of
//                        total capital; a clamped quantity below
//                        min_tradable_quantity → SizeTooSmall.
//   2. Daily loss        daily_realized_pnl of the current trading day at or
//                        below -max_daily_loss_fraction * total capital
//                        → DailyLossLimitBreached. A snapshot whose
//                        trading_day is older counts as zero loss.
//   3. Capital           an Open order's notional must fit in
//                        available_capital → InsufficientCapital. Reduce
//                        orders release capital and always pass.
//   4. Duplicate         an open position on the same side
//                        → DuplicatePosition. An opposite-side position turns
//                        the order into a Reduce capped at its quantity.
//
// Approval attaches stop-loss and take-profit levels around the reference
// price (below/above for buys, mirrored for sells). Reduce orders carry none.
//
// The validator is pure: no I/O, no clock of its own, no retries. The same
// inputs always produce the same output. order_id is left at 0 for the
// orchestrator to assign.
//
// Thread model: const after construction; safe from any thread.
// -----------------------------------------------------------------------------
class RiskValidator {
 public:
  RiskValidator(domain::RiskLimits limits, std::string default_venue);

  ValidationResult validate(const domain::CandidateDecision& decision,
                            const domain::PortfolioSnapshot& portfolio,
                            domain::TimestampMs now_ms) const;

  const domain::RiskLimits& limits() const { return limits_; }
  const std::string& defaultVenue() const { return default_venue_; }

 private:
  const domain::RiskLimits limits_;
  const std::string default_venue_;
};

// Free-function form, for callers that hold limits separately.
ValidationResult validateDecision(const domain::CandidateDecision& decision,
                                  const domain::PortfolioSnapshot& portfolio,
                                  const domain::RiskLimits& limits,
                                  const std::string& venue,
                                  domain::TimestampMs now_ms);

}  // namespace quorum
