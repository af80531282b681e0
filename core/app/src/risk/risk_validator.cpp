#include "quorum/risk/risk_validator.hpp"

#include "quorum/time/daily_boundary.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace quorum {

namespace {

domain::Rejection reject(domain::RejectionReason reason,
                         const domain::CandidateDecision& decision,
                         std::string detail) {
  domain::Rejection rejection;
  rejection.reason = reason;
  rejection.decision = decision;
  rejection.detail = std::move(detail);
  return rejection;
}

}  // namespace

RiskValidator::RiskValidator(domain::RiskLimits limits,
                             std::string default_venue)
    : limits_(limits), default_venue_(std::move(default_venue)) {}

ValidationResult RiskValidator::validate(
    const domain::CandidateDecision& decision,
    const domain::PortfolioSnapshot& portfolio,
    domain::TimestampMs now_ms) const {
  return validateDecision(decision, portfolio, limits_, default_venue_, now_ms);
}

ValidationResult validateDecision(const domain::CandidateDecision& decision,
                                  const domain::PortfolioSnapshot& portfolio,
                                  const domain::RiskLimits& limits,
                                  const std::string& venue,
                                  domain::TimestampMs now_ms) {
  using domain::RejectionReason;

  const double price = decision.reference_price;

  // 1. Position sizing.
  if (!(price > 0.0) || !(decision.quantity > 0.0)) {
    std::ostringstream oss;
    oss << "cannot size order: quantity=" << decision.quantity
        << " reference_price=" << price;
    return reject(RejectionReason::SizeTooSmall, decision, oss.str());
  }

  const double max_notional =
      limits.max_position_size_fraction * portfolio.total_capital;
  const double quantity = std::min(decision.quantity, max_notional / price);
  if (quantity < limits.min_tradable_quantity) {
    std::ostringstream oss;
    oss << "clamped quantity " << quantity << " below minimum "
        << limits.min_tradable_quantity << " (max notional " << max_notional
        << ")";
    return reject(RejectionReason::SizeTooSmall, decision, oss.str());
  }

  // 2. Daily loss breaker. A counter from an earlier trading day has reset.
  const bool same_day =
      portfolio.trading_day ==
      trading_day_index(now_ms, limits.daily_reset_hour_utc);
  const double loss_floor =
      -limits.max_daily_loss_fraction * portfolio.total_capital;
  if (same_day && portfolio.daily_realized_pnl <= loss_floor) {
    std::ostringstream oss;
    oss << "daily realized pnl " << portfolio.daily_realized_pnl
        << " at or below limit " << loss_floor;
    return reject(RejectionReason::DailyLossLimitBreached, decision, oss.str());
  }

  // Intent is needed by the capital check; the duplicate check below decides
  // whether a same-side position refuses the order outright.
  const domain::OpenPosition* existing =
      portfolio.findAnyPosition(decision.instrument);
  const bool reduces = existing != nullptr && existing->side != decision.side;

  // 3. Capital sufficiency.
  const double notional = quantity * price;
  if (!reduces && notional > portfolio.available_capital) {
    std::ostringstream oss;
    oss << "notional " << notional << " exceeds available capital "
        << portfolio.available_capital;
    return reject(RejectionReason::InsufficientCapital, decision, oss.str());
  }

  // 4. Duplicate position.
  if (existing != nullptr && !reduces) {
    std::ostringstream oss;
    oss << "already " << domain::toString(existing->side) << " "
        << existing->quantity << " on " << existing->venue;
    return reject(RejectionReason::DuplicatePosition, decision, oss.str());
  }

  domain::ApprovedOrder order;
  order.decision = decision;
  order.side = decision.side;
  order.instrument = decision.instrument;
  order.requested_quantity = decision.quantity;
  order.price_type = domain::PriceType::Market;
  order.reference_price = price;
  order.created_at = now_ms;

  if (reduces) {
    order.intent = domain::OrderIntent::Reduce;
    order.venue = existing->venue;
    order.approved_quantity = std::min(quantity, existing->quantity);
    return order;
  }

  order.intent = domain::OrderIntent::Open;
  order.venue = venue;
  order.approved_quantity = quantity;
  if (decision.side == domain::Side::Buy) {
    order.stop_loss_price = price * (1.0 - limits.stop_loss_fraction);
    order.take_profit_price = price * (1.0 + limits.take_profit_fraction);
  } else {
    order.stop_loss_price = price * (1.0 + limits.stop_loss_fraction);
    order.take_profit_price = price * (1.0 - limits.take_profit_fraction);
  }
  return order;
}

}  // namespace quorum
