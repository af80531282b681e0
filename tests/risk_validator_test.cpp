// =============================================================================
// risk_validator_test.cpp
// =============================================================================
// Unit tests for quorum::RiskValidator / quorum::validateDecision and the
// trading-day helpers in daily_boundary.hpp.
//
// Validates, in check order:
//   1. Position sizing clamps to max_position_size_fraction, never rejects
//      for being too large; SizeTooSmall below the tradable minimum
//   2. Daily loss breaker, and its exact reset at the trading-day boundary
//   3. InsufficientCapital for opening orders only
//   4. DuplicatePosition for same-side adds; opposite side becomes Reduce
// plus stop-loss / take-profit attachment for both sides.
//
// The validator is pure, so every test is a plain function call with an
// explicit clock value.
// =============================================================================

#include "quorum/risk/risk_validator.hpp"
#include "quorum/time/daily_boundary.hpp"

#include <gtest/gtest.h>

#include <variant>

using quorum::domain::ApprovedOrder;
using quorum::domain::CandidateDecision;
using quorum::domain::OrderIntent;
using quorum::domain::PortfolioSnapshot;
using quorum::domain::Rejection;
using quorum::domain::RejectionReason;
using quorum::domain::Side;

namespace {

// 2024-03-01T12:00:00Z
constexpr quorum::domain::TimestampMs kNoon = 1709294400000;

}  // namespace

class RiskValidatorTest : public ::testing::Test {
 protected:
  quorum::domain::RiskLimits limits;  // 0.10 / 0.05 / 0.02 / 0.05
  quorum::RiskValidator validator{limits, "paper"};

  static PortfolioSnapshot portfolio(double total, double available) {
    PortfolioSnapshot p;
    p.total_capital = total;
    p.available_capital = available;
    p.trading_day = quorum::trading_day_index(kNoon, 0);
    return p;
  }

  static CandidateDecision decision(Side side, double quantity, double price,
                                    const std::string& instrument = "BTC/USDT") {
    CandidateDecision d;
    d.cycle_id = 1;
    d.instrument = instrument;
    d.side = side;
    d.quantity = quantity;
    d.confidence = 0.8;
    d.reference_price = price;
    d.rationale = "agent1: test";
    return d;
  }

  static void addPosition(PortfolioSnapshot& p, const std::string& instrument,
                          Side side, double quantity, double entry,
                          const std::string& venue = "paper") {
    quorum::domain::OpenPosition pos;
    pos.instrument = instrument;
    pos.venue = venue;
    pos.side = side;
    pos.quantity = quantity;
    pos.entry_price = entry;
    p.open_positions[quorum::domain::positionKey(instrument, venue)] = pos;
  }
};

// -----------------------------------------------------------------------------
// 1. $150 requested against a $100 cap is clamped to $100, not rejected.
// -----------------------------------------------------------------------------
TEST_F(RiskValidatorTest, OversizedRequestIsClampedToMaxNotional) {
  auto result = validator.validate(decision(Side::Buy, 1.5, 100.0),
                                   portfolio(1000.0, 1000.0), kNoon);

  ASSERT_TRUE(std::holds_alternative<ApprovedOrder>(result));
  const auto& order = std::get<ApprovedOrder>(result);
  EXPECT_DOUBLE_EQ(order.requested_quantity, 1.5);
  EXPECT_DOUBLE_EQ(order.approved_quantity, 1.0);
  EXPECT_DOUBLE_EQ(order.approved_quantity * order.reference_price, 100.0);
  EXPECT_EQ(order.intent, OrderIntent::Open);
  EXPECT_EQ(order.venue, "paper");
  EXPECT_EQ(order.order_id, 0u);  // assigned by the orchestrator
}

// -----------------------------------------------------------------------------
// 2. Size clamp invariant holds for any requested size.
// -----------------------------------------------------------------------------
TEST_F(RiskValidatorTest, ApprovedNotionalNeverExceedsFraction) {
  for (double qty : {0.01, 0.5, 0.99, 1.0, 3.0, 250.0}) {
    auto result = validator.validate(decision(Side::Buy, qty, 100.0),
                                     portfolio(1000.0, 1000.0), kNoon);
    ASSERT_TRUE(std::holds_alternative<ApprovedOrder>(result)) << qty;
    const auto& order = std::get<ApprovedOrder>(result);
    EXPECT_LE(order.approved_quantity * 100.0, 100.0 + 1e-9) << qty;
    EXPECT_LE(order.approved_quantity, order.requested_quantity) << qty;
  }
}

// -----------------------------------------------------------------------------
// 3. Clamped size below the tradable minimum → SizeTooSmall; a decision with
//    no price cannot be sized either.
// -----------------------------------------------------------------------------
TEST_F(RiskValidatorTest, TinyOrUnpricedDecisionIsTooSmall) {
  auto tiny = validator.validate(decision(Side::Buy, 1e-10, 100.0),
                                 portfolio(1000.0, 1000.0), kNoon);
  ASSERT_TRUE(std::holds_alternative<Rejection>(tiny));
  EXPECT_EQ(std::get<Rejection>(tiny).reason, RejectionReason::SizeTooSmall);

  auto unpriced = validator.validate(decision(Side::Buy, 1.0, 0.0),
                                     portfolio(1000.0, 1000.0), kNoon);
  ASSERT_TRUE(std::holds_alternative<Rejection>(unpriced));
  EXPECT_EQ(std::get<Rejection>(unpriced).reason, RejectionReason::SizeTooSmall);
}

// -----------------------------------------------------------------------------
// 4. $50 notional against $20 available → InsufficientCapital.
// -----------------------------------------------------------------------------
TEST_F(RiskValidatorTest, InsufficientCapitalRejectsOpeningOrder) {
  auto result = validator.validate(decision(Side::Buy, 0.5, 100.0),
                                   portfolio(1000.0, 20.0), kNoon);

  ASSERT_TRUE(std::holds_alternative<Rejection>(result));
  const auto& rejection = std::get<Rejection>(result);
  EXPECT_EQ(rejection.reason, RejectionReason::InsufficientCapital);
  EXPECT_EQ(rejection.decision.rationale, "agent1: test");
  EXPECT_FALSE(rejection.detail.empty());
}

// -----------------------------------------------------------------------------
// 5. Daily loss at the limit trips the breaker.
// -----------------------------------------------------------------------------
TEST_F(RiskValidatorTest, DailyLossBreakerRejects) {
  auto p = portfolio(1000.0, 1000.0);
  p.daily_realized_pnl = -50.0;  // exactly 5 %

  auto result = validator.validate(decision(Side::Buy, 0.1, 100.0), p, kNoon);
  ASSERT_TRUE(std::holds_alternative<Rejection>(result));
  EXPECT_EQ(std::get<Rejection>(result).reason,
            RejectionReason::DailyLossLimitBreached);

  p.daily_realized_pnl = -49.99;
  EXPECT_TRUE(std::holds_alternative<ApprovedOrder>(
      validator.validate(decision(Side::Buy, 0.1, 100.0), p, kNoon)));
}

// -----------------------------------------------------------------------------
// 6. The breaker resets exactly at the configured boundary.
// -----------------------------------------------------------------------------
TEST(RiskValidatorBoundaryTest, BreakerResetsExactlyAtBoundary) {
  quorum::domain::RiskLimits limits;
  limits.daily_reset_hour_utc = 8;
  quorum::RiskValidator validator(limits, "paper");

  PortfolioSnapshot p;
  p.total_capital = 1000.0;
  p.available_capital = 1000.0;
  p.daily_realized_pnl = -80.0;
  p.trading_day = quorum::trading_day_index(kNoon, 8);

  CandidateDecision d;
  d.instrument = "ETH/USDT";
  d.side = Side::Buy;
  d.quantity = 0.01;
  d.reference_price = 3000.0;

  const auto boundary = quorum::next_trading_day_start(kNoon, 8);
  EXPECT_EQ(boundary % quorum::kMillisPerDay, 8 * quorum::kMillisPerHour);

  auto before = validator.validate(d, p, boundary - 1);
  ASSERT_TRUE(std::holds_alternative<Rejection>(before));
  EXPECT_EQ(std::get<Rejection>(before).reason,
            RejectionReason::DailyLossLimitBreached);

  auto at = validator.validate(d, p, boundary);
  EXPECT_TRUE(std::holds_alternative<ApprovedOrder>(at));
}

// -----------------------------------------------------------------------------
// 7. Same-side add on an open position → DuplicatePosition.
// -----------------------------------------------------------------------------
TEST_F(RiskValidatorTest, SameSideAddIsDuplicate) {
  auto p = portfolio(1000.0, 900.0);
  addPosition(p, "BTC/USDT", Side::Buy, 1.0, 100.0);

  auto result = validator.validate(decision(Side::Buy, 0.5, 100.0), p, kNoon);
  ASSERT_TRUE(std::holds_alternative<Rejection>(result));
  EXPECT_EQ(std::get<Rejection>(result).reason,
            RejectionReason::DuplicatePosition);
}

// -----------------------------------------------------------------------------
// 8. Opposite side → Reduce on the position's venue, capped at its size,
//    allowed even with no free capital.
// -----------------------------------------------------------------------------
TEST_F(RiskValidatorTest, OppositeSideBecomesCappedReduce) {
  auto p = portfolio(1000.0, 0.0);
  addPosition(p, "BTC/USDT", Side::Buy, 0.4, 100.0, "binance");

  auto result = validator.validate(decision(Side::Sell, 0.9, 110.0), p, kNoon);
  ASSERT_TRUE(std::holds_alternative<ApprovedOrder>(result));
  const auto& order = std::get<ApprovedOrder>(result);
  EXPECT_EQ(order.intent, OrderIntent::Reduce);
  EXPECT_EQ(order.side, Side::Sell);
  EXPECT_EQ(order.venue, "binance");
  EXPECT_DOUBLE_EQ(order.approved_quantity, 0.4);
  EXPECT_DOUBLE_EQ(order.stop_loss_price, 0.0);
}

// -----------------------------------------------------------------------------
// 9. Protective levels: below/above entry for buys, mirrored for sells.
// -----------------------------------------------------------------------------
TEST_F(RiskValidatorTest, AttachesStopLossAndTakeProfit) {
  auto buy = std::get<ApprovedOrder>(validator.validate(
      decision(Side::Buy, 0.1, 200.0), portfolio(1000.0, 1000.0), kNoon));
  EXPECT_DOUBLE_EQ(buy.stop_loss_price, 196.0);
  EXPECT_DOUBLE_EQ(buy.take_profit_price, 210.0);

  auto sell = std::get<ApprovedOrder>(validator.validate(
      decision(Side::Sell, 0.1, 200.0, "ETH/USDT"), portfolio(1000.0, 1000.0),
      kNoon));
  EXPECT_DOUBLE_EQ(sell.stop_loss_price, 204.0);
  EXPECT_DOUBLE_EQ(sell.take_profit_price, 190.0);
}

// -----------------------------------------------------------------------------
// 10. Checks run in order: sizing before the breaker before capital.
// -----------------------------------------------------------------------------
TEST_F(RiskValidatorTest, ChecksShortCircuitInOrder) {
  auto p = portfolio(1000.0, 0.0);
  p.daily_realized_pnl = -100.0;

  auto tiny = validator.validate(decision(Side::Buy, 0.0, 100.0), p, kNoon);
  EXPECT_EQ(std::get<Rejection>(tiny).reason, RejectionReason::SizeTooSmall);

  auto sized = validator.validate(decision(Side::Buy, 1.0, 100.0), p, kNoon);
  EXPECT_EQ(std::get<Rejection>(sized).reason,
            RejectionReason::DailyLossLimitBreached);
}

// -----------------------------------------------------------------------------
// 11. trading_day_index floors correctly before the epoch too.
// -----------------------------------------------------------------------------
TEST(DailyBoundaryTest, TradingDayIndexFloors) {
  EXPECT_EQ(quorum::trading_day_index(0, 0), 0);
  EXPECT_EQ(quorum::trading_day_index(quorum::kMillisPerDay - 1, 0), 0);
  EXPECT_EQ(quorum::trading_day_index(quorum::kMillisPerDay, 0), 1);
  EXPECT_EQ(quorum::trading_day_index(-1, 0), -1);
  EXPECT_EQ(quorum::trading_day_index(quorum::kMillisPerHour * 3, 4), -1);
}
