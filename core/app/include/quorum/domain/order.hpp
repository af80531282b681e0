#pragma once

#include "quorum/domain/order_status.hpp"
#include "quorum/domain/proposal.hpp"
#include "quorum/domain/types.hpp"

#include <string>
#include <vector>

namespace quorum {
namespace domain {

// How an order relates to the existing position on its instrument/venue.
//   Open   — no position exists; the order creates one.
//   Reduce — opposite side of an existing position; closes all or part of it.
// Same-side additions are refused by the risk layer (DuplicatePosition), so
// there is no Add intent.
enum class OrderIntent {
  Open,
  Reduce,
};

enum class PriceType {
  Market,
  Limit,
};

inline const char* toString(OrderIntent intent) {
  return intent == OrderIntent::Open ? "open" : "reduce";
}

inline const char* toString(PriceType type) {
  return type == PriceType::Market ? "market" : "limit";
}

// -----------------------------------------------------------------------------
// ApprovedOrder
// -----------------------------------------------------------------------------
//
// @brief  A Candidate Decision that passed risk validation, sized and priced
//         for submission to one venue.
//
// @details
// Created by RiskValidator (order_id assigned by the orchestrator from the
// OrderIdGenerator). From then on it is owned by the ExecutionCoordinator;
// copies carried by events are read-only snapshots.
//
// approved_quantity <= requested_quantity; it is smaller when the risk layer
// clamped the notional or capped a reduce order at the open quantity.
//
// stop_loss_price / take_profit_price are absolute price levels derived from
// reference_price; the PositionMonitor enforces them once the order fills.
// Both are 0 for Reduce orders, which do not open exposure.
// -----------------------------------------------------------------------------
struct ApprovedOrder {
  OrderId order_id{0};
  CandidateDecision decision;
  OrderIntent intent{OrderIntent::Open};
  Side side{Side::Buy};
  std::string instrument;
  std::string venue;
  double requested_quantity{0.0};
  double approved_quantity{0.0};
  PriceType price_type{PriceType::Market};
  double limit_price{0.0};
  double reference_price{0.0};
  double stop_loss_price{0.0};
  double take_profit_price{0.0};
  TimestampMs created_at{0};
};

// Machine-readable cause attached to every non-Filled ExecutionResult.
enum class ExecutionFailureReason {
  None,
  VenueRejected,
  RetryBudgetExhausted,
  ResubmissionBudgetExhausted,
  StatusPollExhausted,
  Cancelled,
  InvariantViolation,
  NothingToReduce,  // Reduce order found no opposite position to close
};

inline const char* toString(ExecutionFailureReason reason) {
  switch (reason) {
    case ExecutionFailureReason::None:                        return "None";
    case ExecutionFailureReason::VenueRejected:               return "VenueRejected";
    case ExecutionFailureReason::RetryBudgetExhausted:        return "RetryBudgetExhausted";
    case ExecutionFailureReason::ResubmissionBudgetExhausted: return "ResubmissionBudgetExhausted";
    case ExecutionFailureReason::StatusPollExhausted:         return "StatusPollExhausted";
    case ExecutionFailureReason::Cancelled:                   return "Cancelled";
    case ExecutionFailureReason::InvariantViolation:          return "InvariantViolation";
    case ExecutionFailureReason::NothingToReduce:             return "NothingToReduce";
  }
  return "Unknown";
}

// One confirmed fill. fill_seq numbers the fills of a single order from 1;
// (order_id, fill_seq) is the idempotency key the PortfolioStore uses.
struct Fill {
  OrderId order_id{0};
  std::uint32_t fill_seq{0};
  std::string venue_order_id;
  std::string instrument;
  std::string venue;
  Side side{Side::Buy};
  double quantity{0.0};
  double price{0.0};
  TimestampMs filled_at{0};
  // Set for Reduce orders: the fill may shrink or close the opposite
  // position but never open or flip one.
  bool reduce_only{false};
};

// -----------------------------------------------------------------------------
// ExecutionResult — terminal outcome of one Approved Order
// -----------------------------------------------------------------------------
struct ExecutionResult {
  OrderId order_id{0};
  std::string instrument;
  std::string venue;
  Side side{Side::Buy};
  ExecutionState state{ExecutionState::Pending};
  double requested_quantity{0.0};
  double filled_quantity{0.0};
  double average_fill_price{0.0};
  int attempts{0};
  int resubmissions{0};
  ExecutionFailureReason reason{ExecutionFailureReason::None};
  std::string rationale;
  std::vector<Fill> fills;
};

}  // namespace domain
}  // namespace quorum
