#pragma once

namespace quorum {
namespace domain {

// -----------------------------------------------------------------------------
// ExecutionState — per-order execution state machine
// -----------------------------------------------------------------------------
//
// @brief  Every Approved Order moves through these states inside
//         ExecutionCoordinator::execute().
//
// @details
//
//   Pending ──> Submitted ──> Filled              (terminal, success)
//      │            │  └────> PartiallyFilled ──> Submitted (re-submission)
//      │            │                     ├────> Failed (re-submission budget)
//      │            │                     └────> Rejected (re-submission refused)
//      │            └───────> Rejected            (terminal, venue refused)
//      ├──> Rejected          (permanent failure on first submit)
//      ├──> Failed            (transient retry budget exhausted)
//      └──> Cancelled         (cooperative cancellation before completion)
//
// Submitted and PartiallyFilled may also reach Failed or Cancelled.
// Terminal states: Filled, Rejected, Failed, Cancelled. Once terminal the
// coordinator publishes exactly one ExecutionResultEvent for the order.
// -----------------------------------------------------------------------------
enum class ExecutionState {
  Pending,
  Submitted,
  PartiallyFilled,
  Filled,
  Rejected,
  Failed,
  Cancelled,
};

inline bool isTerminal(ExecutionState state) {
  return state == ExecutionState::Filled ||
         state == ExecutionState::Rejected ||
         state == ExecutionState::Failed ||
         state == ExecutionState::Cancelled;
}

// Legal transitions of the graph above.
inline bool isValidTransition(ExecutionState from, ExecutionState to) {
  using S = ExecutionState;
  switch (from) {
    case S::Pending:
      return to == S::Submitted || to == S::Rejected || to == S::Failed ||
             to == S::Cancelled;
    case S::Submitted:
      return to == S::Filled || to == S::PartiallyFilled ||
             to == S::Rejected || to == S::Failed || to == S::Cancelled;
    case S::PartiallyFilled:
      return to == S::Submitted || to == S::Rejected || to == S::Failed ||
             to == S::Cancelled;
    case S::Filled:
    case S::Rejected:
    case S::Failed:
    case S::Cancelled:
      return false;
  }
  return false;
}

inline const char* toString(ExecutionState state) {
  switch (state) {
    case ExecutionState::Pending:         return "Pending";
    case ExecutionState::Submitted:       return "Submitted";
    case ExecutionState::PartiallyFilled: return "PartiallyFilled";
    case ExecutionState::Filled:          return "Filled";
    case ExecutionState::Rejected:        return "Rejected";
    case ExecutionState::Failed:          return "Failed";
    case ExecutionState::Cancelled:       return "Cancelled";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace quorum
