#pragma once

#include "quorum/domain/proposal.hpp"

#include <string>

namespace quorum {
namespace domain {

// Why the risk layer (or the orchestrator's pre-checks) refused a decision.
enum class RejectionReason {
  SizeTooSmall,
  DailyLossLimitBreached,
  InsufficientCapital,
  DuplicatePosition,
  TradingHalted,
};

inline const char* toString(RejectionReason reason) {
  switch (reason) {
    case RejectionReason::SizeTooSmall:           return "SizeTooSmall";
    case RejectionReason::DailyLossLimitBreached: return "DailyLossLimitBreached";
    case RejectionReason::InsufficientCapital:    return "InsufficientCapital";
    case RejectionReason::DuplicatePosition:      return "DuplicatePosition";
    case RejectionReason::TradingHalted:          return "TradingHalted";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// Rejection — business outcome of a failed risk check
// -----------------------------------------------------------------------------
// A rejection is never retried. It is persisted and notified with the
// decision that produced it, so `detail` plus decision.rationale explain the
// refusal end to end.
// -----------------------------------------------------------------------------
struct Rejection {
  RejectionReason reason{RejectionReason::SizeTooSmall};
  CandidateDecision decision;
  std::string detail;
};

}  // namespace domain
}  // namespace quorum
