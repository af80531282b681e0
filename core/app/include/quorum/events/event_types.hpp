#pragma once

#include "quorum/domain/order.hpp"
#include "quorum/domain/portfolio.hpp"
#include "quorum/domain/proposal.hpp"
#include "quorum/domain/rejection.hpp"
#include "quorum/domain/types.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>

namespace quorum {

// -----------------------------------------------------------------------------
// Event payloads
// -----------------------------------------------------------------------------
// Each struct is one alternative of the Event variant (see event.hpp). They
// are value types, copied into the audit EventLoopThread's queue and handed
// to subscribers as const references on the loop thread.
//
// Every event carries `timestamp_ms` (ITimeProvider time at emission) and a
// `sequence_id` assigned by the publisher, which lets the journal and the IPC
// telemetry stream be totally ordered.
// -----------------------------------------------------------------------------

// One normalized market tick for one instrument.
struct MarketDataEvent {
  std::string instrument;
  double price{0.0};
  double volume{0.0};
  std::map<std::string, double> indicators;
  domain::TimestampMs timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

// An agent produced a proposal and it entered the proposal buffer.
struct ProposalEvent {
  domain::Proposal proposal;
  domain::TimestampMs timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

// The aggregator produced a Candidate Decision for the current cycle.
struct DecisionEvent {
  domain::CandidateDecision decision;
  domain::TimestampMs timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

// A decision was refused before reaching a venue.
struct RiskRejectionEvent {
  domain::Rejection rejection;
  domain::TimestampMs timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

// A decision passed validation and is about to be submitted.
struct OrderApprovedEvent {
  domain::ApprovedOrder order;
  domain::TimestampMs timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

// A single state-machine transition of an order inside the coordinator.
struct OrderUpdateEvent {
  domain::OrderId order_id{0};
  std::string instrument;
  domain::ExecutionState previous_state{domain::ExecutionState::Pending};
  domain::ExecutionState new_state{domain::ExecutionState::Pending};
  std::string detail;
  domain::TimestampMs timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

// Terminal outcome of an order. Published exactly once per order.
struct ExecutionResultEvent {
  domain::ExecutionResult result;
  domain::TimestampMs timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

// The portfolio store published a new snapshot.
struct PortfolioUpdateEvent {
  std::shared_ptr<const domain::PortfolioSnapshot> snapshot;
  domain::TimestampMs timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

// A consistency check failed; the affected order path was aborted.
struct InvariantViolationEvent {
  std::string component;
  domain::OrderId order_id{0};
  std::string detail;
  domain::TimestampMs timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

// Liveness report from an agent runner after each completed cycle.
struct AgentHeartbeatEvent {
  std::string agent_id;
  std::string status;  // "ok", "idle" (no proposal), "error"
  int proposals_emitted{0};
  domain::TimestampMs timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

}  // namespace quorum
