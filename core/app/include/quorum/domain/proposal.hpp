#pragma once

#include "quorum/domain/types.hpp"

#include <string>
#include <vector>

namespace quorum {
namespace domain {

// -----------------------------------------------------------------------------
// Proposal — one agent's suggested trade for one instrument
// -----------------------------------------------------------------------------
//
// @brief  Immutable value emitted by an analysis agent. Owned by the agent
//         until pushed into the ProposalBuffer; after that it belongs to the
//         buffer and then to the cycle that drains it.
//
// @details
// confidence is normalised to [0, 1]. reference_price is the snapshot price
// the agent evaluated; the risk layer uses it to turn quantities into
// notionals and to derive stop-loss / take-profit levels.
// -----------------------------------------------------------------------------
struct Proposal {
  std::string agent_id;
  std::string instrument;
  Side side{Side::Buy};
  double suggested_quantity{0.0};
  double confidence{0.0};
  std::string rationale;
  TimestampMs generated_at{0};
  double reference_price{0.0};
};

// -----------------------------------------------------------------------------
// CandidateDecision — the aggregator's single output per instrument per cycle
// -----------------------------------------------------------------------------
//
// @details
// Invariants (enforced by DecisionAggregator):
//   * quantity > 0
//   * confidence == max confidence among contributing proposals whose side
//     matches `side`
//   * contributing_proposals sorted by confidence, highest first
//
// rationale joins the contributors' rationales ("agent: text; ...") so every
// downstream rejection or failure can explain itself in human terms.
// -----------------------------------------------------------------------------
struct CandidateDecision {
  CycleId cycle_id{0};
  std::string instrument;
  Side side{Side::Buy};
  double quantity{0.0};
  double confidence{0.0};
  double reference_price{0.0};
  std::string rationale;
  std::vector<Proposal> contributing_proposals;
};

}  // namespace domain
}  // namespace quorum
