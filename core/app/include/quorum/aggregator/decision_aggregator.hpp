#pragma once

#include "quorum/domain/proposal.hpp"

#include <map>
#include <string>
#include <vector>

namespace quorum {

struct AggregatorSettings {
  // Per-agent trust multiplier; agents not listed get default_trust_weight.
  std::map<std::string, double> trust_weights;
  double default_trust_weight{1.0};

  // Per-instrument quantity cap; 0 (or absent with a 0 default) = no cap.
  std::map<std::string, double> max_quantity_per_instrument;
  double default_max_quantity{0.0};
};

// -----------------------------------------------------------------------------
// DecisionAggregator
// -----------------------------------------------------------------------------
//
// @brief  Collapses one cycle's proposals into at most one Candidate Decision
//         per instrument.
//
// @details
// Per instrument:
//   * Only the latest proposal of each agent counts (later generated_at
//     replaces earlier; equal stamps keep the later-drained one).
//   * Each side's weighted confidence is sum(confidence * trust).
//   * The side with the higher weighted confidence wins. On a tie the side
//     with more proposals wins; then the side holding the most recent
//     proposal. If that is tied too, the instrument is skipped this cycle.
//   * quantity is the confidence*trust weighted mean of the winning side's
//     suggested quantities, clamped to the instrument cap.
//   * confidence is the highest raw confidence on the winning side.
//   * contributing_proposals are the winning side's proposals, highest
//     confidence first.
//
// Output is sorted by instrument. Malformed proposals (empty instrument,
// confidence outside [0, 1], non-positive quantity) are logged and ignored.
//
// Pure with respect to engine state: never reads or writes the portfolio.
// Thread model: const after construction; safe from any thread.
// -----------------------------------------------------------------------------
class DecisionAggregator {
 public:
  explicit DecisionAggregator(AggregatorSettings settings = {});

  std::vector<domain::CandidateDecision> aggregate(
      const std::vector<domain::Proposal>& proposals,
      domain::CycleId cycle_id) const;

  double trustWeight(const std::string& agent_id) const;
  double maxQuantity(const std::string& instrument) const;

 private:
  AggregatorSettings settings_;
};

}  // namespace quorum
