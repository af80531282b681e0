#include "quorum/aggregator/decision_aggregator.hpp"

#include <algorithm>
#include <iostream>
#include <optional>
#include <sstream>
#include <utility>

namespace quorum {

namespace {

struct SideTally {
  std::vector<domain::Proposal> proposals;
  double weighted_confidence{0.0};
  domain::TimestampMs latest{0};
  bool has_any{false};
};

bool isWellFormed(const domain::Proposal& p) {
  return !p.instrument.empty() && p.confidence >= 0.0 && p.confidence <= 1.0 &&
         p.suggested_quantity > 0.0;
}

// Returns the winning side, or nullopt when every tie-break is exhausted.
std::optional<domain::Side> pickSide(const SideTally& buy,
                                     const SideTally& sell) {
  if (!buy.has_any) return domain::Side::Sell;
  if (!sell.has_any) return domain::Side::Buy;

  if (buy.weighted_confidence != sell.weighted_confidence) {
    return buy.weighted_confidence > sell.weighted_confidence
               ? domain::Side::Buy
               : domain::Side::Sell;
  }
  if (buy.proposals.size() != sell.proposals.size()) {
    return buy.proposals.size() > sell.proposals.size() ? domain::Side::Buy
                                                        : domain::Side::Sell;
  }
  if (buy.latest != sell.latest) {
    return buy.latest > sell.latest ? domain::Side::Buy : domain::Side::Sell;
  }
  return std::nullopt;
}

}  // namespace

DecisionAggregator::DecisionAggregator(AggregatorSettings settings)
    : settings_(std::move(settings)) {}

double DecisionAggregator::trustWeight(const std::string& agent_id) const {
  auto it = settings_.trust_weights.find(agent_id);
  return it != settings_.trust_weights.end() ? it->second
                                             : settings_.default_trust_weight;
}

double DecisionAggregator::maxQuantity(const std::string& instrument) const {
  auto it = settings_.max_quantity_per_instrument.find(instrument);
  return it != settings_.max_quantity_per_instrument.end()
             ? it->second
             : settings_.default_max_quantity;
}

std::vector<domain::CandidateDecision> DecisionAggregator::aggregate(
    const std::vector<domain::Proposal>& proposals,
    domain::CycleId cycle_id) const {
  // instrument -> agent -> latest proposal. std::map keeps instruments sorted.
  std::map<std::string, std::map<std::string, domain::Proposal>> latest;
  for (const auto& proposal : proposals) {
    if (!isWellFormed(proposal)) {
      std::cerr << "[DecisionAggregator] ignoring malformed proposal from "
                << proposal.agent_id << " for '" << proposal.instrument
                << "' (confidence=" << proposal.confidence
                << ", quantity=" << proposal.suggested_quantity << ")\n";
      continue;
    }
    auto& slot = latest[proposal.instrument];
    auto it = slot.find(proposal.agent_id);
    if (it == slot.end() || proposal.generated_at >= it->second.generated_at) {
      slot[proposal.agent_id] = proposal;
    }
  }

  std::vector<domain::CandidateDecision> decisions;
  for (auto& [instrument, by_agent] : latest) {
    SideTally buy;
    SideTally sell;
    for (auto& [agent, proposal] : by_agent) {
      SideTally& tally = proposal.side == domain::Side::Buy ? buy : sell;
      tally.weighted_confidence += proposal.confidence * trustWeight(agent);
      tally.latest = tally.has_any ? std::max(tally.latest, proposal.generated_at)
                                   : proposal.generated_at;
      tally.has_any = true;
      tally.proposals.push_back(proposal);
    }

    std::optional<domain::Side> side = pickSide(buy, sell);
    if (!side) {
      std::cout << "[DecisionAggregator] cycle " << cycle_id << ": " << instrument
                << " tied on weight, count and recency; no decision\n";
      continue;
    }

    SideTally& winner = *side == domain::Side::Buy ? buy : sell;
    std::stable_sort(winner.proposals.begin(), winner.proposals.end(),
                     [](const domain::Proposal& a, const domain::Proposal& b) {
                       return a.confidence > b.confidence;
                     });

    double weight_sum = 0.0;
    double weighted_qty = 0.0;
    double plain_qty = 0.0;
    const domain::Proposal* freshest = &winner.proposals.front();
    for (const auto& p : winner.proposals) {
      const double w = p.confidence * trustWeight(p.agent_id);
      weight_sum += w;
      weighted_qty += w * p.suggested_quantity;
      plain_qty += p.suggested_quantity;
      if (p.generated_at > freshest->generated_at) {
        freshest = &p;
      }
    }
    double quantity = weight_sum > 0.0
                          ? weighted_qty / weight_sum
                          : plain_qty / static_cast<double>(winner.proposals.size());
    const double cap = maxQuantity(instrument);
    if (cap > 0.0) {
      quantity = std::min(quantity, cap);
    }
    if (!(quantity > 0.0)) {
      continue;
    }

    std::ostringstream rationale;
    for (std::size_t i = 0; i < winner.proposals.size(); ++i) {
      if (i > 0) rationale << "; ";
      rationale << winner.proposals[i].agent_id << ": "
                << winner.proposals[i].rationale;
    }

    domain::CandidateDecision decision;
    decision.cycle_id = cycle_id;
    decision.instrument = instrument;
    decision.side = *side;
    decision.quantity = quantity;
    decision.confidence = winner.proposals.front().confidence;
    decision.reference_price = freshest->reference_price;
    decision.rationale = rationale.str();
    decision.contributing_proposals = std::move(winner.proposals);
    decisions.push_back(std::move(decision));
  }
  return decisions;
}

}  // namespace quorum
