#include "quorum/agent/scalping_agent.hpp"

#include "quorum/agent/indicators.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace quorum {

ScalpingAgent::ScalpingAgent(AgentSettings settings)
    : settings_(std::move(settings)) {}

std::optional<domain::Proposal> ScalpingAgent::propose(
    const ProposerInput& input) {
  const auto& history = input.history;
  if (history.size() < kMinSamples) {
    return std::nullopt;
  }

  const double newest = history.back().price;
  const double earlier = history[history.size() - 1 - kLookback].price;
  if (!(earlier > 0.0) || !(newest > 0.0)) {
    return std::nullopt;
  }

  const double change_pct = (newest - earlier) / earlier * 100.0;
  const double volume_mean = indicators::averageVolume(history, kLookback);
  const bool volume_spike = history.back().volume > volume_mean * kVolumeSpikeRatio;

  if (!volume_spike || std::abs(change_pct) <= kMomentumThresholdPct) {
    return std::nullopt;
  }

  domain::Proposal proposal;
  proposal.agent_id = settings_.agent_id;
  proposal.instrument = input.snapshot.instrument;
  proposal.side = change_pct > 0.0 ? domain::Side::Buy : domain::Side::Sell;
  proposal.confidence = std::min(std::abs(change_pct) * 10.0, 95.0) / 100.0;
  proposal.reference_price = input.snapshot.price;
  proposal.suggested_quantity = settings_.order_notional / input.snapshot.price;
  proposal.generated_at = input.now_ms;

  std::ostringstream oss;
  oss.precision(4);
  oss << "momentum " << change_pct << "% over " << kLookback
      << " samples, volume spike " << history.back().volume << " vs mean "
      << volume_mean;
  proposal.rationale = oss.str();
  return proposal;
}

}  // namespace quorum
