#pragma once

#include "quorum/agent/i_proposer.hpp"

namespace quorum {

// -----------------------------------------------------------------------------
// ScalpingAgent — short-horizon momentum with a volume confirmation
// -----------------------------------------------------------------------------
// Compares the newest price with the one five samples earlier. A move of more
// than kMomentumThresholdPct percent, with the newest volume above
// kVolumeSpikeRatio times the mean of the last five volumes, proposes a trade
// in the direction of the move. Confidence is min(|move%| * 10, 95) / 100.
// Needs kMinSamples samples of history.
// -----------------------------------------------------------------------------
class ScalpingAgent final : public IProposer {
 public:
  static constexpr std::size_t kMinSamples = 10;
  static constexpr std::size_t kLookback = 5;
  static constexpr double kMomentumThresholdPct = 0.5;
  static constexpr double kVolumeSpikeRatio = 1.5;

  explicit ScalpingAgent(AgentSettings settings);

  const std::string& agentId() const override { return settings_.agent_id; }
  std::size_t historyDepth() const override { return kMinSamples; }
  std::optional<domain::Proposal> propose(const ProposerInput& input) override;

 private:
  AgentSettings settings_;
};

}  // namespace quorum
