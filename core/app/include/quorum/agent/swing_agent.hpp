#pragma once

#include "quorum/agent/i_proposer.hpp"

namespace quorum {

// -----------------------------------------------------------------------------
// SwingAgent — medium-horizon trend following
// -----------------------------------------------------------------------------
// Buys when price > MA20 > MA50 and RSI14 < 70; sells when price < MA20 <
// MA50 and RSI14 > 30. Fixed confidence of 0.70. Needs 50 samples.
// -----------------------------------------------------------------------------
class SwingAgent final : public IProposer {
 public:
  static constexpr std::size_t kFastPeriod = 20;
  static constexpr std::size_t kSlowPeriod = 50;
  static constexpr std::size_t kRsiPeriod = 14;
  static constexpr double kConfidence = 0.70;

  explicit SwingAgent(AgentSettings settings);

  const std::string& agentId() const override { return settings_.agent_id; }
  std::size_t historyDepth() const override { return kSlowPeriod; }
  std::optional<domain::Proposal> propose(const ProposerInput& input) override;

 private:
  AgentSettings settings_;
};

}  // namespace quorum
