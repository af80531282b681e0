#pragma once

#include "quorum/agent/i_proposer.hpp"

#include <string>

namespace quorum {

enum class Trend {
  StrongUp,
  Up,
  Sideways,
  Down,
  StrongDown,
};

const char* toString(Trend trend);

// -----------------------------------------------------------------------------
// ResearchAgent — trend classification with volume participation
// -----------------------------------------------------------------------------
//
// @details
// Classifies the instrument with SMA20 / SMA50 (SMA50 falls back to the mean
// of whatever history exists when fewer than 50 samples are available):
//
//   price > SMA20 > SMA50   StrongUp     base confidence 0.70
//   price > SMA20           Up           base confidence 0.55
//   price < SMA20 < SMA50   StrongDown   base confidence 0.70
//   price < SMA20           Down         base confidence 0.55
//   otherwise               Sideways     no proposal
//
// Newest volume above kVolumeBoostRatio times the 20-sample mean adds
// kVolumeBoost. Only proposals with confidence above kMinConfidence are
// emitted, so a plain Up/Down trend needs volume behind it.
// -----------------------------------------------------------------------------
class ResearchAgent final : public IProposer {
 public:
  static constexpr std::size_t kMinSamples = 20;
  static constexpr std::size_t kSlowPeriod = 50;
  static constexpr double kVolumeBoostRatio = 1.2;
  static constexpr double kVolumeBoost = 0.15;
  static constexpr double kMinConfidence = 0.65;

  explicit ResearchAgent(AgentSettings settings);

  const std::string& agentId() const override { return settings_.agent_id; }
  std::size_t historyDepth() const override { return kSlowPeriod; }
  std::optional<domain::Proposal> propose(const ProposerInput& input) override;

  static Trend classify(double price, double sma_fast, double sma_slow);

 private:
  AgentSettings settings_;
};

}  // namespace quorum
