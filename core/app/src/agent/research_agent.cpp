#include "quorum/agent/research_agent.hpp"

#include "quorum/agent/indicators.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace quorum {

const char* toString(Trend trend) {
  switch (trend) {
    case Trend::StrongUp:   return "strong uptrend";
    case Trend::Up:         return "uptrend";
    case Trend::Sideways:   return "sideways";
    case Trend::Down:       return "downtrend";
    case Trend::StrongDown: return "strong downtrend";
  }
  return "unknown";
}

ResearchAgent::ResearchAgent(AgentSettings settings)
    : settings_(std::move(settings)) {}

Trend ResearchAgent::classify(double price, double sma_fast, double sma_slow) {
  if (price > sma_fast && sma_fast > sma_slow) return Trend::StrongUp;
  if (price > sma_fast) return Trend::Up;
  if (price < sma_fast && sma_fast < sma_slow) return Trend::StrongDown;
  if (price < sma_fast) return Trend::Down;
  return Trend::Sideways;
}

std::optional<domain::Proposal> ResearchAgent::propose(
    const ProposerInput& input) {
  const auto& history = input.history;
  if (history.size() < kMinSamples) {
    return std::nullopt;
  }

  const double price = history.back().price;
  const double sma_fast = indicators::sma(history, kMinSamples);
  const double sma_slow =
      indicators::sma(history, std::min(kSlowPeriod, history.size()));
  const Trend trend = classify(price, sma_fast, sma_slow);

  double confidence = 0.0;
  domain::Side side = domain::Side::Buy;
  switch (trend) {
    case Trend::StrongUp:   confidence = 0.70; side = domain::Side::Buy;  break;
    case Trend::Up:         confidence = 0.55; side = domain::Side::Buy;  break;
    case Trend::StrongDown: confidence = 0.70; side = domain::Side::Sell; break;
    case Trend::Down:       confidence = 0.55; side = domain::Side::Sell; break;
    case Trend::Sideways:   return std::nullopt;
  }

  const double volume_mean = indicators::averageVolume(history, kMinSamples);
  const double volume_ratio =
      volume_mean > 0.0 ? history.back().volume / volume_mean : 1.0;
  if (volume_ratio > kVolumeBoostRatio) {
    confidence += kVolumeBoost;
  }
  if (confidence <= kMinConfidence) {
    return std::nullopt;
  }

  domain::Proposal proposal;
  proposal.agent_id = settings_.agent_id;
  proposal.instrument = input.snapshot.instrument;
  proposal.side = side;
  proposal.confidence = std::min(confidence, 1.0);
  proposal.reference_price = input.snapshot.price;
  proposal.suggested_quantity = settings_.order_notional / input.snapshot.price;
  proposal.generated_at = input.now_ms;

  std::ostringstream oss;
  oss.precision(6);
  oss << toString(trend) << " (SMA20 " << sma_fast << ", SMA50 " << sma_slow
      << "), volume ratio " << volume_ratio;
  proposal.rationale = oss.str();
  return proposal;
}

}  // namespace quorum
