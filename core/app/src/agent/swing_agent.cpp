#include "quorum/agent/swing_agent.hpp"

#include "quorum/agent/indicators.hpp"

#include <sstream>
#include <utility>

namespace quorum {

SwingAgent::SwingAgent(AgentSettings settings) : settings_(std::move(settings)) {}

std::optional<domain::Proposal> SwingAgent::propose(const ProposerInput& input) {
  const auto& history = input.history;
  if (history.size() < kSlowPeriod) {
    return std::nullopt;
  }

  const double price = history.back().price;
  const double ma_fast = indicators::sma(history, kFastPeriod);
  const double ma_slow = indicators::sma(history, kSlowPeriod);
  const double rsi = indicators::rsi(history, kRsiPeriod);

  domain::Side side;
  if (price > ma_fast && ma_fast > ma_slow && rsi < 70.0) {
    side = domain::Side::Buy;
  } else if (price < ma_fast && ma_fast < ma_slow && rsi > 30.0) {
    side = domain::Side::Sell;
  } else {
    return std::nullopt;
  }

  domain::Proposal proposal;
  proposal.agent_id = settings_.agent_id;
  proposal.instrument = input.snapshot.instrument;
  proposal.side = side;
  proposal.confidence = kConfidence;
  proposal.reference_price = input.snapshot.price;
  proposal.suggested_quantity = settings_.order_notional / input.snapshot.price;
  proposal.generated_at = input.now_ms;

  std::ostringstream oss;
  oss.precision(6);
  oss << "MA20 " << ma_fast << ", MA50 " << ma_slow << ", RSI " << rsi;
  proposal.rationale = oss.str();
  return proposal;
}

}  // namespace quorum
