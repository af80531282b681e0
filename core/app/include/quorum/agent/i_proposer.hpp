#pragma once

#include "quorum/domain/proposal.hpp"
#include "quorum/market/market_snapshot.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace quorum {

// Everything a proposer may look at for one instrument in one evaluation.
struct ProposerInput {
  market::MarketSnapshot snapshot;
  std::vector<market::PriceSample> history;  // oldest first, newest last
  domain::TimestampMs now_ms{0};
};

// Static configuration shared by every reference agent.
struct AgentSettings {
  std::string agent_id;
  std::vector<std::string> instruments;
  std::chrono::milliseconds cadence{30000};
  domain::TimestampMs max_snapshot_age_ms{120000};
  double order_notional{10.0};
  bool enabled{true};
};

// -----------------------------------------------------------------------------
// IProposer — the analysis-agent capability
// -----------------------------------------------------------------------------
//
// @brief  One trading strategy. Given the market state of one instrument it
//         either proposes a trade or declines.
//
// @details
// Strategies are registered with the Orchestrator at startup, each wrapped in
// its own AgentRunner thread. The runner guarantees that propose() is only
// called with a snapshot that exists and is fresh, and with at most
// historyDepth() samples of history. Declining (std::nullopt) is the normal
// outcome and is not an error.
//
// Implementations must be deterministic for a given input and must not block.
//
// Thread model:
//   propose() is called from the owning AgentRunner thread only; no
//   synchronization is needed inside an implementation.
// -----------------------------------------------------------------------------
class IProposer {
 public:
  virtual ~IProposer() = default;

  virtual const std::string& agentId() const = 0;

  // How many samples of history propose() wants.
  virtual std::size_t historyDepth() const = 0;

  virtual std::optional<domain::Proposal> propose(const ProposerInput& input) = 0;
};

}  // namespace quorum
