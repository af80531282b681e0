#pragma once

#include "quorum/agent/i_proposer.hpp"
#include "quorum/concurrent/cancellation_token.hpp"
#include "quorum/market/i_market_data_feed.hpp"
#include "quorum/time/i_time_provider.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace quorum {

// Liveness of one agent, as reported by Orchestrator::agentHealth().
struct AgentHealth {
  std::string agent_id;
  bool running{false};
  domain::TimestampMs last_cycle_at{0};
  domain::TimestampMs last_success_at{0};
  std::uint64_t cycles{0};
  std::uint64_t proposals_emitted{0};
  std::uint64_t stale_skips{0};
  std::uint64_t errors{0};
  std::string last_error;
};

// -----------------------------------------------------------------------------
// AgentRunner
// -----------------------------------------------------------------------------
//
// @brief  Drives one IProposer on its own thread at its own cadence.
//
// @details
// Each cycle, for every configured instrument:
//   1. getSnapshot(); missing → skip, older than max_snapshot_age_ms → skip
//      (a "stale skip", logged once per instrument until it recovers).
//   2. recentSamples(historyDepth()).
//   3. propose(); a proposal goes to the ProposalSink.
// A std::exception escaping propose() is logged, counted in the health
// record and ends that instrument's evaluation; the runner keeps going.
//
// After every cycle the heartbeat callback (if any) receives the agent id,
// a status ("ok", "idle", "error") and the number of proposals emitted.
//
// Thread model:
//   One owned thread. The cadence wait is CancellationToken::waitFor(), so
//   stop() returns within one evaluation. health() is safe from any thread.
//
// Ownership:
//   Owns the proposer. Borrows the feed and the clock.
// -----------------------------------------------------------------------------
class AgentRunner {
 public:
  using ProposalSink = std::function<void(domain::Proposal)>;
  using HeartbeatSink =
      std::function<void(const std::string& agent_id, const std::string& status,
                         int proposals_emitted)>;

  AgentRunner(std::unique_ptr<IProposer> proposer, AgentSettings settings,
              const market::IMarketDataFeed& feed, const ITimeProvider& clock,
              ProposalSink sink, HeartbeatSink heartbeat = nullptr);
  ~AgentRunner();

  AgentRunner(const AgentRunner&) = delete;
  AgentRunner& operator=(const AgentRunner&) = delete;

  void start();
  void stop();

  // Runs one evaluation over all instruments on the caller's thread.
  // Returns the number of proposals emitted.
  int runOnce();

  AgentHealth health() const;
  const std::string& agentId() const { return proposer_->agentId(); }

 private:
  void run();

  std::unique_ptr<IProposer> proposer_;
  const AgentSettings settings_;
  const market::IMarketDataFeed& feed_;
  const ITimeProvider& clock_;
  ProposalSink sink_;
  HeartbeatSink heartbeat_;

  mutable std::mutex health_mutex_;
  AgentHealth health_;
  std::vector<std::string> stale_instruments_;

  CancellationToken stop_token_;
  std::thread thread_;
};

}  // namespace quorum
