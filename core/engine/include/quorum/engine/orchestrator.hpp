#pragma once

#include "quorum/agent/agent_runner.hpp"
#include "quorum/aggregator/cycle_scheduler.hpp"
#include "quorum/aggregator/decision_aggregator.hpp"
#include "quorum/aggregator/proposal_buffer.hpp"
#include "quorum/concurrent/event_loop_thread.hpp"
#include "quorum/concurrent/order_id_generator.hpp"
#include "quorum/config/engine_config.hpp"
#include "quorum/engine/decision_history.hpp"
#include "quorum/execution/execution_coordinator.hpp"
#include "quorum/execution/position_monitor.hpp"
#include "quorum/execution/retry_policy.hpp"
#include "quorum/execution/simulated_venue.hpp"
#include "quorum/market/market_snapshot_store.hpp"
#include "quorum/network/ipc_server.hpp"
#include "quorum/network/market_data_thread.hpp"
#include "quorum/notification/notification_dispatcher.hpp"
#include "quorum/persistence/json_lines_journal.hpp"
#include "quorum/portfolio/portfolio_store.hpp"
#include "quorum/risk/risk_validator.hpp"
#include "quorum/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace quorum {

// -----------------------------------------------------------------------------
// Orchestrator
// -----------------------------------------------------------------------------
//
// @brief  Root object of the engine. Owns every component, thread and
//         socket, wires the decision pipeline and exposes the operator
//         queries.
//
// @details
// Pipeline, per cycle:
//
//   AgentRunner threads ──Proposal──▶ ProposalBuffer
//   CycleScheduler tick ──drain──▶ DecisionAggregator ──CandidateDecision──▶
//     kill switch / in-flight check ──▶ RiskValidator
//       ├─ Rejection      → DecisionHistory + RiskRejectionEvent
//       └─ ApprovedOrder  → OrderIdGenerator → ExecutionCoordinator::submit
//   instrument lane ──fills──▶ PortfolioStore ──snapshot──▶ PortfolioUpdateEvent
//   lane completion ──▶ DecisionHistory, PositionMonitor (arm / close done)
//
// Market ticks (ZeroMQ SUB or pushMarketData()) update the
// MarketSnapshotStore and drive the PositionMonitor, which issues
// stop-loss / take-profit Reduce orders through the same coordinator.
//
// Every Event is stamped with a process-wide sequence_id and pushed onto the
// audit EventLoopThread, where the journal, notification dispatcher and IPC
// telemetry subscribe.
//
// Capital reservation:
//   An approved Open order reserves its notional until its ExecutionResult
//   arrives, and validation of later decisions sees available_capital minus
//   the reservations, so concurrently running orders cannot jointly overdraw.
//
// Thread model:
//   Constructed, started and stopped on the owning thread (main). Cycles run
//   on the scheduler thread or on a caller of runCycle(), serialized by
//   cycle_mutex_. Decision dispatch and protective closes (market data
//   thread) share dispatch_mutex_ from the in-flight check to the submit.
//   Execution results arrive on instrument lane threads.
//   Queries (portfolio(), recentDecisions(), agentHealth(), executeCommand())
//   are safe from any thread.
//
// Ownership:
//   Orchestrator
//    ├── audit_loop_         (EventLoopThread, value, declared first so it
//    │                        outlives every component that pushes into it)
//    ├── journal_, notifications_  (unique_ptr, optional)
//    ├── market_, portfolio_, buffer_, aggregator_, validator_, history_
//    ├── order_ids_, retry_policy_
//    ├── venues_             (SimulatedVenue per configured venue name)
//    ├── coordinator_        (unique_ptr<ExecutionCoordinator>)
//    ├── monitor_            (PositionMonitor)
//    ├── runners_            (one AgentRunner per enabled agent)
//    ├── scheduler_          (unique_ptr<CycleScheduler>)
//    ├── market_data_thread_ (unique_ptr, only when enabled)
//    └── ipc_server_         (unique_ptr, only when enabled)
//
// Single-use: start() after stop() is a no-op.
// -----------------------------------------------------------------------------
class Orchestrator {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  config  Validated configuration (see loadEngineConfig()).
  // @param  clock   Time source for every component. Must outlive this.
  //
  // @details
  // Builds all components and the configured agents; opens the journal when
  // persistence is enabled. No thread is spawned and no socket is bound.
  //
  // Throws ConfigError for an unknown agent kind, std::runtime_error if the
  // journal cannot be opened.
  // -------------------------------------------------------------------------
  Orchestrator(EngineConfig config, const ITimeProvider& clock);
  ~Orchestrator();

  Orchestrator(const Orchestrator&) = delete;
  Orchestrator& operator=(const Orchestrator&) = delete;
  Orchestrator(Orchestrator&&) = delete;
  Orchestrator& operator=(Orchestrator&&) = delete;

  // Registers an extra agent. Only before start().
  void addAgent(std::unique_ptr<IProposer> proposer, AgentSettings settings);

  // Adds a notification sink. Only before start().
  void addNotificationSink(std::shared_ptr<INotificationSink> sink);

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  //
  // @details
  // Startup sequence:
  //   1. Restore the portfolio file (when persistence and restore are on).
  //   2. Start the notification dispatcher and the IPC server.
  //   3. Attach journal / notification / telemetry subscribers, then start
  //      the audit loop.
  //   4. Start agents, then the cycle scheduler.
  //   5. Start the market data thread LAST so every consumer is live
  //      before the first tick.
  //
  // Throws std::runtime_error for an unreadable portfolio file and
  // zmq::error_t for an endpoint that cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  //
  // @details
  // Reverse order: market data, scheduler, agents, then in-flight orders are
  // cancelled and the lanes joined (a venue call already in flight completes
  // and its fill is applied), then the audit loop (flushes pending events
  // to the journal and telemetry), IPC and the dispatcher. The final
  // portfolio snapshot is written last. Buffered proposals are kept.
  // -------------------------------------------------------------------------
  void stop();

  bool isRunning() const { return running_.load(); }

  // Feeds one tick (also the sink of the market data thread). Returns false
  // if the snapshot store dropped it as stale or invalid.
  bool pushMarketData(const MarketDataEvent& event);

  // Buffers a proposal for the next cycle (also the agents' sink).
  void submitProposal(domain::Proposal proposal);

  // Closes a cycle immediately on the caller's thread.
  domain::CycleId runCycle();

  // Blocks until no order is in flight and the audit loop is drained, or
  // until `timeout`. Returns true when idle.
  bool waitForIdle(std::chrono::milliseconds timeout) const;

  // --- Operator queries ----------------------------------------------------
  std::shared_ptr<const domain::PortfolioSnapshot> portfolio() const;
  std::vector<DecisionRecord> recentDecisions(std::size_t count) const;
  std::vector<AgentHealth> agentHealth() const;

  void halt();
  void resume();
  bool isHalted() const { return halted_.load(); }

  // Handles one IPC command and returns the JSON reply.
  std::string executeCommand(const std::string& command);

  // --- Accessors used by main() and tests ----------------------------------
  EventBus& auditBus() { return audit_loop_.eventBus(); }
  SimulatedVenue* venue(const std::string& name);
  const market::MarketSnapshotStore& marketData() const { return market_; }
  const PositionMonitor& positionMonitor() const { return monitor_; }
  std::size_t inFlightCount() const;
  const EngineConfig& config() const { return config_; }

 private:
  void processCycle(domain::CycleId cycle_id,
                    std::vector<domain::Proposal> proposals);
  void handleDecision(const domain::CandidateDecision& decision,
                      const domain::PortfolioSnapshot& view);
  void reject(domain::RejectionReason reason,
              const domain::CandidateDecision& decision,
              const std::string& detail);
  bool dispatchOrder(domain::ApprovedOrder order, bool protective);
  void onExecutionResult(const domain::ApprovedOrder& order,
                         const domain::ExecutionResult& result);
  bool requestProtectiveClose(const ProtectiveLevels& levels,
                              ExitTrigger trigger, double price);

  double reservedNotional() const;
  void restorePortfolio();
  void attachSubscribers();
  void publish(Event event);

  EngineConfig config_;
  const ITimeProvider& clock_;

  EventLoopThread audit_loop_{"audit"};
  std::mutex publish_mutex_;
  std::vector<EventBus::SubscriptionId> subscriptions_;

  std::unique_ptr<JsonLinesJournal> journal_;
  std::unique_ptr<NotificationDispatcher> notifications_;

  market::MarketSnapshotStore market_;
  PortfolioStore portfolio_;
  ProposalBuffer buffer_;
  DecisionAggregator aggregator_;
  RiskValidator validator_;
  DecisionHistory history_;
  OrderIdGenerator order_ids_;
  RetryPolicy retry_policy_;

  std::map<std::string, std::unique_ptr<SimulatedVenue>> venues_;
  std::unique_ptr<ExecutionCoordinator> coordinator_;
  PositionMonitor monitor_;

  std::vector<std::unique_ptr<AgentRunner>> runners_;
  std::unique_ptr<CycleScheduler> scheduler_;
  std::unique_ptr<MarketDataThread> market_data_thread_;
  std::unique_ptr<IpcServer> ipc_server_;

  std::mutex cycle_mutex_;
  // Serializes "nothing in flight for X" checks with the submit that follows.
  std::mutex dispatch_mutex_;

  mutable std::mutex orders_mutex_;
  std::map<domain::OrderId, double> reserved_notional_;
  std::set<domain::OrderId> protective_closes_;

  std::uint64_t sequence_{0};
  std::atomic<bool> halted_{false};
  std::atomic<bool> running_{false};
  bool started_{false};
};

}  // namespace quorum
