// =============================================================================
// orchestrator_test.cpp
// =============================================================================
// End-to-end tests of quorum::Orchestrator with a simulated clock and the
// in-process SimulatedVenue. No sockets are opened: IPC and market data are
// disabled, and the cycle window is long enough that every cycle in these
// tests is closed explicitly with runCycle().
//
// Validates:
//   - Proposal → decision → approval → fill → portfolio → history
//   - Stop-loss crossing closes the position through a Reduce order
//   - Operator HALT / RESUME
//   - One order per instrument in flight, protective closes included;
//     capital reserved for running orders
//   - Venue timeouts surface as a Failed decision with no portfolio change
//   - Audit events: strictly increasing sequence ids, one result per order
//   - Operator commands and telemetry formatting
//   - Journal lines and portfolio restore across restarts
// =============================================================================

#include "quorum/engine/orchestrator.hpp"
#include "quorum/network/ipc_server.hpp"
#include "quorum/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <memory>
#include <mutex>
#include <variant>
#include <vector>

using namespace std::chrono_literals;
using quorum::DecisionOutcome;
using quorum::domain::ExecutionState;
using quorum::domain::Side;

namespace {

constexpr quorum::domain::TimestampMs kNoon = 1709294400000;

quorum::EngineConfig testConfig() {
  quorum::EngineConfig c;
  c.initial_capital = 1000.0;
  c.trading_pairs = {"BTC/USDT", "ETH/USDT"};
  c.agents.clear();
  c.cycle_window = 1h;
  c.retry.base_delay = 1ms;
  c.retry.max_delay = 2ms;
  c.retry.jitter_fraction = 0.0;
  c.retry.poll_interval = 1ms;
  c.retry_seed = 1;
  c.market_data_enabled = false;
  c.ipc_enabled = false;
  c.persistence_enabled = false;
  return c;
}

quorum::domain::Proposal proposal(const std::string& instrument, double qty,
                                  double price = 100.0, Side side = Side::Buy) {
  quorum::domain::Proposal p;
  p.agent_id = "swing_agent";
  p.instrument = instrument;
  p.side = side;
  p.suggested_quantity = qty;
  p.confidence = 0.8;
  p.reference_price = price;
  p.rationale = "trend";
  p.generated_at = kNoon;
  return p;
}

quorum::MarketDataEvent tick(const std::string& instrument, double price) {
  quorum::MarketDataEvent e;
  e.instrument = instrument;
  e.price = price;
  e.volume = 1.0;
  e.timestamp_ms = kNoon;
  return e;
}

}  // namespace

class OrchestratorTest : public ::testing::Test {
 protected:
  void TearDown() override {
    if (engine) engine->stop();
  }

  void build(quorum::EngineConfig config = testConfig()) {
    engine = std::make_unique<quorum::Orchestrator>(std::move(config), clock);
  }

  // Submits `proposals`, closes one cycle and waits for execution.
  void runCycleWith(const std::vector<quorum::domain::Proposal>& proposals) {
    for (const auto& p : proposals) engine->submitProposal(p);
    engine->runCycle();
    ASSERT_TRUE(engine->waitForIdle(3s));
  }

  quorum::SimulationTimeProvider clock{kNoon};
  std::unique_ptr<quorum::Orchestrator> engine;
};

// -----------------------------------------------------------------------------
// 1. A lone proposal becomes a filled position with protective levels.
// -----------------------------------------------------------------------------
TEST_F(OrchestratorTest, ProposalIsExecutedAndRecorded) {
  build();
  engine->start();
  runCycleWith({proposal("BTC/USDT", 0.5)});

  auto snap = engine->portfolio();
  const auto* pos = snap->findPosition("BTC/USDT", "paper");
  ASSERT_NE(pos, nullptr);
  EXPECT_DOUBLE_EQ(pos->quantity, 0.5);
  EXPECT_DOUBLE_EQ(snap->available_capital, 950.0);

  auto decisions = engine->recentDecisions(5);
  ASSERT_EQ(decisions.size(), 1u);
  EXPECT_EQ(decisions[0].outcome, DecisionOutcome::Executed);
  EXPECT_EQ(decisions[0].state, ExecutionState::Filled);
  EXPECT_NE(decisions[0].order_id, 0u);
  EXPECT_EQ(decisions[0].decision.cycle_id, 1u);

  auto levels = engine->positionMonitor().levels("BTC/USDT", "paper");
  ASSERT_TRUE(levels.has_value());
  EXPECT_NEAR(levels->stop_loss_price, 98.0, 1e-9);
  EXPECT_NEAR(levels->take_profit_price, 105.0, 1e-9);
}

// -----------------------------------------------------------------------------
// 2. A price through the stop-loss closes the position.
// -----------------------------------------------------------------------------
TEST_F(OrchestratorTest, StopLossClosesPosition) {
  build();
  engine->start();
  runCycleWith({proposal("BTC/USDT", 0.5)});

  EXPECT_TRUE(engine->pushMarketData(tick("BTC/USDT", 99.0)));
  EXPECT_EQ(engine->venue("paper")->submitCount(), 1);

  EXPECT_TRUE(engine->pushMarketData(tick("BTC/USDT", 97.0)));
  ASSERT_TRUE(engine->waitForIdle(3s));

  auto snap = engine->portfolio();
  EXPECT_TRUE(snap->open_positions.empty());
  EXPECT_DOUBLE_EQ(snap->total_realized_pnl, -1.5);
  EXPECT_DOUBLE_EQ(snap->total_capital, 998.5);
  EXPECT_EQ(engine->positionMonitor().armedCount(), 0u);

  auto latest = engine->recentDecisions(1).front();
  EXPECT_EQ(latest.state, ExecutionState::Filled);
  EXPECT_EQ(latest.decision.side, Side::Sell);
  EXPECT_NE(latest.decision.rationale.find("stop_loss"), std::string::npos);
}

// -----------------------------------------------------------------------------
// 3. HALT rejects new decisions until RESUME.
// -----------------------------------------------------------------------------
TEST_F(OrchestratorTest, HaltAndResume) {
  build();
  engine->start();

  engine->executeCommand("HALT");
  EXPECT_TRUE(engine->isHalted());
  runCycleWith({proposal("ETH/USDT", 0.2)});

  auto halted = engine->recentDecisions(1).front();
  EXPECT_EQ(halted.outcome, DecisionOutcome::Rejected);
  EXPECT_EQ(halted.reason, "TradingHalted");
  EXPECT_EQ(engine->venue("paper")->submitCount(), 0);

  engine->executeCommand("RESUME");
  runCycleWith({proposal("ETH/USDT", 0.2)});
  EXPECT_EQ(engine->recentDecisions(1).front().state, ExecutionState::Filled);
}

// -----------------------------------------------------------------------------
// 4. A second decision on an instrument with a running order is refused.
// -----------------------------------------------------------------------------
TEST_F(OrchestratorTest, InFlightOrderBlocksSameInstrument) {
  build();
  quorum::SimulatedVenue::ScriptedStep slow;
  slow.response.status = quorum::VenueOrderStatus::Filled;
  slow.latency = 300ms;
  engine->venue("paper")->scriptSubmit(slow);
  engine->start();

  engine->submitProposal(proposal("BTC/USDT", 0.5));
  engine->runCycle();
  EXPECT_EQ(engine->inFlightCount(), 1u);

  engine->submitProposal(proposal("BTC/USDT", 0.5));
  engine->runCycle();
  ASSERT_TRUE(engine->waitForIdle(3s));

  auto decisions = engine->recentDecisions(2);
  ASSERT_EQ(decisions.size(), 2u);
  EXPECT_EQ(decisions[0].outcome, DecisionOutcome::Rejected);
  EXPECT_EQ(decisions[0].reason, "DuplicatePosition");
  EXPECT_EQ(decisions[1].state, ExecutionState::Filled);
  EXPECT_EQ(engine->venue("paper")->submitCount(), 1);
}

// -----------------------------------------------------------------------------
// 5. Two large orders in one cycle cannot jointly overdraw capital.
// -----------------------------------------------------------------------------
TEST_F(OrchestratorTest, RunningOrdersReserveCapital) {
  auto config = testConfig();
  config.risk.max_position_size_fraction = 1.0;
  build(config);
  quorum::SimulatedVenue::ScriptedStep slow;
  slow.response.status = quorum::VenueOrderStatus::Filled;
  slow.latency = 200ms;
  engine->venue("paper")->scriptSubmit(slow);

  std::mutex mutex;
  int violations = 0;
  engine->auditBus().subscribe<quorum::InvariantViolationEvent>(
      [&](const quorum::InvariantViolationEvent&) {
        std::lock_guard lock(mutex);
        ++violations;
      });
  engine->start();

  runCycleWith({proposal("BTC/USDT", 6.0), proposal("ETH/USDT", 6.0)});

  auto decisions = engine->recentDecisions(2);
  ASSERT_EQ(decisions.size(), 2u);
  int filled = 0;
  int refused = 0;
  for (const auto& d : decisions) {
    if (d.state == ExecutionState::Filled) ++filled;
    if (d.reason == "InsufficientCapital") ++refused;
  }
  EXPECT_EQ(filled, 1);
  EXPECT_EQ(refused, 1);
  EXPECT_DOUBLE_EQ(engine->portfolio()->available_capital, 400.0);
  std::lock_guard lock(mutex);
  EXPECT_EQ(violations, 0);
}

// -----------------------------------------------------------------------------
// 6. Three venue timeouts: Failed, nothing applied to the portfolio.
// -----------------------------------------------------------------------------
TEST_F(OrchestratorTest, VenueTimeoutsLeavePortfolioUntouched) {
  build();
  for (int i = 0; i < 3; ++i) {
    engine->venue("paper")->scriptSubmit(quorum::SimulatedVenue::timeout());
  }
  engine->start();
  runCycleWith({proposal("BTC/USDT", 0.5)});

  auto d = engine->recentDecisions(1).front();
  EXPECT_EQ(d.outcome, DecisionOutcome::Executed);
  EXPECT_EQ(d.state, ExecutionState::Failed);
  EXPECT_EQ(d.reason, "RetryBudgetExhausted");
  EXPECT_EQ(engine->portfolio()->version, 0u);
  EXPECT_DOUBLE_EQ(engine->portfolio()->available_capital, 1000.0);
  EXPECT_EQ(engine->positionMonitor().armedCount(), 0u);
}

// -----------------------------------------------------------------------------
// 7. Audit events arrive in sequence order; one result per order.
// -----------------------------------------------------------------------------
TEST_F(OrchestratorTest, AuditEventsAreSequenced) {
  build();
  std::mutex mutex;
  std::vector<std::uint64_t> sequence_ids;
  int results = 0;
  int portfolio_updates = 0;
  std::promise<void> result_seen;

  engine->auditBus().subscribe([&](const quorum::Event& event) {
    std::lock_guard lock(mutex);
    sequence_ids.push_back(
        std::visit([](const auto& e) { return e.sequence_id; }, event));
    if (std::holds_alternative<quorum::PortfolioUpdateEvent>(event)) {
      ++portfolio_updates;
    }
    if (std::holds_alternative<quorum::ExecutionResultEvent>(event)) {
      if (++results == 1) result_seen.set_value();
    }
  });
  engine->start();
  runCycleWith({proposal("BTC/USDT", 0.5)});
  ASSERT_EQ(result_seen.get_future().wait_for(2s), std::future_status::ready);
  engine->stop();

  std::lock_guard lock(mutex);
  EXPECT_EQ(results, 1);
  EXPECT_EQ(portfolio_updates, 1);
  ASSERT_GE(sequence_ids.size(), 5u);
  for (std::size_t i = 1; i < sequence_ids.size(); ++i) {
    EXPECT_LT(sequence_ids[i - 1], sequence_ids[i]);
  }
}

// -----------------------------------------------------------------------------
// 8. Operator commands.
// -----------------------------------------------------------------------------
TEST_F(OrchestratorTest, OperatorCommands) {
  build();
  engine->start();
  runCycleWith({proposal("BTC/USDT", 0.5)});

  auto ping = nlohmann::json::parse(engine->executeCommand("PING"));
  EXPECT_EQ(ping["response"], "PONG");

  auto portfolio = nlohmann::json::parse(engine->executeCommand("PORTFOLIO"));
  EXPECT_EQ(portfolio["status"], "ok");
  EXPECT_EQ(portfolio["halted"], false);
  EXPECT_EQ(portfolio["portfolio"]["open_positions"].size(), 1u);

  auto decisions = nlohmann::json::parse(engine->executeCommand("DECISIONS 5"));
  ASSERT_EQ(decisions["decisions"].size(), 1u);
  EXPECT_EQ(decisions["decisions"][0]["outcome"], "executed");
  EXPECT_EQ(decisions["decisions"][0]["state"], "Filled");

  auto defaulted = nlohmann::json::parse(engine->executeCommand("DECISIONS"));
  EXPECT_EQ(defaulted["status"], "ok");

  EXPECT_EQ(nlohmann::json::parse(engine->executeCommand("DECISIONS -2"))["status"],
            "error");
  EXPECT_EQ(nlohmann::json::parse(engine->executeCommand("DECISIONS many"))["status"],
            "error");

  auto health = nlohmann::json::parse(engine->executeCommand("HEALTH"));
  EXPECT_EQ(health["last_cycle_id"], 1);
  EXPECT_EQ(health["orders_in_flight"], 0);
  EXPECT_EQ(health["protective_levels_armed"], 1);
  EXPECT_TRUE(health["agents"].is_array());

  auto unknown = nlohmann::json::parse(engine->executeCommand("SELL EVERYTHING"));
  EXPECT_EQ(unknown["status"], "error");
  EXPECT_NE(unknown["response"].get<std::string>().find("Unknown command"),
            std::string::npos);
}

// -----------------------------------------------------------------------------
// 9. Telemetry covers decision-path events only.
// -----------------------------------------------------------------------------
TEST(IpcTelemetryTest, FormatsDecisionPathEvents) {
  quorum::DecisionEvent decision;
  decision.decision.instrument = "BTC/USDT";
  decision.timestamp_ms = kNoon;
  decision.sequence_id = 12;

  auto text = quorum::IpcServer::formatTelemetry(decision);
  ASSERT_TRUE(text.has_value());
  auto j = nlohmann::json::parse(*text);
  EXPECT_EQ(j["type"], "decision");
  EXPECT_EQ(j["sequence_id"], 12);
  EXPECT_EQ(j["timestamp_ms"], kNoon);

  EXPECT_FALSE(quorum::IpcServer::formatTelemetry(quorum::MarketDataEvent{})
                   .has_value());
  EXPECT_FALSE(quorum::IpcServer::formatTelemetry(quorum::ProposalEvent{})
                   .has_value());
}

// -----------------------------------------------------------------------------
// 10. Invalid ticks are refused without reaching the monitor.
// -----------------------------------------------------------------------------
TEST_F(OrchestratorTest, InvalidTickRefused) {
  build();
  EXPECT_FALSE(engine->pushMarketData(tick("BTC/USDT", -1.0)));
  EXPECT_FALSE(engine->marketData().getSnapshot("BTC/USDT").has_value());
}

// -----------------------------------------------------------------------------
// 11. Journal contents and portfolio restore across a restart.
// -----------------------------------------------------------------------------
TEST_F(OrchestratorTest, JournalAndRestore) {
  namespace fs = std::filesystem;
  const fs::path journal = fs::temp_directory_path() / "quorum_e2e.jsonl";
  const fs::path saved = fs::temp_directory_path() / "quorum_e2e_portfolio.json";
  fs::remove(journal);
  fs::remove(saved);

  auto config = testConfig();
  config.persistence_enabled = true;
  config.journal_path = journal.string();
  config.portfolio_path = saved.string();

  build(config);
  engine->start();
  runCycleWith({proposal("BTC/USDT", 0.5)});
  engine->stop();
  engine.reset();

  std::vector<std::string> types;
  {
    std::ifstream in(journal);
    std::string line;
    while (std::getline(in, line)) {
      types.push_back(nlohmann::json::parse(line)["type"].get<std::string>());
    }
  }
  std::vector<std::string> expected{"proposal", "decision", "approved_order",
                                    "execution_result"};
  EXPECT_EQ(types, expected);
  ASSERT_TRUE(fs::exists(saved));

  build(config);
  engine->start();
  const auto* pos = engine->portfolio()->findPosition("BTC/USDT", "paper");
  ASSERT_NE(pos, nullptr);
  EXPECT_DOUBLE_EQ(pos->quantity, 0.5);
  EXPECT_DOUBLE_EQ(engine->portfolio()->available_capital, 950.0);
  engine->stop();
  engine.reset();

  fs::remove(journal);
  fs::remove(saved);
}

// -----------------------------------------------------------------------------
// 12. A cycle decision cannot join a protective close already in flight, so
//     the position is closed once and never flipped.
// -----------------------------------------------------------------------------
TEST_F(OrchestratorTest, ProtectiveCloseBlocksCycleReduce) {
  build();
  engine->start();
  runCycleWith({proposal("BTC/USDT", 0.5)});

  quorum::SimulatedVenue::ScriptedStep slow;
  slow.response.status = quorum::VenueOrderStatus::Filled;
  slow.latency = 300ms;
  engine->venue("paper")->scriptSubmit(slow);

  ASSERT_TRUE(engine->pushMarketData(tick("BTC/USDT", 97.0)));
  EXPECT_EQ(engine->inFlightCount(), 1u);

  engine->submitProposal(proposal("BTC/USDT", 0.5, 97.0, Side::Sell));
  engine->runCycle();
  ASSERT_TRUE(engine->waitForIdle(3s));

  auto decisions = engine->recentDecisions(3);
  ASSERT_EQ(decisions.size(), 3u);
  EXPECT_EQ(decisions[0].outcome, DecisionOutcome::Rejected);
  EXPECT_EQ(decisions[0].reason, "DuplicatePosition");
  EXPECT_EQ(decisions[1].state, ExecutionState::Filled);
  EXPECT_NE(decisions[1].decision.rationale.find("stop_loss"),
            std::string::npos);

  EXPECT_TRUE(engine->portfolio()->open_positions.empty());
  EXPECT_EQ(engine->venue("paper")->submitCount(), 2);
}
