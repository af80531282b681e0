// =============================================================================
// agents_test.cpp
// =============================================================================
// Unit tests for the indicator helpers, the reference proposers and
// quorum::AgentRunner.
//
// Validates:
//   - sma / averageVolume / rsi over oldest-first histories
//   - ScalpingAgent: momentum with volume spike, declines without spike
//   - SwingAgent: trend with pullbacks buys, monotonic series declines (RSI)
//   - ResearchAgent: classification and confidence floor
//   - AgentRunner: stale / missing snapshots skipped, exceptions contained,
//     heartbeat status, threaded run emits proposals
//   - makeProposer() factory
// =============================================================================

#include "quorum/agent/agent_factory.hpp"
#include "quorum/agent/agent_runner.hpp"
#include "quorum/agent/indicators.hpp"
#include "quorum/agent/research_agent.hpp"
#include "quorum/agent/scalping_agent.hpp"
#include "quorum/agent/swing_agent.hpp"
#include "quorum/market/market_snapshot_store.hpp"
#include "quorum/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using quorum::ProposerInput;
using quorum::market::PriceSample;

namespace {

constexpr quorum::domain::TimestampMs kNow = 1709294400000;

std::vector<PriceSample> series(const std::vector<double>& prices,
                                double volume = 100.0) {
  std::vector<PriceSample> out;
  for (std::size_t i = 0; i < prices.size(); ++i) {
    out.push_back(PriceSample{prices[i], volume,
                              kNow - static_cast<std::int64_t>(prices.size() - i)});
  }
  return out;
}

ProposerInput inputFrom(std::vector<PriceSample> history,
                        const std::string& instrument = "BTC/USDT") {
  ProposerInput input;
  input.snapshot.instrument = instrument;
  input.snapshot.price = history.back().price;
  input.snapshot.volume = history.back().volume;
  input.snapshot.observed_at = kNow;
  input.history = std::move(history);
  input.now_ms = kNow;
  return input;
}

quorum::AgentSettings settingsFor(const std::string& id) {
  quorum::AgentSettings s;
  s.agent_id = id;
  s.instruments = {"BTC/USDT"};
  s.cadence = 10ms;
  s.max_snapshot_age_ms = 60000;
  s.order_notional = 20.0;
  return s;
}

// Proposer returning a fixed proposal, or throwing when asked to.
class FixedProposer final : public quorum::IProposer {
 public:
  explicit FixedProposer(bool throws = false) : throws_(throws) {}

  const std::string& agentId() const override { return id_; }
  std::size_t historyDepth() const override { return 5; }

  std::optional<quorum::domain::Proposal> propose(
      const ProposerInput& input) override {
    if (throws_) {
      throw std::runtime_error("indicator blew up");
    }
    quorum::domain::Proposal p;
    p.agent_id = id_;
    p.instrument = input.snapshot.instrument;
    p.confidence = 0.8;
    p.reference_price = input.snapshot.price;
    p.suggested_quantity = 1.0;
    p.generated_at = input.now_ms;
    return p;
  }

 private:
  std::string id_{"fixed_agent"};
  bool throws_;
};

quorum::MarketDataEvent tick(const std::string& instrument, double price,
                             quorum::domain::TimestampMs ts) {
  quorum::MarketDataEvent e;
  e.instrument = instrument;
  e.price = price;
  e.volume = 10.0;
  e.timestamp_ms = ts;
  return e;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Indicator helpers.
// -----------------------------------------------------------------------------
TEST(IndicatorsTest, SmaAndVolumeUseNewestSamples) {
  auto h = series({1, 2, 3, 4, 5});
  EXPECT_DOUBLE_EQ(quorum::indicators::sma(h, 2), 4.5);
  EXPECT_DOUBLE_EQ(quorum::indicators::sma(h, 5), 3.0);
  EXPECT_DOUBLE_EQ(quorum::indicators::averageVolume(h, 3), 100.0);
}

TEST(IndicatorsTest, RsiEdgeCases) {
  EXPECT_DOUBLE_EQ(quorum::indicators::rsi(series({1, 2, 3, 4}), 3), 100.0);
  EXPECT_DOUBLE_EQ(quorum::indicators::rsi(series({5, 5, 5, 5}), 3), 50.0);
  // Gains 2, losses 1 → RS 2 → RSI 66.67
  EXPECT_NEAR(quorum::indicators::rsi(series({10, 12, 11}), 2), 66.6667, 1e-3);
}

// -----------------------------------------------------------------------------
// 2. ScalpingAgent.
// -----------------------------------------------------------------------------
TEST(ScalpingAgentTest, MomentumWithVolumeSpikeProposes) {
  quorum::ScalpingAgent agent(settingsFor("scalping_agent"));
  auto h = series({100, 100, 100, 100, 100, 100, 100, 100, 100, 102});
  h.back().volume = 1000.0;

  auto p = agent.propose(inputFrom(h));
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(p->side, quorum::domain::Side::Buy);
  EXPECT_NEAR(p->confidence, 0.20, 1e-9);
  EXPECT_DOUBLE_EQ(p->suggested_quantity, 20.0 / 102.0);
  EXPECT_EQ(p->agent_id, "scalping_agent");
  EXPECT_FALSE(p->rationale.empty());
}

TEST(ScalpingAgentTest, DeclinesWithoutSpikeOrHistory) {
  quorum::ScalpingAgent agent(settingsFor("scalping_agent"));
  auto flat_volume = series({100, 100, 100, 100, 100, 100, 100, 100, 100, 102});
  EXPECT_FALSE(agent.propose(inputFrom(flat_volume)).has_value());

  auto short_history = series({100, 102});
  EXPECT_FALSE(agent.propose(inputFrom(short_history)).has_value());
}

TEST(ScalpingAgentTest, DownMoveSells) {
  quorum::ScalpingAgent agent(settingsFor("scalping_agent"));
  auto h = series({100, 100, 100, 100, 100, 100, 100, 100, 100, 98});
  h.back().volume = 1000.0;

  auto p = agent.propose(inputFrom(h));
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(p->side, quorum::domain::Side::Sell);
}

// -----------------------------------------------------------------------------
// 3. SwingAgent.
// -----------------------------------------------------------------------------
TEST(SwingAgentTest, UptrendWithPullbacksBuys) {
  std::vector<double> prices{100.0};
  for (int i = 1; i < 50; ++i) {
    prices.push_back(prices.back() + (i % 2 == 1 ? 2.0 : -1.0));
  }
  quorum::SwingAgent agent(settingsFor("swing_agent"));

  auto p = agent.propose(inputFrom(series(prices)));
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(p->side, quorum::domain::Side::Buy);
  EXPECT_DOUBLE_EQ(p->confidence, quorum::SwingAgent::kConfidence);
}

TEST(SwingAgentTest, OverboughtMonotonicSeriesDeclines) {
  std::vector<double> prices;
  for (int i = 0; i < 50; ++i) prices.push_back(100.0 + i);
  quorum::SwingAgent agent(settingsFor("swing_agent"));

  EXPECT_FALSE(agent.propose(inputFrom(series(prices))).has_value());
}

// -----------------------------------------------------------------------------
// 4. ResearchAgent.
// -----------------------------------------------------------------------------
TEST(ResearchAgentTest, Classification) {
  using quorum::ResearchAgent;
  using quorum::Trend;
  EXPECT_EQ(ResearchAgent::classify(110, 105, 100), Trend::StrongUp);
  EXPECT_EQ(ResearchAgent::classify(110, 105, 108), Trend::Up);
  EXPECT_EQ(ResearchAgent::classify(90, 95, 100), Trend::StrongDown);
  EXPECT_EQ(ResearchAgent::classify(90, 95, 92), Trend::Down);
  EXPECT_EQ(ResearchAgent::classify(100, 100, 100), Trend::Sideways);
}

TEST(ResearchAgentTest, StrongTrendProposesPlainTrendNeedsVolume) {
  quorum::ResearchAgent agent(settingsFor("research_agent"));

  std::vector<double> down;
  for (int i = 0; i < 30; ++i) down.push_back(200.0 - i);
  auto p = agent.propose(inputFrom(series(down)));
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(p->side, quorum::domain::Side::Sell);
  EXPECT_DOUBLE_EQ(p->confidence, 0.70);

  // Rising then falling back below SMA20 while SMA20 > SMA50: plain Down.
  std::vector<double> hump;
  for (int i = 0; i < 40; ++i) hump.push_back(100.0 + i);
  hump.push_back(120.0);
  EXPECT_FALSE(agent.propose(inputFrom(series(hump))).has_value());

  auto boosted = series(hump);
  boosted.back().volume = 500.0;
  auto q = agent.propose(inputFrom(boosted));
  ASSERT_TRUE(q.has_value());
  EXPECT_NEAR(q->confidence, 0.70, 1e-9);
}

// -----------------------------------------------------------------------------
// 5. Factory.
// -----------------------------------------------------------------------------
TEST(AgentFactoryTest, BuildsKnownKinds) {
  EXPECT_NE(quorum::makeProposer("scalping", settingsFor("a")), nullptr);
  EXPECT_NE(quorum::makeProposer("swing", settingsFor("b")), nullptr);
  auto research = quorum::makeProposer("research", settingsFor("c"));
  ASSERT_NE(research, nullptr);
  EXPECT_EQ(research->agentId(), "c");
  EXPECT_EQ(quorum::makeProposer("arbitrage", settingsFor("d")), nullptr);
}

// -----------------------------------------------------------------------------
// AgentRunner fixture: snapshot store + simulated clock.
// -----------------------------------------------------------------------------
class AgentRunnerTest : public ::testing::Test {
 protected:
  void sink(quorum::domain::Proposal p) {
    std::lock_guard lock(mutex);
    proposals.push_back(std::move(p));
  }

  std::size_t proposalCount() {
    std::lock_guard lock(mutex);
    return proposals.size();
  }

  quorum::SimulationTimeProvider clock{kNow};
  quorum::market::MarketSnapshotStore store{50};
  std::mutex mutex;
  std::vector<quorum::domain::Proposal> proposals;
};

// -----------------------------------------------------------------------------
// 6. Missing and stale snapshots are skipped and counted.
// -----------------------------------------------------------------------------
TEST_F(AgentRunnerTest, SkipsMissingAndStaleSnapshots) {
  auto settings = settingsFor("fixed_agent");
  settings.instruments = {"BTC/USDT", "ETH/USDT"};
  std::vector<std::string> statuses;
  quorum::AgentRunner runner(
      std::make_unique<FixedProposer>(), settings, store, clock,
      [this](quorum::domain::Proposal p) { sink(std::move(p)); },
      [&statuses](const std::string&, const std::string& status, int) {
        statuses.push_back(status);
      });

  // No data at all.
  EXPECT_EQ(runner.runOnce(), 0);
  EXPECT_EQ(runner.health().stale_skips, 2u);

  // Fresh BTC, stale ETH.
  store.update(tick("BTC/USDT", 100.0, kNow - 1000));
  store.update(tick("ETH/USDT", 50.0, kNow - 120000));
  EXPECT_EQ(runner.runOnce(), 1);
  ASSERT_EQ(proposalCount(), 1u);
  EXPECT_EQ(proposals[0].instrument, "BTC/USDT");

  auto health = runner.health();
  EXPECT_EQ(health.cycles, 2u);
  EXPECT_EQ(health.stale_skips, 3u);
  EXPECT_EQ(health.proposals_emitted, 1u);

  ASSERT_EQ(statuses.size(), 2u);
  EXPECT_EQ(statuses[0], "idle");
  EXPECT_EQ(statuses[1], "ok");
}

// -----------------------------------------------------------------------------
// 7. An exception from propose() is contained and reported.
// -----------------------------------------------------------------------------
TEST_F(AgentRunnerTest, ProposerExceptionIsContained) {
  store.update(tick("BTC/USDT", 100.0, kNow));
  std::string last_status;
  quorum::AgentRunner runner(
      std::make_unique<FixedProposer>(true), settingsFor("fixed_agent"), store,
      clock, [this](quorum::domain::Proposal p) { sink(std::move(p)); },
      [&last_status](const std::string&, const std::string& status, int) {
        last_status = status;
      });

  EXPECT_NO_THROW(runner.runOnce());
  auto health = runner.health();
  EXPECT_EQ(health.errors, 1u);
  EXPECT_EQ(health.last_error, "indicator blew up");
  EXPECT_EQ(health.last_success_at, 0);
  EXPECT_EQ(last_status, "error");
  EXPECT_EQ(proposalCount(), 0u);
}

// -----------------------------------------------------------------------------
// 8. The runner thread evaluates at its cadence until stopped.
// -----------------------------------------------------------------------------
TEST_F(AgentRunnerTest, ThreadedRunEmitsUntilStopped) {
  store.update(tick("BTC/USDT", 100.0, kNow));
  std::promise<void> three;
  std::atomic<int> seen{0};
  quorum::AgentRunner runner(
      std::make_unique<FixedProposer>(), settingsFor("fixed_agent"), store,
      clock, [&](quorum::domain::Proposal p) {
        sink(std::move(p));
        if (seen.fetch_add(1) + 1 == 3) three.set_value();
      });

  runner.start();
  EXPECT_TRUE(runner.health().running);
  ASSERT_EQ(three.get_future().wait_for(2s), std::future_status::ready);
  runner.stop();

  EXPECT_FALSE(runner.health().running);
  const auto after_stop = proposalCount();
  std::this_thread::sleep_for(30ms);
  EXPECT_EQ(proposalCount(), after_stop);
}
