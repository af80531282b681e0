// =============================================================================
// persistence_test.cpp
// =============================================================================
// Unit tests for the JSON codec, quorum::JsonLinesJournal and
// quorum::DecisionHistory.
//
// Validates:
//   - Domain types serialize with enum names and nested records
//   - Portfolio snapshot survives to_json / from_json
//   - Journal writes one typed, timestamped line per record
//   - Portfolio file: atomic rewrite, absent → nullopt, corrupt → throws
//   - Decision history: newest first, bounded, results update the record
// =============================================================================

#include "quorum/engine/decision_history.hpp"
#include "quorum/persistence/json_codec.hpp"
#include "quorum/persistence/json_lines_journal.hpp"
#include "quorum/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using quorum::domain::Side;

namespace {

quorum::domain::CandidateDecision decisionFor(const std::string& instrument,
                                              quorum::domain::CycleId cycle) {
  quorum::domain::CandidateDecision d;
  d.cycle_id = cycle;
  d.instrument = instrument;
  d.side = Side::Buy;
  d.quantity = 0.5;
  d.confidence = 0.8;
  d.reference_price = 100.0;
  d.rationale = "swing_agent: trend";
  quorum::domain::Proposal p;
  p.agent_id = "swing_agent";
  p.instrument = instrument;
  p.confidence = 0.8;
  d.contributing_proposals.push_back(p);
  return d;
}

std::vector<nlohmann::json> readLines(const fs::path& path) {
  std::ifstream in(path);
  std::vector<nlohmann::json> lines;
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(nlohmann::json::parse(line));
  }
  return lines;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Codec shapes.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, DecisionAndResultShapes) {
  nlohmann::json d = decisionFor("BTC/USDT", 7);
  EXPECT_EQ(d["cycle_id"], 7);
  EXPECT_EQ(d["side"], "buy");
  ASSERT_EQ(d["contributing_proposals"].size(), 1u);
  EXPECT_EQ(d["contributing_proposals"][0]["agent_id"], "swing_agent");

  quorum::domain::ExecutionResult r;
  r.order_id = 3;
  r.state = quorum::domain::ExecutionState::Failed;
  r.reason = quorum::domain::ExecutionFailureReason::RetryBudgetExhausted;
  quorum::domain::Fill f;
  f.order_id = 3;
  f.fill_seq = 1;
  f.side = Side::Sell;
  r.fills.push_back(f);

  nlohmann::json j = r;
  EXPECT_EQ(j["state"], "Failed");
  EXPECT_EQ(j["reason"], "RetryBudgetExhausted");
  EXPECT_EQ(j["fills"][0]["side"], "sell");
}

TEST(JsonCodecTest, PortfolioSnapshotRoundTrip) {
  quorum::domain::PortfolioSnapshot s;
  s.total_capital = 1010.0;
  s.available_capital = 910.0;
  s.daily_realized_pnl = 10.0;
  s.total_realized_pnl = 25.0;
  s.trading_day = 19783;
  s.version = 12;
  quorum::domain::OpenPosition pos;
  pos.instrument = "ETH/USDT";
  pos.venue = "paper";
  pos.side = Side::Sell;
  pos.quantity = 2.0;
  pos.entry_price = 50.0;
  s.open_positions[quorum::domain::positionKey("ETH/USDT", "paper")] = pos;

  auto back = nlohmann::json(s).get<quorum::domain::PortfolioSnapshot>();

  EXPECT_DOUBLE_EQ(back.available_capital, 910.0);
  EXPECT_EQ(back.trading_day, 19783);
  EXPECT_EQ(back.version, 12u);
  const auto* restored = back.findPosition("ETH/USDT", "paper");
  ASSERT_NE(restored, nullptr);
  EXPECT_EQ(restored->side, Side::Sell);
  EXPECT_DOUBLE_EQ(restored->entry_price, 50.0);
}

// -----------------------------------------------------------------------------
// Journal fixture: unique files under the temp directory.
// -----------------------------------------------------------------------------
class JsonLinesJournalTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const std::string stem =
        std::string("quorum_") +
        ::testing::UnitTest::GetInstance()->current_test_info()->name();
    journal_path = fs::temp_directory_path() / (stem + ".jsonl");
    portfolio_path = fs::temp_directory_path() / (stem + "_portfolio.json");
    fs::remove(journal_path);
    fs::remove(portfolio_path);
  }

  void TearDown() override {
    fs::remove(journal_path);
    fs::remove(portfolio_path);
  }

  quorum::SimulationTimeProvider clock{1709294400000};
  fs::path journal_path;
  fs::path portfolio_path;
};

// -----------------------------------------------------------------------------
// 2. One line per record, tagged and timestamped.
// -----------------------------------------------------------------------------
TEST_F(JsonLinesJournalTest, AppendsTypedLines) {
  {
    quorum::JsonLinesJournal journal(journal_path.string(),
                                     portfolio_path.string(), clock);
    journal.recordProposal(decisionFor("BTC/USDT", 1).contributing_proposals[0]);
    journal.recordDecision(decisionFor("BTC/USDT", 1));

    quorum::domain::Rejection rejection;
    rejection.reason = quorum::domain::RejectionReason::InsufficientCapital;
    rejection.decision = decisionFor("ETH/USDT", 1);
    rejection.detail = "available 0";
    journal.recordRejection(rejection);
    EXPECT_EQ(journal.linesWritten(), 3u);
  }

  auto lines = readLines(journal_path);
  ASSERT_EQ(lines.size(), 3u);
  EXPECT_EQ(lines[0]["type"], "proposal");
  EXPECT_EQ(lines[1]["type"], "decision");
  EXPECT_EQ(lines[2]["type"], "rejection");
  EXPECT_EQ(lines[2]["data"]["reason"], "InsufficientCapital");
  EXPECT_EQ(lines[2]["recorded_at"], 1709294400000);
}

// -----------------------------------------------------------------------------
// 3. The journal appends across reopen.
// -----------------------------------------------------------------------------
TEST_F(JsonLinesJournalTest, ReopenAppends) {
  for (int i = 0; i < 2; ++i) {
    quorum::JsonLinesJournal journal(journal_path.string(),
                                     portfolio_path.string(), clock);
    journal.recordDecision(decisionFor("SOL/USDT", i));
  }
  EXPECT_EQ(readLines(journal_path).size(), 2u);
}

// -----------------------------------------------------------------------------
// 4. Portfolio file: absent, written, rewritten, corrupt.
// -----------------------------------------------------------------------------
TEST_F(JsonLinesJournalTest, PortfolioFileLifecycle) {
  EXPECT_FALSE(quorum::JsonLinesJournal::loadPortfolio(portfolio_path.string())
                   .has_value());

  quorum::JsonLinesJournal journal(journal_path.string(),
                                   portfolio_path.string(), clock);
  quorum::domain::PortfolioSnapshot s;
  s.total_capital = 100.0;
  s.available_capital = 100.0;
  journal.upsertPortfolio(s);
  s.available_capital = 80.0;
  s.version = 2;
  journal.upsertPortfolio(s);

  auto loaded = quorum::JsonLinesJournal::loadPortfolio(portfolio_path.string());
  ASSERT_TRUE(loaded.has_value());
  EXPECT_DOUBLE_EQ(loaded->available_capital, 80.0);
  EXPECT_EQ(loaded->version, 2u);
  EXPECT_FALSE(fs::exists(portfolio_path.string() + ".tmp"));

  {
    std::ofstream out(portfolio_path, std::ios::trunc);
    out << R"({"total_capital": "lots"})";
  }
  EXPECT_THROW(quorum::JsonLinesJournal::loadPortfolio(portfolio_path.string()),
               std::runtime_error);
}

TEST_F(JsonLinesJournalTest, UnopenableJournalThrows) {
  EXPECT_THROW(quorum::JsonLinesJournal("/nonexistent/dir/j.jsonl",
                                        portfolio_path.string(), clock),
               std::runtime_error);
}

// -----------------------------------------------------------------------------
// 5. Decision history.
// -----------------------------------------------------------------------------
TEST(DecisionHistoryTest, RecordsNewestFirstAndUpdatesResults) {
  quorum::DecisionHistory history(10);

  quorum::domain::Rejection rejection;
  rejection.reason = quorum::domain::RejectionReason::SizeTooSmall;
  rejection.decision = decisionFor("BNB/USDT", 1);
  history.recordRejection(rejection, 100);

  quorum::domain::ApprovedOrder order;
  order.order_id = 42;
  order.decision = decisionFor("BTC/USDT", 1);
  order.venue = "paper";
  order.approved_quantity = 0.5;
  history.recordApproval(order, 200);

  auto recent = history.recent(5);
  ASSERT_EQ(recent.size(), 2u);
  EXPECT_EQ(recent[0].outcome, quorum::DecisionOutcome::Approved);
  EXPECT_EQ(recent[0].detail, "open on paper");
  EXPECT_EQ(recent[1].reason, "SizeTooSmall");

  quorum::domain::ExecutionResult result;
  result.order_id = 42;
  result.state = quorum::domain::ExecutionState::Filled;
  result.filled_quantity = 0.5;
  result.average_fill_price = 101.0;
  EXPECT_TRUE(history.recordResult(result, 300));

  auto updated = history.recent(1).front();
  EXPECT_EQ(updated.outcome, quorum::DecisionOutcome::Executed);
  EXPECT_EQ(updated.state, quorum::domain::ExecutionState::Filled);
  EXPECT_DOUBLE_EQ(updated.average_fill_price, 101.0);
  EXPECT_EQ(updated.decided_at, 200);
  EXPECT_EQ(updated.updated_at, 300);

  result.order_id = 99;
  EXPECT_FALSE(history.recordResult(result, 400));
}

TEST(DecisionHistoryTest, BoundedCapacity) {
  quorum::DecisionHistory history(3);
  for (int i = 1; i <= 5; ++i) {
    quorum::domain::Rejection r;
    r.decision = decisionFor("BTC/USDT", static_cast<quorum::domain::CycleId>(i));
    history.recordRejection(r, i);
  }
  EXPECT_EQ(history.size(), 3u);
  auto recent = history.recent(10);
  ASSERT_EQ(recent.size(), 3u);
  EXPECT_EQ(recent.front().decision.cycle_id, 5u);
  EXPECT_EQ(recent.back().decision.cycle_id, 3u);
  EXPECT_EQ(quorum::DecisionHistory(0).capacity(), 1u);
}
