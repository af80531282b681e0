#pragma once

#include "quorum/persistence/i_persistence_sink.hpp"
#include "quorum/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <optional>
#include <string>

namespace quorum {

// -----------------------------------------------------------------------------
// JsonLinesJournal — file-backed IPersistenceSink
// -----------------------------------------------------------------------------
//
// @details
// Appends one JSON object per line to `journal_path`:
//
//   {"type":"decision","recorded_at":1700000000000,"data":{...}}
//
// with type one of proposal, decision, approved_order, execution_result,
// rejection. Every line is flushed so a crash loses at most the record
// being written.
//
// upsertPortfolio() rewrites `portfolio_path` (write to "<path>.tmp" then
// rename), so the file always holds one complete snapshot. loadPortfolio()
// reads it back at startup.
//
// Thread model: not thread-safe; used from the audit loop thread only.
// -----------------------------------------------------------------------------
class JsonLinesJournal final : public IPersistenceSink {
 public:
  JsonLinesJournal(std::string journal_path, std::string portfolio_path,
                   const ITimeProvider& clock);

  void recordProposal(const domain::Proposal& proposal) override;
  void recordDecision(const domain::CandidateDecision& decision) override;
  void recordApprovedOrder(const domain::ApprovedOrder& order) override;
  void recordExecutionResult(const domain::ExecutionResult& result) override;
  void recordRejection(const domain::Rejection& rejection) override;
  void upsertPortfolio(const domain::PortfolioSnapshot& snapshot) override;

  std::size_t linesWritten() const { return lines_written_; }

  // std::nullopt if the file does not exist; throws std::runtime_error if it
  // exists but cannot be parsed.
  static std::optional<domain::PortfolioSnapshot> loadPortfolio(
      const std::string& portfolio_path);

 private:
  void append(const char* type, nlohmann::json data);

  const std::string journal_path_;
  const std::string portfolio_path_;
  const ITimeProvider& clock_;
  std::ofstream journal_;
  std::size_t lines_written_{0};
};

}  // namespace quorum
