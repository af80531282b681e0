#include "quorum/persistence/json_lines_journal.hpp"

#include "quorum/persistence/json_codec.hpp"

#include <cstdio>
#include <stdexcept>
#include <utility>

namespace quorum {

JsonLinesJournal::JsonLinesJournal(std::string journal_path,
                                   std::string portfolio_path,
                                   const ITimeProvider& clock)
    : journal_path_(std::move(journal_path)),
      portfolio_path_(std::move(portfolio_path)),
      clock_(clock),
      journal_(journal_path_, std::ios::out | std::ios::app) {
  if (!journal_) {
    throw std::runtime_error("cannot open journal " + journal_path_);
  }
}

void JsonLinesJournal::append(const char* type, nlohmann::json data) {
  nlohmann::json line = {{"type", type},
                         {"recorded_at", clock_.now_ms()},
                         {"data", std::move(data)}};
  journal_ << line.dump() << '\n';
  journal_.flush();
  if (!journal_) {
    throw std::runtime_error("write to journal " + journal_path_ + " failed");
  }
  ++lines_written_;
}

void JsonLinesJournal::recordProposal(const domain::Proposal& proposal) {
  append("proposal", proposal);
}

void JsonLinesJournal::recordDecision(const domain::CandidateDecision& decision) {
  append("decision", decision);
}

void JsonLinesJournal::recordApprovedOrder(const domain::ApprovedOrder& order) {
  append("approved_order", order);
}

void JsonLinesJournal::recordExecutionResult(
    const domain::ExecutionResult& result) {
  append("execution_result", result);
}

void JsonLinesJournal::recordRejection(const domain::Rejection& rejection) {
  append("rejection", rejection);
}

void JsonLinesJournal::upsertPortfolio(
    const domain::PortfolioSnapshot& snapshot) {
  const std::string tmp_path = portfolio_path_ + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::out | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("cannot open " + tmp_path);
    }
    out << nlohmann::json(snapshot).dump(2) << '\n';
    if (!out) {
      throw std::runtime_error("write to " + tmp_path + " failed");
    }
  }
  if (std::rename(tmp_path.c_str(), portfolio_path_.c_str()) != 0) {
    throw std::runtime_error("cannot replace " + portfolio_path_);
  }
}

std::optional<domain::PortfolioSnapshot> JsonLinesJournal::loadPortfolio(
    const std::string& portfolio_path) {
  std::ifstream in(portfolio_path);
  if (!in) {
    return std::nullopt;
  }
  try {
    return nlohmann::json::parse(in).get<domain::PortfolioSnapshot>();
  } catch (const nlohmann::json::exception& ex) {
    throw std::runtime_error("corrupt portfolio file " + portfolio_path + ": " +
                             ex.what());
  } catch (const std::invalid_argument& ex) {
    throw std::runtime_error("corrupt portfolio file " + portfolio_path + ": " +
                             ex.what());
  }
}

}  // namespace quorum
