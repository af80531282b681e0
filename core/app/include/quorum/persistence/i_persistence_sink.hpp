#pragma once

#include "quorum/domain/order.hpp"
#include "quorum/domain/portfolio.hpp"
#include "quorum/domain/proposal.hpp"
#include "quorum/domain/rejection.hpp"

namespace quorum {

// -----------------------------------------------------------------------------
// IPersistenceSink — durable audit trail
// -----------------------------------------------------------------------------
// Called on the audit EventLoopThread only, one record at a time, in event
// order. Implementations report I/O problems by throwing std::runtime_error;
// the journal subscriber logs and continues, so a full disk never stops
// trading.
// -----------------------------------------------------------------------------
class IPersistenceSink {
 public:
  virtual ~IPersistenceSink() = default;

  virtual void recordProposal(const domain::Proposal& proposal) = 0;
  virtual void recordDecision(const domain::CandidateDecision& decision) = 0;
  virtual void recordApprovedOrder(const domain::ApprovedOrder& order) = 0;
  virtual void recordExecutionResult(const domain::ExecutionResult& result) = 0;
  virtual void recordRejection(const domain::Rejection& rejection) = 0;
  virtual void upsertPortfolio(const domain::PortfolioSnapshot& snapshot) = 0;
};

}  // namespace quorum
