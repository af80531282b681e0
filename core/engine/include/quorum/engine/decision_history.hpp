#pragma once

#include "quorum/domain/order.hpp"
#include "quorum/domain/proposal.hpp"
#include "quorum/domain/rejection.hpp"

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace quorum {

// Where a Candidate Decision ended up.
enum class DecisionOutcome {
  Rejected,   // refused before a venue was contacted
  Approved,   // submitted, execution still running
  Executed,   // terminal ExecutionResult recorded (see `state`)
};

inline const char* toString(DecisionOutcome outcome) {
  switch (outcome) {
    case DecisionOutcome::Rejected: return "rejected";
    case DecisionOutcome::Approved: return "approved";
    case DecisionOutcome::Executed: return "executed";
  }
  return "unknown";
}

struct DecisionRecord {
  domain::CandidateDecision decision;
  DecisionOutcome outcome{DecisionOutcome::Rejected};
  domain::OrderId order_id{0};  // 0 while no order was issued
  domain::ExecutionState state{domain::ExecutionState::Pending};
  std::string reason;           // rejection or failure code
  std::string detail;
  double approved_quantity{0.0};
  double filled_quantity{0.0};
  double average_fill_price{0.0};
  domain::TimestampMs decided_at{0};
  domain::TimestampMs updated_at{0};
};

// -----------------------------------------------------------------------------
// DecisionHistory
// -----------------------------------------------------------------------------
//
// @brief  Bounded, newest-last ring of recent decisions and their outcomes,
//         backing Orchestrator::recentDecisions() and the DECISIONS command.
//
// @details
// Oldest records are evicted once `capacity` is reached. An execution result
// for an order whose record was already evicted is ignored.
//
// Thread model: all methods lock an internal mutex; writers are the cycle
// thread (rejections, approvals) and the instrument lanes (results).
// -----------------------------------------------------------------------------
class DecisionHistory {
 public:
  explicit DecisionHistory(std::size_t capacity = 500);

  DecisionHistory(const DecisionHistory&) = delete;
  DecisionHistory& operator=(const DecisionHistory&) = delete;

  void recordRejection(const domain::Rejection& rejection,
                       domain::TimestampMs now_ms);
  void recordApproval(const domain::ApprovedOrder& order,
                      domain::TimestampMs now_ms);

  // Returns false if no record for result.order_id is held.
  bool recordResult(const domain::ExecutionResult& result,
                    domain::TimestampMs now_ms);

  // Up to `count` most recent records, newest first.
  std::vector<DecisionRecord> recent(std::size_t count) const;

  std::size_t size() const;
  std::size_t capacity() const { return capacity_; }

 private:
  void append(DecisionRecord record);

  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::deque<DecisionRecord> records_;
};

}  // namespace quorum
