#include "quorum/engine/decision_history.hpp"

#include <algorithm>
#include <utility>

namespace quorum {

DecisionHistory::DecisionHistory(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

void DecisionHistory::recordRejection(const domain::Rejection& rejection,
                                      domain::TimestampMs now_ms) {
  DecisionRecord record;
  record.decision = rejection.decision;
  record.outcome = DecisionOutcome::Rejected;
  record.reason = domain::toString(rejection.reason);
  record.detail = rejection.detail;
  record.decided_at = now_ms;
  record.updated_at = now_ms;
  append(std::move(record));
}

void DecisionHistory::recordApproval(const domain::ApprovedOrder& order,
                                     domain::TimestampMs now_ms) {
  DecisionRecord record;
  record.decision = order.decision;
  record.outcome = DecisionOutcome::Approved;
  record.order_id = order.order_id;
  record.approved_quantity = order.approved_quantity;
  record.detail = std::string(domain::toString(order.intent)) + " on " +
                  order.venue;
  record.decided_at = now_ms;
  record.updated_at = now_ms;
  append(std::move(record));
}

bool DecisionHistory::recordResult(const domain::ExecutionResult& result,
                                   domain::TimestampMs now_ms) {
  std::lock_guard lock(mutex_);
  for (auto it = records_.rbegin(); it != records_.rend(); ++it) {
    if (it->order_id != result.order_id || it->order_id == 0) {
      continue;
    }
    it->outcome = DecisionOutcome::Executed;
    it->state = result.state;
    it->filled_quantity = result.filled_quantity;
    it->average_fill_price = result.average_fill_price;
    if (result.reason != domain::ExecutionFailureReason::None) {
      it->reason = domain::toString(result.reason);
    }
    it->updated_at = now_ms;
    return true;
  }
  return false;
}

std::vector<DecisionRecord> DecisionHistory::recent(std::size_t count) const {
  std::lock_guard lock(mutex_);
  const std::size_t n = std::min(count, records_.size());
  return std::vector<DecisionRecord>(records_.rbegin(), records_.rbegin() + n);
}

std::size_t DecisionHistory::size() const {
  std::lock_guard lock(mutex_);
  return records_.size();
}

void DecisionHistory::append(DecisionRecord record) {
  std::lock_guard lock(mutex_);
  records_.push_back(std::move(record));
  while (records_.size() > capacity_) {
    records_.pop_front();
  }
}

}  // namespace quorum
