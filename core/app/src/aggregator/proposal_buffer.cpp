#include "quorum/aggregator/proposal_buffer.hpp"

#include <algorithm>

namespace quorum {

ProposalBuffer::ProposalBuffer(std::size_t capacity_per_cycle)
    : capacity_per_cycle_(std::max<std::size_t>(capacity_per_cycle, 1)) {}

void ProposalBuffer::push(domain::Proposal proposal) {
  std::lock_guard lock(mutex_);
  pending_.push_back(std::move(proposal));
}

std::vector<domain::Proposal> ProposalBuffer::drain(
    domain::TimestampMs boundary) {
  std::lock_guard lock(mutex_);

  // Oldest first; insertion order breaks timestamp ties.
  std::stable_sort(pending_.begin(), pending_.end(),
                   [](const domain::Proposal& a, const domain::Proposal& b) {
                     return a.generated_at < b.generated_at;
                   });

  std::vector<domain::Proposal> taken;
  std::deque<domain::Proposal> kept;
  for (auto& proposal : pending_) {
    if (proposal.generated_at <= boundary &&
        taken.size() < capacity_per_cycle_) {
      taken.push_back(std::move(proposal));
    } else {
      kept.push_back(std::move(proposal));
    }
  }
  pending_.swap(kept);
  return taken;
}

std::size_t ProposalBuffer::size() const {
  std::lock_guard lock(mutex_);
  return pending_.size();
}

}  // namespace quorum
