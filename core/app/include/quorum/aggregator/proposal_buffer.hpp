#pragma once

#include "quorum/domain/proposal.hpp"

#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

namespace quorum {

// -----------------------------------------------------------------------------
// ProposalBuffer
// -----------------------------------------------------------------------------
//
// @brief  Holding area between the agent threads and the cycle tick.
//
// @details
// Agents push() whenever they produce a proposal. At each tick the scheduler
// calls drain(boundary), which removes proposals generated at or before the
// boundary, oldest first, up to capacity_per_cycle. Everything else
// (proposals stamped after the boundary, overflow beyond capacity) stays
// for the next cycle. Nothing is discarded, including on shutdown.
//
// Thread model: one mutex, held only for the push/drain critical section.
// -----------------------------------------------------------------------------
class ProposalBuffer {
 public:
  explicit ProposalBuffer(std::size_t capacity_per_cycle = 256);

  ProposalBuffer(const ProposalBuffer&) = delete;
  ProposalBuffer& operator=(const ProposalBuffer&) = delete;

  void push(domain::Proposal proposal);

  std::vector<domain::Proposal> drain(domain::TimestampMs boundary);

  std::size_t size() const;
  std::size_t capacityPerCycle() const { return capacity_per_cycle_; }

 private:
  const std::size_t capacity_per_cycle_;
  mutable std::mutex mutex_;
  std::deque<domain::Proposal> pending_;
};

}  // namespace quorum
