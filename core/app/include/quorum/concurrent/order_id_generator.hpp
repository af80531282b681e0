#pragma once

#include "quorum/domain/types.hpp"

#include <atomic>
#include <cstdint>

namespace quorum {

// -----------------------------------------------------------------------------
// OrderIdGenerator — unique Approved Order identifiers
// -----------------------------------------------------------------------------
//
// @brief  Hands out monotonically increasing OrderIds. The orchestrator calls
//         next_id() at approval time (one id per Approved Order, including the
//         closing orders the PositionMonitor issues).
//
// @details
// ID 0 is reserved as the "unset" sentinel, so the first id is `first_id`
// (default 1). A restarted process can pass a higher first_id to avoid
// reusing ids already present in the journal.
//
// Thread model:
//   next_id() is called concurrently from the cycle thread (risk approvals)
//   and from the monitor loop (stop-loss / take-profit closes). fetch_add with
//   relaxed ordering is enough: only uniqueness is required.
//
// Ownership:
//   Value member of Orchestrator; injected by reference.
// -----------------------------------------------------------------------------
class OrderIdGenerator {
 public:
  explicit OrderIdGenerator(domain::OrderId first_id = 1) : next_id_(first_id) {}

  OrderIdGenerator(const OrderIdGenerator&) = delete;
  OrderIdGenerator& operator=(const OrderIdGenerator&) = delete;
  OrderIdGenerator(OrderIdGenerator&&) = delete;
  OrderIdGenerator& operator=(OrderIdGenerator&&) = delete;

  domain::OrderId next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<domain::OrderId> next_id_;
};

}  // namespace quorum
