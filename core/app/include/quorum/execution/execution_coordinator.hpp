#pragma once

#include "quorum/concurrent/cancellation_token.hpp"
#include "quorum/domain/order.hpp"
#include "quorum/events/event.hpp"
#include "quorum/execution/i_venue_adapter.hpp"
#include "quorum/execution/instrument_lanes.hpp"
#include "quorum/execution/retry_policy.hpp"
#include "quorum/portfolio/portfolio_store.hpp"
#include "quorum/time/i_time_provider.hpp"

#include <atomic>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace quorum {

// -----------------------------------------------------------------------------
// ExecutionTicket — handle onto one asynchronously executing order
// -----------------------------------------------------------------------------
// cancel() requests cooperative cancellation; result() blocks until the
// order reaches a terminal state. A cancelled order still returns exactly one
// ExecutionResult (state Cancelled, or whatever terminal state it reached
// first).
// -----------------------------------------------------------------------------
class ExecutionTicket {
 public:
  ExecutionTicket(domain::OrderId order_id, std::string instrument,
                  CancellationToken token,
                  std::shared_future<domain::ExecutionResult> future)
      : order_id_(order_id),
        instrument_(std::move(instrument)),
        token_(std::move(token)),
        future_(std::move(future)) {}

  domain::OrderId orderId() const { return order_id_; }
  const std::string& instrument() const { return instrument_; }

  void cancel() const { token_.requestCancel(); }
  bool isCancelRequested() const { return token_.isCancelled(); }

  domain::ExecutionResult result() const { return future_.get(); }

  template <typename Rep, typename Period>
  bool waitFor(std::chrono::duration<Rep, Period> timeout) const {
    return future_.wait_for(timeout) == std::future_status::ready;
  }

 private:
  domain::OrderId order_id_;
  std::string instrument_;
  CancellationToken token_;
  std::shared_future<domain::ExecutionResult> future_;
};

// -----------------------------------------------------------------------------
// ExecutionCoordinator
// -----------------------------------------------------------------------------
//
// @brief  Owns the lifecycle of every Approved Order from submission to a
//         terminal ExecutionResult.
//
// @details
// execute() is the synchronous state machine:
//
//   submit ──ok──> Submitted ──> poll while Open (≤ max_status_polls)
//     │                 ├── Filled ────────────────────────> Filled
//     │                 ├── PartiallyFilled ─> re-submit remainder
//     │                 │       (≤ max_resubmissions, else Failed)
//     │                 └── Rejected ──────────────────────> Rejected
//     ├─transient─> wait backoff ─> submit again (≤ max_attempts, else Failed)
//     └─permanent─────────────────────────────────────────> Rejected
//
// Every increase in a venue order's cumulative fill becomes one domain::Fill
// with the next fill_seq and is applied through PortfolioStore::applyFill()
// before anything else happens, so partial fills are reflected immediately.
// A refused fill (InvariantViolation) aborts the order: an
// InvariantViolationEvent is published, a [CRITICAL] line is logged and the
// order ends Failed with reason InvariantViolation.
//
// A Reduce order is sized against the live position before every
// submission: it is clamped to the opposite-side quantity still open, and
// ends Rejected (NothingToReduce) when none is left. Its fills are marked
// reduce_only so the store refuses one that would open or flip a position.
//
// Cancellation is checked before every venue call and interrupts backoff
// and poll waits. A venue call already in flight completes, and any fill it
// reports is still applied, before the order ends Cancelled.
//
// Each transition publishes an OrderUpdateEvent; the terminal state
// publishes exactly one ExecutionResultEvent.
//
// submit() runs execute() on the order's instrument lane and returns a
// ticket. While the order runs, hasInFlight(instrument) is true.
//
// Thread model:
//   execute() may run concurrently for different orders. Venue adapters and
//   the portfolio store are thread-safe; the in-flight table is guarded by
//   its own mutex.
//
// Ownership:
//   Borrows the portfolio store, the retry policy, the clock and the venue
//   adapters (registered by the Orchestrator, which owns them). Owns the
//   instrument lanes.
// -----------------------------------------------------------------------------
class ExecutionCoordinator {
 public:
  using EventSink = std::function<void(Event)>;
  using ResultListener = std::function<void(const domain::ApprovedOrder&,
                                            const domain::ExecutionResult&)>;

  ExecutionCoordinator(PortfolioStore& portfolio, RetryPolicy& retry_policy,
                       const ITimeProvider& clock, EventSink event_sink);
  ~ExecutionCoordinator();

  ExecutionCoordinator(const ExecutionCoordinator&) = delete;
  ExecutionCoordinator& operator=(const ExecutionCoordinator&) = delete;

  void registerVenue(IVenueAdapter& venue);
  bool hasVenue(const std::string& name) const;

  domain::ExecutionResult execute(const domain::ApprovedOrder& order,
                                  const CancellationToken& token);

  // Asynchronous form. `on_result` (optional) runs on the lane thread after
  // the result is published and before the order leaves the in-flight
  // table. Returns nullptr if the coordinator is stopping.
  std::shared_ptr<ExecutionTicket> submit(domain::ApprovedOrder order,
                                          ResultListener on_result = nullptr);

  bool hasInFlight(const std::string& instrument) const;
  std::size_t inFlightCount() const;

  // Requests cancellation of every in-flight order.
  void cancelAll();

  // Cancels everything and joins the lanes. Idempotent.
  void shutdown();

 private:
  struct Run;

  IVenueAdapter* findVenue(const std::string& name) const;

  domain::ExecutionResult runStateMachine(Run& run, IVenueAdapter& venue);

  void transition(Run& run, domain::ExecutionState next,
                  const std::string& detail);
  bool applyVenueFills(Run& run, const VenueResponse& response);
  double reducibleQuantity(const domain::ApprovedOrder& order) const;
  domain::ExecutionResult finish(Run& run, domain::ExecutionState state,
                                 domain::ExecutionFailureReason reason,
                                 const std::string& detail);

  std::uint64_t nextSequence() { return sequence_.fetch_add(1) + 1; }

  PortfolioStore& portfolio_;
  RetryPolicy& retry_policy_;
  const ITimeProvider& clock_;
  EventSink event_sink_;

  mutable std::mutex venues_mutex_;
  std::map<std::string, IVenueAdapter*> venues_;

  mutable std::mutex in_flight_mutex_;
  std::map<domain::OrderId, std::shared_ptr<ExecutionTicket>> in_flight_;

  std::atomic<std::uint64_t> sequence_{0};
  InstrumentLanes lanes_;
};

}  // namespace quorum
