#pragma once

#include "quorum/aggregator/proposal_buffer.hpp"
#include "quorum/concurrent/cancellation_token.hpp"
#include "quorum/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <thread>
#include <vector>

namespace quorum {

// -----------------------------------------------------------------------------
// CycleScheduler
// -----------------------------------------------------------------------------
//
// @brief  Timer thread that closes one evaluation cycle per window.
//
// @details
// Every `window` the scheduler stamps a boundary with clock.now_ms(), drains
// the ProposalBuffer up to that boundary and invokes the cycle handler with
// the next CycleId (starting at 1). The tick is the only synchronization
// point between agents and the decision path.
//
// The wait between ticks is a CancellationToken::waitFor(), so stop()
// interrupts it immediately. stop() never drains the buffer; proposals that
// missed the last tick stay buffered.
//
// runOnce() closes a cycle on the caller's thread without the timer, which
// is how tests drive the pipeline deterministically.
//
// Thread model:
//   The handler runs on the scheduler thread (or on the runOnce() caller).
//   start()/stop() from the owning thread.
// -----------------------------------------------------------------------------
class CycleScheduler {
 public:
  using CycleHandler = std::function<void(domain::CycleId,
                                          std::vector<domain::Proposal>)>;

  CycleScheduler(ProposalBuffer& buffer, const ITimeProvider& clock,
                 std::chrono::milliseconds window, CycleHandler handler);
  ~CycleScheduler();

  CycleScheduler(const CycleScheduler&) = delete;
  CycleScheduler& operator=(const CycleScheduler&) = delete;

  void start();
  void stop();

  // Closes one cycle now. Returns the id of the cycle it closed.
  domain::CycleId runOnce();

  domain::CycleId lastCycleId() const { return last_cycle_.load(); }
  std::chrono::milliseconds window() const { return window_; }

 private:
  void run();

  ProposalBuffer& buffer_;
  const ITimeProvider& clock_;
  const std::chrono::milliseconds window_;
  CycleHandler handler_;

  std::atomic<domain::CycleId> last_cycle_{0};
  CancellationToken stop_token_;
  std::thread thread_;
};

}  // namespace quorum
