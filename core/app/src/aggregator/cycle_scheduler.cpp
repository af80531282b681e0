#include "quorum/aggregator/cycle_scheduler.hpp"

#include <iostream>
#include <utility>

namespace quorum {

CycleScheduler::CycleScheduler(ProposalBuffer& buffer,
                               const ITimeProvider& clock,
                               std::chrono::milliseconds window,
                               CycleHandler handler)
    : buffer_(buffer),
      clock_(clock),
      window_(window.count() > 0 ? window : std::chrono::milliseconds(1000)),
      handler_(std::move(handler)) {}

CycleScheduler::~CycleScheduler() { stop(); }

void CycleScheduler::start() {
  if (thread_.joinable()) {
    return;
  }
  stop_token_ = CancellationToken{};
  thread_ = std::thread([this] { run(); });
  std::cout << "[CycleScheduler] started, window=" << window_.count()
            << "ms\n";
}

void CycleScheduler::stop() {
  if (!thread_.joinable()) {
    return;
  }
  stop_token_.requestCancel();
  thread_.join();
  std::cout << "[CycleScheduler] stopped after cycle " << last_cycle_.load()
            << " (" << buffer_.size() << " proposals still buffered)\n";
}

domain::CycleId CycleScheduler::runOnce() {
  const domain::TimestampMs boundary = clock_.now_ms();
  std::vector<domain::Proposal> proposals = buffer_.drain(boundary);
  const domain::CycleId cycle_id = last_cycle_.fetch_add(1) + 1;
  handler_(cycle_id, std::move(proposals));
  return cycle_id;
}

void CycleScheduler::run() {
  while (!stop_token_.waitFor(window_)) {
    runOnce();
  }
}

}  // namespace quorum
