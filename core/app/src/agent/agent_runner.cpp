#include "quorum/agent/agent_runner.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <utility>

namespace quorum {

AgentRunner::AgentRunner(std::unique_ptr<IProposer> proposer,
                         AgentSettings settings,
                         const market::IMarketDataFeed& feed,
                         const ITimeProvider& clock, ProposalSink sink,
                         HeartbeatSink heartbeat)
    : proposer_(std::move(proposer)),
      settings_(std::move(settings)),
      feed_(feed),
      clock_(clock),
      sink_(std::move(sink)),
      heartbeat_(std::move(heartbeat)) {
  health_.agent_id = proposer_->agentId();
}

AgentRunner::~AgentRunner() { stop(); }

void AgentRunner::start() {
  if (thread_.joinable()) {
    return;
  }
  stop_token_ = CancellationToken{};
  {
    std::lock_guard lock(health_mutex_);
    health_.running = true;
  }
  thread_ = std::thread([this] { run(); });
  std::cout << "[AgentRunner:" << agentId() << "] started, cadence="
            << settings_.cadence.count() << "ms, "
            << settings_.instruments.size() << " instruments\n";
}

void AgentRunner::stop() {
  if (!thread_.joinable()) {
    return;
  }
  stop_token_.requestCancel();
  thread_.join();
  {
    std::lock_guard lock(health_mutex_);
    health_.running = false;
  }
  std::cout << "[AgentRunner:" << agentId() << "] stopped\n";
}

AgentHealth AgentRunner::health() const {
  std::lock_guard lock(health_mutex_);
  return health_;
}

void AgentRunner::run() {
  // Evaluate immediately, then once per cadence.
  do {
    runOnce();
  } while (!stop_token_.waitFor(settings_.cadence));
}

int AgentRunner::runOnce() {
  int emitted = 0;
  bool failed = false;
  std::uint64_t stale = 0;

  for (const auto& instrument : settings_.instruments) {
    if (stop_token_.isCancelled()) {
      break;
    }

    const domain::TimestampMs now = clock_.now_ms();
    auto snapshot = feed_.getSnapshot(instrument);
    const bool is_stale =
        !snapshot || now - snapshot->observed_at > settings_.max_snapshot_age_ms;

    auto known = std::find(stale_instruments_.begin(), stale_instruments_.end(),
                           instrument);
    if (is_stale) {
      ++stale;
      if (known == stale_instruments_.end()) {
        stale_instruments_.push_back(instrument);
        std::cout << "[AgentRunner:" << agentId() << "] " << instrument
                  << (snapshot ? " snapshot stale" : " snapshot unavailable")
                  << ", skipping\n";
      }
      continue;
    }
    if (known != stale_instruments_.end()) {
      stale_instruments_.erase(known);
    }

    ProposerInput input;
    input.snapshot = std::move(*snapshot);
    input.history = feed_.recentSamples(instrument, proposer_->historyDepth());
    input.now_ms = now;

    try {
      auto proposal = proposer_->propose(input);
      if (proposal) {
        ++emitted;
        sink_(std::move(*proposal));
      }
    } catch (const std::exception& ex) {
      failed = true;
      std::cerr << "[AgentRunner:" << agentId() << "] " << instrument
                << " evaluation failed: " << ex.what() << "\n";
      std::lock_guard lock(health_mutex_);
      ++health_.errors;
      health_.last_error = ex.what();
    }
  }

  const domain::TimestampMs finished = clock_.now_ms();
  {
    std::lock_guard lock(health_mutex_);
    ++health_.cycles;
    health_.last_cycle_at = finished;
    if (!failed) {
      health_.last_success_at = finished;
    }
    health_.proposals_emitted += static_cast<std::uint64_t>(emitted);
    health_.stale_skips += stale;
  }

  if (heartbeat_) {
    heartbeat_(agentId(), failed ? "error" : (emitted > 0 ? "ok" : "idle"),
               emitted);
  }
  return emitted;
}

}  // namespace quorum
