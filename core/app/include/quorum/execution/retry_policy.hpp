#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>

namespace quorum {

struct RetrySettings {
  // Submissions of one venue order that may fail transiently before the
  // order is Failed.
  int max_attempts{3};
  std::chrono::milliseconds base_delay{200};
  std::chrono::milliseconds max_delay{5000};
  // Each delay is scaled by a uniform factor in [1 - jitter, 1 + jitter].
  double jitter_fraction{0.2};

  int max_resubmissions{3};
  int max_status_polls{10};
  std::chrono::milliseconds poll_interval{250};

  std::chrono::milliseconds venue_timeout{5000};
};

// -----------------------------------------------------------------------------
// RetryPolicy — bounded exponential backoff with jitter
// -----------------------------------------------------------------------------
//
// @details
// delayFor(n) is the wait after the n-th transient failure (n >= 1):
//
//   min(max_delay, base_delay * 2^(n-1)) * U[1 - jitter, 1 + jitter]
//
// clamped to [0, max_delay]. The jitter source is a seeded std::mt19937, so a
// fixed seed gives a reproducible sequence in tests.
//
// Thread model: the RNG is guarded by a mutex; instrument lanes share one
// policy.
// -----------------------------------------------------------------------------
class RetryPolicy {
 public:
  explicit RetryPolicy(RetrySettings settings = {},
                       std::uint32_t seed = std::random_device{}());

  std::chrono::milliseconds delayFor(int failed_attempts);

  // True while another submission is allowed after `failed_attempts`
  // transient failures.
  bool canRetry(int failed_attempts) const {
    return failed_attempts < settings_.max_attempts;
  }

  const RetrySettings& settings() const { return settings_; }

 private:
  const RetrySettings settings_;
  std::mutex rng_mutex_;
  std::mt19937 rng_;
};

}  // namespace quorum
