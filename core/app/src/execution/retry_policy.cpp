#include "quorum/execution/retry_policy.hpp"

#include <algorithm>
#include <cmath>

namespace quorum {

RetryPolicy::RetryPolicy(RetrySettings settings, std::uint32_t seed)
    : settings_(settings), rng_(seed) {}

std::chrono::milliseconds RetryPolicy::delayFor(int failed_attempts) {
  const int exponent = std::clamp(failed_attempts - 1, 0, 30);
  const double cap = static_cast<double>(settings_.max_delay.count());
  const double raw = std::min(
      cap, static_cast<double>(settings_.base_delay.count()) *
               std::pow(2.0, static_cast<double>(exponent)));

  double factor = 1.0;
  const double jitter = std::clamp(settings_.jitter_fraction, 0.0, 1.0);
  if (jitter > 0.0) {
    std::uniform_real_distribution<double> dist(1.0 - jitter, 1.0 + jitter);
    std::lock_guard lock(rng_mutex_);
    factor = dist(rng_);
  }

  const double delay = std::clamp(raw * factor, 0.0, cap);
  return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(delay)));
}

}  // namespace quorum
