#include "quorum/time/simulation_time_provider.hpp"

namespace quorum {

domain::TimestampMs SimulationTimeProvider::now_ms() const {
  return current_time_ms_.load();
}

// Monotonicity is not enforced; tests rewind the clock on purpose.
void SimulationTimeProvider::advance_time(domain::TimestampMs new_time_ms) {
  current_time_ms_.store(new_time_ms);
}

void SimulationTimeProvider::advance_by(domain::TimestampMs delta_ms) {
  current_time_ms_.fetch_add(delta_ms);
}

}  // namespace quorum
