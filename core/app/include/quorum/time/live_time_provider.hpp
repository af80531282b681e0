#pragma once

#include "quorum/time/i_time_provider.hpp"

namespace quorum {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock ITimeProvider
// -----------------------------------------------------------------------------
// Delegates to std::chrono::system_clock. Stateless, so safe from any thread.
// Owned by main() / the Orchestrator and lent to components by reference.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  domain::TimestampMs now_ms() const override;
};

}  // namespace quorum
