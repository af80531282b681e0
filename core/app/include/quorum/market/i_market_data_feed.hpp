#pragma once

#include "quorum/market/market_snapshot.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace quorum {
namespace market {

// -----------------------------------------------------------------------------
// IMarketDataFeed — read side of the market data layer
// -----------------------------------------------------------------------------
//
// @brief  What analysis agents are allowed to see of the market.
//
// @details
// getSnapshot() returns std::nullopt when the instrument has never been
// observed ("Unavailable"). Staleness is judged by the caller against its
// own clock, because the acceptable age differs per agent cadence.
//
// recentSamples() returns up to `count` observations, oldest first, newest
// last. Fewer are returned while history is still warming up.
//
// Thread model: implementations must allow concurrent readers.
// -----------------------------------------------------------------------------
class IMarketDataFeed {
 public:
  virtual ~IMarketDataFeed() = default;

  virtual std::optional<MarketSnapshot> getSnapshot(
      const std::string& instrument) const = 0;

  virtual std::vector<PriceSample> recentSamples(const std::string& instrument,
                                                 std::size_t count) const = 0;
};

}  // namespace market
}  // namespace quorum
