#pragma once

#include "quorum/events/event_types.hpp"
#include "quorum/market/i_market_data_feed.hpp"

#include <cstddef>
#include <deque>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace quorum {
namespace market {

// -----------------------------------------------------------------------------
// MarketSnapshotStore
// -----------------------------------------------------------------------------
//
// @brief  In-memory IMarketDataFeed: latest snapshot plus a bounded rolling
//         history per instrument.
//
// @details
// Written by the MarketDataGateway (one writer, the market data thread) and
// read by every AgentRunner and by the PositionMonitor. An update whose
// timestamp is older than the stored snapshot is ignored, so a delayed or
// replayed tick cannot move the view backwards.
//
// Thread model:
//   std::shared_mutex. update() takes the unique lock; every read takes a
//   shared lock and returns copies, so no reference escapes the lock.
//
// Ownership:
//   Owned by the Orchestrator, lent by reference to the gateway (as the
//   concrete type) and to agents (as IMarketDataFeed).
// -----------------------------------------------------------------------------
class MarketSnapshotStore final : public IMarketDataFeed {
 public:
  explicit MarketSnapshotStore(std::size_t history_capacity = 200);

  MarketSnapshotStore(const MarketSnapshotStore&) = delete;
  MarketSnapshotStore& operator=(const MarketSnapshotStore&) = delete;

  // Records one tick. Returns false if it was older than the current
  // snapshot (and therefore dropped) or carried a non-positive price.
  bool update(const MarketDataEvent& event);

  std::optional<MarketSnapshot> getSnapshot(
      const std::string& instrument) const override;

  std::vector<PriceSample> recentSamples(const std::string& instrument,
                                         std::size_t count) const override;

  std::vector<std::string> instruments() const;

 private:
  struct Entry {
    MarketSnapshot latest;
    std::deque<PriceSample> history;
  };

  std::size_t history_capacity_;
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;
};

}  // namespace market
}  // namespace quorum
