#include "quorum/market/market_snapshot_store.hpp"

#include <algorithm>
#include <mutex>

namespace quorum {
namespace market {

MarketSnapshotStore::MarketSnapshotStore(std::size_t history_capacity)
    : history_capacity_(std::max<std::size_t>(history_capacity, 1)) {}

bool MarketSnapshotStore::update(const MarketDataEvent& event) {
  if (event.instrument.empty() || !(event.price > 0.0)) {
    return false;
  }

  std::unique_lock lock(mutex_);
  Entry& entry = entries_[event.instrument];
  if (!entry.history.empty() &&
      event.timestamp_ms < entry.latest.observed_at) {
    return false;
  }

  entry.latest.instrument = event.instrument;
  entry.latest.price = event.price;
  entry.latest.volume = event.volume;
  entry.latest.indicators = event.indicators;
  entry.latest.observed_at = event.timestamp_ms;

  entry.history.push_back(
      PriceSample{event.price, event.volume, event.timestamp_ms});
  while (entry.history.size() > history_capacity_) {
    entry.history.pop_front();
  }
  return true;
}

std::optional<MarketSnapshot> MarketSnapshotStore::getSnapshot(
    const std::string& instrument) const {
  std::shared_lock lock(mutex_);
  auto it = entries_.find(instrument);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second.latest;
}

std::vector<PriceSample> MarketSnapshotStore::recentSamples(
    const std::string& instrument, std::size_t count) const {
  std::shared_lock lock(mutex_);
  auto it = entries_.find(instrument);
  if (it == entries_.end()) {
    return {};
  }
  const auto& history = it->second.history;
  const std::size_t n = std::min(count, history.size());
  return std::vector<PriceSample>(history.end() - static_cast<std::ptrdiff_t>(n),
                                  history.end());
}

std::vector<std::string> MarketSnapshotStore::instruments() const {
  std::shared_lock lock(mutex_);
  std::vector<std::string> names;
  names.reserve(entries_.size());
  for (const auto& entry : entries_) {
    names.push_back(entry.first);
  }
  std::sort(names.begin(), names.end());
  return names;
}

}  // namespace market
}  // namespace quorum
