#pragma once

#include "quorum/domain/types.hpp"

#include <map>
#include <string>

namespace quorum {
namespace market {

// Latest observed market state for one instrument.
struct MarketSnapshot {
  std::string instrument;
  double price{0.0};
  double volume{0.0};
  std::map<std::string, double> indicators;
  domain::TimestampMs observed_at{0};
};

// One historical observation, as retained by MarketSnapshotStore.
struct PriceSample {
  double price{0.0};
  double volume{0.0};
  domain::TimestampMs observed_at{0};
};

}  // namespace market
}  // namespace quorum
