#pragma once

#include <cstdint>
#include <string>

namespace quorum {
namespace domain {

// -----------------------------------------------------------------------------
// Shared vocabulary types
// -----------------------------------------------------------------------------
// Epoch milliseconds (UTC) are used for every timestamp in the domain model:
// they come straight from ITimeProvider::now_ms(), compare cheaply, and
// serialize to JSON without conversion.
// -----------------------------------------------------------------------------
using TimestampMs = std::int64_t;

// Unique Approved Order identifier (0 = unset). Issued by OrderIdGenerator.
using OrderId = std::uint64_t;

// Monotonic evaluation-cycle counter, starting at 1.
using CycleId = std::uint64_t;

enum class Side {
  Buy,
  Sell,
};

inline Side opposite(Side side) {
  return side == Side::Buy ? Side::Sell : Side::Buy;
}

inline const char* toString(Side side) {
  switch (side) {
    case Side::Buy:  return "buy";
    case Side::Sell: return "sell";
  }
  return "unknown";
}

// Accepts "buy"/"BUY"/"Buy" and the sell equivalents. Returns false for
// anything else and leaves `out` untouched.
inline bool parseSide(const std::string& text, Side& out) {
  std::string lowered;
  lowered.reserve(text.size());
  for (char c : text) {
    lowered.push_back(static_cast<char>((c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c));
  }
  if (lowered == "buy") {
    out = Side::Buy;
    return true;
  }
  if (lowered == "sell") {
    out = Side::Sell;
    return true;
  }
  return false;
}

}  // namespace domain
}  // namespace quorum
