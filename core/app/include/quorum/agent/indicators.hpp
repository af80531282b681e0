#pragma once

#include "quorum/market/market_snapshot.hpp"

#include <cstddef>
#include <vector>

namespace quorum {
namespace indicators {

// Helpers over a history ordered oldest first, newest last. Callers must
// pass at least `period` samples (and period + 1 for rsi()).

// Mean price of the newest `period` samples.
inline double sma(const std::vector<market::PriceSample>& history,
                  std::size_t period) {
  double sum = 0.0;
  for (std::size_t i = history.size() - period; i < history.size(); ++i) {
    sum += history[i].price;
  }
  return sum / static_cast<double>(period);
}

// Mean volume of the newest `period` samples.
inline double averageVolume(const std::vector<market::PriceSample>& history,
                            std::size_t period) {
  double sum = 0.0;
  for (std::size_t i = history.size() - period; i < history.size(); ++i) {
    sum += history[i].volume;
  }
  return sum / static_cast<double>(period);
}

// Simple-average RSI over the newest `period` price changes. Returns 100
// when there were no losses and 50 for a flat window.
inline double rsi(const std::vector<market::PriceSample>& history,
                  std::size_t period) {
  double gains = 0.0;
  double losses = 0.0;
  for (std::size_t i = history.size() - period; i < history.size(); ++i) {
    const double delta = history[i].price - history[i - 1].price;
    if (delta > 0.0) {
      gains += delta;
    } else {
      losses -= delta;
    }
  }
  if (gains == 0.0 && losses == 0.0) {
    return 50.0;
  }
  if (losses == 0.0) {
    return 100.0;
  }
  const double rs = gains / losses;
  return 100.0 - 100.0 / (1.0 + rs);
}

}  // namespace indicators
}  // namespace quorum
