#pragma once

#include "quorum/domain/order.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace quorum {

// Stop-loss / take-profit levels protecting one open position.
struct ProtectiveLevels {
  domain::OrderId opening_order_id{0};
  std::string instrument;
  std::string venue;
  domain::Side position_side{domain::Side::Buy};
  double entry_price{0.0};
  double stop_loss_price{0.0};
  double take_profit_price{0.0};
  domain::TimestampMs armed_at{0};
  bool closing{false};
};

// Why a protective close fired.
enum class ExitTrigger {
  StopLoss,
  TakeProfit,
};

inline const char* toString(ExitTrigger trigger) {
  return trigger == ExitTrigger::StopLoss ? "stop_loss" : "take_profit";
}

// -----------------------------------------------------------------------------
// PositionMonitor
// -----------------------------------------------------------------------------
//
// @brief  Watches prices against the protective levels of every open
//         position and asks for a closing order when one is crossed.
//
// @details
// arm() is called when an opening order fills (fully or partly). Each price
// update for an armed instrument is checked:
//
//   long  position: price <= stop_loss  or price >= take_profit
//   short position: price >= stop_loss  or price <= take_profit
//
// A crossing marks the levels as `closing` and invokes the CloseRequest
// callback once. Further prices are ignored until closeCompleted() reports
// the outcome: if the position is gone the levels are dropped, otherwise
// they are re-armed and the next crossing fires again. If the callback
// itself returns false (no order could be submitted) the levels are re-armed
// immediately.
//
// Thread model:
//   onPrice() from the market data thread, arm()/closeCompleted() from lane
//   threads. One mutex; the callback runs without it.
// -----------------------------------------------------------------------------
class PositionMonitor {
 public:
  using CloseRequest = std::function<bool(const ProtectiveLevels& levels,
                                          ExitTrigger trigger,
                                          double trigger_price)>;

  explicit PositionMonitor(CloseRequest close_request);

  PositionMonitor(const PositionMonitor&) = delete;
  PositionMonitor& operator=(const PositionMonitor&) = delete;

  // Arms from a filled opening order. Reduce orders and orders without
  // fills are ignored.
  void arm(const domain::ApprovedOrder& order,
           const domain::ExecutionResult& result);

  void disarm(const std::string& instrument, const std::string& venue);

  // Outcome of a close requested by this monitor.
  void closeCompleted(const std::string& instrument, const std::string& venue,
                      bool position_still_open);

  // Returns the number of closes requested for this price.
  int onPrice(const std::string& instrument, double price);

  std::optional<ProtectiveLevels> levels(const std::string& instrument,
                                         const std::string& venue) const;
  std::size_t armedCount() const;

 private:
  static std::optional<ExitTrigger> crossed(const ProtectiveLevels& levels,
                                            double price);

  CloseRequest close_request_;

  mutable std::mutex mutex_;
  // keyed by domain::positionKey(instrument, venue)
  std::map<std::string, ProtectiveLevels> armed_;
};

}  // namespace quorum
