#include "quorum/execution/position_monitor.hpp"

#include "quorum/domain/portfolio.hpp"

#include <iostream>
#include <utility>

namespace quorum {

PositionMonitor::PositionMonitor(CloseRequest close_request)
    : close_request_(std::move(close_request)) {}

void PositionMonitor::arm(const domain::ApprovedOrder& order,
                          const domain::ExecutionResult& result) {
  if (order.intent != domain::OrderIntent::Open ||
      result.filled_quantity <= 0.0) {
    return;
  }
  if (order.stop_loss_price <= 0.0 && order.take_profit_price <= 0.0) {
    return;
  }

  ProtectiveLevels levels;
  levels.opening_order_id = order.order_id;
  levels.instrument = order.instrument;
  levels.venue = order.venue;
  levels.position_side = order.side;
  levels.entry_price = result.average_fill_price;
  levels.stop_loss_price = order.stop_loss_price;
  levels.take_profit_price = order.take_profit_price;
  levels.armed_at = order.created_at;

  std::lock_guard lock(mutex_);
  armed_[domain::positionKey(order.instrument, order.venue)] = levels;
  std::cout << "[PositionMonitor] armed " << order.instrument << "@"
            << order.venue << " SL=" << levels.stop_loss_price
            << " TP=" << levels.take_profit_price << "\n";
}

void PositionMonitor::disarm(const std::string& instrument,
                             const std::string& venue) {
  std::lock_guard lock(mutex_);
  armed_.erase(domain::positionKey(instrument, venue));
}

void PositionMonitor::closeCompleted(const std::string& instrument,
                                     const std::string& venue,
                                     bool position_still_open) {
  std::lock_guard lock(mutex_);
  auto it = armed_.find(domain::positionKey(instrument, venue));
  if (it == armed_.end()) {
    return;
  }
  if (position_still_open) {
    it->second.closing = false;
    std::cerr << "[PositionMonitor] close of " << instrument << "@" << venue
              << " did not flatten the position; re-armed\n";
  } else {
    armed_.erase(it);
  }
}

std::optional<ExitTrigger> PositionMonitor::crossed(
    const ProtectiveLevels& levels, double price) {
  const bool is_long = levels.position_side == domain::Side::Buy;
  if (levels.stop_loss_price > 0.0 &&
      (is_long ? price <= levels.stop_loss_price
               : price >= levels.stop_loss_price)) {
    return ExitTrigger::StopLoss;
  }
  if (levels.take_profit_price > 0.0 &&
      (is_long ? price >= levels.take_profit_price
               : price <= levels.take_profit_price)) {
    return ExitTrigger::TakeProfit;
  }
  return std::nullopt;
}

int PositionMonitor::onPrice(const std::string& instrument, double price) {
  std::vector<std::pair<ProtectiveLevels, ExitTrigger>> fired;
  {
    std::lock_guard lock(mutex_);
    for (auto& [key, levels] : armed_) {
      if (levels.instrument != instrument || levels.closing) {
        continue;
      }
      if (auto trigger = crossed(levels, price)) {
        levels.closing = true;
        fired.emplace_back(levels, *trigger);
      }
    }
  }

  int requested = 0;
  for (const auto& [levels, trigger] : fired) {
    std::cout << "[PositionMonitor] " << toString(trigger) << " hit for "
              << levels.instrument << "@" << levels.venue << " at " << price
              << "\n";
    if (close_request_(levels, trigger, price)) {
      ++requested;
    } else {
      closeCompleted(levels.instrument, levels.venue, true);
    }
  }
  return requested;
}

std::optional<ProtectiveLevels> PositionMonitor::levels(
    const std::string& instrument, const std::string& venue) const {
  std::lock_guard lock(mutex_);
  auto it = armed_.find(domain::positionKey(instrument, venue));
  if (it == armed_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t PositionMonitor::armedCount() const {
  std::lock_guard lock(mutex_);
  return armed_.size();
}

}  // namespace quorum
