#include "quorum/portfolio/portfolio_store.hpp"

#include "quorum/time/daily_boundary.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <sstream>

namespace quorum {

PortfolioStore::PortfolioStore(double initial_capital,
                               const ITimeProvider& clock,
                               int daily_reset_hour_utc)
    : clock_(clock), daily_reset_hour_utc_(daily_reset_hour_utc) {
  auto initial = std::make_shared<domain::PortfolioSnapshot>();
  initial->total_capital = initial_capital;
  initial->available_capital = initial_capital;
  initial->trading_day =
      trading_day_index(clock_.now_ms(), daily_reset_hour_utc_);
  initial->updated_at = clock_.now_ms();
  current_ = std::move(initial);
}

std::shared_ptr<const domain::PortfolioSnapshot> PortfolioStore::snapshot()
    const {
  std::shared_lock lock(mutex_);
  return current_;
}

void PortfolioStore::setUpdateListener(UpdateListener listener) {
  std::lock_guard lock(listener_mutex_);
  listener_ = std::move(listener);
}

bool PortfolioStore::hasApplied(domain::OrderId order_id,
                                std::uint32_t fill_seq) const {
  std::shared_lock lock(mutex_);
  return applied_.count({order_id, fill_seq}) > 0;
}

std::size_t PortfolioStore::appliedFillCount() const {
  std::shared_lock lock(mutex_);
  return applied_.size();
}

bool PortfolioStore::hydrate(const domain::PortfolioSnapshot& restored) {
  if (restored.available_capital < 0.0 || restored.total_capital < 0.0) {
    std::cerr << "[PortfolioStore] refusing to hydrate: negative capital\n";
    return false;
  }
  for (const auto& [key, position] : restored.open_positions) {
    if (key != domain::positionKey(position.instrument, position.venue) ||
        !(position.quantity > 0.0)) {
      std::cerr << "[PortfolioStore] refusing to hydrate: bad position "
                << key << "\n";
      return false;
    }
  }

  auto next = std::make_shared<domain::PortfolioSnapshot>(restored);
  {
    std::unique_lock lock(mutex_);
    next->version = current_->version + 1;
    current_ = next;
  }
  std::cout << "[PortfolioStore] hydrated: capital=" << next->total_capital
            << " available=" << next->available_capital
            << " positions=" << next->open_positions.size() << "\n";
  return true;
}

// -----------------------------------------------------------------------------
// applyFill()
// -----------------------------------------------------------------------------
// Copy-on-write: the new snapshot is built from a copy of the current one and
// only swapped in if every invariant holds.
// -----------------------------------------------------------------------------
FillApplication PortfolioStore::applyFill(const domain::Fill& fill) {
  FillApplication result;
  // Taken before the state lock is released so listeners see snapshots in
  // version order even when several lanes apply fills at once.
  std::unique_lock<std::mutex> notify_lock(listener_mutex_, std::defer_lock);

  {
    std::unique_lock lock(mutex_);

    if (applied_.count({fill.order_id, fill.fill_seq}) > 0) {
      result.outcome = FillOutcome::Duplicate;
      result.snapshot = current_;
      result.detail = "fill already applied";
      return result;
    }

    domain::PortfolioSnapshot next = *current_;

    const domain::TimestampMs now = clock_.now_ms();
    const std::int64_t today = trading_day_index(now, daily_reset_hour_utc_);
    if (next.trading_day != today) {
      next.trading_day = today;
      next.daily_realized_pnl = 0.0;
    }

    std::string error =
        applyToSnapshot(next, fill, result.realized_pnl, result.position_closed);
    if (!error.empty()) {
      result.outcome = FillOutcome::InvariantViolation;
      result.snapshot = current_;
      result.detail = std::move(error);
      std::cerr << "[PortfolioStore] [CRITICAL] order=" << fill.order_id
                << " fill_seq=" << fill.fill_seq << " refused: "
                << result.detail << "\n";
      return result;
    }

    next.version = current_->version + 1;
    next.updated_at = now;
    current_ = std::make_shared<const domain::PortfolioSnapshot>(std::move(next));
    applied_.insert({fill.order_id, fill.fill_seq});
    result.outcome = FillOutcome::Applied;
    result.snapshot = current_;
    notify_lock.lock();
  }

  if (listener_) {
    listener_(result.snapshot);
  }
  return result;
}

// -----------------------------------------------------------------------------
// forgetOrder()
// -----------------------------------------------------------------------------
// Called once an order is terminal: no further fill can arrive for it, so its
// idempotency keys are no longer needed.
// -----------------------------------------------------------------------------
void PortfolioStore::forgetOrder(domain::OrderId order_id) {
  std::unique_lock lock(mutex_);
  applied_.erase(applied_.lower_bound({order_id, 0}),
                 applied_.upper_bound(
                     {order_id, std::numeric_limits<std::uint32_t>::max()}));
}

std::string PortfolioStore::applyToSnapshot(domain::PortfolioSnapshot& next,
                                            const domain::Fill& fill,
                                            double& realized_pnl,
                                            bool& position_closed) const {
  if (!(fill.quantity > 0.0) || !(fill.price > 0.0)) {
    std::ostringstream oss;
    oss << "non-positive fill quantity/price (" << fill.quantity << " @ "
        << fill.price << ")";
    return oss.str();
  }

  const std::string key = domain::positionKey(fill.instrument, fill.venue);
  auto it = next.open_positions.find(key);
  double remaining = fill.quantity;

  if (fill.reduce_only) {
    if (it == next.open_positions.end() || it->second.side == fill.side) {
      return "reduce-only fill with no opposite position on " + key;
    }
    if (fill.quantity > it->second.quantity + kEpsilon) {
      std::ostringstream oss;
      oss << "reduce-only fill of " << fill.quantity << " exceeds open "
          << it->second.quantity << " on " << key;
      return oss.str();
    }
  }

  if (it != next.open_positions.end() && it->second.side != fill.side) {
    domain::OpenPosition& pos = it->second;
    const double closed = std::min(remaining, pos.quantity);
    const double direction = pos.side == domain::Side::Buy ? 1.0 : -1.0;
    const double pnl = closed * (fill.price - pos.entry_price) * direction;

    realized_pnl = pnl;
    next.available_capital += closed * pos.entry_price + pnl;
    next.total_capital += pnl;
    next.daily_realized_pnl += pnl;
    next.total_realized_pnl += pnl;

    pos.quantity -= closed;
    remaining -= closed;
    if (pos.quantity <= kEpsilon) {
      next.open_positions.erase(it);
      position_closed = true;
    }
    it = next.open_positions.find(key);
  }

  if (remaining > kEpsilon) {
    const double cost = remaining * fill.price;
    if (it == next.open_positions.end()) {
      domain::OpenPosition pos;
      pos.instrument = fill.instrument;
      pos.venue = fill.venue;
      pos.side = fill.side;
      pos.quantity = remaining;
      pos.entry_price = fill.price;
      pos.opened_at = fill.filled_at;
      next.open_positions.emplace(key, pos);
    } else {
      domain::OpenPosition& pos = it->second;
      const double total = pos.quantity + remaining;
      pos.entry_price =
          (pos.quantity * pos.entry_price + remaining * fill.price) / total;
      pos.quantity = total;
    }
    next.available_capital -= cost;
  }

  if (next.available_capital < -kEpsilon) {
    std::ostringstream oss;
    oss << "available capital would become " << next.available_capital;
    return oss.str();
  }
  if (next.available_capital < 0.0) {
    next.available_capital = 0.0;
  }
  return {};
}

}  // namespace quorum
