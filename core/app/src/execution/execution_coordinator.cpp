#include "quorum/execution/execution_coordinator.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <sstream>
#include <utility>

namespace quorum {

namespace {

constexpr double kQuantityEpsilon = 1e-9;

}  // namespace

// Per-order working state of execute().
struct ExecutionCoordinator::Run {
  const domain::ApprovedOrder& order;
  const CancellationToken& token;
  domain::ExecutionResult result;
  std::uint32_t fill_seq{0};
  // Cumulative fill already turned into Fills for the current venue order.
  double venue_filled{0.0};
  double venue_average{0.0};

  Run(const domain::ApprovedOrder& o, const CancellationToken& t)
      : order(o), token(t) {}

  double remaining() const {
    return std::max(0.0, order.approved_quantity - result.filled_quantity);
  }
};

ExecutionCoordinator::ExecutionCoordinator(PortfolioStore& portfolio,
                                           RetryPolicy& retry_policy,
                                           const ITimeProvider& clock,
                                           EventSink event_sink)
    : portfolio_(portfolio),
      retry_policy_(retry_policy),
      clock_(clock),
      event_sink_(std::move(event_sink)) {}

ExecutionCoordinator::~ExecutionCoordinator() { shutdown(); }

void ExecutionCoordinator::registerVenue(IVenueAdapter& venue) {
  std::lock_guard lock(venues_mutex_);
  venues_[venue.name()] = &venue;
}

bool ExecutionCoordinator::hasVenue(const std::string& name) const {
  return findVenue(name) != nullptr;
}

IVenueAdapter* ExecutionCoordinator::findVenue(const std::string& name) const {
  std::lock_guard lock(venues_mutex_);
  auto it = venues_.find(name);
  return it == venues_.end() ? nullptr : it->second;
}

// -----------------------------------------------------------------------------
// execute()
// -----------------------------------------------------------------------------
domain::ExecutionResult ExecutionCoordinator::execute(
    const domain::ApprovedOrder& order, const CancellationToken& token) {
  Run run(order, token);
  run.result.order_id = order.order_id;
  run.result.instrument = order.instrument;
  run.result.venue = order.venue;
  run.result.side = order.side;
  run.result.requested_quantity = order.approved_quantity;
  run.result.state = domain::ExecutionState::Pending;

  if (!(order.approved_quantity > 0.0)) {
    return finish(run, domain::ExecutionState::Failed,
                  domain::ExecutionFailureReason::InvariantViolation,
                  "approved quantity must be positive");
  }

  IVenueAdapter* venue = findVenue(order.venue);
  if (venue == nullptr) {
    return finish(run, domain::ExecutionState::Rejected,
                  domain::ExecutionFailureReason::VenueRejected,
                  "no adapter registered for venue '" + order.venue + "'");
  }

  try {
    return runStateMachine(run, *venue);
  } catch (const std::exception& ex) {
    return finish(run, domain::ExecutionState::Failed,
                  domain::ExecutionFailureReason::VenueRejected,
                  std::string("venue adapter error: ") + ex.what());
  }
}

domain::ExecutionResult ExecutionCoordinator::runStateMachine(
    Run& run, IVenueAdapter& venue) {
  using domain::ExecutionFailureReason;
  using domain::ExecutionState;

  const RetrySettings& settings = retry_policy_.settings();
  const domain::ApprovedOrder& order = run.order;

  for (int submission = 1;; ++submission) {
    double quantity = run.remaining();
    if (order.intent == domain::OrderIntent::Reduce) {
      // The lane serializes this instrument, so the live position cannot
      // change under this order except through its own fills.
      const double open = reducibleQuantity(order);
      if (open <= kQuantityEpsilon) {
        return finish(run, ExecutionState::Rejected,
                      ExecutionFailureReason::NothingToReduce,
                      "no opposite " + order.instrument + " position on " +
                          order.venue + " left to reduce");
      }
      if (open < quantity) {
        std::cout << "[ExecutionCoordinator] order " << order.order_id
                  << " reduce clamped from " << quantity << " to open "
                  << open << "\n";
        quantity = open;
      }
    }

    VenueOrderRequest request;
    request.order_id = order.order_id;
    request.submission = submission;
    request.instrument = order.instrument;
    request.side = order.side;
    request.quantity = quantity;
    request.price_type = order.price_type;
    request.limit_price = order.limit_price;
    request.reference_price = order.reference_price;

    // Submission with bounded transient retry.
    VenueResponse response;
    int transient_failures = 0;
    while (true) {
      if (run.token.isCancelled()) {
        return finish(run, ExecutionState::Cancelled,
                      ExecutionFailureReason::Cancelled,
                      "cancelled before submission " + std::to_string(submission));
      }

      ++run.result.attempts;
      response = venue.submitOrder(request, settings.venue_timeout);
      if (response.failure == VenueFailure::None) {
        break;
      }

      if (response.failure == VenueFailure::Permanent) {
        return finish(run, ExecutionState::Rejected,
                      ExecutionFailureReason::VenueRejected,
                      response.error_code + ": " + response.message);
      }

      ++transient_failures;
      std::cerr << "[ExecutionCoordinator] order " << order.order_id
                << " submission " << submission << " transient failure "
                << transient_failures << "/" << settings.max_attempts << " ("
                << response.error_code << ")\n";
      if (!retry_policy_.canRetry(transient_failures)) {
        std::ostringstream oss;
        oss << transient_failures << " transient failures, last "
            << response.error_code;
        return finish(run, ExecutionState::Failed,
                      ExecutionFailureReason::RetryBudgetExhausted, oss.str());
      }
      if (run.token.waitFor(retry_policy_.delayFor(transient_failures))) {
        return finish(run, ExecutionState::Cancelled,
                      ExecutionFailureReason::Cancelled,
                      "cancelled during retry backoff");
      }
    }

    if (response.status == VenueOrderStatus::Rejected &&
        response.filled_quantity <= kQuantityEpsilon) {
      return finish(run, ExecutionState::Rejected,
                    ExecutionFailureReason::VenueRejected,
                    "venue rejected: " + response.error_code);
    }

    transition(run, ExecutionState::Submitted,
               "venue order " + response.venue_order_id);
    run.venue_filled = 0.0;
    run.venue_average = 0.0;
    const std::string venue_order_id = response.venue_order_id;

    // Follow the venue order until it stops working.
    int polls = 0;
    while (true) {
      if (!applyVenueFills(run, response)) {
        return finish(run, ExecutionState::Failed,
                      ExecutionFailureReason::InvariantViolation,
                      "portfolio refused a fill of venue order " +
                          venue_order_id);
      }
      if (response.status == VenueOrderStatus::Filled ||
          run.remaining() <= kQuantityEpsilon) {
        return finish(run, ExecutionState::Filled,
                      ExecutionFailureReason::None, "filled");
      }
      if (response.status != VenueOrderStatus::Open) {
        break;  // PartiallyFilled, or Rejected after some fills
      }

      if (polls >= settings.max_status_polls) {
        // The venue order is still working; pull it so it cannot fill later.
        if (!run.token.isCancelled()) {
          VenueResponse cancelled =
              venue.cancelOrder(venue_order_id, settings.venue_timeout);
          if (cancelled.failure == VenueFailure::None &&
              !applyVenueFills(run, cancelled)) {
            return finish(run, ExecutionState::Failed,
                          ExecutionFailureReason::InvariantViolation,
                          "portfolio refused a fill of venue order " +
                              venue_order_id);
          }
        }
        return finish(run, ExecutionState::Failed,
                      ExecutionFailureReason::StatusPollExhausted,
                      "venue order " + venue_order_id + " still open after " +
                          std::to_string(polls) + " status polls");
      }

      if (run.token.waitFor(settings.poll_interval)) {
        return finish(run, ExecutionState::Cancelled,
                      ExecutionFailureReason::Cancelled,
                      "cancelled while venue order " + venue_order_id +
                          " was working");
      }
      ++polls;
      VenueResponse polled =
          venue.getOrderStatus(venue_order_id, settings.venue_timeout);
      if (polled.failure != VenueFailure::None) {
        std::cerr << "[ExecutionCoordinator] order " << order.order_id
                  << " status poll " << polls << " failed ("
                  << toString(polled.failure) << " " << polled.error_code
                  << ")\n";
        continue;
      }
      if (polled.venue_order_id.empty()) {
        polled.venue_order_id = venue_order_id;
      }
      response = std::move(polled);
    }

    // The venue order ended with part of the quantity unfilled.
    if (run.result.filled_quantity <= kQuantityEpsilon) {
      return finish(run, ExecutionState::Rejected,
                    ExecutionFailureReason::VenueRejected,
                    "venue order " + venue_order_id + " closed without fills");
    }
    transition(run, ExecutionState::PartiallyFilled,
               "remaining " + std::to_string(run.remaining()));
    if (run.result.resubmissions >= settings.max_resubmissions) {
      return finish(run, ExecutionState::Failed,
                    ExecutionFailureReason::ResubmissionBudgetExhausted,
                    std::to_string(run.result.resubmissions) +
                        " re-submissions used, remaining " +
                        std::to_string(run.remaining()));
    }
    ++run.result.resubmissions;
  }
}

// Quantity of the order's instrument/venue position on the opposite side.
double ExecutionCoordinator::reducibleQuantity(
    const domain::ApprovedOrder& order) const {
  auto snapshot = portfolio_.snapshot();
  const domain::OpenPosition* position =
      snapshot->findPosition(order.instrument, order.venue);
  if (position == nullptr || position->side == order.side) {
    return 0.0;
  }
  return position->quantity;
}

// -----------------------------------------------------------------------------
// applyVenueFills()
// -----------------------------------------------------------------------------
// Converts the increase in the venue order's cumulative fill into one Fill.
// The price of the increment is recovered from the cumulative averages.
// Returns false if the portfolio refused the fill.
// -----------------------------------------------------------------------------
bool ExecutionCoordinator::applyVenueFills(Run& run,
                                           const VenueResponse& response) {
  double delta = response.filled_quantity - run.venue_filled;
  if (delta <= kQuantityEpsilon) {
    return true;
  }
  delta = std::min(delta, run.remaining());
  if (delta <= kQuantityEpsilon) {
    std::cerr << "[ExecutionCoordinator] order " << run.order.order_id
              << " venue reported more than the approved quantity; excess ignored\n";
    run.venue_filled = response.filled_quantity;
    return true;
  }

  double price = response.average_fill_price;
  const double cumulative_notional =
      response.filled_quantity * response.average_fill_price -
      run.venue_filled * run.venue_average;
  if (response.filled_quantity - run.venue_filled > kQuantityEpsilon &&
      cumulative_notional > 0.0) {
    price = cumulative_notional / (response.filled_quantity - run.venue_filled);
  }

  domain::Fill fill;
  fill.order_id = run.order.order_id;
  fill.fill_seq = ++run.fill_seq;
  fill.venue_order_id = response.venue_order_id;
  fill.instrument = run.order.instrument;
  fill.venue = run.order.venue;
  fill.side = run.order.side;
  fill.quantity = delta;
  fill.price = price;
  fill.filled_at = clock_.now_ms();
  fill.reduce_only = run.order.intent == domain::OrderIntent::Reduce;

  FillApplication applied = portfolio_.applyFill(fill);
  switch (applied.outcome) {
    case FillOutcome::Applied: {
      const double before = run.result.filled_quantity;
      run.result.filled_quantity += delta;
      run.result.average_fill_price =
          (before * run.result.average_fill_price + delta * price) /
          run.result.filled_quantity;
      run.result.fills.push_back(fill);
      break;
    }
    case FillOutcome::Duplicate:
      std::cerr << "[ExecutionCoordinator] order " << fill.order_id
                << " fill " << fill.fill_seq << " already applied\n";
      break;
    case FillOutcome::InvariantViolation: {
      std::cerr << "[ExecutionCoordinator] [CRITICAL] order " << fill.order_id
                << " fill " << fill.fill_seq << ": " << applied.detail << "\n";
      InvariantViolationEvent violation;
      violation.component = "PortfolioStore";
      violation.order_id = fill.order_id;
      violation.detail = applied.detail;
      violation.timestamp_ms = clock_.now_ms();
      violation.sequence_id = nextSequence();
      event_sink_(std::move(violation));
      return false;
    }
  }

  run.venue_filled = response.filled_quantity;
  run.venue_average = response.average_fill_price;
  return true;
}

void ExecutionCoordinator::transition(Run& run, domain::ExecutionState next,
                                      const std::string& detail) {
  const domain::ExecutionState previous = run.result.state;
  if (!domain::isValidTransition(previous, next)) {
    std::cerr << "[ExecutionCoordinator] order " << run.order.order_id
              << " unexpected transition " << domain::toString(previous)
              << " -> " << domain::toString(next) << "\n";
  }
  run.result.state = next;

  OrderUpdateEvent update;
  update.order_id = run.order.order_id;
  update.instrument = run.order.instrument;
  update.previous_state = previous;
  update.new_state = next;
  update.detail = detail;
  update.timestamp_ms = clock_.now_ms();
  update.sequence_id = nextSequence();
  event_sink_(std::move(update));
}

domain::ExecutionResult ExecutionCoordinator::finish(
    Run& run, domain::ExecutionState state,
    domain::ExecutionFailureReason reason, const std::string& detail) {
  transition(run, state, detail);
  portfolio_.forgetOrder(run.order.order_id);
  run.result.reason = reason;
  run.result.rationale = detail;
  if (!run.order.decision.rationale.empty()) {
    run.result.rationale += " | " + run.order.decision.rationale;
  }

  if (state == domain::ExecutionState::Filled) {
    std::cout << "[ExecutionCoordinator] order " << run.order.order_id << " "
              << run.order.instrument << " filled "
              << run.result.filled_quantity << " @ "
              << run.result.average_fill_price << " (attempts "
              << run.result.attempts << ")\n";
  } else {
    std::cerr << "[ExecutionCoordinator] order " << run.order.order_id << " "
              << run.order.instrument << " " << domain::toString(state) << " ("
              << domain::toString(reason) << "): " << detail << "\n";
  }

  ExecutionResultEvent event;
  event.result = run.result;
  event.timestamp_ms = clock_.now_ms();
  event.sequence_id = nextSequence();
  event_sink_(std::move(event));
  return run.result;
}

// -----------------------------------------------------------------------------
// submit()
// -----------------------------------------------------------------------------
std::shared_ptr<ExecutionTicket> ExecutionCoordinator::submit(
    domain::ApprovedOrder order, ResultListener on_result) {
  auto promise = std::make_shared<std::promise<domain::ExecutionResult>>();
  CancellationToken token;
  auto ticket = std::make_shared<ExecutionTicket>(
      order.order_id, order.instrument, token, promise->get_future().share());

  {
    std::lock_guard lock(in_flight_mutex_);
    in_flight_[order.order_id] = ticket;
  }

  const std::string instrument = order.instrument;
  const domain::OrderId order_id = order.order_id;
  bool posted = lanes_.post(
      instrument, [this, order = std::move(order), token, promise,
                   on_result = std::move(on_result)]() {
        domain::ExecutionResult result = execute(order, token);
        // The listener runs while the order still counts as in flight, so
        // an idle coordinator implies every listener has finished.
        if (on_result) {
          try {
            on_result(order, result);
          } catch (const std::exception& ex) {
            std::cerr << "[ExecutionCoordinator] result listener threw: "
                      << ex.what() << "\n";
          }
        }
        {
          std::lock_guard lock(in_flight_mutex_);
          in_flight_.erase(order.order_id);
        }
        promise->set_value(std::move(result));
      });

  if (!posted) {
    std::lock_guard lock(in_flight_mutex_);
    in_flight_.erase(order_id);
    std::cerr << "[ExecutionCoordinator] refusing order " << order_id
              << ": shutting down\n";
    return nullptr;
  }
  return ticket;
}

bool ExecutionCoordinator::hasInFlight(const std::string& instrument) const {
  std::lock_guard lock(in_flight_mutex_);
  return std::any_of(in_flight_.begin(), in_flight_.end(),
                     [&instrument](const auto& entry) {
                       return entry.second->instrument() == instrument;
                     });
}

std::size_t ExecutionCoordinator::inFlightCount() const {
  std::lock_guard lock(in_flight_mutex_);
  return in_flight_.size();
}

void ExecutionCoordinator::cancelAll() {
  std::lock_guard lock(in_flight_mutex_);
  for (const auto& entry : in_flight_) {
    entry.second->cancel();
  }
}

void ExecutionCoordinator::shutdown() {
  cancelAll();
  lanes_.stop();
}

}  // namespace quorum
