#include "quorum/execution/simulated_venue.hpp"

#include <algorithm>
#include <thread>
#include <utility>

namespace quorum {

SimulatedVenue::SimulatedVenue(std::string name) : name_(std::move(name)) {}

SimulatedVenue::ScriptedStep SimulatedVenue::partialFill(double fraction) {
  ScriptedStep step;
  step.response.status = VenueOrderStatus::PartiallyFilled;
  step.fill_fraction = fraction;
  return step;
}

SimulatedVenue::ScriptedStep SimulatedVenue::openOrder() {
  ScriptedStep step;
  step.response.status = VenueOrderStatus::Open;
  step.fill_fraction = 0.0;
  return step;
}

SimulatedVenue::ScriptedStep SimulatedVenue::timeout() {
  ScriptedStep step;
  step.response = VenueResponse::transient("Timeout", "simulated timeout");
  return step;
}

void SimulatedVenue::scriptSubmit(ScriptedStep step) {
  std::lock_guard lock(mutex_);
  submit_script_.push_back(std::move(step));
}

void SimulatedVenue::scriptStatus(ScriptedStep step) {
  std::lock_guard lock(mutex_);
  status_script_.push_back(std::move(step));
}

bool SimulatedVenue::simulateLatency(std::chrono::milliseconds latency,
                                     std::chrono::milliseconds timeout) {
  if (latency.count() <= 0) {
    return false;
  }
  std::this_thread::sleep_for(std::min(latency, timeout));
  return latency > timeout;
}

VenueResponse SimulatedVenue::submitOrder(const VenueOrderRequest& request,
                                          std::chrono::milliseconds timeout) {
  std::optional<ScriptedStep> step;
  {
    std::lock_guard lock(mutex_);
    ++submit_calls_;
    submitted_.push_back(request);
    if (!submit_script_.empty()) {
      step = std::move(submit_script_.front());
      submit_script_.pop_front();
    }
  }

  if (step && simulateLatency(step->latency, timeout)) {
    return VenueResponse::transient("Timeout", "venue did not answer in time");
  }
  if (step && step->response.failure != VenueFailure::None) {
    return step->response;
  }

  VenueOrder order;
  order.request = request;
  order.price = request.price_type == domain::PriceType::Limit
                    ? request.limit_price
                    : request.reference_price;

  VenueResponse response;
  if (!step) {
    order.filled = request.quantity;
    response.status = VenueOrderStatus::Filled;
  } else if (step->fill_fraction >= 0.0) {
    order.filled = request.quantity * std::min(step->fill_fraction, 1.0);
    response.status = step->fill_fraction >= 1.0 ? VenueOrderStatus::Filled
                                                 : step->response.status;
  } else {
    response = step->response;
    order.filled = response.status == VenueOrderStatus::Filled &&
                           response.filled_quantity <= 0.0
                       ? request.quantity
                       : response.filled_quantity;
  }
  order.done = response.status != VenueOrderStatus::Open;

  std::lock_guard lock(mutex_);
  response.venue_order_id = name_ + "-" + std::to_string(next_venue_id_++);
  response.filled_quantity = order.filled;
  response.average_fill_price = order.filled > 0.0 ? order.price : 0.0;
  orders_[response.venue_order_id] = order;
  return response;
}

VenueResponse SimulatedVenue::getOrderStatus(const std::string& venue_order_id,
                                             std::chrono::milliseconds timeout) {
  std::optional<ScriptedStep> step;
  {
    std::lock_guard lock(mutex_);
    ++status_calls_;
    if (!status_script_.empty()) {
      step = std::move(status_script_.front());
      status_script_.pop_front();
    }
  }

  if (step && simulateLatency(step->latency, timeout)) {
    return VenueResponse::transient("Timeout", "venue did not answer in time");
  }
  if (step && step->response.failure != VenueFailure::None) {
    return step->response;
  }

  std::lock_guard lock(mutex_);
  auto it = orders_.find(venue_order_id);
  if (it == orders_.end()) {
    return VenueResponse::permanent("UnknownOrder", venue_order_id);
  }
  VenueOrder& order = it->second;

  VenueResponse response;
  response.venue_order_id = venue_order_id;
  if (order.done) {
    response.status = order.filled >= order.request.quantity
                          ? VenueOrderStatus::Filled
                          : VenueOrderStatus::PartiallyFilled;
  } else if (!step) {
    order.filled = order.request.quantity;
    order.done = true;
    response.status = VenueOrderStatus::Filled;
  } else {
    if (step->fill_fraction >= 0.0) {
      order.filled = std::max(order.filled,
                              order.request.quantity *
                                  std::min(step->fill_fraction, 1.0));
    }
    response.status = step->response.status;
    if (order.filled >= order.request.quantity) {
      response.status = VenueOrderStatus::Filled;
    }
    order.done = response.status != VenueOrderStatus::Open;
  }
  response.filled_quantity = order.filled;
  response.average_fill_price = order.filled > 0.0 ? order.price : 0.0;
  return response;
}

VenueResponse SimulatedVenue::cancelOrder(const std::string& venue_order_id,
                                          std::chrono::milliseconds) {
  std::lock_guard lock(mutex_);
  ++cancel_calls_;
  auto it = orders_.find(venue_order_id);
  if (it == orders_.end()) {
    return VenueResponse::permanent("UnknownOrder", venue_order_id);
  }
  VenueOrder& order = it->second;
  order.done = true;

  VenueResponse response;
  response.venue_order_id = venue_order_id;
  response.filled_quantity = order.filled;
  response.average_fill_price = order.filled > 0.0 ? order.price : 0.0;
  if (order.filled >= order.request.quantity) {
    response.status = VenueOrderStatus::Filled;
  } else if (order.filled > 0.0) {
    response.status = VenueOrderStatus::PartiallyFilled;
  } else {
    response.status = VenueOrderStatus::Rejected;
    response.error_code = "Cancelled";
  }
  return response;
}

int SimulatedVenue::submitCount() const {
  std::lock_guard lock(mutex_);
  return submit_calls_;
}

int SimulatedVenue::statusCount() const {
  std::lock_guard lock(mutex_);
  return status_calls_;
}

int SimulatedVenue::cancelCount() const {
  std::lock_guard lock(mutex_);
  return cancel_calls_;
}

std::vector<VenueOrderRequest> SimulatedVenue::submittedRequests() const {
  std::lock_guard lock(mutex_);
  return submitted_;
}

}  // namespace quorum
