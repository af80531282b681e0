#pragma once

#include "quorum/execution/i_venue_adapter.hpp"

#include <chrono>
#include <deque>
#include <optional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace quorum {

// -----------------------------------------------------------------------------
// SimulatedVenue — paper-trading IVenueAdapter
// -----------------------------------------------------------------------------
//
// @brief  In-process venue used for paper trading and by the test-suite.
//
// @details
// Without a script every submission fills immediately and completely at the
// request's limit price (Limit orders) or reference price (Market orders).
//
// Tests queue ScriptedStep values to reproduce venue behavior:
//
//   scriptSubmit({VenueResponse::transient("Timeout")});   // one timeout
//   scriptSubmit({partialFill(0.4)});                       // 40 % then done
//   scriptStatus({openResponse()});                         // still working
//
// A scripted step may carry `latency`; the call sleeps min(latency, timeout)
// and returns a Timeout if the latency exceeded the caller's timeout.
// Steps that omit venue_order_id get the generated one. For submit steps,
// `fill_fraction` >= 0 fills that fraction of the requested quantity.
//
// Thread model: one mutex guards scripts, orders and counters; the latency
// sleep happens outside it.
// -----------------------------------------------------------------------------
class SimulatedVenue final : public IVenueAdapter {
 public:
  struct ScriptedStep {
    VenueResponse response;
    std::chrono::milliseconds latency{0};
    double fill_fraction{-1.0};
  };

  explicit SimulatedVenue(std::string name = "paper");

  const std::string& name() const override { return name_; }

  VenueResponse submitOrder(const VenueOrderRequest& request,
                            std::chrono::milliseconds timeout) override;

  VenueResponse getOrderStatus(const std::string& venue_order_id,
                               std::chrono::milliseconds timeout) override;

  VenueResponse cancelOrder(const std::string& venue_order_id,
                            std::chrono::milliseconds timeout) override;

  void scriptSubmit(ScriptedStep step);
  void scriptStatus(ScriptedStep step);

  // Convenience steps.
  static ScriptedStep partialFill(double fraction);
  static ScriptedStep openOrder();
  static ScriptedStep timeout();

  int submitCount() const;
  int statusCount() const;
  int cancelCount() const;
  std::vector<VenueOrderRequest> submittedRequests() const;

 private:
  struct VenueOrder {
    VenueOrderRequest request;
    double price{0.0};
    double filled{0.0};
    bool done{false};
  };

  // Sleeps for the step latency; true if the caller's timeout was exceeded.
  static bool simulateLatency(std::chrono::milliseconds latency,
                              std::chrono::milliseconds timeout);

  const std::string name_;

  mutable std::mutex mutex_;
  std::deque<ScriptedStep> submit_script_;
  std::deque<ScriptedStep> status_script_;
  std::unordered_map<std::string, VenueOrder> orders_;
  std::vector<VenueOrderRequest> submitted_;
  std::uint64_t next_venue_id_{1};
  int submit_calls_{0};
  int status_calls_{0};
  int cancel_calls_{0};
};

}  // namespace quorum
