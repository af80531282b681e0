#pragma once

#include "quorum/domain/order.hpp"
#include "quorum/domain/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace quorum {

// How a venue call failed, from the coordinator's point of view.
enum class VenueFailure {
  None,       // call succeeded; see VenueResponse::status
  Transient,  // timeout, rate limit, venue unavailable; retry may succeed
  Permanent,  // invalid order, insufficient venue balance; never retry
};

// Venue-side state of one venue order.
enum class VenueOrderStatus {
  Open,             // accepted and still working; poll again
  PartiallyFilled,  // done at the venue with only part filled
  Filled,           // done, fully filled
  Rejected,         // refused by the venue
};

inline const char* toString(VenueFailure failure) {
  switch (failure) {
    case VenueFailure::None:      return "None";
    case VenueFailure::Transient: return "Transient";
    case VenueFailure::Permanent: return "Permanent";
  }
  return "Unknown";
}

inline const char* toString(VenueOrderStatus status) {
  switch (status) {
    case VenueOrderStatus::Open:            return "Open";
    case VenueOrderStatus::PartiallyFilled: return "PartiallyFilled";
    case VenueOrderStatus::Filled:          return "Filled";
    case VenueOrderStatus::Rejected:        return "Rejected";
  }
  return "Unknown";
}

// One submission of (part of) an Approved Order to a venue.
struct VenueOrderRequest {
  domain::OrderId order_id{0};
  int submission{1};  // 1 for the first venue order, +1 per re-submission
  std::string instrument;
  domain::Side side{domain::Side::Buy};
  double quantity{0.0};
  domain::PriceType price_type{domain::PriceType::Market};
  double limit_price{0.0};
  double reference_price{0.0};
};

// -----------------------------------------------------------------------------
// VenueResponse
// -----------------------------------------------------------------------------
// filled_quantity and average_fill_price are cumulative for the venue order
// named by venue_order_id; the coordinator turns increases into Fills.
// error_code is a short machine code ("Timeout", "RateLimited",
// "VenueUnavailable", "InvalidOrder", "InsufficientBalance", ...) and is set
// whenever failure != None or status == Rejected.
// -----------------------------------------------------------------------------
struct VenueResponse {
  VenueFailure failure{VenueFailure::None};
  std::string error_code;
  std::string message;
  std::string venue_order_id;
  VenueOrderStatus status{VenueOrderStatus::Open};
  double filled_quantity{0.0};
  double average_fill_price{0.0};

  static VenueResponse transient(std::string code, std::string message = {}) {
    VenueResponse r;
    r.failure = VenueFailure::Transient;
    r.error_code = std::move(code);
    r.message = std::move(message);
    return r;
  }

  static VenueResponse permanent(std::string code, std::string message = {}) {
    VenueResponse r;
    r.failure = VenueFailure::Permanent;
    r.error_code = std::move(code);
    r.message = std::move(message);
    return r;
  }
};

// -----------------------------------------------------------------------------
// IVenueAdapter — abstract order-submission contract
// -----------------------------------------------------------------------------
//
// @brief  The only way the engine talks to an exchange.
//
// @details
// Every call receives a timeout. An implementation that cannot complete
// within it must return VenueResponse::transient("Timeout") rather than
// block longer; the coordinator never enforces deadlines on its own.
// Implementations classify their errors into Transient vs Permanent; the
// coordinator's retry state machine relies on that classification alone.
//
// Thread model:
//   Calls for different instruments may arrive concurrently from different
//   instrument lanes; implementations must be thread-safe.
// -----------------------------------------------------------------------------
class IVenueAdapter {
 public:
  virtual ~IVenueAdapter() = default;

  virtual const std::string& name() const = 0;

  virtual VenueResponse submitOrder(const VenueOrderRequest& request,
                                    std::chrono::milliseconds timeout) = 0;

  virtual VenueResponse getOrderStatus(const std::string& venue_order_id,
                                       std::chrono::milliseconds timeout) = 0;

  // Best-effort cancel of a working venue order.
  virtual VenueResponse cancelOrder(const std::string& venue_order_id,
                                    std::chrono::milliseconds timeout) = 0;
};

}  // namespace quorum
