#include "quorum/network/market_data_thread.hpp"

#include <iostream>
#include <utility>

namespace quorum {

// -----------------------------------------------------------------------------
// Constructor: the gateway (and its socket) is created in start()
// -----------------------------------------------------------------------------
MarketDataThread::MarketDataThread(const ITimeProvider& clock,
                                   EventSink event_sink, std::string endpoint)
    : clock_(clock),
      event_sink_(std::move(event_sink)),
      endpoint_(std::move(endpoint)) {}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
MarketDataThread::~MarketDataThread() { stop(); }

// -----------------------------------------------------------------------------
// start(): connect the SUB socket and spawn the receive thread
// -----------------------------------------------------------------------------
void MarketDataThread::start() {
  if (thread_.joinable()) {
    return;
  }

  gateway_ = std::make_unique<MarketDataGateway>(clock_, event_sink_, endpoint_);

  thread_ = std::thread([this] {
    std::cout << "[MarketDataThread] listening on " << endpoint_ << "\n";
    gateway_->run();
    std::cout << "[MarketDataThread] recv loop exited ("
              << gateway_->receivedCount() << " received, "
              << gateway_->droppedCount() << " dropped).\n";
  });
}

// -----------------------------------------------------------------------------
// stop(): unblock the gateway, join, then close the socket
// -----------------------------------------------------------------------------
void MarketDataThread::stop() {
  if (gateway_) {
    gateway_->stop();
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  gateway_.reset();
}

}  // namespace quorum
