#pragma once

#include "quorum/events/event.hpp"
#include "quorum/gateway/market_data_gateway.hpp"
#include "quorum/time/i_time_provider.hpp"

#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace quorum {

// -----------------------------------------------------------------------------
// MarketDataThread — owns the thread that runs MarketDataGateway::run()
// -----------------------------------------------------------------------------
// The gateway (and its ZMQ socket) is created in start() and destroyed in
// stop(), so a stopped thread holds no socket. The sink runs on this thread;
// the orchestrator's sink updates the MarketSnapshotStore and forwards the
// tick to the PositionMonitor.
// -----------------------------------------------------------------------------
class MarketDataThread {
 public:
  using EventSink = std::function<void(Event)>;

  MarketDataThread(const ITimeProvider& clock, EventSink event_sink,
                   std::string endpoint = "tcp://127.0.0.1:5555");

  ~MarketDataThread();

  MarketDataThread(const MarketDataThread&) = delete;
  MarketDataThread& operator=(const MarketDataThread&) = delete;
  MarketDataThread(MarketDataThread&&) = delete;
  MarketDataThread& operator=(MarketDataThread&&) = delete;

  void start();
  void stop();

 private:
  const ITimeProvider& clock_;
  EventSink event_sink_;
  std::string endpoint_;

  std::unique_ptr<MarketDataGateway> gateway_;
  std::thread thread_;
};

}  // namespace quorum
