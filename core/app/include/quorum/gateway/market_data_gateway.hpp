#pragma once

#include "quorum/events/event.hpp"
#include "quorum/time/i_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace quorum {

// -----------------------------------------------------------------------------
// MarketDataGateway — ZeroMQ SUB ingress for JSON market ticks
// -----------------------------------------------------------------------------
//
// @brief  Receives one JSON object per message from the upstream market data
//         publisher, turns it into a MarketDataEvent and hands it to the sink.
//
// @details
// Accepted message shape:
//
//   {"instrument": "BTC/USDT",          // or "symbol"
//    "price": 64250.5,
//    "volume": 12.4,                    // optional, default 0
//    "timestamp_ms": 1700000000000,     // optional, default clock.now_ms()
//    "indicators": {"rsi": 61.2}}       // optional, numeric values only
//
// Malformed payloads (invalid JSON, missing price/instrument, wrong types)
// are logged to std::cerr and dropped; the loop never exits because of bad
// input.
//
// run() blocks in recv() with a kRecvTimeoutMs timeout so stop() is observed
// within that bound. stop() before run() makes run() return immediately.
//
// Thread model:
//   run() on exactly one thread (MarketDataThread). stop() from any thread.
//   The sink is invoked on the run() thread.
//
// Ownership:
//   Owns the ZMQ context and SUB socket. Borrows the clock.
// -----------------------------------------------------------------------------
class MarketDataGateway {
 public:
  using EventSink = std::function<void(Event)>;

  MarketDataGateway(const ITimeProvider& clock, EventSink event_sink,
                    const std::string& endpoint = "tcp://127.0.0.1:5555");

  ~MarketDataGateway() = default;

  MarketDataGateway(const MarketDataGateway&) = delete;
  MarketDataGateway& operator=(const MarketDataGateway&) = delete;
  MarketDataGateway(MarketDataGateway&&) = delete;
  MarketDataGateway& operator=(MarketDataGateway&&) = delete;

  void run();
  void stop();

  std::uint64_t receivedCount() const { return received_.load(); }
  std::uint64_t droppedCount() const { return dropped_.load(); }

  // -------------------------------------------------------------------------
  // parseTick(payload, fallback_timestamp_ms)
  // -------------------------------------------------------------------------
  // Decodes one message. Returns std::nullopt (after logging) when the
  // payload is unusable. Exposed for tests and for replay tooling that reads
  // ticks from a file instead of a socket.
  // -------------------------------------------------------------------------
  static std::optional<MarketDataEvent> parseTick(
      const std::string& payload, domain::TimestampMs fallback_timestamp_ms);

 private:
  static constexpr int kRecvTimeoutMs = 100;

  const ITimeProvider& clock_;
  EventSink event_sink_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> stop_requested_{false};
  std::atomic<std::uint64_t> received_{0};
  std::atomic<std::uint64_t> dropped_{0};
  std::uint64_t next_sequence_{1};
};

}  // namespace quorum
