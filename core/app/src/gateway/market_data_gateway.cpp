#include "quorum/gateway/market_data_gateway.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

namespace quorum {

MarketDataGateway::MarketDataGateway(const ITimeProvider& clock,
                                     EventSink event_sink,
                                     const std::string& endpoint)
    : clock_(clock), event_sink_(std::move(event_sink)) {
  // Empty prefix: receive every topic.
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);
}

void MarketDataGateway::run() {
  while (!stop_requested_.load()) {
    zmq::message_t msg;
    auto result = socket_.recv(msg, zmq::recv_flags::none);
    if (!result.has_value()) {
      continue;  // rcvtimeo expired
    }

    received_.fetch_add(1);
    auto tick = parseTick(msg.to_string(), clock_.now_ms());
    if (!tick) {
      dropped_.fetch_add(1);
      continue;
    }
    tick->sequence_id = next_sequence_++;
    event_sink_(std::move(*tick));
  }
}

void MarketDataGateway::stop() {
  stop_requested_.store(true);
}

std::optional<MarketDataEvent> MarketDataGateway::parseTick(
    const std::string& payload, domain::TimestampMs fallback_timestamp_ms) {
  try {
    auto json = nlohmann::json::parse(payload);

    MarketDataEvent md;
    if (json.contains("instrument")) {
      md.instrument = json.at("instrument").get<std::string>();
    } else {
      md.instrument = json.at("symbol").get<std::string>();
    }
    md.price = json.at("price").get<double>();
    md.volume = json.value("volume", 0.0);
    md.timestamp_ms =
        json.value("timestamp_ms", static_cast<std::int64_t>(fallback_timestamp_ms));

    if (json.contains("indicators")) {
      for (const auto& [name, value] : json.at("indicators").items()) {
        if (value.is_number()) {
          md.indicators[name] = value.get<double>();
        }
      }
    }

    if (md.instrument.empty() || !(md.price > 0.0)) {
      std::cerr << "[MarketDataGateway] rejected tick (empty instrument or "
                   "non-positive price): "
                << payload << "\n";
      return std::nullopt;
    }
    return md;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[MarketDataGateway] JSON parse error: " << e.what()
              << " (payload: " << payload << ")\n";
    return std::nullopt;
  }
}

}  // namespace quorum
