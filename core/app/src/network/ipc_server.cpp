#include "quorum/network/ipc_server.hpp"

#include "quorum/persistence/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <type_traits>
#include <utility>

namespace quorum {

IpcServer::IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto maybe_event = telemetry_queue_.try_pop()) {
    auto json_str = formatTelemetry(*maybe_event);
    if (json_str.has_value()) {
      zmq::message_t msg(json_str->data(), json_str->size());
      pub_socket_->send(msg, zmq::send_flags::dontwait);
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): poll REP socket and dispatch
// -----------------------------------------------------------------------------
// A REP socket must answer every request before it can receive the next one,
// so a handler failure is turned into an error reply instead of escaping.
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response;
  try {
    response = command_handler_(cmd);
  } catch (const std::exception& ex) {
    std::cerr << "[IpcServer] command '" << cmd << "' failed: " << ex.what()
              << "\n";
    nlohmann::json err;
    err["status"] = "error";
    err["message"] = ex.what();
    response = err.dump();
  }

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// formatTelemetry(): dispatch Event variant to the JSON telemetry shape
// -----------------------------------------------------------------------------
std::optional<std::string> IpcServer::formatTelemetry(const Event& event) {
  return std::visit(
      [](const auto& e) -> std::optional<std::string> {
        using T = std::decay_t<decltype(e)>;
        nlohmann::json j;
        if constexpr (std::is_same_v<T, DecisionEvent>) {
          j["type"] = "decision";
          j["decision"] = e.decision;
        } else if constexpr (std::is_same_v<T, RiskRejectionEvent>) {
          j["type"] = "risk_rejection";
          j["rejection"] = e.rejection;
        } else if constexpr (std::is_same_v<T, OrderUpdateEvent>) {
          j["type"] = "order_update";
          j["order_id"] = e.order_id;
          j["instrument"] = e.instrument;
          j["previous_state"] = domain::toString(e.previous_state);
          j["state"] = domain::toString(e.new_state);
          j["detail"] = e.detail;
        } else if constexpr (std::is_same_v<T, ExecutionResultEvent>) {
          j["type"] = "execution_result";
          j["result"] = e.result;
        } else if constexpr (std::is_same_v<T, PortfolioUpdateEvent>) {
          if (!e.snapshot) {
            return std::nullopt;
          }
          j["type"] = "portfolio_update";
          j["portfolio"] = *e.snapshot;
        } else if constexpr (std::is_same_v<T, InvariantViolationEvent>) {
          j["type"] = "invariant_violation";
          j["component"] = e.component;
          j["order_id"] = e.order_id;
          j["detail"] = e.detail;
        } else {
          return std::nullopt;
        }
        j["timestamp_ms"] = e.timestamp_ms;
        j["sequence_id"] = e.sequence_id;
        return j.dump();
      },
      event);
}

}  // namespace quorum
