#pragma once

#include "quorum/concurrent/thread_safe_queue.hpp"
#include "quorum/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace quorum {

// -----------------------------------------------------------------------------
// IpcServer: dual-socket ZeroMQ gateway for telemetry and operator commands
// -----------------------------------------------------------------------------
//
// @brief  Broadcasts pipeline telemetry on a PUB socket and answers operator
//         commands on a REP socket, both from one worker thread.
//
// @details
//   1. PUB socket (default tcp://*:5557):
//      JSON telemetry for DecisionEvent, RiskRejectionEvent,
//      OrderUpdateEvent, ExecutionResultEvent, PortfolioUpdateEvent and
//      InvariantViolationEvent. Events arrive through a ThreadSafeQueue so
//      serialization and socket I/O stay off the audit loop.
//
//   2. REP socket (default tcp://*:5556):
//      Receives a command string (PING, PORTFOLIO, DECISIONS [n], HEALTH,
//      HALT, RESUME), forwards it to the command handler and sends the JSON
//      reply. ZMQ_RCVTIMEO bounds each poll to kPollTimeoutMs so the thread
//      alternates between commands and telemetry.
//
// Thread model:
//   start()/stop() from the owning thread. pushTelemetry() from any thread.
//   The command handler runs on the IPC thread and must only touch
//   thread-safe accessors.
//
// Ownership:
//   Owned by the Orchestrator via std::unique_ptr. Owns the ZMQ context,
//   both sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://*:5556",
                     std::string pub_endpoint = "tcp://*:5557");
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the worker. No-op when already running.
  // Throws zmq::error_t when an endpoint cannot be bound.
  void start();

  // Stops the worker within kPollTimeoutMs, publishes what is left in the
  // queue and closes the sockets. Idempotent.
  void stop();

  void pushTelemetry(Event event);

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  //
  // @return {"type": "...", "timestamp_ms": ..., "sequence_id": ..., ...}
  //         for telemetry event kinds; std::nullopt for everything else
  //         (market ticks, proposals and heartbeats are not broadcast).
  // -------------------------------------------------------------------------
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace quorum
