// -----------------------------------------------------------------------------
// quorum_engine: single executable entry point.
//
//   1) Load the EngineConfig (JSON file from argv[1], defaults otherwise,
//      then environment overrides).
//   2) Create the LiveTimeProvider and the Orchestrator and start it. The
//      orchestrator spawns the agent, cycle, audit, market data and IPC
//      threads.
//   3) Wait on the main thread until SIGINT / SIGTERM.
//   4) Shut down cleanly (every thread joined, portfolio file written).
//
// Usage: quorum_engine [config.json]
// -----------------------------------------------------------------------------

#include "quorum/config/engine_config.hpp"
#include "quorum/engine/orchestrator.hpp"
#include "quorum/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <thread>

// -----------------------------------------------------------------------------
// Shutdown flag for signal handler access.
// The only global in the program. A lock-free atomic store is
// async-signal-safe; the main thread polls it.
// -----------------------------------------------------------------------------
static std::atomic<bool> g_shutdown_requested{false};

static void shutdown_handler(int /*signum*/) {
  g_shutdown_requested.store(true);
}

int main(int argc, char** argv) {
  const std::string config_path = argc > 1 ? argv[1] : "";

  quorum::EngineConfig config;
  try {
    config = quorum::loadEngineConfig(config_path);
  } catch (const quorum::ConfigError& ex) {
    std::cerr << "[main] configuration error: " << ex.what() << "\n";
    return 2;
  }

  quorum::LiveTimeProvider clock;

  try {
    quorum::Orchestrator orchestrator(std::move(config), clock);

    std::signal(SIGINT, shutdown_handler);
    std::signal(SIGTERM, shutdown_handler);

    orchestrator.start();

    const auto& cfg = orchestrator.config();
    std::cout << "[main] capital=" << cfg.initial_capital
              << " pairs=" << cfg.trading_pairs.size()
              << " market_data=" << cfg.market_data_endpoint
              << " commands=" << cfg.ipc_command_endpoint
              << " telemetry=" << cfg.ipc_telemetry_endpoint << "\n"
              << "[main] Press Ctrl-C to shut down.\n";

    while (!g_shutdown_requested.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\n[main] shutdown requested. Stopping orchestrator...\n";
    orchestrator.stop();
  } catch (const std::exception& ex) {
    std::cerr << "[main] fatal: " << ex.what() << "\n";
    return 1;
  }

  return 0;
}
