#pragma once

#include "quorum/agent/i_proposer.hpp"
#include "quorum/aggregator/decision_aggregator.hpp"
#include "quorum/domain/risk_limits.hpp"
#include "quorum/execution/retry_policy.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace quorum {

// Thrown for unreadable, malformed or out-of-range configuration.
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// One registered agent: its strategy kind plus runner settings.
struct AgentConfig {
  std::string type;  // "scalping" | "swing" | "research"
  AgentSettings settings;
};

// -----------------------------------------------------------------------------
// EngineConfig
// -----------------------------------------------------------------------------
//
// @brief  Everything the Orchestrator needs to wire the engine, with a
//         default for every field.
//
// @details
// JSON layout (every key optional):
//
//   {
//     "initial_capital": 100,
//     "trading_pairs": ["BTC/USDT", "ETH/USDT", "SOL/USDT", "BNB/USDT"],
//     "risk": {"max_position_size": 0.1, "max_daily_loss": 0.05,
//              "stop_loss_percentage": 0.02, "take_profit_percentage": 0.05,
//              "min_tradable_quantity": 1e-8, "daily_reset_hour_utc": 0},
//     "agents": [{"type": "scalping", "id": "scalping_agent",
//                 "cadence_ms": 30000, "order_notional": 10,
//                 "max_snapshot_age_ms": 120000, "enabled": true,
//                 "instruments": [...]}],
//     "aggregator": {"cycle_window_ms": 0, "capacity_per_cycle": 256,
//                    "trust_weights": {"swing_agent": 1.2},
//                    "max_quantity": {"BTC/USDT": 0.01},
//                    "default_max_quantity": 0},
//     "execution": {"max_attempts": 3, "base_delay_ms": 200,
//                   "max_delay_ms": 5000, "jitter": 0.2,
//                   "max_resubmissions": 3, "max_status_polls": 10,
//                   "poll_interval_ms": 250, "venue_timeout_ms": 5000,
//                   "seed": 0, "default_venue": "paper",
//                   "venues": ["paper"]},
//     "market_data": {"enabled": true, "endpoint": "tcp://127.0.0.1:5555",
//                     "history_capacity": 200},
//     "ipc": {"enabled": true, "command_endpoint": "tcp://*:5556",
//             "telemetry_endpoint": "tcp://*:5557"},
//     "persistence": {"enabled": true, "journal_path": "quorum_journal.jsonl",
//                     "portfolio_path": "quorum_portfolio.json",
//                     "restore_portfolio": true},
//     "decision_history_capacity": 500
//   }
//
// Agents without "instruments" trade every pair in trading_pairs. When
// "agents" is absent the three reference agents are registered with their
// default cadences (scalping 30 s, swing 300 s, research 300 s).
// cycle_window_ms = 0 resolves to the fastest enabled agent cadence.
//
// Environment overrides (applied after the file, before validation):
//   INITIAL_CAPITAL, MAX_POSITION_SIZE, MAX_DAILY_LOSS,
//   STOP_LOSS_PERCENTAGE, TAKE_PROFIT_PERCENTAGE
// -----------------------------------------------------------------------------
struct EngineConfig {
  double initial_capital{100.0};
  std::vector<std::string> trading_pairs{"BTC/USDT", "ETH/USDT", "SOL/USDT",
                                         "BNB/USDT"};
  domain::RiskLimits risk;
  std::vector<AgentConfig> agents;

  AggregatorSettings aggregator;
  std::chrono::milliseconds cycle_window{0};
  std::size_t proposal_capacity_per_cycle{256};

  RetrySettings retry;
  std::uint32_t retry_seed{0};  // 0 = seed from std::random_device
  std::string default_venue{"paper"};
  std::vector<std::string> venues{"paper"};

  bool market_data_enabled{true};
  std::string market_data_endpoint{"tcp://127.0.0.1:5555"};
  std::size_t history_capacity{200};

  bool ipc_enabled{true};
  std::string ipc_command_endpoint{"tcp://*:5556"};
  std::string ipc_telemetry_endpoint{"tcp://*:5557"};

  bool persistence_enabled{true};
  std::string journal_path{"quorum_journal.jsonl"};
  std::string portfolio_path{"quorum_portfolio.json"};
  bool restore_portfolio{true};

  std::size_t decision_history_capacity{500};
};

// Looks up an environment variable; empty optional when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads the process environment via std::getenv.
std::optional<std::string> processEnv(const std::string& name);

// The three reference agents with default cadences over `pairs`.
std::vector<AgentConfig> defaultAgents(const std::vector<std::string>& pairs);

// Parses a JSON document into a config. Throws ConfigError.
EngineConfig parseEngineConfig(const nlohmann::json& document,
                               const EnvLookup& env = processEnv);

// Reads and parses `path`; an empty path yields the defaults (plus env
// overrides). Throws ConfigError.
EngineConfig loadEngineConfig(const std::string& path,
                              const EnvLookup& env = processEnv);

// Throws ConfigError describing the first out-of-range field.
void validateEngineConfig(const EngineConfig& config);

}  // namespace quorum
