#include "quorum/config/engine_config.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>

namespace quorum {

namespace {

constexpr std::int64_t kScalpingCadenceMs = 30'000;
constexpr std::int64_t kSwingCadenceMs = 300'000;
constexpr std::int64_t kResearchCadenceMs = 300'000;

std::chrono::milliseconds millis(const nlohmann::json& j, const char* key,
                                 std::chrono::milliseconds fallback) {
  return std::chrono::milliseconds(
      j.value(key, static_cast<std::int64_t>(fallback.count())));
}

// Parses an override value; a malformed number is a configuration error,
// not something to silently ignore.
double envDouble(const EnvLookup& env, const char* name, double current) {
  auto raw = env(name);
  if (!raw || raw->empty()) {
    return current;
  }
  try {
    std::size_t consumed = 0;
    double value = std::stod(*raw, &consumed);
    if (consumed != raw->size()) {
      throw ConfigError(std::string(name) + " is not a number: " + *raw);
    }
    std::cout << "[EngineConfig] " << name << " overridden from environment: "
              << value << "\n";
    return value;
  } catch (const std::invalid_argument&) {
    throw ConfigError(std::string(name) + " is not a number: " + *raw);
  } catch (const std::out_of_range&) {
    throw ConfigError(std::string(name) + " is out of range: " + *raw);
  }
}

AgentConfig parseAgent(const nlohmann::json& j,
                       const std::vector<std::string>& pairs) {
  AgentConfig agent;
  agent.type = j.at("type").get<std::string>();
  agent.settings.agent_id = j.value("id", agent.type + "_agent");

  std::int64_t default_cadence = kScalpingCadenceMs;
  if (agent.type == "swing") default_cadence = kSwingCadenceMs;
  if (agent.type == "research") default_cadence = kResearchCadenceMs;

  agent.settings.cadence =
      millis(j, "cadence_ms", std::chrono::milliseconds(default_cadence));
  agent.settings.order_notional =
      j.value("order_notional", agent.settings.order_notional);
  agent.settings.max_snapshot_age_ms =
      j.value("max_snapshot_age_ms", agent.settings.max_snapshot_age_ms);
  agent.settings.enabled = j.value("enabled", true);
  agent.settings.instruments =
      j.value("instruments", std::vector<std::string>{});
  if (agent.settings.instruments.empty()) {
    agent.settings.instruments = pairs;
  }
  return agent;
}

}  // namespace

std::optional<std::string> processEnv(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  if (value == nullptr) {
    return std::nullopt;
  }
  return std::string(value);
}

std::vector<AgentConfig> defaultAgents(const std::vector<std::string>& pairs) {
  std::vector<AgentConfig> agents;
  const std::pair<const char*, std::int64_t> kinds[] = {
      {"scalping", kScalpingCadenceMs},
      {"swing", kSwingCadenceMs},
      {"research", kResearchCadenceMs}};
  for (const auto& [type, cadence] : kinds) {
    AgentConfig agent;
    agent.type = type;
    agent.settings.agent_id = std::string(type) + "_agent";
    agent.settings.cadence = std::chrono::milliseconds(cadence);
    agent.settings.instruments = pairs;
    agents.push_back(std::move(agent));
  }
  return agents;
}

EngineConfig parseEngineConfig(const nlohmann::json& document,
                               const EnvLookup& env) {
  EngineConfig config;
  const nlohmann::json empty = nlohmann::json::object();

  try {
    if (!document.is_null() && !document.is_object()) {
      throw ConfigError("configuration root must be a JSON object");
    }
    const nlohmann::json& root = document.is_object() ? document : empty;

    config.initial_capital = root.value("initial_capital", config.initial_capital);
    config.trading_pairs = root.value("trading_pairs", config.trading_pairs);
    config.decision_history_capacity =
        root.value("decision_history_capacity", config.decision_history_capacity);

    const auto& risk = root.contains("risk") ? root.at("risk") : empty;
    config.risk.max_position_size_fraction =
        risk.value("max_position_size", config.risk.max_position_size_fraction);
    config.risk.max_daily_loss_fraction =
        risk.value("max_daily_loss", config.risk.max_daily_loss_fraction);
    config.risk.stop_loss_fraction =
        risk.value("stop_loss_percentage", config.risk.stop_loss_fraction);
    config.risk.take_profit_fraction =
        risk.value("take_profit_percentage", config.risk.take_profit_fraction);
    config.risk.min_tradable_quantity =
        risk.value("min_tradable_quantity", config.risk.min_tradable_quantity);
    config.risk.daily_reset_hour_utc =
        risk.value("daily_reset_hour_utc", config.risk.daily_reset_hour_utc);

    if (root.contains("agents")) {
      for (const auto& agent : root.at("agents")) {
        config.agents.push_back(parseAgent(agent, config.trading_pairs));
      }
    } else {
      config.agents = defaultAgents(config.trading_pairs);
    }

    const auto& agg = root.contains("aggregator") ? root.at("aggregator") : empty;
    config.cycle_window = millis(agg, "cycle_window_ms", config.cycle_window);
    config.proposal_capacity_per_cycle =
        agg.value("capacity_per_cycle", config.proposal_capacity_per_cycle);
    config.aggregator.trust_weights =
        agg.value("trust_weights", std::map<std::string, double>{});
    config.aggregator.default_trust_weight =
        agg.value("default_trust_weight", config.aggregator.default_trust_weight);
    config.aggregator.max_quantity_per_instrument =
        agg.value("max_quantity", std::map<std::string, double>{});
    config.aggregator.default_max_quantity =
        agg.value("default_max_quantity", config.aggregator.default_max_quantity);

    const auto& exec = root.contains("execution") ? root.at("execution") : empty;
    config.retry.max_attempts = exec.value("max_attempts", config.retry.max_attempts);
    config.retry.base_delay = millis(exec, "base_delay_ms", config.retry.base_delay);
    config.retry.max_delay = millis(exec, "max_delay_ms", config.retry.max_delay);
    config.retry.jitter_fraction = exec.value("jitter", config.retry.jitter_fraction);
    config.retry.max_resubmissions =
        exec.value("max_resubmissions", config.retry.max_resubmissions);
    config.retry.max_status_polls =
        exec.value("max_status_polls", config.retry.max_status_polls);
    config.retry.poll_interval =
        millis(exec, "poll_interval_ms", config.retry.poll_interval);
    config.retry.venue_timeout =
        millis(exec, "venue_timeout_ms", config.retry.venue_timeout);
    config.retry_seed = exec.value("seed", config.retry_seed);
    config.default_venue = exec.value("default_venue", config.default_venue);
    config.venues = exec.value("venues", std::vector<std::string>{config.default_venue});

    const auto& md = root.contains("market_data") ? root.at("market_data") : empty;
    config.market_data_enabled = md.value("enabled", config.market_data_enabled);
    config.market_data_endpoint = md.value("endpoint", config.market_data_endpoint);
    config.history_capacity = md.value("history_capacity", config.history_capacity);

    const auto& ipc = root.contains("ipc") ? root.at("ipc") : empty;
    config.ipc_enabled = ipc.value("enabled", config.ipc_enabled);
    config.ipc_command_endpoint =
        ipc.value("command_endpoint", config.ipc_command_endpoint);
    config.ipc_telemetry_endpoint =
        ipc.value("telemetry_endpoint", config.ipc_telemetry_endpoint);

    const auto& persist =
        root.contains("persistence") ? root.at("persistence") : empty;
    config.persistence_enabled = persist.value("enabled", config.persistence_enabled);
    config.journal_path = persist.value("journal_path", config.journal_path);
    config.portfolio_path = persist.value("portfolio_path", config.portfolio_path);
    config.restore_portfolio =
        persist.value("restore_portfolio", config.restore_portfolio);
  } catch (const nlohmann::json::exception& ex) {
    throw ConfigError(std::string("invalid configuration: ") + ex.what());
  }

  config.initial_capital = envDouble(env, "INITIAL_CAPITAL", config.initial_capital);
  config.risk.max_position_size_fraction = envDouble(
      env, "MAX_POSITION_SIZE", config.risk.max_position_size_fraction);
  config.risk.max_daily_loss_fraction =
      envDouble(env, "MAX_DAILY_LOSS", config.risk.max_daily_loss_fraction);
  config.risk.stop_loss_fraction =
      envDouble(env, "STOP_LOSS_PERCENTAGE", config.risk.stop_loss_fraction);
  config.risk.take_profit_fraction =
      envDouble(env, "TAKE_PROFIT_PERCENTAGE", config.risk.take_profit_fraction);

  if (config.cycle_window.count() == 0) {
    auto fastest = std::chrono::milliseconds::max();
    for (const auto& agent : config.agents) {
      if (agent.settings.enabled) {
        fastest = std::min(fastest, agent.settings.cadence);
      }
    }
    config.cycle_window = fastest == std::chrono::milliseconds::max()
                              ? std::chrono::milliseconds(kScalpingCadenceMs)
                              : fastest;
  }

  validateEngineConfig(config);
  return config;
}

EngineConfig loadEngineConfig(const std::string& path, const EnvLookup& env) {
  if (path.empty()) {
    return parseEngineConfig(nlohmann::json::object(), env);
  }
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open configuration file " + path);
  }
  nlohmann::json document;
  try {
    document = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& ex) {
    throw ConfigError("cannot parse " + path + ": " + ex.what());
  }
  std::cout << "[EngineConfig] loaded " << path << "\n";
  return parseEngineConfig(document, env);
}

void validateEngineConfig(const EngineConfig& config) {
  auto fraction = [](const char* name, double value) {
    if (!(value > 0.0) || value > 1.0) {
      throw ConfigError(std::string(name) + " must be in (0, 1], got " +
                        std::to_string(value));
    }
  };

  if (!(config.initial_capital > 0.0)) {
    throw ConfigError("initial_capital must be positive");
  }
  fraction("max_position_size", config.risk.max_position_size_fraction);
  fraction("max_daily_loss", config.risk.max_daily_loss_fraction);
  fraction("stop_loss_percentage", config.risk.stop_loss_fraction);
  fraction("take_profit_percentage", config.risk.take_profit_fraction);
  if (config.risk.min_tradable_quantity < 0.0) {
    throw ConfigError("min_tradable_quantity must not be negative");
  }
  if (config.risk.daily_reset_hour_utc < 0 ||
      config.risk.daily_reset_hour_utc > 23) {
    throw ConfigError("daily_reset_hour_utc must be within 0..23");
  }
  if (config.trading_pairs.empty()) {
    throw ConfigError("trading_pairs must not be empty");
  }
  for (const auto& agent : config.agents) {
    if (agent.type != "scalping" && agent.type != "swing" &&
        agent.type != "research") {
      throw ConfigError("unknown agent type '" + agent.type + "'");
    }
    if (agent.settings.cadence.count() <= 0) {
      throw ConfigError("agent " + agent.settings.agent_id +
                        " cadence must be positive");
    }
    if (!(agent.settings.order_notional > 0.0)) {
      throw ConfigError("agent " + agent.settings.agent_id +
                        " order_notional must be positive");
    }
  }
  if (config.retry.max_attempts < 1) {
    throw ConfigError("execution.max_attempts must be at least 1");
  }
  if (config.retry.max_resubmissions < 0 || config.retry.max_status_polls < 0) {
    throw ConfigError("execution budgets must not be negative");
  }
  if (config.retry.venue_timeout.count() <= 0) {
    throw ConfigError("execution.venue_timeout_ms must be positive");
  }
  if (std::find(config.venues.begin(), config.venues.end(),
                config.default_venue) == config.venues.end()) {
    throw ConfigError("default_venue '" + config.default_venue +
                      "' is not listed in venues");
  }
  if (config.proposal_capacity_per_cycle == 0) {
    throw ConfigError("aggregator.capacity_per_cycle must be positive");
  }
}

}  // namespace quorum
