#include "quorum/engine/orchestrator.hpp"

#include "quorum/agent/agent_factory.hpp"
#include "quorum/notification/console_notification_sink.hpp"
#include "quorum/persistence/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <random>
#include <sstream>
#include <thread>
#include <type_traits>
#include <utility>

namespace quorum {

namespace {

constexpr std::size_t kDefaultDecisionsReply = 20;

std::uint32_t resolveSeed(std::uint32_t configured) {
  return configured != 0 ? configured : std::random_device{}();
}

nlohmann::json recordToJson(const DecisionRecord& r) {
  nlohmann::json j;
  j["decision"] = r.decision;
  j["outcome"] = toString(r.outcome);
  j["order_id"] = r.order_id;
  if (r.outcome == DecisionOutcome::Executed) {
    j["state"] = domain::toString(r.state);
  }
  j["reason"] = r.reason;
  j["detail"] = r.detail;
  j["approved_quantity"] = r.approved_quantity;
  j["filled_quantity"] = r.filled_quantity;
  j["average_fill_price"] = r.average_fill_price;
  j["decided_at"] = r.decided_at;
  j["updated_at"] = r.updated_at;
  return j;
}

nlohmann::json healthToJson(const AgentHealth& h) {
  return {{"agent_id", h.agent_id},
          {"running", h.running},
          {"last_cycle_at", h.last_cycle_at},
          {"last_success_at", h.last_success_at},
          {"cycles", h.cycles},
          {"proposals_emitted", h.proposals_emitted},
          {"stale_skips", h.stale_skips},
          {"errors", h.errors},
          {"last_error", h.last_error}};
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: build every component; nothing runs yet
// -----------------------------------------------------------------------------
Orchestrator::Orchestrator(EngineConfig config, const ITimeProvider& clock)
    : config_(std::move(config)),
      clock_(clock),
      market_(config_.history_capacity),
      portfolio_(config_.initial_capital, clock_,
                 config_.risk.daily_reset_hour_utc),
      buffer_(config_.proposal_capacity_per_cycle),
      aggregator_(config_.aggregator),
      validator_(config_.risk, config_.default_venue),
      history_(config_.decision_history_capacity),
      retry_policy_(config_.retry, resolveSeed(config_.retry_seed)),
      monitor_([this](const ProtectiveLevels& levels, ExitTrigger trigger,
                      double price) {
        return requestProtectiveClose(levels, trigger, price);
      }) {
  if (config_.persistence_enabled) {
    journal_ = std::make_unique<JsonLinesJournal>(
        config_.journal_path, config_.portfolio_path, clock_);
  }

  notifications_ = std::make_unique<NotificationDispatcher>();
  notifications_->addSink(std::make_shared<ConsoleNotificationSink>());

  portfolio_.setUpdateListener(
      [this](std::shared_ptr<const domain::PortfolioSnapshot> snapshot) {
        PortfolioUpdateEvent e;
        e.snapshot = std::move(snapshot);
        e.timestamp_ms = clock_.now_ms();
        publish(std::move(e));
      });

  coordinator_ = std::make_unique<ExecutionCoordinator>(
      portfolio_, retry_policy_, clock_,
      [this](Event event) { publish(std::move(event)); });

  for (const auto& name : config_.venues) {
    auto venue = std::make_unique<SimulatedVenue>(name);
    coordinator_->registerVenue(*venue);
    venues_.emplace(name, std::move(venue));
  }

  for (const auto& agent : config_.agents) {
    if (!agent.settings.enabled) {
      std::cout << "[Orchestrator] agent " << agent.settings.agent_id
                << " disabled by configuration\n";
      continue;
    }
    auto proposer = makeProposer(agent.type, agent.settings);
    if (!proposer) {
      throw ConfigError("unknown agent type '" + agent.type + "'");
    }
    addAgent(std::move(proposer), agent.settings);
  }

  scheduler_ = std::make_unique<CycleScheduler>(
      buffer_, clock_, config_.cycle_window,
      [this](domain::CycleId id, std::vector<domain::Proposal> proposals) {
        processCycle(id, std::move(proposals));
      });
}

// Lanes may still hold orders from runCycle() calls made without start().
Orchestrator::~Orchestrator() {
  stop();
  coordinator_->shutdown();
}

void Orchestrator::addAgent(std::unique_ptr<IProposer> proposer,
                            AgentSettings settings) {
  runners_.push_back(std::make_unique<AgentRunner>(
      std::move(proposer), std::move(settings), market_, clock_,
      [this](domain::Proposal proposal) { submitProposal(std::move(proposal)); },
      [this](const std::string& agent_id, const std::string& status,
             int emitted) {
        AgentHeartbeatEvent e;
        e.agent_id = agent_id;
        e.status = status;
        e.proposals_emitted = emitted;
        e.timestamp_ms = clock_.now_ms();
        publish(std::move(e));
      }));
}

void Orchestrator::addNotificationSink(std::shared_ptr<INotificationSink> sink) {
  notifications_->addSink(std::move(sink));
}

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void Orchestrator::start() {
  if (started_) {
    return;
  }
  started_ = true;

  // ---  1) Restore persisted portfolio before any fill can land ------------
  restorePortfolio();

  // ---  2) Notification delivery and operator surface ----------------------
  notifications_->start();

  if (config_.ipc_enabled) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.ipc_command_endpoint, config_.ipc_telemetry_endpoint);
    ipc_server_->start();
  }

  // ---  3) Audit loop + subscribers ----------------------------------------
  attachSubscribers();
  audit_loop_.start();

  // ---  4) Agents, then the cycle clock ------------------------------------
  for (auto& runner : runners_) {
    runner->start();
  }
  scheduler_->start();

  // ---  5) Market data LAST (ticks begin flowing) ---------------------------
  if (config_.market_data_enabled) {
    market_data_thread_ = std::make_unique<MarketDataThread>(
        clock_,
        [this](Event event) {
          if (const auto* tick = std::get_if<MarketDataEvent>(&event)) {
            pushMarketData(*tick);
          }
        },
        config_.market_data_endpoint);
    market_data_thread_->start();
  }

  running_.store(true);

  std::cout << "[Orchestrator] started. agents=" << runners_.size()
            << " venues=" << venues_.size()
            << " cycle_window=" << config_.cycle_window.count() << "ms"
            << (market_data_thread_ ? " market_data=on" : "")
            << (ipc_server_ ? " ipc=on" : "") << "\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void Orchestrator::stop() {
  if (!running_.exchange(false)) {
    return;
  }

  // ---  1) No new ticks, cycles or proposals -------------------------------
  market_data_thread_.reset();
  scheduler_->stop();
  for (auto& runner : runners_) {
    runner->stop();
  }

  // ---  2) Cancel and drain execution --------------------------------------
  coordinator_->shutdown();

  // ---  3) Flush the audit trail, then the operator surface ----------------
  audit_loop_.stop();
  for (auto id : subscriptions_) {
    audit_loop_.eventBus().unsubscribe(id);
  }
  subscriptions_.clear();
  ipc_server_.reset();
  notifications_->stop();

  if (journal_) {
    try {
      journal_->upsertPortfolio(*portfolio_.snapshot());
    } catch (const std::exception& ex) {
      std::cerr << "[Orchestrator] final portfolio write failed: " << ex.what()
                << "\n";
    }
  }

  std::cout << "[Orchestrator] stopped. All threads joined. "
            << buffer_.size() << " proposal(s) left buffered.\n";
}

// -----------------------------------------------------------------------------
// restorePortfolio(): synchronization gate at startup
// -----------------------------------------------------------------------------
void Orchestrator::restorePortfolio() {
  if (!config_.persistence_enabled || !config_.restore_portfolio) {
    return;
  }
  auto restored = JsonLinesJournal::loadPortfolio(config_.portfolio_path);
  if (!restored) {
    std::cout << "[Orchestrator] no saved portfolio at "
              << config_.portfolio_path << ", starting with capital "
              << config_.initial_capital << "\n";
    return;
  }
  if (!portfolio_.hydrate(*restored)) {
    throw std::runtime_error("saved portfolio " + config_.portfolio_path +
                             " violates portfolio invariants");
  }
  std::cout << "[Orchestrator] restored portfolio: total="
            << restored->total_capital
            << " available=" << restored->available_capital << " positions="
            << restored->open_positions.size() << "\n";
}

// -----------------------------------------------------------------------------
// attachSubscribers(): journal, notifications, telemetry on the audit loop
// -----------------------------------------------------------------------------
void Orchestrator::attachSubscribers() {
  EventBus& bus = audit_loop_.eventBus();

  if (journal_) {
    // A failing write must not starve the notification and telemetry
    // subscribers registered after this one.
    subscriptions_.push_back(bus.subscribe([this](const Event& event) {
      try {
        std::visit(
            [this](const auto& e) {
              using T = std::decay_t<decltype(e)>;
              if constexpr (std::is_same_v<T, ProposalEvent>) {
                journal_->recordProposal(e.proposal);
              } else if constexpr (std::is_same_v<T, DecisionEvent>) {
                journal_->recordDecision(e.decision);
              } else if constexpr (std::is_same_v<T, OrderApprovedEvent>) {
                journal_->recordApprovedOrder(e.order);
              } else if constexpr (std::is_same_v<T, ExecutionResultEvent>) {
                journal_->recordExecutionResult(e.result);
              } else if constexpr (std::is_same_v<T, RiskRejectionEvent>) {
                journal_->recordRejection(e.rejection);
              } else if constexpr (std::is_same_v<T, PortfolioUpdateEvent>) {
                if (e.snapshot) {
                  journal_->upsertPortfolio(*e.snapshot);
                }
              }
            },
            event);
      } catch (const std::exception& ex) {
        std::cerr << "[Orchestrator] journal write failed: " << ex.what()
                  << "\n";
      }
    }));
  }

  subscriptions_.push_back(bus.subscribe([this](const Event& event) {
    if (auto notification = NotificationDispatcher::fromEvent(event)) {
      notifications_->dispatch(std::move(*notification));
    }
  }));

  subscriptions_.push_back(bus.subscribe<AgentHeartbeatEvent>(
      [](const AgentHeartbeatEvent& e) {
        if (e.status == "error") {
          std::cerr << "[Orchestrator] agent " << e.agent_id
                    << " reported an error cycle\n";
        }
      }));

  if (ipc_server_) {
    subscriptions_.push_back(bus.subscribe(
        [this](const Event& event) { ipc_server_->pushTelemetry(event); }));
  }
}

// -----------------------------------------------------------------------------
// publish(): stamp a global sequence id and hand to the audit loop
// -----------------------------------------------------------------------------
// Stamp and enqueue under one lock so delivery order matches sequence order
// across publishing threads.
void Orchestrator::publish(Event event) {
  std::lock_guard lock(publish_mutex_);
  const std::uint64_t seq = ++sequence_;
  std::visit([seq](auto& e) { e.sequence_id = seq; }, event);
  audit_loop_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// Ingress
// -----------------------------------------------------------------------------
bool Orchestrator::pushMarketData(const MarketDataEvent& event) {
  if (!market_.update(event)) {
    return false;
  }
  monitor_.onPrice(event.instrument, event.price);
  return true;
}

void Orchestrator::submitProposal(domain::Proposal proposal) {
  ProposalEvent e;
  e.proposal = proposal;
  e.timestamp_ms = clock_.now_ms();
  buffer_.push(std::move(proposal));
  publish(std::move(e));
}

domain::CycleId Orchestrator::runCycle() { return scheduler_->runOnce(); }

// -----------------------------------------------------------------------------
// processCycle(): aggregate → gate → validate → submit
// -----------------------------------------------------------------------------
void Orchestrator::processCycle(domain::CycleId cycle_id,
                                std::vector<domain::Proposal> proposals) {
  std::lock_guard lock(cycle_mutex_);

  if (proposals.empty()) {
    return;
  }

  auto decisions = aggregator_.aggregate(proposals, cycle_id);
  std::cout << "[Orchestrator] cycle " << cycle_id << ": "
            << proposals.size() << " proposal(s) -> " << decisions.size()
            << " decision(s)\n";

  for (const auto& decision : decisions) {
    DecisionEvent e;
    e.decision = decision;
    e.timestamp_ms = clock_.now_ms();
    publish(std::move(e));

    // Validation sees capital already promised to running orders.
    domain::PortfolioSnapshot view = *portfolio_.snapshot();
    view.available_capital -= reservedNotional();
    handleDecision(decision, view);
  }
}

void Orchestrator::handleDecision(const domain::CandidateDecision& decision,
                                  const domain::PortfolioSnapshot& view) {
  if (halted_.load()) {
    reject(domain::RejectionReason::TradingHalted, decision,
           "trading halted by operator");
    return;
  }
  // The in-flight check and the submit form one step, shared with
  // requestProtectiveClose(), so two orders cannot both pass the check.
  std::lock_guard dispatch_lock(dispatch_mutex_);
  if (coordinator_->hasInFlight(decision.instrument)) {
    reject(domain::RejectionReason::DuplicatePosition, decision,
           "an order for " + decision.instrument + " is already in flight");
    return;
  }

  ValidationResult result = validator_.validate(decision, view, clock_.now_ms());
  if (auto* rejection = std::get_if<domain::Rejection>(&result)) {
    std::cout << "[Orchestrator] rejected " << decision.instrument << " "
              << domain::toString(decision.side) << ": "
              << domain::toString(rejection->reason) << " ("
              << rejection->detail << ")\n";
    history_.recordRejection(*rejection, clock_.now_ms());
    RiskRejectionEvent e;
    e.rejection = std::move(*rejection);
    e.timestamp_ms = clock_.now_ms();
    publish(std::move(e));
    return;
  }

  auto order = std::get<domain::ApprovedOrder>(std::move(result));
  order.order_id = order_ids_.next_id();
  order.created_at = clock_.now_ms();
  dispatchOrder(std::move(order), false);
}

void Orchestrator::reject(domain::RejectionReason reason,
                          const domain::CandidateDecision& decision,
                          const std::string& detail) {
  domain::Rejection rejection;
  rejection.reason = reason;
  rejection.decision = decision;
  rejection.detail = detail;
  std::cout << "[Orchestrator] rejected " << decision.instrument << ": "
            << domain::toString(reason) << " (" << detail << ")\n";
  history_.recordRejection(rejection, clock_.now_ms());

  RiskRejectionEvent e;
  e.rejection = std::move(rejection);
  e.timestamp_ms = clock_.now_ms();
  publish(std::move(e));
}

// -----------------------------------------------------------------------------
// dispatchOrder(): reserve, record, publish and hand to the coordinator
// -----------------------------------------------------------------------------
bool Orchestrator::dispatchOrder(domain::ApprovedOrder order, bool protective) {
  {
    std::lock_guard lock(orders_mutex_);
    if (order.intent == domain::OrderIntent::Open) {
      reserved_notional_[order.order_id] =
          order.approved_quantity * order.reference_price;
    }
    if (protective) {
      protective_closes_.insert(order.order_id);
    }
  }

  history_.recordApproval(order, clock_.now_ms());
  OrderApprovedEvent approved;
  approved.order = order;
  approved.timestamp_ms = clock_.now_ms();
  publish(std::move(approved));

  const domain::OrderId id = order.order_id;
  auto ticket = coordinator_->submit(
      std::move(order),
      [this](const domain::ApprovedOrder& o, const domain::ExecutionResult& r) {
        onExecutionResult(o, r);
      });
  if (!ticket) {
    std::cerr << "[Orchestrator] order " << id
              << " not submitted: execution is shutting down\n";
    std::lock_guard lock(orders_mutex_);
    reserved_notional_.erase(id);
    protective_closes_.erase(id);
    return false;
  }
  return true;
}

// -----------------------------------------------------------------------------
// onExecutionResult(): runs on the instrument lane after the result event
// -----------------------------------------------------------------------------
void Orchestrator::onExecutionResult(const domain::ApprovedOrder& order,
                                     const domain::ExecutionResult& result) {
  bool protective = false;
  {
    std::lock_guard lock(orders_mutex_);
    reserved_notional_.erase(order.order_id);
    protective = protective_closes_.erase(order.order_id) > 0;
  }

  history_.recordResult(result, clock_.now_ms());

  if (order.intent == domain::OrderIntent::Open) {
    monitor_.arm(order, result);
    return;
  }

  const bool still_open =
      portfolio_.snapshot()->findPosition(order.instrument, order.venue) !=
      nullptr;
  if (protective) {
    monitor_.closeCompleted(order.instrument, order.venue, still_open);
  } else if (!still_open) {
    monitor_.disarm(order.instrument, order.venue);
  }
}

// -----------------------------------------------------------------------------
// requestProtectiveClose(): PositionMonitor callback (market data thread)
// -----------------------------------------------------------------------------
// Closes reduce exposure, so they bypass the validator and the kill switch.
// -----------------------------------------------------------------------------
bool Orchestrator::requestProtectiveClose(const ProtectiveLevels& levels,
                                          ExitTrigger trigger, double price) {
  std::lock_guard dispatch_lock(dispatch_mutex_);
  auto snapshot = portfolio_.snapshot();
  const domain::OpenPosition* position =
      snapshot->findPosition(levels.instrument, levels.venue);
  if (position == nullptr) {
    monitor_.disarm(levels.instrument, levels.venue);
    return false;
  }
  if (coordinator_->hasInFlight(levels.instrument)) {
    return false;
  }

  const domain::TimestampMs now = clock_.now_ms();
  std::ostringstream rationale;
  rationale << toString(trigger) << " triggered at " << price << " (entry "
            << position->entry_price << ", SL " << levels.stop_loss_price
            << ", TP " << levels.take_profit_price << ")";

  domain::ApprovedOrder order;
  order.order_id = order_ids_.next_id();
  order.intent = domain::OrderIntent::Reduce;
  order.side = domain::opposite(position->side);
  order.instrument = position->instrument;
  order.venue = position->venue;
  order.requested_quantity = position->quantity;
  order.approved_quantity = position->quantity;
  order.price_type = domain::PriceType::Market;
  order.reference_price = price;
  order.created_at = now;

  order.decision.instrument = order.instrument;
  order.decision.side = order.side;
  order.decision.quantity = order.approved_quantity;
  order.decision.confidence = 1.0;
  order.decision.reference_price = price;
  order.decision.rationale = rationale.str();

  std::cout << "[Orchestrator] protective close " << order.order_id << ": "
            << order.decision.rationale << "\n";
  return dispatchOrder(std::move(order), true);
}

double Orchestrator::reservedNotional() const {
  std::lock_guard lock(orders_mutex_);
  double total = 0.0;
  for (const auto& entry : reserved_notional_) {
    total += entry.second;
  }
  return total;
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
bool Orchestrator::waitForIdle(std::chrono::milliseconds timeout) const {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (coordinator_->inFlightCount() == 0 && audit_loop_.pending() == 0) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return coordinator_->inFlightCount() == 0 && audit_loop_.pending() == 0;
}

std::shared_ptr<const domain::PortfolioSnapshot> Orchestrator::portfolio()
    const {
  return portfolio_.snapshot();
}

std::vector<DecisionRecord> Orchestrator::recentDecisions(
    std::size_t count) const {
  return history_.recent(count);
}

std::vector<AgentHealth> Orchestrator::agentHealth() const {
  std::vector<AgentHealth> health;
  health.reserve(runners_.size());
  for (const auto& runner : runners_) {
    health.push_back(runner->health());
  }
  return health;
}

void Orchestrator::halt() {
  if (!halted_.exchange(true)) {
    std::cerr << "[Orchestrator] HALT: new decisions will be rejected\n";
    Notification n;
    n.severity = Severity::Critical;
    n.category = "system";
    n.title = "Trading halted";
    n.body = "operator kill switch engaged";
    n.created_at = clock_.now_ms();
    notifications_->dispatch(std::move(n));
  }
}

void Orchestrator::resume() {
  if (halted_.exchange(false)) {
    std::cout << "[Orchestrator] RESUME: trading re-enabled\n";
    Notification n;
    n.severity = Severity::Info;
    n.category = "system";
    n.title = "Trading resumed";
    n.created_at = clock_.now_ms();
    notifications_->dispatch(std::move(n));
  }
}

SimulatedVenue* Orchestrator::venue(const std::string& name) {
  auto it = venues_.find(name);
  return it == venues_.end() ? nullptr : it->second.get();
}

std::size_t Orchestrator::inFlightCount() const {
  return coordinator_->inFlightCount();
}

// -----------------------------------------------------------------------------
// executeCommand(): handle IPC command requests
// -----------------------------------------------------------------------------
std::string Orchestrator::executeCommand(const std::string& command) {
  std::istringstream in(command);
  std::string verb;
  in >> verb;

  nlohmann::json response;

  if (verb == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (verb == "PORTFOLIO") {
    response["status"] = "ok";
    response["halted"] = isHalted();
    response["portfolio"] = *portfolio();
  } else if (verb == "DECISIONS") {
    long long count = static_cast<long long>(kDefaultDecisionsReply);
    std::string arg;
    if (in >> arg) {
      try {
        count = std::stoll(arg);
      } catch (const std::exception&) {
        count = -1;
      }
    }
    if (count < 0) {
      response["status"] = "error";
      response["response"] = "DECISIONS expects a non-negative count";
    } else {
      nlohmann::json records = nlohmann::json::array();
      for (const auto& record :
           recentDecisions(static_cast<std::size_t>(count))) {
        records.push_back(recordToJson(record));
      }
      response["status"] = "ok";
      response["decisions"] = std::move(records);
    }
  } else if (verb == "HEALTH") {
    nlohmann::json agents = nlohmann::json::array();
    for (const auto& h : agentHealth()) {
      agents.push_back(healthToJson(h));
    }
    response["status"] = "ok";
    response["halted"] = isHalted();
    response["agents"] = std::move(agents);
    response["last_cycle_id"] = scheduler_->lastCycleId();
    response["buffered_proposals"] = buffer_.size();
    response["orders_in_flight"] = inFlightCount();
    response["protective_levels_armed"] = monitor_.armedCount();
    response["notifications_delivered"] = notifications_->deliveredCount();
    response["notifications_failed"] = notifications_->failedCount();
  } else if (verb == "HALT") {
    halt();
    response["status"] = "ok";
    response["response"] = "Trading halted";
  } else if (verb == "RESUME") {
    resume();
    response["status"] = "ok";
    response["response"] = "Trading resumed";
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + command;
  }

  return response.dump();
}

}  // namespace quorum
