#pragma once

#include "quorum/events/event_types.hpp"

#include <variant>

namespace quorum {

// Closed set of everything that travels on an EventBus.
using Event = std::variant<
    MarketDataEvent,
    ProposalEvent,
    DecisionEvent,
    RiskRejectionEvent,
    OrderApprovedEvent,
    OrderUpdateEvent,
    ExecutionResultEvent,
    PortfolioUpdateEvent,
    InvariantViolationEvent,
    AgentHeartbeatEvent>;

}  // namespace quorum
