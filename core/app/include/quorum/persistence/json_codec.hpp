#pragma once

#include "quorum/domain/order.hpp"
#include "quorum/domain/portfolio.hpp"
#include "quorum/domain/proposal.hpp"
#include "quorum/domain/rejection.hpp"

#include <nlohmann/json.hpp>

namespace quorum {
namespace domain {

// -----------------------------------------------------------------------------
// nlohmann/json bindings for the domain model
// -----------------------------------------------------------------------------
// Found by ADL, so `nlohmann::json j = proposal;` works anywhere. Used by the
// JSON-lines journal, the portfolio file and the IPC query replies, which
// therefore all share one wire shape. Enums serialize as their toString()
// names.
//
// from_json exists only for PortfolioSnapshot (restored from the portfolio
// file at startup); everything else is write-only audit output.
// -----------------------------------------------------------------------------

void to_json(nlohmann::json& j, const Proposal& proposal);
void to_json(nlohmann::json& j, const CandidateDecision& decision);
void to_json(nlohmann::json& j, const ApprovedOrder& order);
void to_json(nlohmann::json& j, const Fill& fill);
void to_json(nlohmann::json& j, const ExecutionResult& result);
void to_json(nlohmann::json& j, const Rejection& rejection);
void to_json(nlohmann::json& j, const OpenPosition& position);
void to_json(nlohmann::json& j, const PortfolioSnapshot& snapshot);

void from_json(const nlohmann::json& j, OpenPosition& position);
void from_json(const nlohmann::json& j, PortfolioSnapshot& snapshot);

}  // namespace domain
}  // namespace quorum
