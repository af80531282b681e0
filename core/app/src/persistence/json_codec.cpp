#include "quorum/persistence/json_codec.hpp"

#include <stdexcept>

namespace quorum {
namespace domain {

void to_json(nlohmann::json& j, const Proposal& proposal) {
  j = nlohmann::json{{"agent_id", proposal.agent_id},
                     {"instrument", proposal.instrument},
                     {"side", toString(proposal.side)},
                     {"suggested_quantity", proposal.suggested_quantity},
                     {"confidence", proposal.confidence},
                     {"rationale", proposal.rationale},
                     {"generated_at", proposal.generated_at},
                     {"reference_price", proposal.reference_price}};
}

void to_json(nlohmann::json& j, const CandidateDecision& decision) {
  j = nlohmann::json{{"cycle_id", decision.cycle_id},
                     {"instrument", decision.instrument},
                     {"side", toString(decision.side)},
                     {"quantity", decision.quantity},
                     {"confidence", decision.confidence},
                     {"reference_price", decision.reference_price},
                     {"rationale", decision.rationale},
                     {"contributing_proposals", decision.contributing_proposals}};
}

void to_json(nlohmann::json& j, const ApprovedOrder& order) {
  j = nlohmann::json{{"order_id", order.order_id},
                     {"cycle_id", order.decision.cycle_id},
                     {"intent", toString(order.intent)},
                     {"side", toString(order.side)},
                     {"instrument", order.instrument},
                     {"venue", order.venue},
                     {"requested_quantity", order.requested_quantity},
                     {"approved_quantity", order.approved_quantity},
                     {"price_type", toString(order.price_type)},
                     {"limit_price", order.limit_price},
                     {"reference_price", order.reference_price},
                     {"stop_loss_price", order.stop_loss_price},
                     {"take_profit_price", order.take_profit_price},
                     {"created_at", order.created_at},
                     {"rationale", order.decision.rationale}};
}

void to_json(nlohmann::json& j, const Fill& fill) {
  j = nlohmann::json{{"order_id", fill.order_id},
                     {"fill_seq", fill.fill_seq},
                     {"venue_order_id", fill.venue_order_id},
                     {"instrument", fill.instrument},
                     {"venue", fill.venue},
                     {"side", toString(fill.side)},
                     {"quantity", fill.quantity},
                     {"price", fill.price},
                     {"filled_at", fill.filled_at},
                     {"reduce_only", fill.reduce_only}};
}

void to_json(nlohmann::json& j, const ExecutionResult& result) {
  j = nlohmann::json{{"order_id", result.order_id},
                     {"instrument", result.instrument},
                     {"venue", result.venue},
                     {"side", toString(result.side)},
                     {"state", toString(result.state)},
                     {"requested_quantity", result.requested_quantity},
                     {"filled_quantity", result.filled_quantity},
                     {"average_fill_price", result.average_fill_price},
                     {"attempts", result.attempts},
                     {"resubmissions", result.resubmissions},
                     {"reason", toString(result.reason)},
                     {"rationale", result.rationale},
                     {"fills", result.fills}};
}

void to_json(nlohmann::json& j, const Rejection& rejection) {
  j = nlohmann::json{{"reason", toString(rejection.reason)},
                     {"detail", rejection.detail},
                     {"decision", rejection.decision}};
}

void to_json(nlohmann::json& j, const OpenPosition& position) {
  j = nlohmann::json{{"instrument", position.instrument},
                     {"venue", position.venue},
                     {"side", toString(position.side)},
                     {"quantity", position.quantity},
                     {"entry_price", position.entry_price},
                     {"opened_at", position.opened_at}};
}

void to_json(nlohmann::json& j, const PortfolioSnapshot& snapshot) {
  nlohmann::json positions = nlohmann::json::array();
  for (const auto& [key, position] : snapshot.open_positions) {
    positions.push_back(position);
  }
  j = nlohmann::json{{"total_capital", snapshot.total_capital},
                     {"available_capital", snapshot.available_capital},
                     {"open_positions", positions},
                     {"daily_realized_pnl", snapshot.daily_realized_pnl},
                     {"total_realized_pnl", snapshot.total_realized_pnl},
                     {"trading_day", snapshot.trading_day},
                     {"version", snapshot.version},
                     {"updated_at", snapshot.updated_at}};
}

void from_json(const nlohmann::json& j, OpenPosition& position) {
  j.at("instrument").get_to(position.instrument);
  j.at("venue").get_to(position.venue);
  if (!parseSide(j.at("side").get<std::string>(), position.side)) {
    throw std::invalid_argument("unknown side: " + j.at("side").dump());
  }
  j.at("quantity").get_to(position.quantity);
  j.at("entry_price").get_to(position.entry_price);
  position.opened_at = j.value("opened_at", TimestampMs{0});
}

void from_json(const nlohmann::json& j, PortfolioSnapshot& snapshot) {
  j.at("total_capital").get_to(snapshot.total_capital);
  j.at("available_capital").get_to(snapshot.available_capital);
  snapshot.daily_realized_pnl = j.value("daily_realized_pnl", 0.0);
  snapshot.total_realized_pnl = j.value("total_realized_pnl", 0.0);
  snapshot.trading_day = j.value("trading_day", std::int64_t{0});
  snapshot.version = j.value("version", std::uint64_t{0});
  snapshot.updated_at = j.value("updated_at", TimestampMs{0});
  snapshot.open_positions.clear();
  if (j.contains("open_positions")) {
    for (const auto& item : j.at("open_positions")) {
      OpenPosition position = item.get<OpenPosition>();
      snapshot.open_positions[positionKey(position.instrument, position.venue)] =
          position;
    }
  }
}

}  // namespace domain
}  // namespace quorum
