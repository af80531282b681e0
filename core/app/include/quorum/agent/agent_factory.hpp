#pragma once

#include "quorum/agent/i_proposer.hpp"

#include <memory>
#include <string>

namespace quorum {

// Builds a reference proposer by kind ("scalping", "swing", "research").
// Returns nullptr for an unknown kind.
std::unique_ptr<IProposer> makeProposer(const std::string& type,
                                        AgentSettings settings);

}  // namespace quorum
