#include "quorum/agent/agent_factory.hpp"

#include "quorum/agent/research_agent.hpp"
#include "quorum/agent/scalping_agent.hpp"
#include "quorum/agent/swing_agent.hpp"

#include <utility>

namespace quorum {

std::unique_ptr<IProposer> makeProposer(const std::string& type,
                                        AgentSettings settings) {
  if (type == "scalping") {
    return std::make_unique<ScalpingAgent>(std::move(settings));
  }
  if (type == "swing") {
    return std::make_unique<SwingAgent>(std::move(settings));
  }
  if (type == "research") {
    return std::make_unique<ResearchAgent>(std::move(settings));
  }
  return nullptr;
}

}  // namespace quorum
