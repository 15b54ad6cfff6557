// RELIQUARY - Agent Registry Implementation
// Copyright (c) 2024 RELIQUARY Developers
// MIT License

#include "reliquary/governance/agent_registry.h"

#include <sstream>

namespace reliquary {
namespace governance {

std::string Agent::ToString() const {
    std::ostringstream oss;
    oss << "Agent(id=" << id
        << ", type=" << agentType
        << ", power=" << votingPower
        << ", active=" << (active ? "yes" : "no") << ")";
    return oss.str();
}

Status AgentRegistry::PrepareRegistration(const AgentId& agentId,
                                          const std::string& agentType,
                                          VotingPower votingPower,
                                          const std::string& publicKey,
                                          Timestamp now,
                                          Agent* out) const {
    if (agentId.empty()) {
        return Status::InvalidArgument("agent id must not be empty");
    }
    if (votingPower == 0) {
        return Status::InvalidArgument("voting power must be positive");
    }
    if (votingPower > MAX_VOTING_POWER) {
        return Status::InvalidArgument("voting power exceeds " +
                                       std::to_string(MAX_VOTING_POWER));
    }
    
    auto it = agents_.find(agentId);
    if (it != agents_.end() && it->second.active) {
        return Status::AlreadyExists("agent " + agentId + " is already active");
    }
    
    Agent agent;
    agent.id = agentId;
    agent.agentType = agentType;
    agent.votingPower = votingPower;
    agent.active = true;
    agent.publicKey = publicKey;
    agent.registeredAt = now;
    *out = agent;
    return Status::Ok();
}

Status AgentRegistry::PrepareDeactivation(const AgentId& agentId, Agent* out) const {
    auto it = agents_.find(agentId);
    if (it == agents_.end()) {
        return Status::NotFound("agent " + agentId + " is not registered");
    }
    if (!it->second.active) {
        return Status::InvalidState("agent " + agentId + " is already inactive");
    }
    
    *out = it->second;
    out->active = false;
    return Status::Ok();
}

void AgentRegistry::Apply(const Agent& agent) {
    agents_[agent.id] = agent;
}

std::optional<Agent> AgentRegistry::Find(const AgentId& agentId) const {
    auto it = agents_.find(agentId);
    if (it == agents_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool AgentRegistry::IsActive(const AgentId& agentId) const {
    auto it = agents_.find(agentId);
    return it != agents_.end() && it->second.active;
}

VotingPower AgentRegistry::GetPower(const AgentId& agentId) const {
    auto it = agents_.find(agentId);
    if (it == agents_.end() || !it->second.active) {
        return 0;
    }
    return it->second.votingPower;
}

std::vector<Agent> AgentRegistry::List(bool activeOnly) const {
    std::vector<Agent> result;
    result.reserve(agents_.size());
    for (const auto& [id, agent] : agents_) {
        if (!activeOnly || agent.active) {
            result.push_back(agent);
        }
    }
    return result;
}

VotingPower AgentRegistry::GetActiveVotingPower() const {
    VotingPower total = 0;
    for (const auto& [id, agent] : agents_) {
        if (agent.active) {
            total += agent.votingPower;
        }
    }
    return total;
}

size_t AgentRegistry::ActiveCount() const {
    size_t count = 0;
    for (const auto& [id, agent] : agents_) {
        if (agent.active) {
            ++count;
        }
    }
    return count;
}

} // namespace governance
} // namespace reliquary
