// RELIQUARY - Agent Registry
// Copyright (c) 2024 RELIQUARY Developers
// MIT License
//
// The set of authorized voting participants. Records are soft-disabled,
// never removed.

#ifndef RELIQUARY_GOVERNANCE_AGENT_REGISTRY_H
#define RELIQUARY_GOVERNANCE_AGENT_REGISTRY_H

#include "reliquary/core/serialize.h"
#include "reliquary/core/types.h"
#include "reliquary/governance/params.h"
#include "reliquary/governance/status.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace reliquary {
namespace governance {

// ============================================================================
// Agent
// ============================================================================

/// A registered voting participant
struct Agent {
    AgentId id;
    
    /// Opaque classification ("neutral", "permissive", "strict", "watchdog", ...)
    std::string agentType;
    
    VotingPower votingPower{0};
    bool active{false};
    
    /// Opaque public key reference, not verified here
    std::string publicKey;
    
    /// Time of the most recent registration
    Timestamp registeredAt{0};
    
    /// True for the zero-valued record returned on a miss
    bool IsNull() const { return id.empty(); }
    
    bool operator==(const Agent& other) const {
        return id == other.id && agentType == other.agentType &&
               votingPower == other.votingPower && active == other.active &&
               publicKey == other.publicKey && registeredAt == other.registeredAt;
    }
    bool operator!=(const Agent& other) const { return !(*this == other); }
    
    std::string ToString() const;
};

template<typename Stream>
void Serialize(Stream& s, const Agent& agent) {
    ::reliquary::Serialize(s, agent.id);
    ::reliquary::Serialize(s, agent.agentType);
    ::reliquary::Serialize(s, agent.votingPower);
    ::reliquary::Serialize(s, agent.active);
    ::reliquary::Serialize(s, agent.publicKey);
    ::reliquary::Serialize(s, agent.registeredAt);
}

template<typename Stream>
void Unserialize(Stream& s, Agent& agent) {
    ::reliquary::Unserialize(s, agent.id);
    ::reliquary::Unserialize(s, agent.agentType);
    ::reliquary::Unserialize(s, agent.votingPower);
    ::reliquary::Unserialize(s, agent.active);
    ::reliquary::Unserialize(s, agent.publicKey);
    ::reliquary::Unserialize(s, agent.registeredAt);
}

// ============================================================================
// Agent Registry
// ============================================================================

/**
 * In-memory agent table.
 *
 * Mutations are split in two steps so the caller can persist a change
 * before it becomes visible: Prepare* validates and returns the record
 * that would be stored, Apply installs it. The registry does not lock;
 * GovernanceEngine serializes access.
 */
class AgentRegistry {
public:
    AgentRegistry() = default;
    
    /**
     * Validate a registration.
     * INVALID_ARGUMENT for an empty id or a power outside
     * [1, MAX_VOTING_POWER], ALREADY_EXISTS if
     * the id is currently active. A deactivated id may be registered
     * again; the new record replaces the old one.
     */
    Status PrepareRegistration(const AgentId& agentId,
                               const std::string& agentType,
                               VotingPower votingPower,
                               const std::string& publicKey,
                               Timestamp now,
                               Agent* out) const;
    
    /// NOT_FOUND if never registered, INVALID_STATE if already inactive
    Status PrepareDeactivation(const AgentId& agentId, Agent* out) const;
    
    /// Insert or replace a record
    void Apply(const Agent& agent);
    
    std::optional<Agent> Find(const AgentId& agentId) const;
    
    bool IsActive(const AgentId& agentId) const;
    
    /// Current voting power of an active agent, 0 otherwise
    VotingPower GetPower(const AgentId& agentId) const;
    
    /// All records ordered by id
    std::vector<Agent> List(bool activeOnly) const;
    
    /// Summed power of active agents
    VotingPower GetActiveVotingPower() const;
    
    size_t Size() const { return agents_.size(); }
    size_t ActiveCount() const;
    
    void Clear() { agents_.clear(); }

private:
    std::map<AgentId, Agent> agents_;
};

} // namespace governance
} // namespace reliquary

#endif // RELIQUARY_GOVERNANCE_AGENT_REGISTRY_H
