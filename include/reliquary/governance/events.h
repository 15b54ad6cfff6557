// RELIQUARY - Governance Events
// Copyright (c) 2024 RELIQUARY Developers
// MIT License
//
// Structured notifications emitted after each successful state change.

#ifndef RELIQUARY_GOVERNANCE_EVENTS_H
#define RELIQUARY_GOVERNANCE_EVENTS_H

#include "reliquary/core/types.h"

#include <cstdint>
#include <functional>
#include <string>
#include <variant>

namespace reliquary {
namespace governance {

// ============================================================================
// Event Payloads
// ============================================================================

struct AgentRegistered {
    AgentId agentId;
    std::string agentType;
    VotingPower votingPower{0};
};

struct AgentDeactivated {
    AgentId agentId;
};

struct ProposalCreated {
    ProposalId proposalId{0};
    AgentId proposer;
    std::string proposalType;
    std::string contentHash;
    Timestamp votingEnd{0};
};

struct VoteCast {
    ProposalId proposalId{0};
    AgentId voter;
    bool support{false};
    VotingPower weight{0};
};

struct ProposalExecuted {
    ProposalId proposalId{0};
    
    /// False when no handler exists for the type or the handler failed
    bool success{false};
};

struct ProposalCancelled {
    ProposalId proposalId{0};
};

struct ConsensusRecorded {
    std::string requestId;
    std::string decisionType;
    std::string finalDecision;
    double confidence{0.0};
};

struct SystemPauseChanged {
    bool paused{false};
};

using EventPayload = std::variant<
    AgentRegistered,
    AgentDeactivated,
    ProposalCreated,
    VoteCast,
    ProposalExecuted,
    ProposalCancelled,
    ConsensusRecorded,
    SystemPauseChanged
>;

// ============================================================================
// Governance Event
// ============================================================================

struct GovernanceEvent {
    /// Strictly increasing per engine, in commit order
    uint64_t sequence{0};
    
    Timestamp timestamp{0};
    
    EventPayload payload;
    
    /// Event name ("AgentRegistered", "VoteCast", ...)
    const char* Name() const;
    
    /// One-line description for the audit log
    std::string ToString() const;
    
    template<typename T>
    const T* As() const { return std::get_if<T>(&payload); }
};

/// Subscriber callback
using EventListener = std::function<void(const GovernanceEvent&)>;

/// Handle returned by Subscribe
using SubscriptionId = uint64_t;

} // namespace governance
} // namespace reliquary

#endif // RELIQUARY_GOVERNANCE_EVENTS_H
