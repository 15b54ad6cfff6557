// RELIQUARY - Governance Proposals
// Copyright (c) 2024 RELIQUARY Developers
// MIT License
//
// Proposal records, per-agent vote records, derived lifecycle status and
// the type-keyed execution handler registry.

#ifndef RELIQUARY_GOVERNANCE_PROPOSAL_H
#define RELIQUARY_GOVERNANCE_PROPOSAL_H

#include "reliquary/core/serialize.h"
#include "reliquary/core/types.h"

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace reliquary {
namespace governance {

// ============================================================================
// Proposal Status
// ============================================================================

/// Lifecycle state derived from a proposal and the current time
enum class ProposalStatus {
    /// Inside the voting window
    Voting,
    
    /// Voting closed, quorum met and yes > no
    Passed,
    
    /// Voting closed without quorum or majority
    Failed,
    
    /// Executed (terminal)
    Executed,
    
    /// Cancelled by the administrator (terminal)
    Cancelled
};

const char* ProposalStatusToString(ProposalStatus status);

// ============================================================================
// Vote Record
// ============================================================================

/// One agent's vote on one proposal
struct VoteRecord {
    bool hasVoted{false};
    bool support{false};
    
    /// Voter's power when the vote was cast
    VotingPower weight{0};
    
    Timestamp castAt{0};
    
    bool operator==(const VoteRecord& other) const {
        return hasVoted == other.hasVoted && support == other.support &&
               weight == other.weight && castAt == other.castAt;
    }
};

template<typename Stream>
void Serialize(Stream& s, const VoteRecord& vote) {
    ::reliquary::Serialize(s, vote.hasVoted);
    ::reliquary::Serialize(s, vote.support);
    ::reliquary::Serialize(s, vote.weight);
    ::reliquary::Serialize(s, vote.castAt);
}

template<typename Stream>
void Unserialize(Stream& s, VoteRecord& vote) {
    ::reliquary::Unserialize(s, vote.hasVoted);
    ::reliquary::Unserialize(s, vote.support);
    ::reliquary::Unserialize(s, vote.weight);
    ::reliquary::Unserialize(s, vote.castAt);
}

// ============================================================================
// Proposal
// ============================================================================

struct Proposal {
    /// Sequential id, first proposal is 1; 0 marks the null record
    ProposalId id{0};
    
    AgentId proposer;
    std::string proposalType;
    std::string contentHash;
    
    Timestamp votingStart{0};
    Timestamp votingEnd{0};
    int64_t executionDelay{0};
    
    /// Weighted tallies
    VotingPower yesVotes{0};
    VotingPower noVotes{0};
    
    bool executed{false};
    bool cancelled{false};
    
    bool IsNull() const { return id == 0; }
    
    VotingPower TotalVotes() const { return yesVotes + noVotes; }
    
    /// votingStart <= now <= votingEnd
    bool IsVotingOpen(Timestamp now) const {
        return now >= votingStart && now <= votingEnd;
    }
    
    /// Earliest time execution is allowed
    Timestamp ExecutableAt() const { return votingEnd + executionDelay; }
    
    /// Neither executed nor cancelled
    bool IsOpen() const { return !executed && !cancelled; }
    
    /// Status at time now for the given quorum
    ProposalStatus GetStatus(Timestamp now, VotingPower quorumThreshold) const;
    
    std::string ToString() const;
};

template<typename Stream>
void Serialize(Stream& s, const Proposal& p) {
    ::reliquary::Serialize(s, p.id);
    ::reliquary::Serialize(s, p.proposer);
    ::reliquary::Serialize(s, p.proposalType);
    ::reliquary::Serialize(s, p.contentHash);
    ::reliquary::Serialize(s, p.votingStart);
    ::reliquary::Serialize(s, p.votingEnd);
    ::reliquary::Serialize(s, p.executionDelay);
    ::reliquary::Serialize(s, p.yesVotes);
    ::reliquary::Serialize(s, p.noVotes);
    ::reliquary::Serialize(s, p.executed);
    ::reliquary::Serialize(s, p.cancelled);
}

template<typename Stream>
void Unserialize(Stream& s, Proposal& p) {
    ::reliquary::Unserialize(s, p.id);
    ::reliquary::Unserialize(s, p.proposer);
    ::reliquary::Unserialize(s, p.proposalType);
    ::reliquary::Unserialize(s, p.contentHash);
    ::reliquary::Unserialize(s, p.votingStart);
    ::reliquary::Unserialize(s, p.votingEnd);
    ::reliquary::Unserialize(s, p.executionDelay);
    ::reliquary::Unserialize(s, p.yesVotes);
    ::reliquary::Unserialize(s, p.noVotes);
    ::reliquary::Unserialize(s, p.executed);
    ::reliquary::Unserialize(s, p.cancelled);
}

/// Votes on one proposal keyed by agent
using VoteMap = std::map<AgentId, VoteRecord>;

// ============================================================================
// Proposal Handler Registry
// ============================================================================

/// Side effect run when a proposal of a given type executes; returns success
using ProposalHandler = std::function<bool(const Proposal&)>;

/**
 * Maps proposal type strings to execution handlers.
 *
 * Starts with SYSTEM_UPGRADE, TRUST_UPDATE and EMERGENCY_OVERRIDE, each of
 * which reports success and does nothing else. Handlers can be added or
 * replaced at any time. Thread-safe.
 */
class ProposalHandlerRegistry {
public:
    ProposalHandlerRegistry();
    
    /// Register or replace the handler for a type
    void Register(const std::string& proposalType, ProposalHandler handler);
    
    /// @return true if a handler was removed
    bool Unregister(const std::string& proposalType);
    
    bool Has(const std::string& proposalType) const;
    
    std::optional<ProposalHandler> Find(const std::string& proposalType) const;
    
    /// Registered types, sorted
    std::vector<std::string> Types() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, ProposalHandler> handlers_;
};

} // namespace governance
} // namespace reliquary

#endif // RELIQUARY_GOVERNANCE_PROPOSAL_H
