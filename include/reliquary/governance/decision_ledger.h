// RELIQUARY - Consensus Decision Ledger
// Copyright (c) 2024 RELIQUARY Developers
// MIT License
//
// Write-once records of externally computed multi-agent decisions, keyed
// by the caller's request id and verified any number of times.

#ifndef RELIQUARY_GOVERNANCE_DECISION_LEDGER_H
#define RELIQUARY_GOVERNANCE_DECISION_LEDGER_H

#include "reliquary/core/serialize.h"
#include "reliquary/core/types.h"
#include "reliquary/governance/status.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace reliquary {
namespace governance {

// ============================================================================
// Decision Types
// ============================================================================

/// Fields supplied by the agent recording a decision
struct DecisionSubmission {
    std::string requestId;
    std::string decisionType;
    std::string finalDecision;
    double confidence{0.0};
    std::vector<AgentId> participatingAgents;
    std::string proofHash;
};

/// A recorded decision. Immutable once stored.
struct ConsensusDecision {
    std::string requestId;
    std::string decisionType;
    std::string finalDecision;
    double confidence{0.0};
    std::vector<AgentId> participatingAgents;
    Timestamp timestamp{0};
    std::string proofHash;
    bool validated{false};
    AgentId submitter;
    
    /// SHA-256 of the canonical encoding of the fields above
    Hash256 digest;
    
    /// Recompute the digest from the current field values
    Hash256 ComputeDigest() const;
    
    /// True if digest matches the fields
    bool VerifyDigest() const { return digest == ComputeDigest(); }
};

template<typename Stream>
void Serialize(Stream& s, const ConsensusDecision& d) {
    ::reliquary::Serialize(s, d.requestId);
    ::reliquary::Serialize(s, d.decisionType);
    ::reliquary::Serialize(s, d.finalDecision);
    ::reliquary::Serialize(s, d.confidence);
    ::reliquary::Serialize(s, d.participatingAgents);
    ::reliquary::Serialize(s, d.timestamp);
    ::reliquary::Serialize(s, d.proofHash);
    ::reliquary::Serialize(s, d.validated);
    ::reliquary::Serialize(s, d.submitter);
    ::reliquary::Serialize(s, d.digest);
}

template<typename Stream>
void Unserialize(Stream& s, ConsensusDecision& d) {
    ::reliquary::Unserialize(s, d.requestId);
    ::reliquary::Unserialize(s, d.decisionType);
    ::reliquary::Unserialize(s, d.finalDecision);
    ::reliquary::Unserialize(s, d.confidence);
    ::reliquary::Unserialize(s, d.participatingAgents);
    ::reliquary::Unserialize(s, d.timestamp);
    ::reliquary::Unserialize(s, d.proofHash);
    ::reliquary::Unserialize(s, d.validated);
    ::reliquary::Unserialize(s, d.submitter);
    ::reliquary::Unserialize(s, d.digest);
}

/// Result of VerifyDecision; {false, "", 0} for unknown ids
struct DecisionVerification {
    bool isValid{false};
    std::string decision;
    double confidence{0.0};
};

// ============================================================================
// Decision Ledger
// ============================================================================

/**
 * In-memory decision table with the same Prepare/Apply split as
 * AgentRegistry. Not locked; GovernanceEngine serializes access.
 */
class DecisionLedger {
public:
    DecisionLedger() = default;
    
    /**
     * Build the record for a submission.
     * INVALID_ARGUMENT for an empty request id, ALREADY_RECORDED if the id
     * has been recorded before.
     */
    Status Prepare(const AgentId& submitter,
                   const DecisionSubmission& submission,
                   Timestamp now,
                   ConsensusDecision* out) const;
    
    /// Store a prepared record
    void Apply(const ConsensusDecision& decision);
    
    bool Contains(const std::string& requestId) const {
        return decisions_.count(requestId) > 0;
    }
    
    std::optional<ConsensusDecision> Find(const std::string& requestId) const;
    
    DecisionVerification Verify(const std::string& requestId) const;
    
    size_t Size() const { return decisions_.size(); }
    
    void Clear() { decisions_.clear(); }

private:
    std::map<std::string, ConsensusDecision> decisions_;
};

} // namespace governance
} // namespace reliquary

#endif // RELIQUARY_GOVERNANCE_DECISION_LEDGER_H
