// RELIQUARY - Consensus Decision Ledger Implementation
// Copyright (c) 2024 RELIQUARY Developers
// MIT License

#include "reliquary/governance/decision_ledger.h"
#include "reliquary/crypto/sha256.h"

namespace reliquary {
namespace governance {

Hash256 ConsensusDecision::ComputeDigest() const {
    // Every field except the digest itself, in storage order
    DataStream ss;
    ss << requestId
       << decisionType
       << finalDecision
       << confidence
       << participatingAgents
       << timestamp
       << proofHash
       << validated
       << submitter;
    return SHA256Hash(ss.data(), ss.size());
}

Status DecisionLedger::Prepare(const AgentId& submitter,
                               const DecisionSubmission& submission,
                               Timestamp now,
                               ConsensusDecision* out) const {
    if (submission.requestId.empty()) {
        return Status::InvalidArgument("request id must not be empty");
    }
    if (Contains(submission.requestId)) {
        return Status::AlreadyRecorded("decision " + submission.requestId +
                                       " is already recorded");
    }
    
    ConsensusDecision decision;
    decision.requestId = submission.requestId;
    decision.decisionType = submission.decisionType;
    decision.finalDecision = submission.finalDecision;
    decision.confidence = submission.confidence;
    decision.participatingAgents = submission.participatingAgents;
    decision.timestamp = now;
    decision.proofHash = submission.proofHash;
    decision.validated = true;
    decision.submitter = submitter;
    decision.digest = decision.ComputeDigest();
    
    *out = std::move(decision);
    return Status::Ok();
}

void DecisionLedger::Apply(const ConsensusDecision& decision) {
    decisions_.emplace(decision.requestId, decision);
}

std::optional<ConsensusDecision> DecisionLedger::Find(const std::string& requestId) const {
    auto it = decisions_.find(requestId);
    if (it == decisions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

DecisionVerification DecisionLedger::Verify(const std::string& requestId) const {
    DecisionVerification result;
    auto it = decisions_.find(requestId);
    if (it == decisions_.end() || !it->second.validated) {
        return result;
    }
    result.isValid = true;
    result.decision = it->second.finalDecision;
    result.confidence = it->second.confidence;
    return result;
}

} // namespace governance
} // namespace reliquary
