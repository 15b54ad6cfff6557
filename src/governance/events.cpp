// RELIQUARY - Governance Events Implementation
// Copyright (c) 2024 RELIQUARY Developers
// MIT License

#include "reliquary/governance/events.h"

#include <sstream>

namespace reliquary {
namespace governance {

namespace {

struct NameVisitor {
    const char* operator()(const AgentRegistered&) const { return "AgentRegistered"; }
    const char* operator()(const AgentDeactivated&) const { return "AgentDeactivated"; }
    const char* operator()(const ProposalCreated&) const { return "ProposalCreated"; }
    const char* operator()(const VoteCast&) const { return "VoteCast"; }
    const char* operator()(const ProposalExecuted&) const { return "ProposalExecuted"; }
    const char* operator()(const ProposalCancelled&) const { return "ProposalCancelled"; }
    const char* operator()(const ConsensusRecorded&) const { return "ConsensusRecorded"; }
    const char* operator()(const SystemPauseChanged&) const { return "SystemPauseChanged"; }
};

struct DetailVisitor {
    std::ostringstream& os;
    
    void operator()(const AgentRegistered& e) const {
        os << "agent=" << e.agentId << " type=" << e.agentType << " power=" << e.votingPower;
    }
    void operator()(const AgentDeactivated& e) const {
        os << "agent=" << e.agentId;
    }
    void operator()(const ProposalCreated& e) const {
        os << "proposal=" << e.proposalId << " proposer=" << e.proposer
           << " type=" << e.proposalType << " content=" << e.contentHash
           << " votingEnd=" << e.votingEnd;
    }
    void operator()(const VoteCast& e) const {
        os << "proposal=" << e.proposalId << " voter=" << e.voter
           << " support=" << (e.support ? "yes" : "no") << " weight=" << e.weight;
    }
    void operator()(const ProposalExecuted& e) const {
        os << "proposal=" << e.proposalId << " success=" << (e.success ? "true" : "false");
    }
    void operator()(const ProposalCancelled& e) const {
        os << "proposal=" << e.proposalId;
    }
    void operator()(const ConsensusRecorded& e) const {
        os << "request=" << e.requestId << " type=" << e.decisionType
           << " decision=" << e.finalDecision << " confidence=" << e.confidence;
    }
    void operator()(const SystemPauseChanged& e) const {
        os << "paused=" << (e.paused ? "true" : "false");
    }
};

} // namespace

const char* GovernanceEvent::Name() const {
    return std::visit(NameVisitor{}, payload);
}

std::string GovernanceEvent::ToString() const {
    std::ostringstream oss;
    oss << "#" << sequence << " " << Name() << " ";
    std::visit(DetailVisitor{oss}, payload);
    return oss.str();
}

} // namespace governance
} // namespace reliquary
