// RELIQUARY - Governance Proposals Implementation
// Copyright (c) 2024 RELIQUARY Developers
// MIT License

#include "reliquary/governance/proposal.h"
#include "reliquary/governance/params.h"

#include <sstream>

namespace reliquary {
namespace governance {

const char* ProposalStatusToString(ProposalStatus status) {
    switch (status) {
        case ProposalStatus::Voting:    return "Voting";
        case ProposalStatus::Passed:    return "Passed";
        case ProposalStatus::Failed:    return "Failed";
        case ProposalStatus::Executed:  return "Executed";
        case ProposalStatus::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

ProposalStatus Proposal::GetStatus(Timestamp now, VotingPower quorumThreshold) const {
    if (executed) {
        return ProposalStatus::Executed;
    }
    if (cancelled) {
        return ProposalStatus::Cancelled;
    }
    if (now <= votingEnd) {
        return ProposalStatus::Voting;
    }
    if (TotalVotes() >= quorumThreshold && yesVotes > noVotes) {
        return ProposalStatus::Passed;
    }
    return ProposalStatus::Failed;
}

std::string Proposal::ToString() const {
    std::ostringstream oss;
    oss << "Proposal(id=" << id
        << ", type=" << proposalType
        << ", proposer=" << proposer
        << ", yes=" << yesVotes
        << ", no=" << noVotes
        << ", executed=" << (executed ? "yes" : "no")
        << ", cancelled=" << (cancelled ? "yes" : "no") << ")";
    return oss.str();
}

// ============================================================================
// ProposalHandlerRegistry
// ============================================================================

ProposalHandlerRegistry::ProposalHandlerRegistry() {
    auto noop = [](const Proposal&) { return true; };
    handlers_[PROPOSAL_SYSTEM_UPGRADE] = noop;
    handlers_[PROPOSAL_TRUST_UPDATE] = noop;
    handlers_[PROPOSAL_EMERGENCY_OVERRIDE] = noop;
}

void ProposalHandlerRegistry::Register(const std::string& proposalType,
                                       ProposalHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_[proposalType] = std::move(handler);
}

bool ProposalHandlerRegistry::Unregister(const std::string& proposalType) {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.erase(proposalType) > 0;
}

bool ProposalHandlerRegistry::Has(const std::string& proposalType) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.count(proposalType) > 0;
}

std::optional<ProposalHandler> ProposalHandlerRegistry::Find(
    const std::string& proposalType) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(proposalType);
    if (it == handlers_.end() || !it->second) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> ProposalHandlerRegistry::Types() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> types;
    types.reserve(handlers_.size());
    for (const auto& entry : handlers_) {
        types.push_back(entry.first);
    }
    return types;
}

} // namespace governance
} // namespace reliquary
