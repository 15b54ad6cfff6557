// RELIQUARY - Governance Engine Implementation
// Copyright (c) 2024 RELIQUARY Developers
// MIT License

#include "reliquary/governance/engine.h"
#include "reliquary/util/logging.h"

#include <exception>
#include <limits>

namespace reliquary {
namespace governance {

using util::LogCategory::GOVERNANCE;
using util::LogCategory::LEDGER;
using util::LogCategory::REGISTRY;

// ============================================================================
// Construction
// ============================================================================

GovernanceEngine::GovernanceEngine(const GovernanceParams& params,
                                   std::shared_ptr<const util::Clock> clock,
                                   std::unique_ptr<db::Database> db)
    : params_(params)
    , clock_(std::move(clock))
    , db_(std::move(db))
    , store_(*db_) {}

GovernanceEngine::~GovernanceEngine() = default;

Status GovernanceEngine::Open(const GovernanceParams& params,
                              std::shared_ptr<const util::Clock> clock,
                              std::unique_ptr<db::Database> db,
                              std::unique_ptr<GovernanceEngine>* out) {
    Status s = params.Validate();
    if (!s.ok()) {
        return s;
    }
    if (!clock) {
        return Status::InvalidArgument("no clock supplied");
    }
    if (!db) {
        return Status::InvalidArgument("no database supplied");
    }
    
    std::unique_ptr<GovernanceEngine> engine(
        new GovernanceEngine(params, std::move(clock), std::move(db)));
    s = engine->Load();
    if (!s.ok()) {
        return s;
    }
    
    *out = std::move(engine);
    return Status::Ok();
}

Status GovernanceEngine::Load() {
    LedgerSnapshot snap;
    Status s = store_.Load(&snap);
    if (!s.ok()) {
        return s;
    }
    
    if (!snap.schemaVersion) {
        LedgerBatch batch;
        batch.PutSchemaVersion(LEDGER_SCHEMA_VERSION);
        s = store_.Commit(batch, true);
        if (!s.ok()) {
            return s;
        }
    }
    
    std::unique_lock<std::shared_mutex> lock(mutex_);
    agents_.Clear();
    for (const auto& agent : snap.agents) {
        agents_.Apply(agent);
    }
    proposals_ = std::move(snap.proposals);
    votes_ = std::move(snap.votes);
    decisions_.Clear();
    for (const auto& decision : snap.decisions) {
        decisions_.Apply(decision);
    }
    nextProposalId_ = snap.nextProposalId;
    paused_ = snap.paused;
    
    LOG_INFO(GOVERNANCE) << "Governance ledger opened: admin=" << params_.admin
                         << " agents=" << agents_.Size()
                         << " proposals=" << proposals_.size()
                         << " decisions=" << decisions_.Size()
                         << (paused_ ? " (paused)" : "");
    return Status::Ok();
}

// ============================================================================
// Events
// ============================================================================

GovernanceEvent GovernanceEngine::MakeEvent(EventPayload payload, Timestamp now) {
    GovernanceEvent event;
    event.sequence = nextEventSequence_++;
    event.timestamp = now;
    event.payload = std::move(payload);
    return event;
}

void GovernanceEngine::Publish(const std::vector<GovernanceEvent>& events) {
    if (events.empty()) {
        return;
    }
    
    std::vector<EventListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        listeners.reserve(listeners_.size());
        for (const auto& entry : listeners_) {
            listeners.push_back(entry.second);
        }
    }
    
    for (const auto& event : events) {
        LOG_INFO(GOVERNANCE) << "Event " << event.ToString();
        for (const auto& listener : listeners) {
            try {
                listener(event);
            } catch (const std::exception& e) {
                LOG_ERROR(GOVERNANCE) << "Event listener failed on " << event.Name()
                                      << ": " << e.what();
            }
        }
    }
}

SubscriptionId GovernanceEngine::Subscribe(EventListener listener) {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    SubscriptionId id = nextSubscriptionId_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

bool GovernanceEngine::Unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    return listeners_.erase(id) > 0;
}

Status GovernanceEngine::Reject(const char* operation, const AgentId& caller, Status status) {
    LOG_DEBUG(GOVERNANCE) << operation << " by '" << caller << "' rejected: "
                          << status.ToString();
    return status;
}

// ============================================================================
// Agent Registry
// ============================================================================

Status GovernanceEngine::RegisterAgent(const AgentId& caller,
                                       const AgentId& agentId,
                                       const std::string& agentType,
                                       VotingPower votingPower,
                                       const std::string& publicKey) {
    std::vector<GovernanceEvent> events;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        
        if (!IsAdmin(caller)) {
            return Reject("RegisterAgent", caller, Status::Unauthorized("admin only"));
        }
        if (paused_) {
            return Reject("RegisterAgent", caller, Status::SystemPaused());
        }
        
        Timestamp now = clock_->Now();
        Agent agent;
        Status s = agents_.PrepareRegistration(agentId, agentType, votingPower,
                                               publicKey, now, &agent);
        if (!s.ok()) {
            return Reject("RegisterAgent", caller, s);
        }
        
        LedgerBatch batch;
        batch.PutAgent(agent);
        s = store_.Commit(batch);
        if (!s.ok()) {
            return s;
        }
        
        agents_.Apply(agent);
        LOG_INFO(REGISTRY) << "Registered " << agent.ToString();
        events.push_back(MakeEvent(AgentRegistered{agent.id, agent.agentType,
                                                   agent.votingPower}, now));
    }
    Publish(events);
    return Status::Ok();
}

Status GovernanceEngine::DeactivateAgent(const AgentId& caller, const AgentId& agentId) {
    std::vector<GovernanceEvent> events;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        
        if (!IsAdmin(caller)) {
            return Reject("DeactivateAgent", caller, Status::Unauthorized("admin only"));
        }
        
        Agent agent;
        Status s = agents_.PrepareDeactivation(agentId, &agent);
        if (!s.ok()) {
            return Reject("DeactivateAgent", caller, s);
        }
        
        LedgerBatch batch;
        batch.PutAgent(agent);
        s = store_.Commit(batch);
        if (!s.ok()) {
            return s;
        }
        
        agents_.Apply(agent);
        LOG_INFO(REGISTRY) << "Deactivated agent " << agentId;
        events.push_back(MakeEvent(AgentDeactivated{agentId}, clock_->Now()));
    }
    Publish(events);
    return Status::Ok();
}

Agent GovernanceEngine::GetAgent(const AgentId& agentId) const {
    return FindAgent(agentId).value_or(Agent());
}

std::optional<Agent> GovernanceEngine::FindAgent(const AgentId& agentId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return agents_.Find(agentId);
}

bool GovernanceEngine::IsActiveAgent(const AgentId& agentId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return agents_.IsActive(agentId);
}

std::vector<Agent> GovernanceEngine::ListAgents(bool activeOnly) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return agents_.List(activeOnly);
}

VotingPower GovernanceEngine::GetActiveVotingPower() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return agents_.GetActiveVotingPower();
}

// ============================================================================
// Proposals
// ============================================================================

Status GovernanceEngine::CreateProposal(const AgentId& caller,
                                        const std::string& proposalType,
                                        const std::string& contentHash,
                                        ProposalId* outId) {
    std::vector<GovernanceEvent> events;
    ProposalId id = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        
        if (!agents_.IsActive(caller)) {
            return Reject("CreateProposal", caller,
                          Status::Unauthorized("caller is not an active agent"));
        }
        if (paused_) {
            return Reject("CreateProposal", caller, Status::SystemPaused());
        }
        
        Timestamp now = clock_->Now();
        Proposal proposal;
        proposal.id = nextProposalId_;
        proposal.proposer = caller;
        proposal.proposalType = proposalType;
        proposal.contentHash = contentHash;
        proposal.votingStart = now;
        proposal.votingEnd = now + params_.votingPeriod;
        proposal.executionDelay = params_.executionDelay;
        
        LedgerBatch batch;
        batch.PutProposal(proposal);
        batch.PutNextProposalId(proposal.id + 1);
        Status s = store_.Commit(batch);
        if (!s.ok()) {
            return s;
        }
        
        id = proposal.id;
        proposals_.emplace(id, proposal);
        nextProposalId_ = id + 1;
        
        LOG_INFO(LEDGER) << "Created " << proposal.ToString() << ", voting until "
                         << util::FormatISO8601(proposal.votingEnd);
        events.push_back(MakeEvent(ProposalCreated{id, caller, proposalType, contentHash,
                                                   proposal.votingEnd}, now));
    }
    if (outId) {
        *outId = id;
    }
    Publish(events);
    return Status::Ok();
}

Status GovernanceEngine::Vote(const AgentId& caller, ProposalId proposalId, bool support) {
    std::vector<GovernanceEvent> events;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        
        if (!agents_.IsActive(caller)) {
            return Reject("Vote", caller, Status::Unauthorized("caller is not an active agent"));
        }
        if (paused_) {
            return Reject("Vote", caller, Status::SystemPaused());
        }
        
        auto it = proposals_.find(proposalId);
        if (it == proposals_.end()) {
            return Reject("Vote", caller,
                          Status::NotFound("proposal " + std::to_string(proposalId)));
        }
        const Proposal& current = it->second;
        
        Timestamp now = clock_->Now();
        if (!current.IsOpen()) {
            return Reject("Vote", caller, Status::InvalidState(
                current.executed ? "proposal already executed" : "proposal cancelled"));
        }
        if (!current.IsVotingOpen(now)) {
            return Reject("Vote", caller, Status::InvalidState("outside voting window"));
        }
        
        auto& ballots = votes_[proposalId];
        if (ballots.count(caller) > 0) {
            return Reject("Vote", caller, Status::AlreadyVoted(
                caller + " already voted on proposal " + std::to_string(proposalId)));
        }
        
        VoteRecord vote;
        vote.hasVoted = true;
        vote.support = support;
        vote.weight = agents_.GetPower(caller);
        vote.castAt = now;
        
        if (vote.weight > std::numeric_limits<VotingPower>::max() - current.TotalVotes()) {
            if (ballots.empty()) {
                votes_.erase(proposalId);
            }
            return Reject("Vote", caller, Status::InvalidState(
                "tally overflow on proposal " + std::to_string(proposalId)));
        }
        
        Proposal updated = current;
        (support ? updated.yesVotes : updated.noVotes) += vote.weight;
        
        LedgerBatch batch;
        batch.PutVote(proposalId, caller, vote);
        batch.PutProposal(updated);
        Status s = store_.Commit(batch);
        if (!s.ok()) {
            if (ballots.empty()) {
                votes_.erase(proposalId);
            }
            return s;
        }
        
        ballots.emplace(caller, vote);
        it->second = updated;
        
        LOG_INFO(LEDGER) << "Vote on proposal " << proposalId << " by " << caller
                         << ": " << (support ? "yes" : "no") << " (weight " << vote.weight
                         << ", tally " << updated.yesVotes << "/" << updated.noVotes << ")";
        events.push_back(MakeEvent(VoteCast{proposalId, caller, support, vote.weight}, now));
    }
    Publish(events);
    return Status::Ok();
}

Status GovernanceEngine::ExecuteProposal(const AgentId& caller, ProposalId proposalId,
                                         bool* success) {
    Proposal executed;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        
        if (paused_) {
            return Reject("ExecuteProposal", caller, Status::SystemPaused());
        }
        
        auto it = proposals_.find(proposalId);
        if (it == proposals_.end()) {
            return Reject("ExecuteProposal", caller,
                          Status::NotFound("proposal " + std::to_string(proposalId)));
        }
        const Proposal& current = it->second;
        
        Timestamp now = clock_->Now();
        if (current.executed) {
            return Reject("ExecuteProposal", caller,
                          Status::InvalidState("proposal already executed"));
        }
        if (current.cancelled) {
            return Reject("ExecuteProposal", caller, Status::InvalidState("proposal cancelled"));
        }
        if (now <= current.votingEnd) {
            return Reject("ExecuteProposal", caller, Status::InvalidState("voting still open"));
        }
        if (now < current.ExecutableAt()) {
            return Reject("ExecuteProposal", caller, Status::InvalidState(
                "execution delay has " + util::FormatDuration(current.ExecutableAt() - now) +
                " left"));
        }
        if (current.TotalVotes() < params_.quorumThreshold) {
            return Reject("ExecuteProposal", caller, Status::QuorumNotMet(
                std::to_string(current.TotalVotes()) + " of " +
                std::to_string(params_.quorumThreshold)));
        }
        if (current.yesVotes <= current.noVotes) {
            return Reject("ExecuteProposal", caller, Status::ProposalRejected(
                std::to_string(current.yesVotes) + " yes, " +
                std::to_string(current.noVotes) + " no"));
        }
        
        Proposal updated = current;
        updated.executed = true;
        
        LedgerBatch batch;
        batch.PutProposal(updated);
        Status s = store_.Commit(batch, true);
        if (!s.ok()) {
            return s;
        }
        
        it->second = updated;
        executed = updated;
    }
    
    // The handler runs unlocked so it may read engine state
    bool ok = false;
    auto handler = handlers_.Find(executed.proposalType);
    if (!handler) {
        LOG_WARN(GOVERNANCE) << "No handler for proposal type '" << executed.proposalType
                             << "', proposal " << proposalId << " executed without effect";
    } else {
        try {
            ok = (*handler)(executed);
        } catch (const std::exception& e) {
            LOG_ERROR(GOVERNANCE) << "Handler for '" << executed.proposalType
                                  << "' failed on proposal " << proposalId << ": " << e.what();
            ok = false;
        }
    }
    
    LOG_INFO(LEDGER) << "Executed proposal " << proposalId << " ("
                     << executed.proposalType << "): " << (ok ? "success" : "no effect");
    
    std::vector<GovernanceEvent> events;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        events.push_back(MakeEvent(ProposalExecuted{proposalId, ok}, clock_->Now()));
    }
    if (success) {
        *success = ok;
    }
    Publish(events);
    return Status::Ok();
}

Status GovernanceEngine::CancelProposal(const AgentId& caller, ProposalId proposalId) {
    std::vector<GovernanceEvent> events;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        
        if (!IsAdmin(caller)) {
            return Reject("CancelProposal", caller, Status::Unauthorized("admin only"));
        }
        if (paused_) {
            return Reject("CancelProposal", caller, Status::SystemPaused());
        }
        
        auto it = proposals_.find(proposalId);
        if (it == proposals_.end()) {
            return Reject("CancelProposal", caller,
                          Status::NotFound("proposal " + std::to_string(proposalId)));
        }
        if (!it->second.IsOpen()) {
            return Reject("CancelProposal", caller, Status::InvalidState(
                it->second.executed ? "proposal already executed" : "proposal already cancelled"));
        }
        
        Proposal updated = it->second;
        updated.cancelled = true;
        
        LedgerBatch batch;
        batch.PutProposal(updated);
        Status s = store_.Commit(batch);
        if (!s.ok()) {
            return s;
        }
        
        it->second = updated;
        LOG_INFO(LEDGER) << "Cancelled proposal " << proposalId;
        events.push_back(MakeEvent(ProposalCancelled{proposalId}, clock_->Now()));
    }
    Publish(events);
    return Status::Ok();
}

Proposal GovernanceEngine::GetProposal(ProposalId proposalId) const {
    return FindProposal(proposalId).value_or(Proposal());
}

std::optional<Proposal> GovernanceEngine::FindProposal(ProposalId proposalId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = proposals_.find(proposalId);
    if (it == proposals_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Status GovernanceEngine::GetProposalStatus(ProposalId proposalId, ProposalStatus* out) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = proposals_.find(proposalId);
    if (it == proposals_.end()) {
        return Status::NotFound("proposal " + std::to_string(proposalId));
    }
    *out = it->second.GetStatus(clock_->Now(), params_.quorumThreshold);
    return Status::Ok();
}

bool GovernanceEngine::HasVoted(ProposalId proposalId, const AgentId& agentId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = votes_.find(proposalId);
    return it != votes_.end() && it->second.count(agentId) > 0;
}

Status GovernanceEngine::GetVote(ProposalId proposalId, const AgentId& agentId,
                                 VoteRecord* out) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (proposals_.count(proposalId) == 0) {
        return Status::NotFound("proposal " + std::to_string(proposalId));
    }
    auto it = votes_.find(proposalId);
    if (it == votes_.end()) {
        return Status::NeverVoted(agentId);
    }
    auto vote = it->second.find(agentId);
    if (vote == it->second.end()) {
        return Status::NeverVoted(agentId);
    }
    *out = vote->second;
    return Status::Ok();
}

VoteMap GovernanceEngine::GetVotes(ProposalId proposalId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = votes_.find(proposalId);
    if (it == votes_.end()) {
        return VoteMap();
    }
    return it->second;
}

size_t GovernanceEngine::GetProposalCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return proposals_.size();
}

std::vector<Proposal> GovernanceEngine::ListProposals() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Proposal> result;
    result.reserve(proposals_.size());
    for (const auto& entry : proposals_) {
        result.push_back(entry.second);
    }
    return result;
}

// ============================================================================
// Consensus Decisions
// ============================================================================

Status GovernanceEngine::RecordDecision(const AgentId& caller,
                                        const DecisionSubmission& submission) {
    std::vector<GovernanceEvent> events;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        
        if (!agents_.IsActive(caller)) {
            return Reject("RecordDecision", caller,
                          Status::Unauthorized("caller is not an active agent"));
        }
        if (paused_) {
            return Reject("RecordDecision", caller, Status::SystemPaused());
        }
        
        Timestamp now = clock_->Now();
        ConsensusDecision decision;
        Status s = decisions_.Prepare(caller, submission, now, &decision);
        if (!s.ok()) {
            return Reject("RecordDecision", caller, s);
        }
        
        LedgerBatch batch;
        batch.PutDecision(decision);
        s = store_.Commit(batch, true);
        if (!s.ok()) {
            return s;
        }
        
        decisions_.Apply(decision);
        LOG_INFO(LEDGER) << "Recorded decision " << decision.requestId << " ("
                         << decision.decisionType << " -> " << decision.finalDecision
                         << ", " << decision.participatingAgents.size() << " agents, digest "
                         << decision.digest.ToHex() << ")";
        events.push_back(MakeEvent(ConsensusRecorded{decision.requestId, decision.decisionType,
                                                     decision.finalDecision,
                                                     decision.confidence}, now));
    }
    Publish(events);
    return Status::Ok();
}

DecisionVerification GovernanceEngine::VerifyDecision(const std::string& requestId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return decisions_.Verify(requestId);
}

std::optional<ConsensusDecision> GovernanceEngine::GetDecision(
    const std::string& requestId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return decisions_.Find(requestId);
}

size_t GovernanceEngine::GetDecisionCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return decisions_.Size();
}

// ============================================================================
// Administration
// ============================================================================

Status GovernanceEngine::Pause(const AgentId& caller) {
    std::vector<GovernanceEvent> events;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        
        if (!IsAdmin(caller)) {
            return Reject("Pause", caller, Status::Unauthorized("admin only"));
        }
        if (paused_) {
            return Reject("Pause", caller, Status::InvalidState("already paused"));
        }
        
        LedgerBatch batch;
        batch.PutPaused(true);
        Status s = store_.Commit(batch, true);
        if (!s.ok()) {
            return s;
        }
        
        paused_ = true;
        LOG_WARN(GOVERNANCE) << "Governance paused by " << caller;
        events.push_back(MakeEvent(SystemPauseChanged{true}, clock_->Now()));
    }
    Publish(events);
    return Status::Ok();
}

Status GovernanceEngine::Unpause(const AgentId& caller) {
    std::vector<GovernanceEvent> events;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        
        if (!IsAdmin(caller)) {
            return Reject("Unpause", caller, Status::Unauthorized("admin only"));
        }
        if (!paused_) {
            return Reject("Unpause", caller, Status::InvalidState("not paused"));
        }
        
        LedgerBatch batch;
        batch.PutPaused(false);
        Status s = store_.Commit(batch, true);
        if (!s.ok()) {
            return s;
        }
        
        paused_ = false;
        LOG_INFO(GOVERNANCE) << "Governance resumed by " << caller;
        events.push_back(MakeEvent(SystemPauseChanged{false}, clock_->Now()));
    }
    Publish(events);
    return Status::Ok();
}

bool GovernanceEngine::IsPaused() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return paused_;
}

GovernanceSummary GovernanceEngine::GetSummary() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    Timestamp now = clock_->Now();
    
    GovernanceSummary summary;
    summary.totalAgents = agents_.Size();
    summary.activeAgents = agents_.ActiveCount();
    summary.activeVotingPower = agents_.GetActiveVotingPower();
    summary.totalProposals = proposals_.size();
    for (const auto& entry : proposals_) {
        const Proposal& p = entry.second;
        if (p.executed) {
            ++summary.executedProposals;
        } else if (!p.cancelled && p.IsVotingOpen(now)) {
            ++summary.votingProposals;
        }
    }
    summary.decisions = decisions_.Size();
    summary.paused = paused_;
    return summary;
}

} // namespace governance
} // namespace reliquary
