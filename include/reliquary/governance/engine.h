// RELIQUARY - Governance Engine
// Copyright (c) 2024 RELIQUARY Developers
// MIT License
//
// Coordinates the agent registry, proposal voting and the consensus
// decision ledger over one persistent ledger.
//
// Key properties:
// - Every mutation runs under an exclusive lock and is persisted as one
//   atomic batch before it becomes visible
// - Reads take a shared lock and see a consistent state
// - Time comes from an injected Clock
// - Events and proposal handlers run after the lock is released

#ifndef RELIQUARY_GOVERNANCE_ENGINE_H
#define RELIQUARY_GOVERNANCE_ENGINE_H

#include "reliquary/core/types.h"
#include "reliquary/db/database.h"
#include "reliquary/governance/agent_registry.h"
#include "reliquary/governance/decision_ledger.h"
#include "reliquary/governance/events.h"
#include "reliquary/governance/ledger_store.h"
#include "reliquary/governance/params.h"
#include "reliquary/governance/proposal.h"
#include "reliquary/governance/status.h"
#include "reliquary/util/time.h"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace reliquary {
namespace governance {

/// Aggregate counters for status displays
struct GovernanceSummary {
    size_t totalAgents{0};
    size_t activeAgents{0};
    VotingPower activeVotingPower{0};
    size_t totalProposals{0};
    
    /// Proposals whose voting window is still open
    size_t votingProposals{0};
    
    size_t executedProposals{0};
    size_t decisions{0};
    bool paused{false};
};

class GovernanceEngine {
public:
    /**
     * Open an engine over a database and load the ledger stored there.
     * @param params Validated before use (INVALID_ARGUMENT)
     * @param clock Time source, shared with the caller
     * @param db Backing store, owned by the engine
     * @param out Receives the engine on success
     * @return STORAGE_ERROR if the ledger cannot be read or is corrupted
     */
    static Status Open(const GovernanceParams& params,
                       std::shared_ptr<const util::Clock> clock,
                       std::unique_ptr<db::Database> db,
                       std::unique_ptr<GovernanceEngine>* out);
    
    ~GovernanceEngine();
    
    GovernanceEngine(const GovernanceEngine&) = delete;
    GovernanceEngine& operator=(const GovernanceEngine&) = delete;
    
    // === Agent Registry ===
    
    /// Admin only. Registers a new agent or reactivates a deactivated one.
    Status RegisterAgent(const AgentId& caller,
                         const AgentId& agentId,
                         const std::string& agentType,
                         VotingPower votingPower,
                         const std::string& publicKey);
    
    /// Admin only. Allowed while paused. Votes already cast stay counted.
    Status DeactivateAgent(const AgentId& caller, const AgentId& agentId);
    
    /// Record for agentId, or a zero-valued Agent if unknown
    Agent GetAgent(const AgentId& agentId) const;
    
    std::optional<Agent> FindAgent(const AgentId& agentId) const;
    
    bool IsActiveAgent(const AgentId& agentId) const;
    
    std::vector<Agent> ListAgents(bool activeOnly = false) const;
    
    VotingPower GetActiveVotingPower() const;
    
    // === Proposals ===
    
    /// Active agents only. Voting opens immediately.
    Status CreateProposal(const AgentId& caller,
                          const std::string& proposalType,
                          const std::string& contentHash,
                          ProposalId* outId);
    
    /// Active agents only, once per proposal, inside the voting window
    Status Vote(const AgentId& caller, ProposalId proposalId, bool support);
    
    /**
     * Execute a proposal whose voting window and execution delay have
     * passed and which met quorum with yes > no. Any caller.
     *
     * The proposal is marked executed before its handler runs. success
     * is false when no handler is registered for the type or the handler
     * reports failure or throws; the call still returns OK.
     */
    Status ExecuteProposal(const AgentId& caller, ProposalId proposalId, bool* success);
    
    /// Admin only. Tallies are kept.
    Status CancelProposal(const AgentId& caller, ProposalId proposalId);
    
    /// Proposal, or a zero-valued Proposal if unknown
    Proposal GetProposal(ProposalId proposalId) const;
    
    std::optional<Proposal> FindProposal(ProposalId proposalId) const;
    
    /// Lifecycle state at the current time; NOT_FOUND for unknown ids
    Status GetProposalStatus(ProposalId proposalId, ProposalStatus* out) const;
    
    bool HasVoted(ProposalId proposalId, const AgentId& agentId) const;
    
    /// NOT_FOUND for an unknown proposal, NEVER_VOTED if agentId has not voted
    Status GetVote(ProposalId proposalId, const AgentId& agentId, VoteRecord* out) const;
    
    /// All votes on a proposal (empty if unknown)
    VoteMap GetVotes(ProposalId proposalId) const;
    
    size_t GetProposalCount() const;
    
    /// All proposals ordered by id
    std::vector<Proposal> ListProposals() const;
    
    // === Consensus Decisions ===
    
    /// Active agents only. A request id can be recorded once.
    Status RecordDecision(const AgentId& caller, const DecisionSubmission& submission);
    
    /// {true, decision, confidence} for a recorded id, {false, "", 0} otherwise
    DecisionVerification VerifyDecision(const std::string& requestId) const;
    
    std::optional<ConsensusDecision> GetDecision(const std::string& requestId) const;
    
    size_t GetDecisionCount() const;
    
    // === Administration ===
    
    Status Pause(const AgentId& caller);
    Status Unpause(const AgentId& caller);
    bool IsPaused() const;
    
    GovernanceSummary GetSummary() const;
    
    // === Events ===
    
    /// Listeners run on the calling thread after the mutation commits and
    /// may call read accessors. Exceptions they throw are logged.
    SubscriptionId Subscribe(EventListener listener);
    
    bool Unsubscribe(SubscriptionId id);
    
    // === Configuration ===
    
    ProposalHandlerRegistry& GetHandlers() { return handlers_; }
    
    const GovernanceParams& GetParams() const { return params_; }
    
    Timestamp Now() const { return clock_->Now(); }

private:
    GovernanceEngine(const GovernanceParams& params,
                     std::shared_ptr<const util::Clock> clock,
                     std::unique_ptr<db::Database> db);
    
    /// Replace in-memory state with the stored ledger
    Status Load();
    
    bool IsAdmin(const AgentId& caller) const { return caller == params_.admin; }
    
    /// Stamp an event with the next sequence number (exclusive lock held)
    GovernanceEvent MakeEvent(EventPayload payload, Timestamp now);
    
    /// Log and deliver events (no lock held)
    void Publish(const std::vector<GovernanceEvent>& events);
    
    /// Log a rejected request at debug level and return it
    static Status Reject(const char* operation, const AgentId& caller, Status status);
    
    const GovernanceParams params_;
    const std::shared_ptr<const util::Clock> clock_;
    std::unique_ptr<db::Database> db_;
    LedgerStore store_;
    
    mutable std::shared_mutex mutex_;
    AgentRegistry agents_;
    std::map<ProposalId, Proposal> proposals_;
    std::map<ProposalId, VoteMap> votes_;
    DecisionLedger decisions_;
    ProposalId nextProposalId_{1};
    bool paused_{false};
    uint64_t nextEventSequence_{1};
    
    ProposalHandlerRegistry handlers_;
    
    std::mutex listenersMutex_;
    std::map<SubscriptionId, EventListener> listeners_;
    SubscriptionId nextSubscriptionId_{1};
};

} // namespace governance
} // namespace reliquary

#endif // RELIQUARY_GOVERNANCE_ENGINE_H
