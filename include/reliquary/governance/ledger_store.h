// RELIQUARY - Ledger Store
// Copyright (c) 2024 RELIQUARY Developers
// MIT License
//
// Persistent layout of the governance ledger on top of db::Database.
//
// Key layout (one-byte prefix, see db::prefix):
//   'a' + agent id                         -> Agent
//   'p' + proposal id (8 bytes, BE)        -> Proposal
//   'v' + proposal id (8 bytes, BE) + agent id -> VoteRecord
//   'd' + request id                       -> ConsensusDecision
//   'm' + name                             -> metadata (version, nextid, paused)

#ifndef RELIQUARY_GOVERNANCE_LEDGER_STORE_H
#define RELIQUARY_GOVERNANCE_LEDGER_STORE_H

#include "reliquary/db/database.h"
#include "reliquary/governance/agent_registry.h"
#include "reliquary/governance/decision_ledger.h"
#include "reliquary/governance/proposal.h"
#include "reliquary/governance/status.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace reliquary {
namespace governance {

/// On-disk layout version
constexpr uint32_t LEDGER_SCHEMA_VERSION = 1;

// ============================================================================
// Ledger Batch
// ============================================================================

/// Records written together by one governance operation
class LedgerBatch {
public:
    void PutAgent(const Agent& agent);
    void PutProposal(const Proposal& proposal);
    void PutVote(ProposalId proposalId, const AgentId& agentId, const VoteRecord& vote);
    void PutDecision(const ConsensusDecision& decision);
    void PutNextProposalId(ProposalId next);
    void PutPaused(bool paused);
    void PutSchemaVersion(uint32_t version);
    
    size_t Count() const { return batch_.Count(); }
    bool Empty() const { return batch_.Empty(); }

private:
    friend class LedgerStore;
    db::WriteBatch batch_;
};

// ============================================================================
// Ledger Snapshot
// ============================================================================

/// Full ledger contents as read back from storage
struct LedgerSnapshot {
    std::vector<Agent> agents;
    std::map<ProposalId, Proposal> proposals;
    std::map<ProposalId, VoteMap> votes;
    std::vector<ConsensusDecision> decisions;
    ProposalId nextProposalId{1};
    bool paused{false};
    
    /// Empty for a ledger that has never been written
    std::optional<uint32_t> schemaVersion;
};

// ============================================================================
// Ledger Store
// ============================================================================

class LedgerStore {
public:
    /// db must outlive the store
    explicit LedgerStore(db::Database& db);
    
    /// Write a batch atomically; STORAGE_ERROR on failure
    Status Commit(LedgerBatch& batch, bool sync = false);
    
    /**
     * Read the whole ledger.
     * STORAGE_ERROR if a read fails, a record does not decode, a key
     * disagrees with its record, a decision digest does not match, a
     * vote refers to an unknown proposal, tallies disagree with the
     * recorded votes, or the schema version is unknown.
     */
    Status Load(LedgerSnapshot* out) const;
    
    // Key encoding, exposed for tests and tools
    static std::string AgentKey(const AgentId& agentId);
    static std::string ProposalKey(ProposalId proposalId);
    static std::string VoteKey(ProposalId proposalId, const AgentId& agentId);
    static std::string DecisionKey(const std::string& requestId);
    static std::string MetaKey(const std::string& name);

private:
    db::Database& db_;
};

} // namespace governance
} // namespace reliquary

#endif // RELIQUARY_GOVERNANCE_LEDGER_STORE_H
