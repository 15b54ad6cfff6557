// RELIQUARY - Ledger Store Implementation
// Copyright (c) 2024 RELIQUARY Developers
// MIT License

#include "reliquary/governance/ledger_store.h"
#include "reliquary/util/logging.h"

#include <algorithm>
#include <functional>

namespace reliquary {
namespace governance {

namespace {

constexpr const char* META_VERSION = "version";
constexpr const char* META_NEXT_PROPOSAL = "nextid";
constexpr const char* META_PAUSED = "paused";

constexpr size_t ID_BYTES = 8;

// Big-endian so keys sort numerically
std::string EncodeProposalId(ProposalId id) {
    std::string out(ID_BYTES, '\0');
    for (size_t i = 0; i < ID_BYTES; ++i) {
        out[ID_BYTES - 1 - i] = static_cast<char>((id >> (8 * i)) & 0xff);
    }
    return out;
}

ProposalId DecodeProposalId(const char* data) {
    ProposalId id = 0;
    for (size_t i = 0; i < ID_BYTES; ++i) {
        id = (id << 8) | static_cast<uint8_t>(data[i]);
    }
    return id;
}

Status Corrupt(const std::string& what) {
    LOG_ERROR(util::LogCategory::DB) << "Ledger corruption: " << what;
    return Status::StorageError("corrupted ledger: " + what);
}

// Visit every key with the given prefix; the callback receives the key
// without its prefix byte
Status ScanPrefix(db::Database& db, char prefix,
                  const std::function<Status(const std::string&, const std::string&)>& fn) {
    std::string start = db::MakeKey(prefix);
    auto it = db.NewIterator();
    for (it->Seek(start); it->Valid(); it->Next()) {
        db::Slice key = it->key();
        if (!key.starts_with(start)) {
            break;
        }
        Status s = fn(std::string(key.data() + 1, key.size() - 1), it->value().ToString());
        if (!s.ok()) {
            return s;
        }
    }
    db::Status st = it->status();
    if (!st.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Ledger scan failed: " << st.ToString();
        return Status::StorageError(st.ToString());
    }
    return Status::Ok();
}

template<typename T>
Status ReadMeta(db::Database& db, const std::string& key, std::optional<T>* out) {
    std::string value;
    db::Status st = db.Get(key, &value);
    if (st.IsNotFound()) {
        out->reset();
        return Status::Ok();
    }
    if (!st.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Ledger read failed: " << st.ToString();
        return Status::StorageError(st.ToString());
    }
    T decoded;
    if (!db::DeserializeFromString(value, decoded)) {
        return Corrupt("metadata " + key.substr(1));
    }
    *out = decoded;
    return Status::Ok();
}

} // namespace

// ============================================================================
// Keys
// ============================================================================

std::string LedgerStore::AgentKey(const AgentId& agentId) {
    return db::MakeKey(db::prefix::AGENT, agentId);
}

std::string LedgerStore::ProposalKey(ProposalId proposalId) {
    return db::MakeKey(db::prefix::PROPOSAL, EncodeProposalId(proposalId));
}

std::string LedgerStore::VoteKey(ProposalId proposalId, const AgentId& agentId) {
    return db::MakeKey(db::prefix::VOTE, EncodeProposalId(proposalId) + agentId);
}

std::string LedgerStore::DecisionKey(const std::string& requestId) {
    return db::MakeKey(db::prefix::DECISION, requestId);
}

std::string LedgerStore::MetaKey(const std::string& name) {
    return db::MakeKey(db::prefix::META, name);
}

// ============================================================================
// LedgerBatch
// ============================================================================

void LedgerBatch::PutAgent(const Agent& agent) {
    batch_.Put(LedgerStore::AgentKey(agent.id), db::SerializeToString(agent));
}

void LedgerBatch::PutProposal(const Proposal& proposal) {
    batch_.Put(LedgerStore::ProposalKey(proposal.id), db::SerializeToString(proposal));
}

void LedgerBatch::PutVote(ProposalId proposalId, const AgentId& agentId,
                          const VoteRecord& vote) {
    batch_.Put(LedgerStore::VoteKey(proposalId, agentId), db::SerializeToString(vote));
}

void LedgerBatch::PutDecision(const ConsensusDecision& decision) {
    batch_.Put(LedgerStore::DecisionKey(decision.requestId), db::SerializeToString(decision));
}

void LedgerBatch::PutNextProposalId(ProposalId next) {
    batch_.Put(LedgerStore::MetaKey(META_NEXT_PROPOSAL), db::SerializeToString(next));
}

void LedgerBatch::PutPaused(bool paused) {
    batch_.Put(LedgerStore::MetaKey(META_PAUSED), db::SerializeToString(paused));
}

void LedgerBatch::PutSchemaVersion(uint32_t version) {
    batch_.Put(LedgerStore::MetaKey(META_VERSION), db::SerializeToString(version));
}

// ============================================================================
// LedgerStore
// ============================================================================

LedgerStore::LedgerStore(db::Database& db) : db_(db) {}

Status LedgerStore::Commit(LedgerBatch& batch, bool sync) {
    if (batch.Empty()) {
        return Status::Ok();
    }
    db::WriteOptions options;
    options.sync = sync;
    db::Status st = db_.Write(options, &batch.batch_);
    if (!st.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Ledger write of " << batch.Count()
                                         << " records failed: " << st.ToString();
        return Status::StorageError(st.ToString());
    }
    return Status::Ok();
}

Status LedgerStore::Load(LedgerSnapshot* out) const {
    LedgerSnapshot snap;
    
    std::optional<uint32_t> version;
    Status s = ReadMeta(db_, MetaKey(META_VERSION), &version);
    if (!s.ok()) return s;
    if (version && *version != LEDGER_SCHEMA_VERSION) {
        return Status::StorageError("unsupported ledger schema version " +
                                    std::to_string(*version));
    }
    snap.schemaVersion = version;
    
    std::optional<ProposalId> next;
    s = ReadMeta(db_, MetaKey(META_NEXT_PROPOSAL), &next);
    if (!s.ok()) return s;
    
    std::optional<bool> paused;
    s = ReadMeta(db_, MetaKey(META_PAUSED), &paused);
    if (!s.ok()) return s;
    snap.paused = paused.value_or(false);
    
    s = ScanPrefix(db_, db::prefix::AGENT,
        [&snap](const std::string& id, const std::string& value) {
            Agent agent;
            if (!db::DeserializeFromString(value, agent) || agent.id != id) {
                return Corrupt("agent " + id);
            }
            snap.agents.push_back(std::move(agent));
            return Status::Ok();
        });
    if (!s.ok()) return s;
    
    s = ScanPrefix(db_, db::prefix::PROPOSAL,
        [&snap](const std::string& key, const std::string& value) {
            Proposal proposal;
            if (key.size() != ID_BYTES || !db::DeserializeFromString(value, proposal) ||
                proposal.id != DecodeProposalId(key.data()) || proposal.id == 0) {
                return Corrupt("proposal record");
            }
            snap.proposals.emplace(proposal.id, std::move(proposal));
            return Status::Ok();
        });
    if (!s.ok()) return s;
    
    s = ScanPrefix(db_, db::prefix::VOTE,
        [&snap](const std::string& key, const std::string& value) {
            VoteRecord vote;
            if (key.size() <= ID_BYTES || !db::DeserializeFromString(value, vote)) {
                return Corrupt("vote record");
            }
            ProposalId id = DecodeProposalId(key.data());
            if (snap.proposals.count(id) == 0) {
                return Corrupt("vote for unknown proposal " + std::to_string(id));
            }
            snap.votes[id][key.substr(ID_BYTES)] = vote;
            return Status::Ok();
        });
    if (!s.ok()) return s;
    
    s = ScanPrefix(db_, db::prefix::DECISION,
        [&snap](const std::string& requestId, const std::string& value) {
            ConsensusDecision decision;
            if (!db::DeserializeFromString(value, decision) ||
                decision.requestId != requestId) {
                return Corrupt("decision " + requestId);
            }
            if (!decision.VerifyDigest()) {
                return Corrupt("digest mismatch for decision " + requestId);
            }
            snap.decisions.push_back(std::move(decision));
            return Status::Ok();
        });
    if (!s.ok()) return s;
    
    // Tallies must equal the recorded weights
    ProposalId maxId = 0;
    for (const auto& [id, proposal] : snap.proposals) {
        VotingPower yes = 0;
        VotingPower no = 0;
        auto votes = snap.votes.find(id);
        if (votes != snap.votes.end()) {
            for (const auto& [agent, vote] : votes->second) {
                (vote.support ? yes : no) += vote.weight;
            }
        }
        if (yes != proposal.yesVotes || no != proposal.noVotes) {
            return Corrupt("tally mismatch on proposal " + std::to_string(id));
        }
        maxId = std::max(maxId, id);
    }
    
    snap.nextProposalId = next.value_or(1);
    if (snap.nextProposalId <= maxId) {
        return Corrupt("proposal counter behind stored proposals");
    }
    
    LOG_DEBUG(util::LogCategory::DB) << "Loaded ledger: " << snap.agents.size() << " agents, "
                                     << snap.proposals.size() << " proposals, "
                                     << snap.decisions.size() << " decisions";
    *out = std::move(snap);
    return Status::Ok();
}

} // namespace governance
} // namespace reliquary
