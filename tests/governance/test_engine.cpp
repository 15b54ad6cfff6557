// RELIQUARY - Governance Engine Tests
// Copyright (c) 2024 RELIQUARY Developers
// MIT License

#include <gtest/gtest.h>

#include <reliquary/governance/engine.h>
#include <reliquary/util/logging.h>
#include "test_helpers.h"

#include <atomic>
#include <limits>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace reliquary;
using namespace reliquary::governance;

// ============================================================================
// Test Fixture
// ============================================================================

class GovernanceEngineTest : public ::testing::Test {
protected:
    static constexpr Timestamp START = 1700000000;
    
    void SetUp() override {
        clock_ = std::make_shared<util::MockClock>(START);
        backing_ = std::make_shared<db::MemoryDatabase>();
        params_.admin = "admin";
        ASSERT_TRUE(Reopen().ok());
    }
    
    /// Open a fresh engine over the same backing store
    Status Reopen() {
        engine_.reset();
        auto database = std::make_unique<test::FailingDatabase>(backing_);
        db_ = database.get();
        return GovernanceEngine::Open(params_, clock_, std::move(database), &engine_);
    }
    
    void RegisterAB() {
        ASSERT_TRUE(engine_->RegisterAgent("admin", "A", "neutral", 2, "pkA").ok());
        ASSERT_TRUE(engine_->RegisterAgent("admin", "B", "strict", 1, "pkB").ok());
    }
    
    ProposalId Create(const AgentId& proposer = "A",
                      const std::string& type = PROPOSAL_TRUST_UPDATE) {
        ProposalId id = 0;
        Status s = engine_->CreateProposal(proposer, type, "QmContent", &id);
        EXPECT_TRUE(s.ok()) << s.ToString();
        return id;
    }
    
    /// Move the clock to the first instant execution is allowed
    void AdvanceToExecutable(ProposalId id) {
        clock_->Set(engine_->GetProposal(id).ExecutableAt());
    }
    
    std::shared_ptr<util::MockClock> clock_;
    std::shared_ptr<db::MemoryDatabase> backing_;
    test::FailingDatabase* db_{nullptr};
    GovernanceParams params_;
    std::unique_ptr<GovernanceEngine> engine_;
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(GovernanceEngineTest, OpenValidatesArguments) {
    std::unique_ptr<GovernanceEngine> engine;
    
    GovernanceParams noAdmin;
    EXPECT_EQ(GovernanceEngine::Open(noAdmin, clock_, std::make_unique<db::MemoryDatabase>(),
                                     &engine).code(), Status::INVALID_ARGUMENT);
    EXPECT_EQ(GovernanceEngine::Open(params_, nullptr, std::make_unique<db::MemoryDatabase>(),
                                     &engine).code(), Status::INVALID_ARGUMENT);
    EXPECT_EQ(GovernanceEngine::Open(params_, clock_, nullptr, &engine).code(),
              Status::INVALID_ARGUMENT);
    EXPECT_EQ(engine, nullptr);
}

TEST_F(GovernanceEngineTest, OpenWritesSchemaVersion) {
    EXPECT_TRUE(backing_->Exists(LedgerStore::MetaKey("version")));
    EXPECT_EQ(engine_->GetParams().admin, "admin");
    EXPECT_EQ(engine_->Now(), START);
}

TEST_F(GovernanceEngineTest, OpenFailsOnUnreadableLedger) {
    engine_.reset();
    auto database = std::make_unique<test::FailingDatabase>(backing_);
    database->FailReads(true);
    std::unique_ptr<GovernanceEngine> engine;
    EXPECT_EQ(GovernanceEngine::Open(params_, clock_, std::move(database), &engine).code(),
              Status::STORAGE_ERROR);
    EXPECT_EQ(engine, nullptr);
}

// ============================================================================
// Agent Registry
// ============================================================================

TEST_F(GovernanceEngineTest, RegisterAgentAdminOnly) {
    EXPECT_EQ(engine_->RegisterAgent("mallory", "X", "neutral", 1, "").code(),
              Status::UNAUTHORIZED);
    EXPECT_FALSE(engine_->FindAgent("X").has_value());
    
    ASSERT_TRUE(engine_->RegisterAgent("admin", "X", "watchdog", 4, "pkX").ok());
    Agent agent = engine_->GetAgent("X");
    EXPECT_EQ(agent.agentType, "watchdog");
    EXPECT_EQ(agent.votingPower, 4u);
    EXPECT_TRUE(agent.active);
    EXPECT_EQ(agent.registeredAt, START);
}

TEST_F(GovernanceEngineTest, RegisterAgentValidation) {
    EXPECT_EQ(engine_->RegisterAgent("admin", "", "neutral", 1, "").code(),
              Status::INVALID_ARGUMENT);
    EXPECT_EQ(engine_->RegisterAgent("admin", "Z", "neutral", 0, "").code(),
              Status::INVALID_ARGUMENT);
    
    ASSERT_TRUE(engine_->RegisterAgent("admin", "Z", "neutral", 1, "").ok());
    EXPECT_EQ(engine_->RegisterAgent("admin", "Z", "neutral", 3, "").code(),
              Status::ALREADY_EXISTS);
    EXPECT_EQ(engine_->GetAgent("Z").votingPower, 1u);
}

TEST_F(GovernanceEngineTest, GetAgentUnknownIsZeroValued) {
    Agent agent = engine_->GetAgent("ghost");
    EXPECT_TRUE(agent.IsNull());
    EXPECT_EQ(agent.votingPower, 0u);
    EXPECT_FALSE(agent.active);
    EXPECT_FALSE(engine_->FindAgent("ghost").has_value());
    EXPECT_FALSE(engine_->IsActiveAgent("ghost"));
}

TEST_F(GovernanceEngineTest, DeactivateAgent) {
    RegisterAB();
    
    EXPECT_EQ(engine_->DeactivateAgent("A", "B").code(), Status::UNAUTHORIZED);
    EXPECT_EQ(engine_->DeactivateAgent("admin", "ghost").code(), Status::NOT_FOUND);
    
    ASSERT_TRUE(engine_->DeactivateAgent("admin", "B").ok());
    EXPECT_FALSE(engine_->IsActiveAgent("B"));
    EXPECT_EQ(engine_->DeactivateAgent("admin", "B").code(), Status::INVALID_STATE);
    
    // Deactivated agents lose their privileges
    ProposalId id = 0;
    EXPECT_EQ(engine_->CreateProposal("B", PROPOSAL_TRUST_UPDATE, "h", &id).code(),
              Status::UNAUTHORIZED);
    
    EXPECT_EQ(engine_->ListAgents().size(), 2u);
    EXPECT_EQ(engine_->ListAgents(true).size(), 1u);
    EXPECT_EQ(engine_->GetActiveVotingPower(), 2u);
}

TEST_F(GovernanceEngineTest, ReRegisterReactivates) {
    RegisterAB();
    ASSERT_TRUE(engine_->DeactivateAgent("admin", "B").ok());
    ASSERT_TRUE(engine_->RegisterAgent("admin", "B", "permissive", 5, "pkB2").ok());
    
    Agent b = engine_->GetAgent("B");
    EXPECT_TRUE(b.active);
    EXPECT_EQ(b.votingPower, 5u);
    EXPECT_EQ(b.agentType, "permissive");
}

// ============================================================================
// Proposals
// ============================================================================

TEST_F(GovernanceEngineTest, CreateProposalRequiresActiveAgent) {
    RegisterAB();
    ProposalId id = 0;
    EXPECT_EQ(engine_->CreateProposal("outsider", PROPOSAL_TRUST_UPDATE, "h", &id).code(),
              Status::UNAUTHORIZED);
    EXPECT_EQ(engine_->CreateProposal("admin", PROPOSAL_TRUST_UPDATE, "h", &id).code(),
              Status::UNAUTHORIZED);
    EXPECT_EQ(engine_->GetProposalCount(), 0u);
}

TEST_F(GovernanceEngineTest, CreateProposalAssignsSequentialIds) {
    RegisterAB();
    ProposalId first = Create("A");
    ProposalId second = Create("B", PROPOSAL_SYSTEM_UPGRADE);
    EXPECT_EQ(first, 1u);
    EXPECT_EQ(second, 2u);
    
    Proposal p = engine_->GetProposal(first);
    EXPECT_EQ(p.proposer, "A");
    EXPECT_EQ(p.contentHash, "QmContent");
    EXPECT_EQ(p.votingStart, START);
    EXPECT_EQ(p.votingEnd, START + DEFAULT_VOTING_PERIOD);
    EXPECT_EQ(p.executionDelay, DEFAULT_EXECUTION_DELAY);
    EXPECT_EQ(p.yesVotes, 0u);
    EXPECT_FALSE(p.executed);
    
    auto all = engine_->ListProposals();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[1].proposalType, PROPOSAL_SYSTEM_UPGRADE);
}

TEST_F(GovernanceEngineTest, GetProposalUnknownIsZeroValued) {
    EXPECT_TRUE(engine_->GetProposal(99).IsNull());
    EXPECT_FALSE(engine_->FindProposal(99).has_value());
    
    ProposalStatus status;
    EXPECT_EQ(engine_->GetProposalStatus(99, &status).code(), Status::NOT_FOUND);
    EXPECT_TRUE(engine_->GetVotes(99).empty());
}

TEST_F(GovernanceEngineTest, VoteTalliesWeightedPower) {
    RegisterAB();
    ProposalId id = Create();
    
    ASSERT_TRUE(engine_->Vote("A", id, true).ok());
    ASSERT_TRUE(engine_->Vote("B", id, false).ok());
    
    Proposal p = engine_->GetProposal(id);
    EXPECT_EQ(p.yesVotes, 2u);
    EXPECT_EQ(p.noVotes, 1u);
    
    VoteRecord vote;
    ASSERT_TRUE(engine_->GetVote(id, "A", &vote).ok());
    EXPECT_TRUE(vote.hasVoted);
    EXPECT_TRUE(vote.support);
    EXPECT_EQ(vote.weight, 2u);
    EXPECT_EQ(vote.castAt, START);
    
    // Tallies equal the sum of recorded weights
    VotingPower yes = 0;
    VotingPower no = 0;
    for (const auto& entry : engine_->GetVotes(id)) {
        (entry.second.support ? yes : no) += entry.second.weight;
    }
    EXPECT_EQ(yes, p.yesVotes);
    EXPECT_EQ(no, p.noVotes);
}

TEST_F(GovernanceEngineTest, VoteExactlyOnce) {
    RegisterAB();
    ProposalId id = Create();
    
    ASSERT_TRUE(engine_->Vote("A", id, true).ok());
    EXPECT_EQ(engine_->Vote("A", id, true).code(), Status::ALREADY_VOTED);
    EXPECT_EQ(engine_->Vote("A", id, false).code(), Status::ALREADY_VOTED);
    
    Proposal p = engine_->GetProposal(id);
    EXPECT_EQ(p.yesVotes, 2u);
    EXPECT_EQ(p.noVotes, 0u);
    EXPECT_TRUE(engine_->HasVoted(id, "A"));
    EXPECT_FALSE(engine_->HasVoted(id, "B"));
}

TEST_F(GovernanceEngineTest, VoteRejections) {
    RegisterAB();
    ProposalId id = Create();
    
    EXPECT_EQ(engine_->Vote("outsider", id, true).code(), Status::UNAUTHORIZED);
    EXPECT_EQ(engine_->Vote("A", 42, true).code(), Status::NOT_FOUND);
    
    VoteRecord vote;
    EXPECT_EQ(engine_->GetVote(42, "A", &vote).code(), Status::NOT_FOUND);
    EXPECT_EQ(engine_->GetVote(id, "A", &vote).code(), Status::NEVER_VOTED);
}

TEST_F(GovernanceEngineTest, VotingWindowBoundaries) {
    RegisterAB();
    ASSERT_TRUE(engine_->RegisterAgent("admin", "C", "neutral", 1, "").ok());
    ProposalId id = Create();
    Proposal p = engine_->GetProposal(id);
    
    // Before the window (clock moved backwards)
    clock_->Set(p.votingStart - 1);
    EXPECT_EQ(engine_->Vote("A", id, true).code(), Status::INVALID_STATE);
    
    // Last instant of the window is inside
    clock_->Set(p.votingEnd);
    EXPECT_TRUE(engine_->Vote("A", id, true).ok());
    
    clock_->Set(p.votingEnd + 1);
    EXPECT_EQ(engine_->Vote("B", id, true).code(), Status::INVALID_STATE);
    EXPECT_FALSE(engine_->HasVoted(id, "B"));
}

TEST_F(GovernanceEngineTest, WeightIsCapturedAtVoteTime) {
    RegisterAB();
    ProposalId id = Create();
    ASSERT_TRUE(engine_->Vote("B", id, true).ok());
    
    // Deactivation does not rewrite the tally, nor does re-registration
    ASSERT_TRUE(engine_->DeactivateAgent("admin", "B").ok());
    EXPECT_EQ(engine_->GetProposal(id).yesVotes, 1u);
    ASSERT_TRUE(engine_->RegisterAgent("admin", "B", "strict", 10, "").ok());
    EXPECT_EQ(engine_->GetProposal(id).yesVotes, 1u);
    
    VoteRecord vote;
    ASSERT_TRUE(engine_->GetVote(id, "B", &vote).ok());
    EXPECT_EQ(vote.weight, 1u);
    EXPECT_EQ(engine_->Vote("B", id, false).code(), Status::ALREADY_VOTED);
}

TEST_F(GovernanceEngineTest, OversizedVotingPowerRejected) {
    EXPECT_EQ(engine_->RegisterAgent("admin", "A", "neutral",
                                     std::numeric_limits<VotingPower>::max(), "").code(),
              Status::INVALID_ARGUMENT);
    EXPECT_FALSE(engine_->FindAgent("A").has_value());
    
    ASSERT_TRUE(engine_->RegisterAgent("admin", "A", "neutral", MAX_VOTING_POWER, "").ok());
    ASSERT_TRUE(engine_->RegisterAgent("admin", "B", "neutral", MAX_VOTING_POWER, "").ok());
    ProposalId id = Create();
    ASSERT_TRUE(engine_->Vote("A", id, true).ok());
    ASSERT_TRUE(engine_->Vote("B", id, true).ok());
    
    // Tally is the exact sum and never wraps
    Proposal p = engine_->GetProposal(id);
    EXPECT_EQ(p.yesVotes, 2 * MAX_VOTING_POWER);
    EXPECT_GE(p.yesVotes, MAX_VOTING_POWER);
    EXPECT_EQ(engine_->GetActiveVotingPower(), 2 * MAX_VOTING_POWER);
}

TEST_F(GovernanceEngineTest, LongPeriodsStayOrdered) {
    params_.votingPeriod = MAX_GOVERNANCE_PERIOD;
    params_.executionDelay = MAX_GOVERNANCE_PERIOD;
    ASSERT_TRUE(Reopen().ok());
    RegisterAB();
    
    ProposalId id = Create();
    Proposal p = engine_->GetProposal(id);
    EXPECT_LE(p.votingStart, p.votingEnd);
    EXPECT_EQ(p.votingEnd, START + MAX_GOVERNANCE_PERIOD);
    EXPECT_GT(p.ExecutableAt(), p.votingEnd);
    
    clock_->Advance(util::SECONDS_PER_DAY);
    EXPECT_TRUE(engine_->Vote("A", id, true).ok());
}

TEST_F(GovernanceEngineTest, UnboundedPeriodRejectedAtOpen) {
    params_.votingPeriod = std::numeric_limits<int64_t>::max();
    EXPECT_EQ(Reopen().code(), Status::INVALID_ARGUMENT);
    EXPECT_EQ(engine_, nullptr);
}

// ============================================================================
// Execution
// ============================================================================

TEST_F(GovernanceEngineTest, TrustUpdateScenario) {
    RegisterAB();
    ProposalId id = Create("A", PROPOSAL_TRUST_UPDATE);
    ASSERT_TRUE(engine_->Vote("A", id, true).ok());
    ASSERT_TRUE(engine_->Vote("B", id, false).ok());
    
    Proposal p = engine_->GetProposal(id);
    EXPECT_EQ(p.yesVotes, 2u);
    EXPECT_EQ(p.noVotes, 1u);
    
    clock_->Set(START + 26 * util::SECONDS_PER_HOUR);
    
    bool success = false;
    ASSERT_TRUE(engine_->ExecuteProposal("anyone", id, &success).ok());
    EXPECT_TRUE(success);
    EXPECT_TRUE(engine_->GetProposal(id).executed);
    
    ProposalStatus status;
    ASSERT_TRUE(engine_->GetProposalStatus(id, &status).ok());
    EXPECT_EQ(status, ProposalStatus::Executed);
    
    EXPECT_EQ(engine_->ExecuteProposal("anyone", id, &success).code(), Status::INVALID_STATE);
    EXPECT_EQ(engine_->Vote("A", id, true).code(), Status::INVALID_STATE);
}

TEST_F(GovernanceEngineTest, ReExecutionEmitsNothing) {
    RegisterAB();
    ProposalId id = Create();
    ASSERT_TRUE(engine_->Vote("A", id, true).ok());
    ASSERT_TRUE(engine_->Vote("B", id, false).ok());
    AdvanceToExecutable(id);
    
    int executedEvents = 0;
    engine_->Subscribe([&executedEvents](const GovernanceEvent& e) {
        if (e.As<ProposalExecuted>()) {
            ++executedEvents;
        }
    });
    
    bool success = false;
    ASSERT_TRUE(engine_->ExecuteProposal("x", id, &success).ok());
    EXPECT_EQ(executedEvents, 1);
    
    clock_->Advance(util::SECONDS_PER_DAY);
    EXPECT_EQ(engine_->ExecuteProposal("x", id, &success).code(), Status::INVALID_STATE);
    EXPECT_EQ(engine_->ExecuteProposal("y", id, &success).code(), Status::INVALID_STATE);
    EXPECT_EQ(executedEvents, 1);
    
    Proposal p = engine_->GetProposal(id);
    EXPECT_TRUE(p.executed);
    EXPECT_EQ(p.yesVotes, 2u);
    EXPECT_EQ(p.noVotes, 1u);
}

TEST_F(GovernanceEngineTest, ExecutionTiming) {
    RegisterAB();
    ProposalId id = Create();
    ASSERT_TRUE(engine_->Vote("A", id, true).ok());
    ASSERT_TRUE(engine_->Vote("B", id, true).ok());
    Proposal p = engine_->GetProposal(id);
    bool success = false;
    
    EXPECT_EQ(engine_->ExecuteProposal("x", id, &success).code(), Status::INVALID_STATE);
    
    clock_->Set(p.votingEnd);
    EXPECT_EQ(engine_->ExecuteProposal("x", id, &success).code(), Status::INVALID_STATE);
    
    clock_->Set(p.votingEnd + 1);
    EXPECT_EQ(engine_->ExecuteProposal("x", id, &success).code(), Status::INVALID_STATE);
    
    clock_->Set(p.ExecutableAt() - 1);
    EXPECT_EQ(engine_->ExecuteProposal("x", id, &success).code(), Status::INVALID_STATE);
    EXPECT_FALSE(engine_->GetProposal(id).executed);
    
    clock_->Set(p.ExecutableAt());
    EXPECT_TRUE(engine_->ExecuteProposal("x", id, &success).ok());
}

TEST_F(GovernanceEngineTest, ExecuteUnknownProposal) {
    bool success = true;
    EXPECT_EQ(engine_->ExecuteProposal("x", 7, &success).code(), Status::NOT_FOUND);
}

TEST_F(GovernanceEngineTest, QuorumNotMet) {
    RegisterAB();
    ProposalId id = Create();
    ASSERT_TRUE(engine_->Vote("A", id, true).ok());
    AdvanceToExecutable(id);
    
    ProposalStatus status;
    ASSERT_TRUE(engine_->GetProposalStatus(id, &status).ok());
    EXPECT_EQ(status, ProposalStatus::Failed);
    
    bool success = true;
    EXPECT_EQ(engine_->ExecuteProposal("x", id, &success).code(), Status::QUORUM_NOT_MET);
    EXPECT_FALSE(engine_->GetProposal(id).executed);
}

TEST_F(GovernanceEngineTest, TieIsRejected) {
    RegisterAB();
    ASSERT_TRUE(engine_->RegisterAgent("admin", "C", "neutral", 1, "").ok());
    ProposalId id = Create();
    ASSERT_TRUE(engine_->Vote("A", id, true).ok());   // yes 2
    ASSERT_TRUE(engine_->Vote("B", id, false).ok());  // no 1
    ASSERT_TRUE(engine_->Vote("C", id, false).ok());  // no 2
    AdvanceToExecutable(id);
    
    bool success = true;
    EXPECT_EQ(engine_->ExecuteProposal("x", id, &success).code(),
              Status::PROPOSAL_REJECTED);
}

TEST_F(GovernanceEngineTest, UnknownTypeExecutesWithoutEffect) {
    RegisterAB();
    ProposalId id = Create("A", "PARAMETER_CHANGE");
    ASSERT_TRUE(engine_->Vote("A", id, true).ok());
    ASSERT_TRUE(engine_->Vote("B", id, true).ok());
    AdvanceToExecutable(id);
    
    bool success = true;
    ASSERT_TRUE(engine_->ExecuteProposal("x", id, &success).ok());
    EXPECT_FALSE(success);
    EXPECT_TRUE(engine_->GetProposal(id).executed);
}

TEST_F(GovernanceEngineTest, CustomHandlerReceivesProposal) {
    RegisterAB();
    ProposalId seen = 0;
    Proposal fromHandler;
    engine_->GetHandlers().Register("PARAMETER_CHANGE", [&](const Proposal& p) {
        seen = p.id;
        // The engine is unlocked while handlers run
        fromHandler = engine_->GetProposal(p.id);
        return true;
    });
    
    ProposalId id = Create("A", "PARAMETER_CHANGE");
    ASSERT_TRUE(engine_->Vote("A", id, true).ok());
    ASSERT_TRUE(engine_->Vote("B", id, true).ok());
    AdvanceToExecutable(id);
    
    bool success = false;
    ASSERT_TRUE(engine_->ExecuteProposal("x", id, &success).ok());
    EXPECT_TRUE(success);
    EXPECT_EQ(seen, id);
    EXPECT_TRUE(fromHandler.executed);
}

TEST_F(GovernanceEngineTest, ThrowingHandlerReportsFailure) {
    RegisterAB();
    engine_->GetHandlers().Register(PROPOSAL_EMERGENCY_OVERRIDE, [](const Proposal&) -> bool {
        throw std::runtime_error("override failed");
    });
    
    ProposalId id = Create("A", PROPOSAL_EMERGENCY_OVERRIDE);
    ASSERT_TRUE(engine_->Vote("A", id, true).ok());
    ASSERT_TRUE(engine_->Vote("B", id, true).ok());
    AdvanceToExecutable(id);
    
    bool success = true;
    ASSERT_TRUE(engine_->ExecuteProposal("x", id, &success).ok());
    EXPECT_FALSE(success);
    EXPECT_TRUE(engine_->GetProposal(id).executed);
    EXPECT_EQ(engine_->ExecuteProposal("x", id, &success).code(), Status::INVALID_STATE);
}

// ============================================================================
// Cancellation
// ============================================================================

TEST_F(GovernanceEngineTest, CancelProposal) {
    RegisterAB();
    ProposalId id = Create();
    ASSERT_TRUE(engine_->Vote("A", id, true).ok());
    
    EXPECT_EQ(engine_->CancelProposal("A", id).code(), Status::UNAUTHORIZED);
    EXPECT_EQ(engine_->CancelProposal("admin", 99).code(), Status::NOT_FOUND);
    ASSERT_TRUE(engine_->CancelProposal("admin", id).ok());
    
    Proposal p = engine_->GetProposal(id);
    EXPECT_TRUE(p.cancelled);
    EXPECT_EQ(p.yesVotes, 2u);
    
    EXPECT_EQ(engine_->CancelProposal("admin", id).code(), Status::INVALID_STATE);
    EXPECT_EQ(engine_->Vote("B", id, false).code(), Status::INVALID_STATE);
    
    AdvanceToExecutable(id);
    bool success = true;
    EXPECT_EQ(engine_->ExecuteProposal("x", id, &success).code(), Status::INVALID_STATE);
    
    ProposalStatus status;
    ASSERT_TRUE(engine_->GetProposalStatus(id, &status).ok());
    EXPECT_EQ(status, ProposalStatus::Cancelled);
}

TEST_F(GovernanceEngineTest, CannotCancelExecuted) {
    RegisterAB();
    ProposalId id = Create();
    ASSERT_TRUE(engine_->Vote("A", id, true).ok());
    ASSERT_TRUE(engine_->Vote("B", id, true).ok());
    AdvanceToExecutable(id);
    bool success = false;
    ASSERT_TRUE(engine_->ExecuteProposal("x", id, &success).ok());
    
    EXPECT_EQ(engine_->CancelProposal("admin", id).code(), Status::INVALID_STATE);
}

// ============================================================================
// Pause
// ============================================================================

TEST_F(GovernanceEngineTest, PauseBlocksMutations) {
    RegisterAB();
    ProposalId id = Create();
    
    EXPECT_EQ(engine_->Pause("A").code(), Status::UNAUTHORIZED);
    ASSERT_TRUE(engine_->Pause("admin").ok());
    EXPECT_TRUE(engine_->IsPaused());
    EXPECT_EQ(engine_->Pause("admin").code(), Status::INVALID_STATE);
    
    ProposalId newId = 0;
    bool success = false;
    DecisionSubmission submission;
    submission.requestId = "req-p";
    
    EXPECT_EQ(engine_->RegisterAgent("admin", "C", "neutral", 1, "").code(),
              Status::SYSTEM_PAUSED);
    EXPECT_EQ(engine_->CreateProposal("A", PROPOSAL_TRUST_UPDATE, "h", &newId).code(),
              Status::SYSTEM_PAUSED);
    EXPECT_EQ(engine_->Vote("A", id, true).code(), Status::SYSTEM_PAUSED);
    EXPECT_EQ(engine_->ExecuteProposal("x", id, &success).code(), Status::SYSTEM_PAUSED);
    EXPECT_EQ(engine_->CancelProposal("admin", id).code(), Status::SYSTEM_PAUSED);
    EXPECT_EQ(engine_->RecordDecision("A", submission).code(), Status::SYSTEM_PAUSED);
    
    // Reads stay available and deactivation is still allowed
    EXPECT_EQ(engine_->GetProposal(id).id, id);
    EXPECT_FALSE(engine_->VerifyDecision("req-p").isValid);
    EXPECT_TRUE(engine_->DeactivateAgent("admin", "B").ok());
    
    EXPECT_EQ(engine_->Unpause("A").code(), Status::UNAUTHORIZED);
    ASSERT_TRUE(engine_->Unpause("admin").ok());
    EXPECT_FALSE(engine_->IsPaused());
    EXPECT_EQ(engine_->Unpause("admin").code(), Status::INVALID_STATE);
    EXPECT_TRUE(engine_->Vote("A", id, true).ok());
}

TEST_F(GovernanceEngineTest, AuthorizationCheckedBeforePause) {
    RegisterAB();
    ASSERT_TRUE(engine_->Pause("admin").ok());
    EXPECT_EQ(engine_->RegisterAgent("A", "C", "neutral", 1, "").code(), Status::UNAUTHORIZED);
    EXPECT_EQ(engine_->Vote("outsider", 1, true).code(), Status::UNAUTHORIZED);
}

// ============================================================================
// Consensus Decisions
// ============================================================================

TEST_F(GovernanceEngineTest, RecordDecisionScenario) {
    RegisterAB();
    DecisionSubmission submission;
    submission.requestId = "req-1";
    submission.decisionType = "content_moderation";
    submission.finalDecision = "APPROVED";
    submission.confidence = 0.95;
    submission.participatingAgents = {"A", "B"};
    submission.proofHash = "0xabc";
    
    ASSERT_TRUE(engine_->RecordDecision("A", submission).ok());
    
    DecisionVerification v = engine_->VerifyDecision("req-1");
    EXPECT_TRUE(v.isValid);
    EXPECT_EQ(v.decision, "APPROVED");
    EXPECT_DOUBLE_EQ(v.confidence, 0.95);
    
    // A second submission with the same id is rejected and changes nothing
    DecisionSubmission again = submission;
    again.finalDecision = "REJECTED";
    again.confidence = 0.2;
    clock_->Advance(60);
    EXPECT_EQ(engine_->RecordDecision("B", again).code(), Status::ALREADY_RECORDED);
    
    v = engine_->VerifyDecision("req-1");
    EXPECT_EQ(v.decision, "APPROVED");
    EXPECT_DOUBLE_EQ(v.confidence, 0.95);
    
    auto stored = engine_->GetDecision("req-1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->submitter, "A");
    EXPECT_EQ(stored->timestamp, START);
    EXPECT_EQ(engine_->GetDecisionCount(), 1u);
}

TEST_F(GovernanceEngineTest, VerifyUnknownDecision) {
    DecisionVerification v = engine_->VerifyDecision("unknown-id");
    EXPECT_FALSE(v.isValid);
    EXPECT_EQ(v.decision, "");
    EXPECT_EQ(v.confidence, 0.0);
    EXPECT_FALSE(engine_->GetDecision("unknown-id").has_value());
}

TEST_F(GovernanceEngineTest, RecordDecisionRequiresActiveAgent) {
    RegisterAB();
    DecisionSubmission submission;
    submission.requestId = "req-2";
    EXPECT_EQ(engine_->RecordDecision("admin", submission).code(), Status::UNAUTHORIZED);
    
    submission.requestId = "";
    EXPECT_EQ(engine_->RecordDecision("A", submission).code(), Status::INVALID_ARGUMENT);
    EXPECT_EQ(engine_->GetDecisionCount(), 0u);
}

// ============================================================================
// Events
// ============================================================================

TEST_F(GovernanceEngineTest, EventsAreDeliveredInOrder) {
    std::vector<GovernanceEvent> events;
    SubscriptionId sub = engine_->Subscribe(
        [&events](const GovernanceEvent& e) { events.push_back(e); });
    
    RegisterAB();
    ProposalId id = Create();
    ASSERT_TRUE(engine_->Vote("A", id, true).ok());
    ASSERT_TRUE(engine_->Vote("B", id, true).ok());
    AdvanceToExecutable(id);
    bool success = false;
    ASSERT_TRUE(engine_->ExecuteProposal("x", id, &success).ok());
    
    // Rejected calls emit nothing
    EXPECT_EQ(engine_->Vote("A", id, true).code(), Status::INVALID_STATE);
    
    ASSERT_EQ(events.size(), 6u);
    EXPECT_STREQ(events[0].Name(), "AgentRegistered");
    EXPECT_STREQ(events[2].Name(), "ProposalCreated");
    EXPECT_STREQ(events[3].Name(), "VoteCast");
    EXPECT_STREQ(events[5].Name(), "ProposalExecuted");
    for (size_t i = 1; i < events.size(); ++i) {
        EXPECT_GT(events[i].sequence, events[i - 1].sequence);
    }
    
    const auto* created = events[2].As<ProposalCreated>();
    ASSERT_NE(created, nullptr);
    EXPECT_EQ(created->proposalId, id);
    EXPECT_EQ(created->votingEnd, START + DEFAULT_VOTING_PERIOD);
    
    const auto* vote = events[3].As<VoteCast>();
    ASSERT_NE(vote, nullptr);
    EXPECT_EQ(vote->weight, 2u);
    
    const auto* executed = events[5].As<ProposalExecuted>();
    ASSERT_NE(executed, nullptr);
    EXPECT_TRUE(executed->success);
    
    EXPECT_TRUE(engine_->Unsubscribe(sub));
    EXPECT_FALSE(engine_->Unsubscribe(sub));
    ASSERT_TRUE(engine_->Pause("admin").ok());
    EXPECT_EQ(events.size(), 6u);
}

TEST_F(GovernanceEngineTest, ListenerFailureDoesNotAffectOperation) {
    std::vector<std::string> logged;
    auto sink = std::make_shared<util::CallbackSink>(
        [&logged](const util::LogEntry& e) { logged.push_back(e.message); },
        util::LogLevel::Error);
    util::Logger::Instance().AddSink(sink);
    
    engine_->Subscribe([](const GovernanceEvent&) {
        throw std::runtime_error("listener broke");
    });
    int delivered = 0;
    engine_->Subscribe([&delivered](const GovernanceEvent&) { ++delivered; });
    
    EXPECT_TRUE(engine_->RegisterAgent("admin", "A", "neutral", 1, "").ok());
    EXPECT_TRUE(engine_->IsActiveAgent("A"));
    EXPECT_EQ(delivered, 1);
    
    util::Logger::Instance().RemoveSink(sink);
    ASSERT_FALSE(logged.empty());
    EXPECT_NE(logged.back().find("listener broke"), std::string::npos);
}

TEST_F(GovernanceEngineTest, ListenerMayReadEngine) {
    size_t seenAgents = 0;
    engine_->Subscribe([this, &seenAgents](const GovernanceEvent& e) {
        if (e.As<AgentRegistered>()) {
            seenAgents = engine_->ListAgents().size();
        }
    });
    RegisterAB();
    EXPECT_EQ(seenAgents, 2u);
}

// ============================================================================
// Persistence
// ============================================================================

TEST_F(GovernanceEngineTest, StateSurvivesReopen) {
    RegisterAB();
    ProposalId first = Create();
    ASSERT_TRUE(engine_->Vote("A", first, true).ok());
    ASSERT_TRUE(engine_->Vote("B", first, false).ok());
    ProposalId second = Create("B");
    ASSERT_TRUE(engine_->CancelProposal("admin", second).ok());
    
    DecisionSubmission submission;
    submission.requestId = "req-1";
    submission.finalDecision = "APPROVED";
    submission.confidence = 0.95;
    ASSERT_TRUE(engine_->RecordDecision("A", submission).ok());
    ASSERT_TRUE(engine_->DeactivateAgent("admin", "B").ok());
    ASSERT_TRUE(engine_->Pause("admin").ok());
    
    ASSERT_TRUE(Reopen().ok());
    
    EXPECT_TRUE(engine_->IsPaused());
    EXPECT_TRUE(engine_->IsActiveAgent("A"));
    EXPECT_FALSE(engine_->IsActiveAgent("B"));
    EXPECT_EQ(engine_->GetAgent("B").votingPower, 1u);
    
    Proposal p = engine_->GetProposal(first);
    EXPECT_EQ(p.yesVotes, 2u);
    EXPECT_EQ(p.noVotes, 1u);
    EXPECT_TRUE(engine_->HasVoted(first, "A"));
    EXPECT_TRUE(engine_->GetProposal(second).cancelled);
    EXPECT_TRUE(engine_->VerifyDecision("req-1").isValid);
    
    ASSERT_TRUE(engine_->Unpause("admin").ok());
    EXPECT_EQ(engine_->Vote("A", first, true).code(), Status::ALREADY_VOTED);
    EXPECT_EQ(Create("A"), 3u);
    EXPECT_EQ(engine_->RecordDecision("A", submission).code(), Status::ALREADY_RECORDED);
}

TEST_F(GovernanceEngineTest, ExecutedFlagSurvivesReopen) {
    RegisterAB();
    ProposalId id = Create();
    ASSERT_TRUE(engine_->Vote("A", id, true).ok());
    ASSERT_TRUE(engine_->Vote("B", id, true).ok());
    AdvanceToExecutable(id);
    bool success = false;
    ASSERT_TRUE(engine_->ExecuteProposal("x", id, &success).ok());
    
    ASSERT_TRUE(Reopen().ok());
    EXPECT_EQ(engine_->ExecuteProposal("x", id, &success).code(), Status::INVALID_STATE);
}

TEST_F(GovernanceEngineTest, CorruptedDecisionFailsOpen) {
    RegisterAB();
    DecisionSubmission submission;
    submission.requestId = "req-1";
    submission.finalDecision = "APPROVED";
    ASSERT_TRUE(engine_->RecordDecision("A", submission).ok());
    
    ConsensusDecision d = *engine_->GetDecision("req-1");
    d.finalDecision = "REJECTED";
    ASSERT_TRUE(backing_->Put(LedgerStore::DecisionKey("req-1"),
                              db::SerializeToString(d)).ok());
    
    EXPECT_EQ(Reopen().code(), Status::STORAGE_ERROR);
    EXPECT_EQ(engine_, nullptr);
}

// ============================================================================
// Storage Failures
// ============================================================================

TEST_F(GovernanceEngineTest, FailedWriteLeavesStateUnchanged) {
    RegisterAB();
    ProposalId id = Create();
    ASSERT_TRUE(engine_->Vote("A", id, true).ok());
    
    std::vector<GovernanceEvent> events;
    engine_->Subscribe([&events](const GovernanceEvent& e) { events.push_back(e); });
    
    db_->FailWrites(true);
    
    Status s = engine_->RegisterAgent("admin", "C", "neutral", 1, "");
    EXPECT_EQ(s.code(), Status::STORAGE_ERROR);
    EXPECT_TRUE(s.IsInfrastructureError());
    EXPECT_FALSE(engine_->FindAgent("C").has_value());
    
    EXPECT_EQ(engine_->Vote("B", id, false).code(), Status::STORAGE_ERROR);
    EXPECT_FALSE(engine_->HasVoted(id, "B"));
    EXPECT_EQ(engine_->GetProposal(id).noVotes, 0u);
    
    ProposalId newId = 0;
    EXPECT_EQ(engine_->CreateProposal("A", "X", "h", &newId).code(), Status::STORAGE_ERROR);
    EXPECT_EQ(engine_->GetProposalCount(), 1u);
    
    DecisionSubmission submission;
    submission.requestId = "req-9";
    EXPECT_EQ(engine_->RecordDecision("A", submission).code(), Status::STORAGE_ERROR);
    EXPECT_FALSE(engine_->VerifyDecision("req-9").isValid);
    
    EXPECT_EQ(engine_->Pause("admin").code(), Status::STORAGE_ERROR);
    EXPECT_FALSE(engine_->IsPaused());
    EXPECT_EQ(engine_->DeactivateAgent("admin", "A").code(), Status::STORAGE_ERROR);
    EXPECT_TRUE(engine_->IsActiveAgent("A"));
    EXPECT_EQ(engine_->CancelProposal("admin", id).code(), Status::STORAGE_ERROR);
    EXPECT_FALSE(engine_->GetProposal(id).cancelled);
    EXPECT_TRUE(events.empty());
    
    // Recovery: the same calls succeed once the store works again
    db_->FailWrites(false);
    EXPECT_TRUE(engine_->Vote("B", id, false).ok());
    EXPECT_EQ(engine_->GetProposal(id).noVotes, 1u);
    ASSERT_TRUE(engine_->CreateProposal("A", "X", "h", &newId).ok());
    EXPECT_EQ(newId, 2u);
}

TEST_F(GovernanceEngineTest, FailedExecuteSkipsHandler) {
    RegisterAB();
    int calls = 0;
    engine_->GetHandlers().Register(PROPOSAL_TRUST_UPDATE, [&calls](const Proposal&) {
        ++calls;
        return true;
    });
    ProposalId id = Create();
    ASSERT_TRUE(engine_->Vote("A", id, true).ok());
    ASSERT_TRUE(engine_->Vote("B", id, true).ok());
    AdvanceToExecutable(id);
    
    db_->FailWrites(true);
    bool success = true;
    EXPECT_EQ(engine_->ExecuteProposal("x", id, &success).code(), Status::STORAGE_ERROR);
    EXPECT_FALSE(engine_->GetProposal(id).executed);
    EXPECT_EQ(calls, 0);
    
    db_->FailWrites(false);
    ASSERT_TRUE(engine_->ExecuteProposal("x", id, &success).ok());
    EXPECT_TRUE(success);
    EXPECT_EQ(calls, 1);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(GovernanceEngineTest, ConcurrentVotesAreAllCounted) {
    constexpr int AGENTS = 16;
    for (int i = 0; i < AGENTS; ++i) {
        ASSERT_TRUE(engine_->RegisterAgent("admin", "agent-" + std::to_string(i),
                                           "neutral", i + 1, "").ok());
    }
    ProposalId id = Create("agent-0");
    
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < AGENTS; ++i) {
        threads.emplace_back([this, i, id, &failures]() {
            AgentId agent = "agent-" + std::to_string(i);
            if (!engine_->Vote(agent, id, i % 2 == 0).ok()) {
                ++failures;
            }
            // Second attempt always loses
            if (engine_->Vote(agent, id, true).code() != Status::ALREADY_VOTED) {
                ++failures;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    
    EXPECT_EQ(failures.load(), 0);
    Proposal p = engine_->GetProposal(id);
    VotingPower yes = 0;
    VotingPower no = 0;
    for (int i = 0; i < AGENTS; ++i) {
        (i % 2 == 0 ? yes : no) += i + 1;
    }
    EXPECT_EQ(p.yesVotes, yes);
    EXPECT_EQ(p.noVotes, no);
    EXPECT_EQ(engine_->GetVotes(id).size(), static_cast<size_t>(AGENTS));
}

TEST_F(GovernanceEngineTest, ConcurrentProposalsGetUniqueIds) {
    RegisterAB();
    constexpr int PER_THREAD = 20;
    std::vector<std::vector<ProposalId>> ids(4);
    std::vector<std::thread> threads;
    for (size_t t = 0; t < ids.size(); ++t) {
        threads.emplace_back([this, t, &ids]() {
            for (int i = 0; i < PER_THREAD; ++i) {
                ProposalId id = 0;
                if (engine_->CreateProposal(t % 2 ? "A" : "B", "X", "h", &id).ok()) {
                    ids[t].push_back(id);
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    
    std::set<ProposalId> unique;
    for (const auto& list : ids) {
        unique.insert(list.begin(), list.end());
    }
    EXPECT_EQ(unique.size(), ids.size() * PER_THREAD);
    EXPECT_EQ(*unique.rbegin(), ids.size() * PER_THREAD);
}

// ============================================================================
// Summary
// ============================================================================

TEST_F(GovernanceEngineTest, Summary) {
    RegisterAB();
    ASSERT_TRUE(engine_->RegisterAgent("admin", "C", "neutral", 4, "").ok());
    ASSERT_TRUE(engine_->DeactivateAgent("admin", "C").ok());
    ProposalId executed = Create();
    ASSERT_TRUE(engine_->Vote("A", executed, true).ok());
    ASSERT_TRUE(engine_->Vote("B", executed, true).ok());
    AdvanceToExecutable(executed);
    bool success = false;
    ASSERT_TRUE(engine_->ExecuteProposal("x", executed, &success).ok());
    Create();
    
    GovernanceSummary summary = engine_->GetSummary();
    EXPECT_EQ(summary.totalAgents, 3u);
    EXPECT_EQ(summary.activeAgents, 2u);
    EXPECT_EQ(summary.activeVotingPower, 3u);
    EXPECT_EQ(summary.totalProposals, 2u);
    EXPECT_EQ(summary.votingProposals, 1u);
    EXPECT_EQ(summary.executedProposals, 1u);
    EXPECT_EQ(summary.decisions, 0u);
    EXPECT_FALSE(summary.paused);
}
