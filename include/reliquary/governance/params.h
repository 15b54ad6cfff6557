// RELIQUARY - Governance Parameters
// Copyright (c) 2024 RELIQUARY Developers
// MIT License

#ifndef RELIQUARY_GOVERNANCE_PARAMS_H
#define RELIQUARY_GOVERNANCE_PARAMS_H

#include "reliquary/core/types.h"
#include "reliquary/governance/status.h"

#include <cstdint>
#include <string>

namespace reliquary {

namespace util {
class ConfigManager;
}

namespace governance {

// ============================================================================
// Governance Constants
// ============================================================================

/// Voting window length (seconds) - 24 hours
constexpr int64_t DEFAULT_VOTING_PERIOD = 24 * 60 * 60;

/// Wait after voting closes before execution (seconds) - 2 hours
constexpr int64_t DEFAULT_EXECUTION_DELAY = 2 * 60 * 60;

/// Minimum summed voting power (yes + no) for execution
constexpr VotingPower DEFAULT_QUORUM_THRESHOLD = 3;

/// Upper bound on a single agent's voting power
constexpr VotingPower MAX_VOTING_POWER = 1000000000000ULL;

/// Upper bound on the voting period and the execution delay (100 years)
constexpr int64_t MAX_GOVERNANCE_PERIOD = 100LL * 365 * 24 * 60 * 60;

/// Recognised proposal types with built-in handlers
constexpr const char* PROPOSAL_SYSTEM_UPGRADE = "SYSTEM_UPGRADE";
constexpr const char* PROPOSAL_TRUST_UPDATE = "TRUST_UPDATE";
constexpr const char* PROPOSAL_EMERGENCY_OVERRIDE = "EMERGENCY_OVERRIDE";

// ============================================================================
// Parameters
// ============================================================================

/**
 * Fixed configuration of a governance engine. Set once at construction
 * and never changed afterwards.
 */
struct GovernanceParams {
    /// Administrative principal
    AgentId admin;
    
    int64_t votingPeriod{DEFAULT_VOTING_PERIOD};
    int64_t executionDelay{DEFAULT_EXECUTION_DELAY};
    VotingPower quorumThreshold{DEFAULT_QUORUM_THRESHOLD};
    
    /// INVALID_ARGUMENT for an empty admin, a period or delay outside
    /// [0, MAX_GOVERNANCE_PERIOD], or a zero quorum
    Status Validate() const;
    
    /**
     * Read the [governance] section of a configuration. Missing keys keep
     * their defaults; malformed numbers are INVALID_ARGUMENT. The result
     * is validated.
     */
    static Status FromConfig(const util::ConfigManager& config, GovernanceParams* out);
};

} // namespace governance
} // namespace reliquary

#endif // RELIQUARY_GOVERNANCE_PARAMS_H
