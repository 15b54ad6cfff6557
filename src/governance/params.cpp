// RELIQUARY - Governance Parameters Implementation
// Copyright (c) 2024 RELIQUARY Developers
// MIT License

#include "reliquary/governance/params.h"
#include "reliquary/util/config.h"
#include "reliquary/util/logging.h"

#include <string>

namespace reliquary {
namespace governance {

Status GovernanceParams::Validate() const {
    if (admin.empty()) {
        return Status::InvalidArgument("admin identity must be set");
    }
    if (votingPeriod < 0 || votingPeriod > MAX_GOVERNANCE_PERIOD) {
        return Status::InvalidArgument("voting period out of range: " +
                                       std::to_string(votingPeriod));
    }
    if (executionDelay < 0 || executionDelay > MAX_GOVERNANCE_PERIOD) {
        return Status::InvalidArgument("execution delay out of range: " +
                                       std::to_string(executionDelay));
    }
    if (quorumThreshold == 0) {
        return Status::InvalidArgument("quorum threshold must be positive");
    }
    return Status::Ok();
}

namespace {

bool ReadInt(const util::ConfigManager& config, const char* key, int64_t* out) {
    if (!config.HasKey(key, util::ConfigKeys::GOVERNANCE_SECTION)) {
        return true;
    }
    auto value = config.TryGetInt(key, util::ConfigKeys::GOVERNANCE_SECTION);
    if (!value) {
        return false;
    }
    *out = *value;
    return true;
}

} // namespace

Status GovernanceParams::FromConfig(const util::ConfigManager& config,
                                    GovernanceParams* out) {
    using util::ConfigKeys::GOVERNANCE_SECTION;
    
    GovernanceParams params;
    params.admin = config.GetString(util::ConfigKeys::ADMIN, "", GOVERNANCE_SECTION);
    
    if (!ReadInt(config, util::ConfigKeys::VOTINGPERIOD, &params.votingPeriod)) {
        return Status::InvalidArgument("governance.votingperiod is not an integer");
    }
    if (!ReadInt(config, util::ConfigKeys::EXECUTIONDELAY, &params.executionDelay)) {
        return Status::InvalidArgument("governance.executiondelay is not an integer");
    }
    
    int64_t quorum = static_cast<int64_t>(DEFAULT_QUORUM_THRESHOLD);
    if (!ReadInt(config, util::ConfigKeys::QUORUM, &quorum)) {
        return Status::InvalidArgument("governance.quorum is not an integer");
    }
    if (quorum <= 0) {
        return Status::InvalidArgument("quorum threshold must be positive");
    }
    params.quorumThreshold = static_cast<VotingPower>(quorum);
    
    Status s = params.Validate();
    if (!s.ok()) {
        return s;
    }
    
    LOG_DEBUG(util::LogCategory::CONFIG) << "Governance parameters: admin=" << params.admin
                                         << " votingperiod=" << params.votingPeriod
                                         << " executiondelay=" << params.executionDelay
                                         << " quorum=" << params.quorumThreshold;
    *out = params;
    return Status::Ok();
}

} // namespace governance
} // namespace reliquary
