// RELIQUARY - Governance Status Implementation
// Copyright (c) 2024 RELIQUARY Developers
// MIT License

#include "reliquary/governance/status.h"

namespace reliquary {
namespace governance {

const char* StatusCodeToString(Status::Code code) {
    switch (code) {
        case Status::OK:                return "OK";
        case Status::UNAUTHORIZED:      return "Unauthorized";
        case Status::INVALID_ARGUMENT:  return "InvalidArgument";
        case Status::ALREADY_EXISTS:    return "AlreadyExists";
        case Status::ALREADY_RECORDED:  return "AlreadyRecorded";
        case Status::ALREADY_VOTED:     return "AlreadyVoted";
        case Status::NOT_FOUND:         return "NotFound";
        case Status::NEVER_VOTED:       return "NeverVoted";
        case Status::INVALID_STATE:     return "InvalidState";
        case Status::QUORUM_NOT_MET:    return "QuorumNotMet";
        case Status::PROPOSAL_REJECTED: return "ProposalRejected";
        case Status::SYSTEM_PAUSED:     return "SystemPaused";
        case Status::STORAGE_ERROR:     return "StorageError";
    }
    return "Unknown";
}

std::string Status::ToString() const {
    if (ok()) {
        return "OK";
    }
    std::string result = StatusCodeToString(code_);
    if (!message_.empty()) {
        result += ": ";
        result += message_;
    }
    return result;
}

} // namespace governance
} // namespace reliquary
