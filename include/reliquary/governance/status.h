// RELIQUARY - Governance Status
// Copyright (c) 2024 RELIQUARY Developers
// MIT License
//
// Typed result of every governance operation. All codes except
// STORAGE_ERROR are expected outcomes that callers handle; STORAGE_ERROR
// means the persistent ledger failed underneath the operation.

#ifndef RELIQUARY_GOVERNANCE_STATUS_H
#define RELIQUARY_GOVERNANCE_STATUS_H

#include <string>

namespace reliquary {
namespace governance {

class Status {
public:
    enum Code {
        OK = 0,
        UNAUTHORIZED,
        INVALID_ARGUMENT,
        ALREADY_EXISTS,
        ALREADY_RECORDED,
        ALREADY_VOTED,
        NOT_FOUND,
        NEVER_VOTED,
        INVALID_STATE,
        QUORUM_NOT_MET,
        PROPOSAL_REJECTED,
        SYSTEM_PAUSED,
        STORAGE_ERROR,
    };
    
private:
    Code code_;
    std::string message_;
    
public:
    Status() : code_(OK) {}
    Status(Code code, const std::string& msg = "") : code_(code), message_(msg) {}
    
    static Status Ok() { return Status(); }
    static Status Unauthorized(const std::string& msg = "") { return Status(UNAUTHORIZED, msg); }
    static Status InvalidArgument(const std::string& msg = "") { return Status(INVALID_ARGUMENT, msg); }
    static Status AlreadyExists(const std::string& msg = "") { return Status(ALREADY_EXISTS, msg); }
    static Status AlreadyRecorded(const std::string& msg = "") { return Status(ALREADY_RECORDED, msg); }
    static Status AlreadyVoted(const std::string& msg = "") { return Status(ALREADY_VOTED, msg); }
    static Status NotFound(const std::string& msg = "") { return Status(NOT_FOUND, msg); }
    static Status NeverVoted(const std::string& msg = "") { return Status(NEVER_VOTED, msg); }
    static Status InvalidState(const std::string& msg = "") { return Status(INVALID_STATE, msg); }
    static Status QuorumNotMet(const std::string& msg = "") { return Status(QUORUM_NOT_MET, msg); }
    static Status ProposalRejected(const std::string& msg = "") { return Status(PROPOSAL_REJECTED, msg); }
    static Status SystemPaused(const std::string& msg = "") { return Status(SYSTEM_PAUSED, msg); }
    static Status StorageError(const std::string& msg = "") { return Status(STORAGE_ERROR, msg); }
    
    bool ok() const { return code_ == OK; }
    
    /// True for failures of the persistent ledger rather than the request
    bool IsInfrastructureError() const { return code_ == STORAGE_ERROR; }
    
    Code code() const { return code_; }
    const std::string& message() const { return message_; }
    
    /// "Code: message", or "OK"
    std::string ToString() const;
    
    bool operator==(Code code) const { return code_ == code; }
    bool operator!=(Code code) const { return code_ != code; }
};

/// Short name of a code ("Unauthorized", "QuorumNotMet", ...)
const char* StatusCodeToString(Status::Code code);

} // namespace governance
} // namespace reliquary

#endif // RELIQUARY_GOVERNANCE_STATUS_H
