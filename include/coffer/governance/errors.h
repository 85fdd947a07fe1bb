// COFFER - Governance Error Codes
// Copyright (c) 2024 COFFER Developers
// MIT License
//
// Every governance command reports success or exactly one of these codes.
// A failed command leaves pool state untouched.

#ifndef COFFER_GOVERNANCE_ERRORS_H
#define COFFER_GOVERNANCE_ERRORS_H

#include <coffer/core/types.h>

#include <string>

namespace coffer {
namespace governance {

/// Governance error codes
enum class GovernanceError {
    OK = 0,

    /// Caller is not a current member
    AUTHORIZATION,

    /// Record id out of range
    NOT_FOUND,

    /// Record already executed (terminal)
    ALREADY_EXECUTED,

    /// Voter already approved this record
    ALREADY_APPROVED,

    /// Revoke without a prior approval
    NOT_APPROVED,

    /// Member already present
    DUPLICATE_MEMBER,

    /// Member absent
    NOT_MEMBER,

    /// Quorum policy rejected execution
    QUORUM_NOT_MET,

    /// External effect reported failure
    EFFECT_DISPATCH_FAILED,

    /// Unsigned arithmetic would overflow
    ARITHMETIC_OVERFLOW,

    /// Construction-time configuration rejected
    INVALID_CONFIG,
};

/// Convert error to string
const char* GovernanceErrorToString(GovernanceError err);

// ============================================================================
// Results
// ============================================================================

/**
 * Outcome of a governance command.
 */
struct OpResult {
    GovernanceError error{GovernanceError::OK};
    std::string message;

    static OpResult Success() {
        return OpResult{};
    }

    static OpResult Failure(GovernanceError err, const std::string& msg = "") {
        OpResult r;
        r.error = err;
        r.message = msg.empty() ? GovernanceErrorToString(err) : msg;
        return r;
    }

    bool IsOk() const { return error == GovernanceError::OK; }
    explicit operator bool() const { return IsOk(); }
};

/**
 * Outcome of a submit command: the new record's id on success.
 */
struct SubmitResult {
    GovernanceError error{GovernanceError::OK};
    std::string message;
    RecordId id{0};

    static SubmitResult Success(RecordId newId) {
        SubmitResult r;
        r.id = newId;
        return r;
    }

    static SubmitResult Failure(const OpResult& failed) {
        SubmitResult r;
        r.error = failed.error;
        r.message = failed.message;
        return r;
    }

    bool IsOk() const { return error == GovernanceError::OK; }
    explicit operator bool() const { return IsOk(); }
};

} // namespace governance
} // namespace coffer

#endif // COFFER_GOVERNANCE_ERRORS_H
