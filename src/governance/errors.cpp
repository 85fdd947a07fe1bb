// COFFER - Governance Error Codes
// Copyright (c) 2024 COFFER Developers
// MIT License

#include <coffer/governance/errors.h>

namespace coffer {
namespace governance {

const char* GovernanceErrorToString(GovernanceError err) {
    switch (err) {
        case GovernanceError::OK: return "OK";
        case GovernanceError::AUTHORIZATION: return "Caller is not a member";
        case GovernanceError::NOT_FOUND: return "Record does not exist";
        case GovernanceError::ALREADY_EXECUTED: return "Record already executed";
        case GovernanceError::ALREADY_APPROVED: return "Record already approved by voter";
        case GovernanceError::NOT_APPROVED: return "Record not approved by voter";
        case GovernanceError::DUPLICATE_MEMBER: return "Member already exists";
        case GovernanceError::NOT_MEMBER: return "Not a member";
        case GovernanceError::QUORUM_NOT_MET: return "Quorum not met";
        case GovernanceError::EFFECT_DISPATCH_FAILED: return "Effect dispatch failed";
        case GovernanceError::ARITHMETIC_OVERFLOW: return "Arithmetic overflow";
        case GovernanceError::INVALID_CONFIG: return "Invalid configuration";
        default: return "Unknown error";
    }
}

} // namespace governance
} // namespace coffer
