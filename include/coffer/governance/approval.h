// COFFER - Approval Ledger
// Copyright (c) 2024 COFFER Developers
// MIT License
//
// Approval bookkeeping shared by actions and proposals.

#ifndef COFFER_GOVERNANCE_APPROVAL_H
#define COFFER_GOVERNANCE_APPROVAL_H

#include <coffer/core/types.h>
#include <coffer/governance/errors.h>

#include <cstdint>
#include <map>

namespace coffer {
namespace governance {

/**
 * Approvals accumulated on one record.
 *
 * approvedBy maps each voter to the weight it contributed when it approved.
 * Later deposits by that voter do not change a cast approval, and a revoke
 * subtracts exactly the captured amount.
 *
 * Invariants: count == approvedBy.size(), weight == sum of captured weights.
 */
struct ApprovalState {
    std::map<MemberId, Amount> approvedBy;
    uint64_t count{0};
    Amount weight{0};

    bool HasApproved(const MemberId& voter) const {
        return approvedBy.count(voter) > 0;
    }

    /// Check both invariants
    bool IsConsistent() const;
};

/**
 * Record an approval.
 *
 * Checks, in order: voter is a member (NOT_MEMBER), record not executed
 * (ALREADY_EXECUTED), voter has not approved (ALREADY_APPROVED), running
 * weight does not overflow (ARITHMETIC_OVERFLOW).
 */
OpResult ApplyApproval(ApprovalState& state, bool executed,
                       const MemberId& voter, bool voterIsMember, Amount voterWeight);

/**
 * Withdraw an approval.
 *
 * Checks, in order: record not executed (ALREADY_EXECUTED), voter has
 * approved (NOT_APPROVED).
 */
OpResult ApplyRevocation(ApprovalState& state, bool executed, const MemberId& voter);

} // namespace governance
} // namespace coffer

#endif // COFFER_GOVERNANCE_APPROVAL_H
