// COFFER - Approval Ledger Implementation
// Copyright (c) 2024 COFFER Developers
// MIT License

#include <coffer/governance/approval.h>

namespace coffer {
namespace governance {

bool ApprovalState::IsConsistent() const {
    if (count != approvedBy.size()) {
        return false;
    }
    Amount sum = 0;
    for (const auto& [voter, captured] : approvedBy) {
        if (!CheckedAdd(sum, captured, sum)) {
            return false;
        }
    }
    return sum == weight;
}

OpResult ApplyApproval(ApprovalState& state, bool executed,
                       const MemberId& voter, bool voterIsMember, Amount voterWeight) {
    if (!voterIsMember) {
        return OpResult::Failure(GovernanceError::NOT_MEMBER,
                                 "Not a member: " + FormatAddress(voter));
    }
    if (executed) {
        return OpResult::Failure(GovernanceError::ALREADY_EXECUTED);
    }
    if (state.HasApproved(voter)) {
        return OpResult::Failure(GovernanceError::ALREADY_APPROVED);
    }

    Amount newWeight;
    if (!CheckedAdd(state.weight, voterWeight, newWeight)) {
        return OpResult::Failure(GovernanceError::ARITHMETIC_OVERFLOW, "Approval weight overflow");
    }

    state.approvedBy.emplace(voter, voterWeight);
    state.count += 1;
    state.weight = newWeight;
    return OpResult::Success();
}

OpResult ApplyRevocation(ApprovalState& state, bool executed, const MemberId& voter) {
    if (executed) {
        return OpResult::Failure(GovernanceError::ALREADY_EXECUTED);
    }

    auto it = state.approvedBy.find(voter);
    if (it == state.approvedBy.end()) {
        return OpResult::Failure(GovernanceError::NOT_APPROVED);
    }

    Amount newWeight;
    if (!CheckedSub(state.weight, it->second, newWeight)) {
        return OpResult::Failure(GovernanceError::ARITHMETIC_OVERFLOW, "Approval weight underflow");
    }

    state.approvedBy.erase(it);
    state.count -= 1;
    state.weight = newWeight;
    return OpResult::Success();
}

} // namespace governance
} // namespace coffer
