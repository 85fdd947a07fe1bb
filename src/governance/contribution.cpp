// COFFER - Contribution Ledger Implementation
// Copyright (c) 2024 COFFER Developers
// MIT License

#include <coffer/governance/contribution.h>

namespace coffer {
namespace governance {

OpResult ContributionLedger::Deposit(const Address& sender, Amount amount, bool countsAsWeight) {
    Amount newBalance;
    if (!CheckedAdd(balance_, amount, newBalance)) {
        return OpResult::Failure(GovernanceError::ARITHMETIC_OVERFLOW, "Pool balance overflow");
    }

    if (!countsAsWeight) {
        balance_ = newBalance;
        return OpResult::Success();
    }

    Amount newContribution;
    Amount newTotal;
    if (!CheckedAdd(ContributionOf(sender), amount, newContribution) ||
        !CheckedAdd(totalWeight_, amount, newTotal)) {
        return OpResult::Failure(GovernanceError::ARITHMETIC_OVERFLOW, "Contribution overflow");
    }

    balance_ = newBalance;
    contributions_[sender] = newContribution;
    totalWeight_ = newTotal;
    return OpResult::Success();
}

OpResult ContributionLedger::Withdraw(Amount amount) {
    Amount remaining;
    if (!CheckedSub(balance_, amount, remaining)) {
        return OpResult::Failure(GovernanceError::EFFECT_DISPATCH_FAILED,
                                 "Insufficient pool balance: have " + FormatAmount(balance_) +
                                 ", need " + FormatAmount(amount));
    }
    balance_ = remaining;
    return OpResult::Success();
}

Amount ContributionLedger::ContributionOf(const Address& member) const {
    auto it = contributions_.find(member);
    return it == contributions_.end() ? 0 : it->second;
}

bool ContributionLedger::Restore(const std::map<Address, Amount>& contributions,
                                 Amount totalWeight, Amount balance,
                                 ContributionLedger& out) {
    Amount sum = 0;
    for (const auto& [member, amount] : contributions) {
        if (!CheckedAdd(sum, amount, sum)) {
            return false;
        }
    }
    if (sum != totalWeight) {
        return false;
    }

    out.contributions_ = contributions;
    out.totalWeight_ = totalWeight;
    out.balance_ = balance;
    return true;
}

} // namespace governance
} // namespace coffer
