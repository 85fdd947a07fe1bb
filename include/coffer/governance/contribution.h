// COFFER - Contribution Ledger
// Copyright (c) 2024 COFFER Developers
// MIT License
//
// Tracks funds held by the pool and each member's cumulative deposits.
// Member deposits are the only source of voting weight.

#ifndef COFFER_GOVERNANCE_CONTRIBUTION_H
#define COFFER_GOVERNANCE_CONTRIBUTION_H

#include <coffer/core/types.h>
#include <coffer/governance/errors.h>

#include <map>

namespace coffer {
namespace governance {

/**
 * Per-member contributions and pool balance.
 *
 * Invariant: GetTotalWeight() == sum of all contributions.
 * Contributions only grow; the balance shrinks when actions pay out.
 */
class ContributionLedger {
public:
    ContributionLedger() = default;

    /**
     * Accept funds from a sender.
     *
     * The balance always grows by amount. If countsAsWeight (the sender is a
     * current member) the sender's contribution and the total weight grow too.
     * Fails with ARITHMETIC_OVERFLOW without touching anything if any sum
     * would overflow.
     */
    OpResult Deposit(const Address& sender, Amount amount, bool countsAsWeight);

    /// Take funds out of the balance; EFFECT_DISPATCH_FAILED if short
    OpResult Withdraw(Amount amount);

    /// Contribution of a member (0 if never contributed)
    Amount ContributionOf(const Address& member) const;

    Amount GetTotalWeight() const { return totalWeight_; }

    /// Funds held by the pool
    Amount GetBalance() const { return balance_; }

    const std::map<Address, Amount>& GetContributions() const { return contributions_; }

    /**
     * Rebuild a ledger from stored parts.
     * Returns false if totalWeight does not equal the sum of contributions.
     */
    static bool Restore(const std::map<Address, Amount>& contributions,
                        Amount totalWeight, Amount balance,
                        ContributionLedger& out);

private:
    std::map<Address, Amount> contributions_;
    Amount totalWeight_{0};
    Amount balance_{0};
};

} // namespace governance
} // namespace coffer

#endif // COFFER_GOVERNANCE_CONTRIBUTION_H
