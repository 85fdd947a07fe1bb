// COFFER - Pool Engine
// Copyright (c) 2024 COFFER Developers
// MIT License
//
// Command surface of a pooled treasury. Members deposit funds, submit
// disbursement actions and rule-changing proposals, approve or revoke, and
// execute once the quorum policy passes. Execution is exactly-once: the
// executed flag and the record's effect are applied together or not at all.

#ifndef COFFER_GOVERNANCE_POOL_H
#define COFFER_GOVERNANCE_POOL_H

#include <coffer/core/types.h>
#include <coffer/governance/action.h>
#include <coffer/governance/contribution.h>
#include <coffer/governance/errors.h>
#include <coffer/governance/events.h>
#include <coffer/governance/membership.h>
#include <coffer/governance/proposal.h>
#include <coffer/governance/quorum.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace coffer {
namespace governance {

/**
 * Construction parameters.
 */
struct PoolConfig {
    /// Initial members, non-empty and duplicate-free
    std::vector<MemberId> members;

    /// Initial quorum, percent in [0,100]
    QuorumConfig quorum;

    /// INVALID_CONFIG on any violation
    OpResult Validate() const;
};

/**
 * Everything the pool persists: member set, contributions, quorum
 * configuration and the two append-only logs.
 */
struct PoolState {
    MembershipRegistry members;
    ContributionLedger contributions;
    QuorumConfig quorum;
    ActionLog actions;
    ProposalLog proposals;
};

/**
 * Governance engine.
 *
 * Thread-safe: every public method runs under one mutex, so a reader sees
 * either the state before or after a command. Notifications are published
 * after the mutex is released and reach subscribers in commit order.
 */
class PoolEngine {
public:
    /**
     * Create an engine.
     *
     * @param config Initial members and quorum
     * @param effect Capability invoked when an action executes
     * @param error  Filled with the reason if nullptr is returned
     * @return nullptr if config fails validation
     */
    static std::unique_ptr<PoolEngine> Create(const PoolConfig& config,
                                              std::shared_ptr<Effect> effect,
                                              OpResult* error = nullptr);

    PoolEngine(const PoolEngine&) = delete;
    PoolEngine& operator=(const PoolEngine&) = delete;

    // ========================================================================
    // Funds
    // ========================================================================

    /// Accept funds from anyone; only members' deposits count as weight
    OpResult Deposit(const Address& sender, Amount amount);

    // ========================================================================
    // Actions
    // ========================================================================

    SubmitResult SubmitAction(const Address& sender, const Address& target,
                              Amount value, const std::vector<Byte>& data);

    OpResult ApproveAction(const Address& sender, RecordId id);

    OpResult RevokeApproval(const Address& sender, RecordId id);

    /**
     * Execute an action.
     *
     * Checks membership, existence, executed flag, quorum and balance, then
     * debits the value and dispatches the effect. If the effect fails the
     * action stays pending and the balance is untouched.
     */
    OpResult ExecuteAction(const Address& sender, RecordId id);

    // ========================================================================
    // Proposals
    // ========================================================================

    SubmitResult SubmitProposal(const Address& sender, const ProposalPayload& payload);

    OpResult ApproveProposal(const Address& sender, RecordId id);

    OpResult RevokeProposalApproval(const Address& sender, RecordId id);

    /// Execute a proposal; stays pending if its change is rejected
    OpResult ExecuteProposal(const Address& sender, RecordId id);

    // ========================================================================
    // Queries
    // ========================================================================

    /// Members in insertion order
    std::vector<MemberId> GetMembers() const;
    bool IsMember(const MemberId& member) const;

    std::optional<Action> GetAction(RecordId id) const;
    size_t GetActionCount() const;
    bool IsActionApprovedBy(RecordId id, const MemberId& member) const;

    std::optional<Proposal> GetProposal(RecordId id) const;
    size_t GetProposalCount() const;
    bool IsProposalApprovedBy(RecordId id, const MemberId& member) const;

    /// Funds held by the pool
    Amount GetBalance() const;
    Amount ContributionOf(const Address& member) const;
    Amount TotalContributions() const;
    QuorumConfig GetQuorumConfig() const;

    // ========================================================================
    // Snapshot
    // ========================================================================

    /// Encode the full state
    std::vector<Byte> Serialize() const;

    /// Replace the full state from an encoding; INVALID_CONFIG if rejected
    OpResult Restore(const std::vector<Byte>& data);

    // ========================================================================
    // Notifications
    // ========================================================================

    NotificationBus::SubscriptionId Subscribe(NotificationBus::Callback callback);
    bool Unsubscribe(NotificationBus::SubscriptionId id);

private:
    PoolEngine(PoolState state, std::shared_ptr<Effect> effect);

    /// AUTHORIZATION unless sender is a member (lock held)
    OpResult RequireMember(const Address& sender, const char* operation) const;

    /// Whether a record's approvals meet the current quorum (lock held)
    bool QuorumMet(const ApprovalState& approvals) const;

    mutable std::mutex mutex_;
    PoolState state_;
    std::shared_ptr<Effect> effect_;
    NotificationBus bus_;
};

} // namespace governance
} // namespace coffer

#endif // COFFER_GOVERNANCE_POOL_H
