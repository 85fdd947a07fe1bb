// COFFER - Pool Notifications
// Copyright (c) 2024 COFFER Developers
// MIT License

#ifndef COFFER_GOVERNANCE_EVENTS_H
#define COFFER_GOVERNANCE_EVENTS_H

#include <coffer/core/types.h>

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace coffer {
namespace governance {

/// What happened
enum class NotificationType {
    Deposit,
    ActionSubmitted,
    ActionApproved,
    ActionApprovalRevoked,
    ActionExecuted,
    ProposalSubmitted,
    ProposalApproved,
    ProposalApprovalRevoked,
    ProposalExecuted,
};

/// Convert type to string
const char* NotificationTypeToString(NotificationType type);

/**
 * A committed state change.
 *
 * Fields not meaningful for a type are left at their defaults.
 */
struct Notification {
    NotificationType type{NotificationType::Deposit};

    /// Depositor, submitter, voter or executor
    Address actor;

    /// Action or proposal id
    RecordId id{0};

    /// Deposit amount or action value
    Amount amount{0};

    /// Pool balance after a deposit or action execution
    Amount balance{0};

    /// Proposal kind name for proposal notifications
    std::string kind;

    /// Commit order, assigned by NotificationBus::NextSequence()
    uint64_t sequence{0};

    std::string ToString() const;
};

/**
 * Fan-out of notifications to subscribers.
 *
 * Publishers take a sequence number while they hold the lock that commits
 * the change, and Publish() delivers in sequence order no matter which
 * thread publishes first. One thread delivers at a time: a notification may
 * be delivered by another publisher's thread, and a Publish() issued from
 * inside a callback is queued behind the one being delivered.
 * Subscribers are called in subscription order.
 */
class NotificationBus {
public:
    using Callback = std::function<void(const Notification&)>;
    using SubscriptionId = uint64_t;

    SubscriptionId Subscribe(Callback callback);

    /// Returns false if the id is unknown
    bool Unsubscribe(SubscriptionId id);

    /// Reserve the next sequence number; every reserved number must be published
    uint64_t NextSequence();

    void Publish(const Notification& notification);

    size_t SubscriberCount() const;

private:
    mutable std::mutex mutex_;
    std::map<SubscriptionId, Callback> subscribers_;
    SubscriptionId nextId_{1};

    uint64_t nextSequence_{0};
    uint64_t nextDelivery_{0};
    std::map<uint64_t, Notification> pending_;
    bool delivering_{false};
};

} // namespace governance
} // namespace coffer

#endif // COFFER_GOVERNANCE_EVENTS_H
