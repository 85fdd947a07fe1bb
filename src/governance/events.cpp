// COFFER - Pool Notifications Implementation
// Copyright (c) 2024 COFFER Developers
// MIT License

#include <coffer/governance/events.h>

#include <sstream>
#include <vector>

namespace coffer {
namespace governance {

const char* NotificationTypeToString(NotificationType type) {
    switch (type) {
        case NotificationType::Deposit: return "Deposit";
        case NotificationType::ActionSubmitted: return "ActionSubmitted";
        case NotificationType::ActionApproved: return "ActionApproved";
        case NotificationType::ActionApprovalRevoked: return "ActionApprovalRevoked";
        case NotificationType::ActionExecuted: return "ActionExecuted";
        case NotificationType::ProposalSubmitted: return "ProposalSubmitted";
        case NotificationType::ProposalApproved: return "ProposalApproved";
        case NotificationType::ProposalApprovalRevoked: return "ProposalApprovalRevoked";
        case NotificationType::ProposalExecuted: return "ProposalExecuted";
        default: return "Unknown";
    }
}

std::string Notification::ToString() const {
    std::ostringstream ss;
    ss << NotificationTypeToString(type) << "(actor=" << FormatAddress(actor);
    switch (type) {
        case NotificationType::Deposit:
            ss << ", amount=" << FormatAmount(amount) << ", balance=" << FormatAmount(balance);
            break;
        case NotificationType::ActionExecuted:
            ss << ", id=" << id << ", value=" << FormatAmount(amount)
               << ", balance=" << FormatAmount(balance);
            break;
        case NotificationType::ActionSubmitted:
            ss << ", id=" << id << ", value=" << FormatAmount(amount);
            break;
        case NotificationType::ProposalSubmitted:
            ss << ", id=" << id << ", kind=" << kind;
            break;
        default:
            ss << ", id=" << id;
            break;
    }
    ss << ")";
    return ss.str();
}

NotificationBus::SubscriptionId NotificationBus::Subscribe(Callback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = nextId_++;
    subscribers_.emplace(id, std::move(callback));
    return id;
}

bool NotificationBus::Unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.erase(id) > 0;
}

uint64_t NotificationBus::NextSequence() {
    std::lock_guard<std::mutex> lock(mutex_);
    return nextSequence_++;
}

void NotificationBus::Publish(const Notification& notification) {
    std::unique_lock<std::mutex> lock(mutex_);
    pending_.emplace(notification.sequence, notification);
    if (delivering_) {
        return;
    }

    delivering_ = true;
    while (!pending_.empty() && pending_.begin()->first == nextDelivery_) {
        Notification next = std::move(pending_.begin()->second);
        pending_.erase(pending_.begin());
        ++nextDelivery_;

        // Copy so callbacks may subscribe or unsubscribe
        std::vector<Callback> callbacks;
        callbacks.reserve(subscribers_.size());
        for (const auto& [id, callback] : subscribers_) {
            callbacks.push_back(callback);
        }

        lock.unlock();
        try {
            for (const auto& callback : callbacks) {
                if (callback) {
                    callback(next);
                }
            }
        } catch (...) {
            lock.lock();
            delivering_ = false;
            throw;
        }
        lock.lock();
    }
    delivering_ = false;
}

size_t NotificationBus::SubscriberCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

} // namespace governance
} // namespace coffer
