// COFFER - Pool Engine Implementation
// Copyright (c) 2024 COFFER Developers
// MIT License

#include <coffer/governance/pool.h>
#include <coffer/governance/snapshot.h>
#include <coffer/util/logging.h>

#include <exception>

namespace coffer {
namespace governance {

namespace {

void LogRejected(const char* operation, const Address& sender, const OpResult& result) {
    LOG_DEBUG(util::LogCategory::GOVERNANCE) << operation << " by " << FormatAddress(sender)
                                             << " rejected: " << GovernanceErrorToString(result.error)
                                             << " (" << result.message << ")";
}

} // anonymous namespace

// ============================================================================
// PoolConfig
// ============================================================================

OpResult PoolConfig::Validate() const {
    auto result = MembershipRegistry::ValidateInitial(members);
    if (!result) {
        return result;
    }
    return quorum.Validate();
}

// ============================================================================
// Construction
// ============================================================================

PoolEngine::PoolEngine(PoolState state, std::shared_ptr<Effect> effect)
    : state_(std::move(state)), effect_(std::move(effect)) {}

std::unique_ptr<PoolEngine> PoolEngine::Create(const PoolConfig& config,
                                               std::shared_ptr<Effect> effect,
                                               OpResult* error) {
    auto result = config.Validate();
    if (error) {
        *error = result;
    }
    if (!result) {
        LOG_ERROR(util::LogCategory::GOVERNANCE) << "Invalid pool configuration: " << result.message;
        return nullptr;
    }

    PoolState state;
    state.members = MembershipRegistry(config.members);
    state.quorum = config.quorum;

    LOG_INFO(util::LogCategory::GOVERNANCE) << "Pool created with " << config.members.size()
                                            << " members, " << config.quorum.ToString();

    return std::unique_ptr<PoolEngine>(new PoolEngine(std::move(state), std::move(effect)));
}

OpResult PoolEngine::RequireMember(const Address& sender, const char* operation) const {
    if (!state_.members.IsMember(sender)) {
        return OpResult::Failure(GovernanceError::AUTHORIZATION,
                                 std::string(operation) + " requires membership: " +
                                 FormatAddress(sender));
    }
    return OpResult::Success();
}

bool PoolEngine::QuorumMet(const ApprovalState& approvals) const {
    return QuorumPasses(approvals, state_.contributions.GetTotalWeight(), state_.quorum);
}

// ============================================================================
// Funds
// ============================================================================

OpResult PoolEngine::Deposit(const Address& sender, Amount amount) {
    Notification note;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bool isMember = state_.members.IsMember(sender);
        auto result = state_.contributions.Deposit(sender, amount, isMember);
        if (!result) {
            LogRejected("Deposit", sender, result);
            return result;
        }

        note.type = NotificationType::Deposit;
        note.actor = sender;
        note.amount = amount;
        note.balance = state_.contributions.GetBalance();

        LOG_INFO(util::LogCategory::TREASURY) << "Deposit of " << FormatAmount(amount) << " from "
                                              << FormatAddress(sender)
                                              << (isMember ? "" : " (non-member, no weight)")
                                              << ", balance " << FormatAmount(note.balance);
        note.sequence = bus_.NextSequence();
    }
    bus_.Publish(note);
    return OpResult::Success();
}

// ============================================================================
// Actions
// ============================================================================

SubmitResult PoolEngine::SubmitAction(const Address& sender, const Address& target,
                                      Amount value, const std::vector<Byte>& data) {
    Notification note;
    RecordId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto auth = RequireMember(sender, "SubmitAction");
        if (!auth) {
            LogRejected("SubmitAction", sender, auth);
            return SubmitResult::Failure(auth);
        }

        ActionPayload payload;
        payload.target = target;
        payload.value = value;
        payload.data = data;
        id = state_.actions.Append(std::move(payload));

        note.type = NotificationType::ActionSubmitted;
        note.actor = sender;
        note.id = id;
        note.amount = value;

        LOG_INFO(util::LogCategory::GOVERNANCE) << "Action " << id << " submitted by "
                                                << FormatAddress(sender) << ": "
                                                << state_.actions.Find(id)->payload.ToString();
        note.sequence = bus_.NextSequence();
    }
    bus_.Publish(note);
    return SubmitResult::Success(id);
}

OpResult PoolEngine::ApproveAction(const Address& sender, RecordId id) {
    Notification note;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto result = state_.actions.Approve(id, sender, state_.members.IsMember(sender),
                                             state_.contributions.ContributionOf(sender));
        if (!result) {
            LogRejected("ApproveAction", sender, result);
            return result;
        }
        const auto& approvals = state_.actions.Find(id)->approvals;
        LOG_INFO(util::LogCategory::GOVERNANCE) << "Action " << id << " approved by "
                                                << FormatAddress(sender) << " (count "
                                                << approvals.count << ", weight "
                                                << FormatAmount(approvals.weight) << ")";

        note.type = NotificationType::ActionApproved;
        note.actor = sender;
        note.id = id;
        note.sequence = bus_.NextSequence();
    }
    bus_.Publish(note);
    return OpResult::Success();
}

OpResult PoolEngine::RevokeApproval(const Address& sender, RecordId id) {
    Notification note;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto result = RequireMember(sender, "RevokeApproval");
        if (result) {
            result = state_.actions.Revoke(id, sender);
        }
        if (!result) {
            LogRejected("RevokeApproval", sender, result);
            return result;
        }
        LOG_INFO(util::LogCategory::GOVERNANCE) << "Action " << id << " approval revoked by "
                                                << FormatAddress(sender);

        note.type = NotificationType::ActionApprovalRevoked;
        note.actor = sender;
        note.id = id;
        note.sequence = bus_.NextSequence();
    }
    bus_.Publish(note);
    return OpResult::Success();
}

OpResult PoolEngine::ExecuteAction(const Address& sender, RecordId id) {
    Notification note;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto result = RequireMember(sender, "ExecuteAction");
        if (result) {
            result = state_.actions.CheckPending(id);
        }
        if (!result) {
            LogRejected("ExecuteAction", sender, result);
            return result;
        }

        const Action& action = *state_.actions.Find(id);
        if (!QuorumMet(action.approvals)) {
            result = OpResult::Failure(GovernanceError::QUORUM_NOT_MET,
                                       "Action " + std::to_string(id) + " lacks quorum under " +
                                       state_.quorum.ToString());
            LogRejected("ExecuteAction", sender, result);
            return result;
        }

        const Amount value = action.payload.value;
        if (state_.contributions.GetBalance() < value) {
            result = OpResult::Failure(GovernanceError::EFFECT_DISPATCH_FAILED,
                                       "Insufficient pool balance: have " +
                                       FormatAmount(state_.contributions.GetBalance()) +
                                       ", need " + FormatAmount(value));
            LogRejected("ExecuteAction", sender, result);
            return result;
        }
        if (!effect_) {
            result = OpResult::Failure(GovernanceError::EFFECT_DISPATCH_FAILED,
                                       "No effect configured");
            LogRejected("ExecuteAction", sender, result);
            return result;
        }

        // Flag, debit and effect commit together
        state_.actions.MarkExecuted(id);
        OpResult dispatched;
        try {
            dispatched = effect_->Dispatch(id, action.payload);
        } catch (const std::exception& e) {
            dispatched = OpResult::Failure(GovernanceError::EFFECT_DISPATCH_FAILED, e.what());
        } catch (...) {
            state_.actions.UnmarkExecuted(id);
            throw;
        }
        if (dispatched) {
            dispatched = state_.contributions.Withdraw(value);
        }
        if (!dispatched) {
            state_.actions.UnmarkExecuted(id);
            result = OpResult::Failure(GovernanceError::EFFECT_DISPATCH_FAILED,
                                       "Effect failed for action " + std::to_string(id) +
                                       ": " + dispatched.message);
            LOG_WARN(util::LogCategory::EFFECT) << result.message;
            return result;
        }

        note.type = NotificationType::ActionExecuted;
        note.actor = sender;
        note.id = id;
        note.amount = value;
        note.balance = state_.contributions.GetBalance();

        LOG_INFO(util::LogCategory::GOVERNANCE) << "Action " << id << " executed by "
                                                << FormatAddress(sender) << ", balance "
                                                << FormatAmount(note.balance);
        note.sequence = bus_.NextSequence();
    }
    bus_.Publish(note);
    return OpResult::Success();
}

// ============================================================================
// Proposals
// ============================================================================

SubmitResult PoolEngine::SubmitProposal(const Address& sender, const ProposalPayload& payload) {
    Notification note;
    RecordId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto auth = RequireMember(sender, "SubmitProposal");
        if (!auth) {
            LogRejected("SubmitProposal", sender, auth);
            return SubmitResult::Failure(auth);
        }

        id = state_.proposals.Append(payload);

        note.type = NotificationType::ProposalSubmitted;
        note.actor = sender;
        note.id = id;
        note.kind = ProposalKindToString(GetProposalKind(payload));

        LOG_INFO(util::LogCategory::GOVERNANCE) << "Proposal " << id << " submitted by "
                                                << FormatAddress(sender) << ": "
                                                << DescribeProposal(payload);
        note.sequence = bus_.NextSequence();
    }
    bus_.Publish(note);
    return SubmitResult::Success(id);
}

OpResult PoolEngine::ApproveProposal(const Address& sender, RecordId id) {
    Notification note;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto result = state_.proposals.Approve(id, sender, state_.members.IsMember(sender),
                                               state_.contributions.ContributionOf(sender));
        if (!result) {
            LogRejected("ApproveProposal", sender, result);
            return result;
        }
        const auto& approvals = state_.proposals.Find(id)->approvals;
        LOG_INFO(util::LogCategory::GOVERNANCE) << "Proposal " << id << " approved by "
                                                << FormatAddress(sender) << " (count "
                                                << approvals.count << ", weight "
                                                << FormatAmount(approvals.weight) << ")";

        note.type = NotificationType::ProposalApproved;
        note.actor = sender;
        note.id = id;
        note.sequence = bus_.NextSequence();
    }
    bus_.Publish(note);
    return OpResult::Success();
}

OpResult PoolEngine::RevokeProposalApproval(const Address& sender, RecordId id) {
    Notification note;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto result = RequireMember(sender, "RevokeProposalApproval");
        if (result) {
            result = state_.proposals.Revoke(id, sender);
        }
        if (!result) {
            LogRejected("RevokeProposalApproval", sender, result);
            return result;
        }
        LOG_INFO(util::LogCategory::GOVERNANCE) << "Proposal " << id << " approval revoked by "
                                                << FormatAddress(sender);

        note.type = NotificationType::ProposalApprovalRevoked;
        note.actor = sender;
        note.id = id;
        note.sequence = bus_.NextSequence();
    }
    bus_.Publish(note);
    return OpResult::Success();
}

OpResult PoolEngine::ExecuteProposal(const Address& sender, RecordId id) {
    Notification note;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto result = RequireMember(sender, "ExecuteProposal");
        if (result) {
            result = state_.proposals.CheckPending(id);
        }
        if (!result) {
            LogRejected("ExecuteProposal", sender, result);
            return result;
        }

        const Proposal& proposal = *state_.proposals.Find(id);
        if (!QuorumMet(proposal.approvals)) {
            result = OpResult::Failure(GovernanceError::QUORUM_NOT_MET,
                                       "Proposal " + std::to_string(id) + " lacks quorum under " +
                                       state_.quorum.ToString());
            LogRejected("ExecuteProposal", sender, result);
            return result;
        }

        // ApplyProposal changes nothing on failure
        result = ApplyProposal(proposal.payload, state_.members, state_.quorum);
        if (!result) {
            LogRejected("ExecuteProposal", sender, result);
            return result;
        }
        state_.proposals.MarkExecuted(id);

        note.type = NotificationType::ProposalExecuted;
        note.actor = sender;
        note.id = id;
        note.kind = ProposalKindToString(GetProposalKind(proposal.payload));

        LOG_INFO(util::LogCategory::GOVERNANCE) << "Proposal " << id << " executed by "
                                                << FormatAddress(sender);
        note.sequence = bus_.NextSequence();
    }
    bus_.Publish(note);
    return OpResult::Success();
}

// ============================================================================
// Queries
// ============================================================================

std::vector<MemberId> PoolEngine::GetMembers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.members.GetMembers();
}

bool PoolEngine::IsMember(const MemberId& member) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.members.IsMember(member);
}

std::optional<Action> PoolEngine::GetAction(RecordId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Action* action = state_.actions.Find(id);
    if (!action) {
        return std::nullopt;
    }
    return *action;
}

size_t PoolEngine::GetActionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.actions.Size();
}

bool PoolEngine::IsActionApprovedBy(RecordId id, const MemberId& member) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Action* action = state_.actions.Find(id);
    return action && action->approvals.HasApproved(member);
}

std::optional<Proposal> PoolEngine::GetProposal(RecordId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Proposal* proposal = state_.proposals.Find(id);
    if (!proposal) {
        return std::nullopt;
    }
    return *proposal;
}

size_t PoolEngine::GetProposalCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.proposals.Size();
}

bool PoolEngine::IsProposalApprovedBy(RecordId id, const MemberId& member) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Proposal* proposal = state_.proposals.Find(id);
    return proposal && proposal->approvals.HasApproved(member);
}

Amount PoolEngine::GetBalance() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.contributions.GetBalance();
}

Amount PoolEngine::ContributionOf(const Address& member) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.contributions.ContributionOf(member);
}

Amount PoolEngine::TotalContributions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.contributions.GetTotalWeight();
}

QuorumConfig PoolEngine::GetQuorumConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.quorum;
}

// ============================================================================
// Snapshot
// ============================================================================

std::vector<Byte> PoolEngine::Serialize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return EncodeSnapshot(state_);
}

OpResult PoolEngine::Restore(const std::vector<Byte>& data) {
    std::string error;
    auto decoded = DecodeSnapshot(data, &error);
    if (!decoded) {
        LOG_ERROR(util::LogCategory::SNAPSHOT) << "Snapshot rejected: " << error;
        return OpResult::Failure(GovernanceError::INVALID_CONFIG, "Snapshot rejected: " + error);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    state_ = std::move(*decoded);
    LOG_INFO(util::LogCategory::SNAPSHOT) << "Restored pool: " << state_.members.Size()
                                          << " members, " << state_.actions.Size()
                                          << " actions, " << state_.proposals.Size()
                                          << " proposals, balance "
                                          << FormatAmount(state_.contributions.GetBalance());
    return OpResult::Success();
}

// ============================================================================
// Notifications
// ============================================================================

NotificationBus::SubscriptionId PoolEngine::Subscribe(NotificationBus::Callback callback) {
    return bus_.Subscribe(std::move(callback));
}

bool PoolEngine::Unsubscribe(NotificationBus::SubscriptionId id) {
    return bus_.Unsubscribe(id);
}

} // namespace governance
} // namespace coffer
