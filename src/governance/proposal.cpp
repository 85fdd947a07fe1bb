// COFFER - Governance Registry Implementation
// Copyright (c) 2024 COFFER Developers
// MIT License

#include <coffer/governance/proposal.h>
#include <coffer/util/logging.h>

namespace coffer {
namespace governance {

const char* ProposalKindToString(ProposalKind kind) {
    switch (kind) {
        case ProposalKind::AddMember: return "addMember";
        case ProposalKind::RemoveMember: return "removeMember";
        case ProposalKind::ChangeParameters: return "changeParameters";
        default: return "unknown";
    }
}

std::optional<ProposalKind> ParseProposalKind(const std::string& str) {
    if (str == "addMember") return ProposalKind::AddMember;
    if (str == "removeMember") return ProposalKind::RemoveMember;
    if (str == "changeParameters") return ProposalKind::ChangeParameters;
    return std::nullopt;
}

ProposalKind GetProposalKind(const ProposalPayload& payload) {
    if (std::holds_alternative<AddMemberChange>(payload)) {
        return ProposalKind::AddMember;
    } else if (std::holds_alternative<RemoveMemberChange>(payload)) {
        return ProposalKind::RemoveMember;
    }
    return ProposalKind::ChangeParameters;
}

std::string DescribeProposal(const ProposalPayload& payload) {
    if (const auto* add = std::get_if<AddMemberChange>(&payload)) {
        return "addMember(" + FormatAddress(add->member) + ")";
    } else if (const auto* remove = std::get_if<RemoveMemberChange>(&payload)) {
        return "removeMember(" + FormatAddress(remove->member) + ")";
    }
    const auto& change = std::get<ChangeParametersChange>(payload);
    return "changeParameters(" + change.config.ToString() + ")";
}

// ============================================================================
// Effect handlers
// ============================================================================

namespace {

OpResult ApplyChange(const AddMemberChange& change,
                     MembershipRegistry& members, QuorumConfig& /*quorum*/) {
    auto result = members.Add(change.member);
    if (result) {
        LOG_INFO(util::LogCategory::GOVERNANCE) << "Member added: " << FormatAddress(change.member);
    }
    return result;
}

OpResult ApplyChange(const RemoveMemberChange& change,
                     MembershipRegistry& members, QuorumConfig& /*quorum*/) {
    auto result = members.Remove(change.member);
    if (result) {
        LOG_INFO(util::LogCategory::GOVERNANCE) << "Member removed: " << FormatAddress(change.member);
        if (members.Size() == 0) {
            LOG_WARN(util::LogCategory::GOVERNANCE) << "Pool has no members left";
        }
    }
    return result;
}

OpResult ApplyChange(const ChangeParametersChange& change,
                     MembershipRegistry& /*members*/, QuorumConfig& quorum) {
    if (change.config.weightThresholdPercent > MAX_WEIGHT_THRESHOLD_PERCENT) {
        LOG_WARN(util::LogCategory::GOVERNANCE) << "Installing weight threshold above 100%: "
                                                << change.config.weightThresholdPercent;
    }
    LOG_INFO(util::LogCategory::GOVERNANCE) << "Quorum changed: " << quorum.ToString()
                                            << " -> " << change.config.ToString();
    quorum = change.config;
    return OpResult::Success();
}

} // anonymous namespace

OpResult ApplyProposal(const ProposalPayload& payload,
                       MembershipRegistry& members, QuorumConfig& quorum) {
    return std::visit([&](const auto& change) { return ApplyChange(change, members, quorum); },
                      payload);
}

} // namespace governance
} // namespace coffer
