// COFFER - Governance Registry
// Copyright (c) 2024 COFFER Developers
// MIT License
//
// Proposals that change the pool's own rules: who is a member and what
// quorum applies.

#ifndef COFFER_GOVERNANCE_PROPOSAL_H
#define COFFER_GOVERNANCE_PROPOSAL_H

#include <coffer/core/types.h>
#include <coffer/governance/errors.h>
#include <coffer/governance/membership.h>
#include <coffer/governance/quorum.h>
#include <coffer/governance/record.h>

#include <optional>
#include <string>
#include <variant>

namespace coffer {
namespace governance {

/// Kind of proposal
enum class ProposalKind : uint8_t {
    AddMember = 0,
    RemoveMember = 1,
    ChangeParameters = 2,
};

/// Convert kind to its wire name ("addMember", "removeMember", "changeParameters")
const char* ProposalKindToString(ProposalKind kind);

/// Parse kind from its wire name
std::optional<ProposalKind> ParseProposalKind(const std::string& str);

// ============================================================================
// Payload variants
// ============================================================================

/// Admit a new member
struct AddMemberChange {
    MemberId member;

    bool operator==(const AddMemberChange& other) const { return member == other.member; }
};

/// Expel an existing member
struct RemoveMemberChange {
    MemberId member;

    bool operator==(const RemoveMemberChange& other) const { return member == other.member; }
};

/// Replace the whole quorum configuration. Bounds are not checked.
struct ChangeParametersChange {
    QuorumConfig config;

    bool operator==(const ChangeParametersChange& other) const { return config == other.config; }
};

/// Immutable part of a proposal
using ProposalPayload = std::variant<
    AddMemberChange,           // ProposalKind::AddMember
    RemoveMemberChange,        // ProposalKind::RemoveMember
    ChangeParametersChange     // ProposalKind::ChangeParameters
>;

/// Kind of a payload
ProposalKind GetProposalKind(const ProposalPayload& payload);

/// Human readable description
std::string DescribeProposal(const ProposalPayload& payload);

/**
 * Apply an executed proposal to the pool's rules.
 *
 * AddMember fails with DUPLICATE_MEMBER if present, RemoveMember with
 * NOT_MEMBER if absent. ChangeParameters overwrites the quorum configuration
 * unconditionally. Nothing changes on failure.
 */
OpResult ApplyProposal(const ProposalPayload& payload,
                       MembershipRegistry& members, QuorumConfig& quorum);

using Proposal = Record<ProposalPayload>;
using ProposalLog = RecordLog<ProposalPayload>;

} // namespace governance
} // namespace coffer

#endif // COFFER_GOVERNANCE_PROPOSAL_H
