// COFFER - Membership Registry
// Copyright (c) 2024 COFFER Developers
// MIT License

#ifndef COFFER_GOVERNANCE_MEMBERSHIP_H
#define COFFER_GOVERNANCE_MEMBERSHIP_H

#include <coffer/core/types.h>
#include <coffer/governance/errors.h>

#include <set>
#include <vector>

namespace coffer {
namespace governance {

/**
 * The current member set, listed in insertion order.
 *
 * Removal preserves the relative order of the remaining members.
 * Mutated only by executed governance proposals.
 */
class MembershipRegistry {
public:
    MembershipRegistry() = default;

    /// Build from an initial member set that passed ValidateInitial()
    explicit MembershipRegistry(const std::vector<MemberId>& members);

    /// Initial membership must be non-empty and duplicate-free
    static OpResult ValidateInitial(const std::vector<MemberId>& members);

    bool IsMember(const MemberId& member) const;

    /// Append a member; DUPLICATE_MEMBER if present
    OpResult Add(const MemberId& member);

    /// Remove a member; NOT_MEMBER if absent
    OpResult Remove(const MemberId& member);

    /// Members in insertion order
    const std::vector<MemberId>& GetMembers() const { return ordered_; }

    size_t Size() const { return ordered_.size(); }

private:
    std::vector<MemberId> ordered_;
    std::set<MemberId> index_;
};

} // namespace governance
} // namespace coffer

#endif // COFFER_GOVERNANCE_MEMBERSHIP_H
