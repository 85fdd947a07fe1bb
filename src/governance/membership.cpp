// COFFER - Membership Registry Implementation
// Copyright (c) 2024 COFFER Developers
// MIT License

#include <coffer/governance/membership.h>

#include <algorithm>

namespace coffer {
namespace governance {

MembershipRegistry::MembershipRegistry(const std::vector<MemberId>& members) {
    for (const auto& member : members) {
        if (index_.insert(member).second) {
            ordered_.push_back(member);
        }
    }
}

OpResult MembershipRegistry::ValidateInitial(const std::vector<MemberId>& members) {
    if (members.empty()) {
        return OpResult::Failure(GovernanceError::INVALID_CONFIG, "Members required");
    }

    std::set<MemberId> seen;
    for (const auto& member : members) {
        if (member.IsNull()) {
            return OpResult::Failure(GovernanceError::INVALID_CONFIG, "Invalid member");
        }
        if (!seen.insert(member).second) {
            return OpResult::Failure(GovernanceError::INVALID_CONFIG,
                                     "Member not unique: " + FormatAddress(member));
        }
    }
    return OpResult::Success();
}

bool MembershipRegistry::IsMember(const MemberId& member) const {
    return index_.count(member) > 0;
}

OpResult MembershipRegistry::Add(const MemberId& member) {
    if (!index_.insert(member).second) {
        return OpResult::Failure(GovernanceError::DUPLICATE_MEMBER,
                                 "Member already exists: " + FormatAddress(member));
    }
    ordered_.push_back(member);
    return OpResult::Success();
}

OpResult MembershipRegistry::Remove(const MemberId& member) {
    auto it = index_.find(member);
    if (it == index_.end()) {
        return OpResult::Failure(GovernanceError::NOT_MEMBER,
                                 "Not a member: " + FormatAddress(member));
    }
    index_.erase(it);
    ordered_.erase(std::remove(ordered_.begin(), ordered_.end(), member), ordered_.end());
    return OpResult::Success();
}

} // namespace governance
} // namespace coffer
