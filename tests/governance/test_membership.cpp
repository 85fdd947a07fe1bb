// COFFER - Membership Registry Tests
// Copyright (c) 2024 COFFER Developers
// MIT License

#include <gtest/gtest.h>
#include <coffer/governance/membership.h>

#include <vector>

using namespace coffer;
using namespace coffer::governance;

namespace {

MemberId MakeMember(uint8_t id) {
    std::array<Byte, 20> data{};
    data[0] = id;
    data[19] = id;
    return MemberId(data);
}

} // namespace

TEST(MembershipTest, ValidateInitialAcceptsDistinctMembers) {
    EXPECT_TRUE(MembershipRegistry::ValidateInitial({MakeMember(1), MakeMember(2)}).IsOk());
}

TEST(MembershipTest, ValidateInitialRejectsEmpty) {
    auto result = MembershipRegistry::ValidateInitial({});
    EXPECT_EQ(result.error, GovernanceError::INVALID_CONFIG);
}

TEST(MembershipTest, ValidateInitialRejectsDuplicates) {
    auto result = MembershipRegistry::ValidateInitial({MakeMember(1), MakeMember(2), MakeMember(1)});
    EXPECT_EQ(result.error, GovernanceError::INVALID_CONFIG);
    EXPECT_NE(result.message.find("not unique"), std::string::npos);
}

TEST(MembershipTest, ValidateInitialRejectsNullMember) {
    auto result = MembershipRegistry::ValidateInitial({MakeMember(1), MemberId()});
    EXPECT_EQ(result.error, GovernanceError::INVALID_CONFIG);
}

TEST(MembershipTest, ListingKeepsInsertionOrder) {
    MembershipRegistry registry({MakeMember(3), MakeMember(1), MakeMember(2)});
    ASSERT_EQ(registry.Size(), 3u);
    EXPECT_EQ(registry.GetMembers()[0], MakeMember(3));
    EXPECT_EQ(registry.GetMembers()[1], MakeMember(1));
    EXPECT_EQ(registry.GetMembers()[2], MakeMember(2));
}

TEST(MembershipTest, AddAndIsMember) {
    MembershipRegistry registry({MakeMember(1)});
    EXPECT_FALSE(registry.IsMember(MakeMember(2)));
    EXPECT_TRUE(registry.Add(MakeMember(2)).IsOk());
    EXPECT_TRUE(registry.IsMember(MakeMember(2)));
    EXPECT_EQ(registry.GetMembers().back(), MakeMember(2));
}

TEST(MembershipTest, AddDuplicateFails) {
    MembershipRegistry registry({MakeMember(1)});
    auto result = registry.Add(MakeMember(1));
    EXPECT_EQ(result.error, GovernanceError::DUPLICATE_MEMBER);
    EXPECT_EQ(registry.Size(), 1u);
}

TEST(MembershipTest, RemovePreservesOrderOfRemaining) {
    MembershipRegistry registry({MakeMember(1), MakeMember(2), MakeMember(3), MakeMember(4)});
    EXPECT_TRUE(registry.Remove(MakeMember(2)).IsOk());

    EXPECT_FALSE(registry.IsMember(MakeMember(2)));
    ASSERT_EQ(registry.Size(), 3u);
    EXPECT_EQ(registry.GetMembers()[0], MakeMember(1));
    EXPECT_EQ(registry.GetMembers()[1], MakeMember(3));
    EXPECT_EQ(registry.GetMembers()[2], MakeMember(4));
}

TEST(MembershipTest, RemoveAbsentFails) {
    MembershipRegistry registry({MakeMember(1)});
    auto result = registry.Remove(MakeMember(9));
    EXPECT_EQ(result.error, GovernanceError::NOT_MEMBER);
    EXPECT_EQ(registry.Size(), 1u);
}

TEST(MembershipTest, RemoveThenReAdd) {
    MembershipRegistry registry({MakeMember(1), MakeMember(2)});
    ASSERT_TRUE(registry.Remove(MakeMember(1)).IsOk());
    ASSERT_TRUE(registry.Add(MakeMember(1)).IsOk());
    EXPECT_EQ(registry.GetMembers()[0], MakeMember(2));
    EXPECT_EQ(registry.GetMembers()[1], MakeMember(1));
}
