// COFFER - Governance Registry Tests
// Copyright (c) 2024 COFFER Developers
// MIT License

#include <gtest/gtest.h>
#include <coffer/governance/action.h>
#include <coffer/governance/proposal.h>

using namespace coffer;
using namespace coffer::governance;

namespace {

MemberId MakeMember(uint8_t id) {
    std::array<Byte, 20> data{};
    data[0] = 0xC0;
    data[19] = id;
    return MemberId(data);
}

} // namespace

TEST(ProposalKindTest, NamesRoundTrip) {
    for (auto kind : {ProposalKind::AddMember, ProposalKind::RemoveMember,
                      ProposalKind::ChangeParameters}) {
        auto parsed = ParseProposalKind(ProposalKindToString(kind));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, kind);
    }
    EXPECT_STREQ(ProposalKindToString(ProposalKind::AddMember), "addMember");
    EXPECT_FALSE(ParseProposalKind("AddMember").has_value());
    EXPECT_FALSE(ParseProposalKind("").has_value());
}

TEST(ProposalPayloadTest, KindOfEachVariant) {
    EXPECT_EQ(GetProposalKind(AddMemberChange{MakeMember(1)}), ProposalKind::AddMember);
    EXPECT_EQ(GetProposalKind(RemoveMemberChange{MakeMember(1)}), ProposalKind::RemoveMember);
    EXPECT_EQ(GetProposalKind(ChangeParametersChange{}), ProposalKind::ChangeParameters);
}

TEST(ProposalPayloadTest, Describe) {
    std::string text = DescribeProposal(AddMemberChange{MakeMember(7)});
    EXPECT_EQ(text.rfind("addMember(0x", 0), 0u);
    EXPECT_NE(DescribeProposal(ChangeParametersChange{}).find("changeParameters"), std::string::npos);
}

class ApplyProposalTest : public ::testing::Test {
protected:
    MembershipRegistry members_{std::vector<MemberId>{MakeMember(1), MakeMember(2)}};
    QuorumConfig quorum_;
};

TEST_F(ApplyProposalTest, AddMember) {
    ASSERT_TRUE(ApplyProposal(AddMemberChange{MakeMember(3)}, members_, quorum_).IsOk());
    EXPECT_TRUE(members_.IsMember(MakeMember(3)));
    EXPECT_EQ(members_.GetMembers().back(), MakeMember(3));
}

TEST_F(ApplyProposalTest, AddExistingMemberFails) {
    auto result = ApplyProposal(AddMemberChange{MakeMember(1)}, members_, quorum_);
    EXPECT_EQ(result.error, GovernanceError::DUPLICATE_MEMBER);
    EXPECT_EQ(members_.Size(), 2u);
}

TEST_F(ApplyProposalTest, RemoveMember) {
    ASSERT_TRUE(ApplyProposal(RemoveMemberChange{MakeMember(1)}, members_, quorum_).IsOk());
    EXPECT_FALSE(members_.IsMember(MakeMember(1)));
    EXPECT_EQ(members_.Size(), 1u);
}

TEST_F(ApplyProposalTest, RemoveAbsentMemberFails) {
    auto result = ApplyProposal(RemoveMemberChange{MakeMember(9)}, members_, quorum_);
    EXPECT_EQ(result.error, GovernanceError::NOT_MEMBER);
}

TEST_F(ApplyProposalTest, ChangeParametersOverwritesWithoutBoundsCheck) {
    ChangeParametersChange change;
    change.config.countThreshold = 5;
    change.config.weightThresholdPercent = 250;
    change.config.mode = QuorumMode::Weight;

    ASSERT_TRUE(ApplyProposal(change, members_, quorum_).IsOk());
    EXPECT_EQ(quorum_, change.config);
    EXPECT_EQ(members_.Size(), 2u);
}

// ============================================================================
// Effects
// ============================================================================

TEST(EffectTest, CallbackEffectForwards) {
    RecordId seenId = 99;
    Amount seenValue = 0;
    CallbackEffect effect([&](RecordId id, const ActionPayload& payload) {
        seenId = id;
        seenValue = payload.value;
        return OpResult::Success();
    });

    ActionPayload payload;
    payload.value = 500;
    EXPECT_TRUE(effect.Dispatch(4, payload).IsOk());
    EXPECT_EQ(seenId, 4u);
    EXPECT_EQ(seenValue, 500u);
}

TEST(EffectTest, EmptyCallbackEffectFails) {
    CallbackEffect effect(nullptr);
    EXPECT_EQ(effect.Dispatch(0, ActionPayload{}).error, GovernanceError::EFFECT_DISPATCH_FAILED);
}

TEST(EffectTest, LoggingPayoutCounts) {
    LoggingPayoutEffect effect;
    EXPECT_TRUE(effect.Dispatch(0, ActionPayload{}).IsOk());
    EXPECT_TRUE(effect.Dispatch(1, ActionPayload{}).IsOk());
    EXPECT_EQ(effect.PayoutCount(), 2u);
}
