// COFFER - Approval Ledger Tests
// Copyright (c) 2024 COFFER Developers
// MIT License

#include <gtest/gtest.h>
#include <coffer/governance/approval.h>
#include <coffer/governance/record.h>

#include <string>

using namespace coffer;
using namespace coffer::governance;

namespace {

MemberId MakeMember(uint8_t id) {
    std::array<Byte, 20> data{};
    data[19] = id;
    return MemberId(data);
}

} // namespace

// ============================================================================
// ApprovalState
// ============================================================================

class ApprovalStateTest : public ::testing::Test {
protected:
    ApprovalState state_;
    MemberId alice_{MakeMember(1)};
    MemberId bob_{MakeMember(2)};
};

TEST_F(ApprovalStateTest, ApproveAccumulates) {
    ASSERT_TRUE(ApplyApproval(state_, false, alice_, true, 100).IsOk());
    ASSERT_TRUE(ApplyApproval(state_, false, bob_, true, 50).IsOk());

    EXPECT_EQ(state_.count, 2u);
    EXPECT_EQ(state_.weight, 150u);
    EXPECT_TRUE(state_.HasApproved(alice_));
    EXPECT_EQ(state_.approvedBy.at(bob_), 50u);
    EXPECT_TRUE(state_.IsConsistent());
}

TEST_F(ApprovalStateTest, ApproveCheckOrder) {
    // Membership is checked before the executed flag
    EXPECT_EQ(ApplyApproval(state_, true, alice_, false, 0).error, GovernanceError::NOT_MEMBER);
    EXPECT_EQ(ApplyApproval(state_, true, alice_, true, 0).error, GovernanceError::ALREADY_EXECUTED);

    ASSERT_TRUE(ApplyApproval(state_, false, alice_, true, 0).IsOk());
    EXPECT_EQ(ApplyApproval(state_, false, alice_, true, 0).error, GovernanceError::ALREADY_APPROVED);
    EXPECT_EQ(state_.count, 1u);
}

TEST_F(ApprovalStateTest, ApproveOverflowLeavesStateUntouched) {
    ASSERT_TRUE(ApplyApproval(state_, false, alice_, true, MAX_AMOUNT).IsOk());
    auto result = ApplyApproval(state_, false, bob_, true, 1);
    EXPECT_EQ(result.error, GovernanceError::ARITHMETIC_OVERFLOW);
    EXPECT_EQ(state_.count, 1u);
    EXPECT_FALSE(state_.HasApproved(bob_));
}

TEST_F(ApprovalStateTest, RevokeIsInverseOfApprove) {
    ASSERT_TRUE(ApplyApproval(state_, false, bob_, true, 30).IsOk());
    const uint64_t countBefore = state_.count;
    const Amount weightBefore = state_.weight;

    ASSERT_TRUE(ApplyApproval(state_, false, alice_, true, 70).IsOk());
    ASSERT_TRUE(ApplyRevocation(state_, false, alice_).IsOk());

    EXPECT_EQ(state_.count, countBefore);
    EXPECT_EQ(state_.weight, weightBefore);
    EXPECT_FALSE(state_.HasApproved(alice_));

    // May approve again afterwards
    EXPECT_TRUE(ApplyApproval(state_, false, alice_, true, 70).IsOk());
}

TEST_F(ApprovalStateTest, RevokeSubtractsCapturedWeight) {
    ASSERT_TRUE(ApplyApproval(state_, false, alice_, true, 10).IsOk());
    ASSERT_TRUE(ApplyApproval(state_, false, bob_, true, 5).IsOk());

    // alice's contribution has since grown; the captured 10 is what comes off
    ASSERT_TRUE(ApplyRevocation(state_, false, alice_).IsOk());
    EXPECT_EQ(state_.weight, 5u);
    EXPECT_TRUE(state_.IsConsistent());
}

TEST_F(ApprovalStateTest, RevokeFailures) {
    EXPECT_EQ(ApplyRevocation(state_, false, alice_).error, GovernanceError::NOT_APPROVED);

    ASSERT_TRUE(ApplyApproval(state_, false, alice_, true, 1).IsOk());
    EXPECT_EQ(ApplyRevocation(state_, true, alice_).error, GovernanceError::ALREADY_EXECUTED);
    EXPECT_EQ(state_.count, 1u);
}

TEST_F(ApprovalStateTest, ConsistencyCheck) {
    EXPECT_TRUE(state_.IsConsistent());
    state_.approvedBy[alice_] = 5;
    EXPECT_FALSE(state_.IsConsistent());
    state_.count = 1;
    EXPECT_FALSE(state_.IsConsistent());
    state_.weight = 5;
    EXPECT_TRUE(state_.IsConsistent());
}

// ============================================================================
// RecordLog
// ============================================================================

class RecordLogTest : public ::testing::Test {
protected:
    RecordLog<std::string> log_;
    MemberId alice_{MakeMember(1)};
};

TEST_F(RecordLogTest, IdsAreSequentialPositions) {
    EXPECT_EQ(log_.Append("first"), 0u);
    EXPECT_EQ(log_.Append("second"), 1u);
    EXPECT_EQ(log_.Size(), 2u);
    ASSERT_NE(log_.Find(1), nullptr);
    EXPECT_EQ(log_.Find(1)->payload, "second");
    EXPECT_EQ(log_.Find(1)->id, 1u);
    EXPECT_FALSE(log_.Find(1)->executed);
    EXPECT_EQ(log_.Find(2), nullptr);
}

TEST_F(RecordLogTest, UnknownIdIsNotFound) {
    EXPECT_EQ(log_.Approve(0, alice_, true, 1).error, GovernanceError::NOT_FOUND);
    EXPECT_EQ(log_.Revoke(0, alice_).error, GovernanceError::NOT_FOUND);
    EXPECT_EQ(log_.CheckPending(0).error, GovernanceError::NOT_FOUND);
}

TEST_F(RecordLogTest, ExecutedRecordRejectsChanges) {
    RecordId id = log_.Append("payout");
    ASSERT_TRUE(log_.Approve(id, alice_, true, 1).IsOk());
    ASSERT_TRUE(log_.CheckPending(id).IsOk());

    log_.MarkExecuted(id);
    EXPECT_EQ(log_.CheckPending(id).error, GovernanceError::ALREADY_EXECUTED);
    EXPECT_EQ(log_.Revoke(id, alice_).error, GovernanceError::ALREADY_EXECUTED);
    EXPECT_EQ(log_.Approve(id, MakeMember(2), true, 1).error, GovernanceError::ALREADY_EXECUTED);
    EXPECT_EQ(log_.Find(id)->approvals.count, 1u);
}

TEST_F(RecordLogTest, RestoreValidatesIdsAndApprovals) {
    std::vector<Record<std::string>> records(2);
    records[0].id = 0;
    records[1].id = 1;

    RecordLog<std::string> restored;
    ASSERT_TRUE(RecordLog<std::string>::Restore(records, restored));
    EXPECT_EQ(restored.Size(), 2u);

    records[1].id = 5;
    EXPECT_FALSE(RecordLog<std::string>::Restore(records, restored));

    records[1].id = 1;
    records[1].approvals.count = 3;
    EXPECT_FALSE(RecordLog<std::string>::Restore(records, restored));
}
