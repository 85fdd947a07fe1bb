// COFFER - Pool Snapshot Tests
// Copyright (c) 2024 COFFER Developers
// MIT License

#include <gtest/gtest.h>

#include "coffer/core/hex.h"
#include "coffer/governance/snapshot.h"

#include <cstring>
#include <memory>

using namespace coffer;
using namespace coffer::governance;

namespace {

Address MakeAddress(uint8_t id) {
    std::array<Byte, 20> data{};
    data[0] = 0x5C;
    data[19] = id;
    return Address(data);
}

/// Recompute the trailing checksum after tampering with the body
void Reseal(std::vector<Byte>& bytes) {
    size_t body = bytes.size() - 32;
    Hash256 sum = SnapshotChecksum(bytes.data(), body);
    std::memcpy(bytes.data() + body, sum.data(), 32);
}

} // namespace

class SnapshotTest : public ::testing::Test {
protected:
    void SetUp() override {
        a_ = MakeAddress(1);
        b_ = MakeAddress(2);
        c_ = MakeAddress(3);
        target_ = MakeAddress(77);

        effect_ = std::make_shared<CallbackEffect>(
            [](RecordId, const ActionPayload&) { return OpResult::Success(); });

        PoolConfig config;
        config.members = {a_, b_, c_};
        config.quorum.countThreshold = 2;
        config.quorum.weightThresholdPercent = 40;
        engine_ = PoolEngine::Create(config, effect_);
        ASSERT_NE(engine_, nullptr);

        // A pool with some history
        ASSERT_TRUE(engine_->Deposit(a_, 600).IsOk());
        ASSERT_TRUE(engine_->Deposit(b_, 400).IsOk());
        ASSERT_TRUE(engine_->Deposit(target_, 5).IsOk());

        auto paid = engine_->SubmitAction(a_, target_, 250, {0x01, 0x02, 0x03}).id;
        ASSERT_TRUE(engine_->ApproveAction(a_, paid).IsOk());
        ASSERT_TRUE(engine_->ApproveAction(b_, paid).IsOk());
        ASSERT_TRUE(engine_->ExecuteAction(c_, paid).IsOk());

        auto pending = engine_->SubmitAction(b_, target_, 10, {}).id;
        ASSERT_TRUE(engine_->ApproveAction(b_, pending).IsOk());

        ChangeParametersChange change;
        change.config.countThreshold = 1;
        change.config.weightThresholdPercent = 75;
        change.config.mode = QuorumMode::Weight;
        ASSERT_TRUE(engine_->SubmitProposal(a_, change).IsOk());
        ASSERT_TRUE(engine_->SubmitProposal(c_, RemoveMemberChange{b_}).IsOk());
        ASSERT_TRUE(engine_->ApproveProposal(c_, 1).IsOk());
    }

    std::unique_ptr<PoolEngine> MakeEmptyEngine() {
        PoolConfig config;
        config.members = {target_};
        return PoolEngine::Create(config, effect_);
    }

    Address a_, b_, c_, target_;
    std::shared_ptr<CallbackEffect> effect_;
    std::unique_ptr<PoolEngine> engine_;
};

TEST_F(SnapshotTest, RestoreReproducesState) {
    auto bytes = engine_->Serialize();
    ASSERT_EQ(std::memcmp(bytes.data(), SNAPSHOT_MAGIC, 4), 0);

    auto restored = MakeEmptyEngine();
    ASSERT_TRUE(restored->Restore(bytes).IsOk());

    EXPECT_EQ(restored->GetMembers(), engine_->GetMembers());
    EXPECT_EQ(restored->GetBalance(), 755u);
    EXPECT_EQ(restored->ContributionOf(a_), 600u);
    EXPECT_EQ(restored->ContributionOf(target_), 0u);
    EXPECT_EQ(restored->TotalContributions(), 1000u);
    EXPECT_EQ(restored->GetQuorumConfig(), engine_->GetQuorumConfig());

    ASSERT_EQ(restored->GetActionCount(), 2u);
    auto paid = restored->GetAction(0);
    EXPECT_TRUE(paid->executed);
    EXPECT_EQ(paid->payload, engine_->GetAction(0)->payload);
    EXPECT_EQ(paid->approvals.weight, 1000u);
    EXPECT_FALSE(restored->GetAction(1)->executed);
    EXPECT_TRUE(restored->IsActionApprovedBy(1, b_));

    ASSERT_EQ(restored->GetProposalCount(), 2u);
    auto change = restored->GetProposal(0);
    ASSERT_TRUE(std::holds_alternative<ChangeParametersChange>(change->payload));
    EXPECT_EQ(std::get<ChangeParametersChange>(change->payload).config.weightThresholdPercent, 75u);
    EXPECT_TRUE(restored->IsProposalApprovedBy(1, c_));

    // Encoding is a function of state
    EXPECT_EQ(restored->Serialize(), bytes);
}

TEST_F(SnapshotTest, RestoredEngineKeepsWorking) {
    auto restored = MakeEmptyEngine();
    ASSERT_TRUE(restored->Restore(engine_->Serialize()).IsOk());

    EXPECT_EQ(restored->ExecuteAction(a_, 0).error, GovernanceError::ALREADY_EXECUTED);
    ASSERT_TRUE(restored->ApproveProposal(a_, 1).IsOk());
    ASSERT_TRUE(restored->ExecuteProposal(a_, 1).IsOk());
    EXPECT_FALSE(restored->IsMember(b_));
    EXPECT_EQ(restored->SubmitAction(a_, target_, 0, {}).id, 2u);
}

TEST_F(SnapshotTest, ChecksumMismatchRejected) {
    auto bytes = engine_->Serialize();
    bytes[10] ^= 0x01;

    std::string error;
    EXPECT_FALSE(DecodeSnapshot(bytes, &error).has_value());
    EXPECT_EQ(error, "checksum mismatch");

    auto restored = MakeEmptyEngine();
    auto result = restored->Restore(bytes);
    EXPECT_EQ(result.error, GovernanceError::INVALID_CONFIG);
    // Rejected restore leaves the engine as it was
    EXPECT_TRUE(restored->IsMember(target_));
    EXPECT_EQ(restored->GetActionCount(), 0u);
}

TEST_F(SnapshotTest, BadMagicAndVersionRejected) {
    std::string error;

    auto bytes = engine_->Serialize();
    bytes[0] = 'X';
    EXPECT_FALSE(DecodeSnapshot(bytes, &error).has_value());
    EXPECT_EQ(error, "bad magic");

    bytes = engine_->Serialize();
    bytes[4] = 9;
    Reseal(bytes);
    EXPECT_FALSE(DecodeSnapshot(bytes, &error).has_value());
    EXPECT_EQ(error, "unsupported version 9");
}

TEST_F(SnapshotTest, TruncatedInputRejected) {
    std::string error;
    EXPECT_FALSE(DecodeSnapshot({}, &error).has_value());
    EXPECT_EQ(error, "snapshot too short");

    auto bytes = engine_->Serialize();
    bytes.resize(bytes.size() - 40);
    Reseal(bytes);
    EXPECT_FALSE(DecodeSnapshot(bytes, &error).has_value());
    EXPECT_FALSE(error.empty());
}

TEST_F(SnapshotTest, InconsistentLedgerRejected) {
    PoolState state;
    ASSERT_TRUE(state.members.Add(a_).IsOk());
    ASSERT_TRUE(state.contributions.Deposit(a_, 50, true).IsOk());
    ActionPayload payload;
    payload.target = target_;
    state.actions.Append(payload);
    ASSERT_TRUE(state.actions.Approve(0, a_, true, 50).IsOk());

    const auto bytes = EncodeSnapshot(state);
    ASSERT_TRUE(DecodeSnapshot(bytes).has_value());

    // magic(4) version(4) members(1+20) contributions(1+20+8) balance(8)
    constexpr size_t TOTAL_WEIGHT_OFFSET = 66;
    // quorum(17) count(1) id(8) target(20) value(8) data(1) approvedBy(1+20+8)
    constexpr size_t APPROVAL_COUNT_OFFSET = TOTAL_WEIGHT_OFFSET + 8 + 17 + 1 + 8 + 20 + 8 + 1 + 29;

    std::string error;
    auto tampered = bytes;
    tampered[TOTAL_WEIGHT_OFFSET] = 51;
    Reseal(tampered);
    EXPECT_FALSE(DecodeSnapshot(tampered, &error).has_value());
    EXPECT_EQ(error, "total weight does not match contributions");

    tampered = bytes;
    ASSERT_EQ(tampered[APPROVAL_COUNT_OFFSET], 1);
    tampered[APPROVAL_COUNT_OFFSET] = 2;
    Reseal(tampered);
    EXPECT_FALSE(DecodeSnapshot(tampered, &error).has_value());
    EXPECT_EQ(error, "inconsistent action log");
}

TEST_F(SnapshotTest, ChecksumIsSha256) {
    // SHA-256("abc")
    const Byte abc[] = {'a', 'b', 'c'};
    Hash256 sum = SnapshotChecksum(abc, sizeof(abc));
    EXPECT_EQ(BytesToHex(sum.data(), sum.size()),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}
