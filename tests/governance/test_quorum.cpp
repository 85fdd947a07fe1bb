// COFFER - Quorum Policy Tests
// Copyright (c) 2024 COFFER Developers
// MIT License

#include <gtest/gtest.h>
#include <coffer/governance/approval.h>
#include <coffer/governance/quorum.h>

using namespace coffer;
using namespace coffer::governance;

namespace {

QuorumConfig CountConfig(uint64_t threshold) {
    QuorumConfig config;
    config.countThreshold = threshold;
    config.mode = QuorumMode::Count;
    return config;
}

QuorumConfig WeightConfig(uint64_t percent) {
    QuorumConfig config;
    config.weightThresholdPercent = percent;
    config.mode = QuorumMode::Weight;
    return config;
}

} // namespace

// ============================================================================
// Mode names
// ============================================================================

TEST(QuorumModeTest, ToStringAndParse) {
    EXPECT_STREQ(QuorumModeToString(QuorumMode::Count), "count");
    EXPECT_STREQ(QuorumModeToString(QuorumMode::Weight), "weight");
    EXPECT_EQ(ParseQuorumMode("WEIGHT"), QuorumMode::Weight);
    EXPECT_EQ(ParseQuorumMode("count"), QuorumMode::Count);
    EXPECT_FALSE(ParseQuorumMode("majority").has_value());
}

// ============================================================================
// Config validation
// ============================================================================

TEST(QuorumConfigTest, PercentBounds) {
    EXPECT_TRUE(WeightConfig(0).Validate().IsOk());
    EXPECT_TRUE(WeightConfig(100).Validate().IsOk());
    EXPECT_EQ(WeightConfig(101).Validate().error, GovernanceError::INVALID_CONFIG);
}

// ============================================================================
// Count mode
// ============================================================================

TEST(QuorumPolicyTest, CountModeIsInclusive) {
    auto config = CountConfig(2);
    EXPECT_FALSE(QuorumPasses(0, 0, 0, config));
    EXPECT_FALSE(QuorumPasses(1, 0, 0, config));
    EXPECT_TRUE(QuorumPasses(2, 0, 0, config));
    EXPECT_TRUE(QuorumPasses(3, 0, 0, config));
}

TEST(QuorumPolicyTest, CountModeIgnoresWeight) {
    auto config = CountConfig(2);
    config.weightThresholdPercent = 50;
    EXPECT_FALSE(QuorumPasses(1, 1000, 1000, config));
}

TEST(QuorumPolicyTest, ZeroCountThresholdAlwaysPasses) {
    EXPECT_TRUE(QuorumPasses(0, 0, 0, CountConfig(0)));
}

// ============================================================================
// Weight mode
// ============================================================================

TEST(QuorumPolicyTest, WeightModeIsStrict) {
    auto config = WeightConfig(50);
    // threshold = 2000 * 50 / 100 = 1000
    EXPECT_FALSE(QuorumPasses(1, 1000, 2000, config));
    EXPECT_TRUE(QuorumPasses(1, 1001, 2000, config));
}

TEST(QuorumPolicyTest, WeightModeIgnoresCount) {
    auto config = WeightConfig(50);
    config.countThreshold = 1;
    EXPECT_FALSE(QuorumPasses(10, 0, 2000, config));
}

TEST(QuorumPolicyTest, WeightThresholdTruncates) {
    // 7 * 50 / 100 = 3.5 -> 3
    EXPECT_EQ(WeightThreshold(7, 50), 3u);
    EXPECT_TRUE(QuorumPasses(1, 4, 7, WeightConfig(50)));
    EXPECT_FALSE(QuorumPasses(1, 3, 7, WeightConfig(50)));

    // 3 * 33 / 100 = 0.99 -> 0, so any positive weight passes
    EXPECT_EQ(WeightThreshold(3, 33), 0u);
    EXPECT_TRUE(QuorumPasses(1, 1, 3, WeightConfig(33)));
}

TEST(QuorumPolicyTest, ZeroPercentNeedsPositiveWeight) {
    EXPECT_FALSE(QuorumPasses(4, 0, 1000, WeightConfig(0)));
    EXPECT_TRUE(QuorumPasses(1, 1, 1000, WeightConfig(0)));
}

TEST(QuorumPolicyTest, EmptyPoolNeverPassesWeightMode) {
    EXPECT_FALSE(QuorumPasses(4, 0, 0, WeightConfig(50)));
}

TEST(QuorumPolicyTest, HundredPercentUnreachable) {
    EXPECT_FALSE(QuorumPasses(2, 1000, 1000, WeightConfig(100)));
}

TEST(QuorumPolicyTest, PercentAboveHundredIsHonoured) {
    // 1000 * 150 / 100 = 1500
    EXPECT_EQ(WeightThreshold(1000, 150), 1500u);
    EXPECT_FALSE(QuorumPasses(2, 1000, 1000, WeightConfig(150)));
}

TEST(QuorumPolicyTest, WeightThresholdAvoidsIntermediateOverflow) {
    // totalWeight * percent would overflow; the result does not
    Amount total = MAX_AMOUNT - 1;
    auto threshold = WeightThreshold(total, 50);
    ASSERT_TRUE(threshold.has_value());
    EXPECT_EQ(*threshold, total / 2);
}

TEST(QuorumPolicyTest, WeightThresholdOverflowFailsClosed) {
    EXPECT_FALSE(WeightThreshold(MAX_AMOUNT, 200).has_value());
    EXPECT_FALSE(QuorumPasses(1, MAX_AMOUNT, MAX_AMOUNT, WeightConfig(200)));
}

TEST(QuorumPolicyTest, ApprovalStateOverload) {
    ApprovalState approvals;
    approvals.count = 2;
    approvals.weight = 2000;
    EXPECT_TRUE(QuorumPasses(approvals, 2000, CountConfig(2)));
    EXPECT_TRUE(QuorumPasses(approvals, 2000, WeightConfig(50)));
    EXPECT_FALSE(QuorumPasses(approvals, 2000, CountConfig(3)));
}
