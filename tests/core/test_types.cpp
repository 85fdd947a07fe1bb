// COFFER - Core Type Tests
// Copyright (c) 2024 COFFER Developers
// MIT License

#include <gtest/gtest.h>
#include "coffer/core/hex.h"
#include "coffer/core/types.h"

#include <array>
#include <limits>
#include <stdexcept>
#include <vector>

using namespace coffer;

// ============================================================================
// Checked Arithmetic
// ============================================================================

TEST(CheckedArithmeticTest, AddWithinRange) {
    Amount out = 0;
    EXPECT_TRUE(CheckedAdd(40, 2, out));
    EXPECT_EQ(out, 42u);
}

TEST(CheckedArithmeticTest, AddOverflowLeavesOutput) {
    Amount out = 7;
    EXPECT_FALSE(CheckedAdd(MAX_AMOUNT, 1, out));
    EXPECT_EQ(out, 7u);
    EXPECT_TRUE(CheckedAdd(MAX_AMOUNT - 1, 1, out));
    EXPECT_EQ(out, MAX_AMOUNT);
}

TEST(CheckedArithmeticTest, SubUnderflow) {
    Amount out = 0;
    EXPECT_TRUE(CheckedSub(5, 5, out));
    EXPECT_EQ(out, 0u);
    EXPECT_FALSE(CheckedSub(4, 5, out));
}

TEST(CheckedArithmeticTest, MulOverflow) {
    Amount out = 0;
    EXPECT_TRUE(CheckedMul(0, MAX_AMOUNT, out));
    EXPECT_EQ(out, 0u);
    EXPECT_TRUE(CheckedMul(MAX_AMOUNT / 2, 2, out));
    EXPECT_FALSE(CheckedMul(MAX_AMOUNT / 2 + 1, 2, out));
}

// ============================================================================
// Hash Types
// ============================================================================

TEST(Hash160Test, DefaultIsNull) {
    Hash160 hash;
    EXPECT_TRUE(hash.IsNull());
    EXPECT_EQ(hash.size(), 20u);
}

TEST(Hash160Test, ConstructFromShortBytesZeroPads) {
    std::vector<Byte> bytes = {0xAB, 0xCD};
    Hash160 hash(bytes.data(), bytes.size());
    EXPECT_FALSE(hash.IsNull());
    EXPECT_EQ(hash[0], 0xAB);
    EXPECT_EQ(hash[1], 0xCD);
    EXPECT_EQ(hash[19], 0x00);
}

TEST(Hash160Test, Ordering) {
    std::array<Byte, 20> low{};
    std::array<Byte, 20> high{};
    low[19] = 1;
    high[0] = 1;
    Hash160 a(low);
    Hash160 b(high);
    EXPECT_TRUE(a < b);
    EXPECT_FALSE(b < a);
    EXPECT_NE(a, b);
}

TEST(Hash256Test, ToHex) {
    std::array<Byte, 32> data{};
    data[0] = 0x01;
    data[31] = 0xFF;
    Hash256 hash(data);
    std::string hex = hash.ToHex();
    EXPECT_EQ(hex.size(), 64u);
    EXPECT_EQ(hex.substr(0, 2), "01");
    EXPECT_EQ(hex.substr(62, 2), "ff");
}

// ============================================================================
// Addresses
// ============================================================================

TEST(AddressTest, FormatAndParse) {
    std::array<Byte, 20> data{};
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<Byte>(i * 13);
    }
    Address addr(data);
    std::string text = FormatAddress(addr);
    EXPECT_EQ(text.size(), 42u);
    EXPECT_EQ(text.substr(0, 2), "0x");

    auto parsed = ParseAddress(text);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, addr);
}

TEST(AddressTest, ParseWithoutPrefix) {
    auto parsed = ParseAddress("00000000000000000000000000000000000000aa");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ((*parsed)[19], 0xAA);
}

TEST(AddressTest, ParseRejectsMalformed) {
    EXPECT_FALSE(ParseAddress("").has_value());
    EXPECT_FALSE(ParseAddress("0x1234").has_value());
    EXPECT_FALSE(ParseAddress("0xzz00000000000000000000000000000000000000").has_value());
    EXPECT_FALSE(ParseAddress("0x00000000000000000000000000000000000000aabb").has_value());
}

// ============================================================================
// Hex
// ============================================================================

TEST(HexTest, RoundTrip) {
    std::vector<uint8_t> bytes = {0x00, 0x7f, 0x80, 0xff};
    EXPECT_EQ(BytesToHex(bytes), "007f80ff");
    EXPECT_EQ(HexToBytes("0x007F80ff"), bytes);
}

TEST(HexTest, InvalidInputThrows) {
    EXPECT_THROW(HexToBytes("abc"), std::invalid_argument);
    EXPECT_THROW(HexToBytes("zz"), std::invalid_argument);
}

TEST(HexTest, IsValidHex) {
    EXPECT_TRUE(IsValidHex(""));
    EXPECT_TRUE(IsValidHex("0x"));
    EXPECT_TRUE(IsValidHex("0xdeadBEEF"));
    EXPECT_FALSE(IsValidHex("0xdea"));
    EXPECT_FALSE(IsValidHex("g0"));
}
