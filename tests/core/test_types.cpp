// PRICEFEED - Core Types Tests
// Copyright (c) 2024 PRICEFEED Developers
// MIT License

#include <gtest/gtest.h>
#include "pricefeed/core/hex.h"
#include "pricefeed/core/types.h"

#include <map>
#include <stdexcept>
#include <string>

using namespace pricefeed;

// ============================================================================
// Hash Tests
// ============================================================================

TEST(Hash160Test, SizeIs20Bytes) {
    Hash160 hash;
    EXPECT_EQ(hash.size(), 20u);
    EXPECT_EQ(Hash160::SIZE, 20u);
    EXPECT_TRUE(hash.IsNull());
}

TEST(Hash160Test, HexRoundTripKeepsByteOrder) {
    std::string hex = "0102030405060708090a0b0c0d0e0f1011121314";
    Hash160 hash = Hash160::FromHex(hex);
    EXPECT_EQ(hash[0], 0x01);
    EXPECT_EQ(hash[19], 0x14);
    EXPECT_EQ(hash.ToHex(), hex);
}

TEST(Hash160Test, FromHexWrongLengthThrows) {
    EXPECT_THROW(Hash160::FromHex("0102"), std::invalid_argument);
}

TEST(Hash160Test, LessThanFollowsHexOrder) {
    Hash160 a = Hash160::FromHex("00000000000000000000000000000000000000ff");
    Hash160 b = Hash160::FromHex("0100000000000000000000000000000000000000");
    EXPECT_TRUE(a < b);
    EXPECT_FALSE(b < a);
    EXPECT_FALSE(a < a);

    std::map<Hash160, int> ordered{{b, 2}, {a, 1}};
    EXPECT_EQ(ordered.begin()->second, 1);
}

TEST(Hash256Test, EqualityOperator) {
    Hash256 a;
    Hash256 b;
    EXPECT_EQ(a, b);
    b[31] = 1;
    EXPECT_NE(a, b);
    b.SetNull();
    EXPECT_EQ(a, b);
}

// ============================================================================
// Principal Parsing
// ============================================================================

TEST(PrincipalTest, ParseValid) {
    Principal p;
    EXPECT_TRUE(ParsePrincipal("aabbccddeeff00112233445566778899aabbccdd", p));
    EXPECT_EQ(p.ToHex(), "aabbccddeeff00112233445566778899aabbccdd");
}

TEST(PrincipalTest, ParseAcceptsUppercase) {
    Principal p;
    EXPECT_TRUE(ParsePrincipal("AABBCCDDEEFF00112233445566778899AABBCCDD", p));
    EXPECT_EQ(p.ToHex(), "aabbccddeeff00112233445566778899aabbccdd");
}

TEST(PrincipalTest, ParseRejectsMalformed) {
    Principal p;
    EXPECT_FALSE(ParsePrincipal("", p));
    EXPECT_FALSE(ParsePrincipal("abcd", p));
    EXPECT_FALSE(ParsePrincipal("zzbbccddeeff00112233445566778899aabbccdd", p));
    EXPECT_FALSE(ParsePrincipal("aabbccddeeff00112233445566778899aabbccddee", p));
    EXPECT_TRUE(p.IsNull());
}

// ============================================================================
// Hex Tests
// ============================================================================

TEST(HexTest, BytesToHex) {
    std::vector<HexByte> bytes = {0x00, 0x7f, 0xff};
    EXPECT_EQ(BytesToHex(bytes), "007fff");
    EXPECT_EQ(BytesToHex(std::vector<HexByte>{}), "");
}

TEST(HexTest, HexToBytes) {
    auto bytes = HexToBytes("deadBEEF");
    ASSERT_EQ(bytes.size(), 4u);
    EXPECT_EQ(bytes[0], 0xde);
    EXPECT_EQ(bytes[3], 0xef);
}

TEST(HexTest, HexToBytesInvalidThrows) {
    EXPECT_THROW(HexToBytes("abc"), std::invalid_argument);
    EXPECT_THROW(HexToBytes("zz"), std::invalid_argument);
}

TEST(HexTest, IsValidHex) {
    EXPECT_TRUE(IsValidHex("00ff"));
    EXPECT_FALSE(IsValidHex(""));
    EXPECT_FALSE(IsValidHex("0"));
    EXPECT_FALSE(IsValidHex("0g"));
}
