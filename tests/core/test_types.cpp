// SHARELEDGER - Core Types Tests
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include "shareledger/core/types.h"
#include "shareledger/core/hex.h"

#include <stdexcept>

namespace shareledger {
namespace test {

// ============================================================================
// Hash Tests
// ============================================================================

TEST(Hash256Test, DefaultConstructorCreatesZeroHash) {
    Hash256 h;
    EXPECT_TRUE(h.IsNull());
    for (size_t i = 0; i < Hash256::SIZE; ++i) {
        EXPECT_EQ(h[i], 0);
    }
}

TEST(Hash256Test, HexRoundTrip) {
    const std::string hex =
        "00112233445566778899aabbccddeeff00112233445566778899aabbccddeeff";
    Hash256 h = Hash256::FromHex(hex);
    EXPECT_FALSE(h.IsNull());
    EXPECT_EQ(h[0], 0x00);
    EXPECT_EQ(h[1], 0x11);
    EXPECT_EQ(h[15], 0xff);
    EXPECT_EQ(h.ToHex(), hex);
}

TEST(Hash256Test, FromHexRejectsWrongLength) {
    EXPECT_THROW(Hash256::FromHex("abcd"), std::invalid_argument);
}

TEST(Hash160Test, SetNull) {
    Hash160 h;
    h[3] = 7;
    EXPECT_FALSE(h.IsNull());
    h.SetNull();
    EXPECT_TRUE(h.IsNull());
}

TEST(Hash160Test, OrderingIsBytewise) {
    Hash160 a;
    Hash160 b;
    a[0] = 1;
    b[0] = 2;
    EXPECT_TRUE(a < b);
    EXPECT_FALSE(b < a);
    EXPECT_NE(a, b);

    b[0] = 1;
    EXPECT_EQ(a, b);
}

// ============================================================================
// Address Parsing
// ============================================================================

TEST(AddressTest, ParsePlainHex) {
    Address addr;
    ASSERT_TRUE(ParseAddress("0102030405060708090a0b0c0d0e0f1011121314", addr));
    EXPECT_EQ(addr[0], 0x01);
    EXPECT_EQ(addr[19], 0x14);
}

TEST(AddressTest, ParsePrefixedHex) {
    Address addr;
    ASSERT_TRUE(ParseAddress("0xABCDEF0000000000000000000000000000000001", addr));
    EXPECT_EQ(addr[0], 0xab);
    EXPECT_EQ(addr[19], 0x01);
}

TEST(AddressTest, RejectsBadInput) {
    Address addr;
    EXPECT_FALSE(ParseAddress("", addr));
    EXPECT_FALSE(ParseAddress("0x", addr));
    EXPECT_FALSE(ParseAddress("0102", addr));
    EXPECT_FALSE(ParseAddress("zz02030405060708090a0b0c0d0e0f1011121314", addr));
    EXPECT_FALSE(ParseAddress("0102030405060708090a0b0c0d0e0f101112131415", addr));
    EXPECT_TRUE(addr.IsNull());
}

// ============================================================================
// Hex Utilities
// ============================================================================

TEST(HexTest, Encode) {
    std::vector<uint8_t> bytes = {0x00, 0x7f, 0x80, 0xff};
    EXPECT_EQ(HexEncode(bytes), "007f80ff");
    EXPECT_EQ(HexEncode(std::vector<uint8_t>{}), "");
}

TEST(HexTest, DecodeAcceptsMixedCaseAndPrefix) {
    auto bytes = HexDecode("0aFf");
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(*bytes, (std::vector<uint8_t>{0x0a, 0xff}));

    auto prefixed = HexDecode("0X0aff");
    ASSERT_TRUE(prefixed.has_value());
    EXPECT_EQ(*prefixed, *bytes);

    auto empty = HexDecode("");
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
}

TEST(HexTest, DecodeRejectsInvalid) {
    EXPECT_FALSE(HexDecode("abc").has_value());
    EXPECT_FALSE(HexDecode("zz").has_value());
    EXPECT_FALSE(HexDecode("0x0").has_value());
    EXPECT_FALSE(HexDecode("0g").has_value());
}

} // namespace test
} // namespace shareledger
