// SEMAPHORE - Hex Encoding Tests
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License

#include <gtest/gtest.h>

#include "semaphore/core/hex.h"
#include "semaphore/core/types.h"

#include <array>
#include <stdexcept>
#include <string>
#include <vector>

namespace semaphore {
namespace test {

TEST(HexTest, BytesToHex) {
    std::vector<uint8_t> data = {0x00, 0x01, 0xab, 0xff};
    EXPECT_EQ(BytesToHex(data), "0001abff");
    EXPECT_EQ(BytesToHex(std::vector<uint8_t>{}), "");

    std::array<uint8_t, 2> arr = {0xde, 0xad};
    EXPECT_EQ(BytesToHex(arr), "dead");
}

TEST(HexTest, HexToBytes) {
    EXPECT_EQ(HexToBytes("0001abff"), (std::vector<uint8_t>{0x00, 0x01, 0xab, 0xff}));
    EXPECT_EQ(HexToBytes("0xDEAD"), (std::vector<uint8_t>{0xde, 0xad}));
    EXPECT_TRUE(HexToBytes("").empty());
    EXPECT_THROW(HexToBytes("abc"), std::invalid_argument);
    EXPECT_THROW(HexToBytes("zz"), std::invalid_argument);
}

TEST(HexTest, IsValidHex) {
    EXPECT_TRUE(IsValidHex("00ff"));
    EXPECT_TRUE(IsValidHex("0xABcd"));
    EXPECT_FALSE(IsValidHex(""));
    EXPECT_FALSE(IsValidHex("0x"));
    EXPECT_FALSE(IsValidHex("123"));
    EXPECT_FALSE(IsValidHex("g0"));
}

TEST(Hash256Test, DefaultIsNull) {
    Hash256 h;
    EXPECT_TRUE(h.IsNull());
    EXPECT_EQ(h.ToHex(), std::string(64, '0'));
}

TEST(Hash256Test, FromBytes) {
    std::vector<uint8_t> bytes = HexToBytes("0102030405");
    Hash256 h(bytes.data(), bytes.size());
    EXPECT_FALSE(h.IsNull());
    EXPECT_EQ(h[0], 0x01);
    EXPECT_EQ(h[4], 0x05);
    EXPECT_EQ(h[5], 0x00);
    EXPECT_EQ(h.ToHex().substr(0, 12), "010203040500");

    Hash256 same(bytes.data(), bytes.size());
    EXPECT_EQ(h, same);
    same[31] = 1;
    EXPECT_NE(h, same);
}

TEST(TypesTest, ToBytes) {
    EXPECT_EQ(ToBytes("ab"), (Bytes{0x61, 0x62}));
    EXPECT_TRUE(ToBytes("").empty());
}

} // namespace test
} // namespace semaphore
