// SEMAPHORE - Keccak-256 Tests
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License

#include <gtest/gtest.h>
#include "semaphore/crypto/keccak.h"
#include "semaphore/core/hex.h"
#include "semaphore/core/types.h"

#include <array>
#include <string>
#include <vector>

namespace semaphore {
namespace test {

namespace {

std::string DigestHex(const Bytes& data) {
    return Keccak256Hash(data).ToHex();
}

} // namespace

TEST(Keccak256Test, EmptyInput) {
    EXPECT_EQ(DigestHex({}),
              "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
}

TEST(Keccak256Test, ABCString) {
    // Differs from SHA3-256("abc") only through the padding byte
    EXPECT_EQ(DigestHex(ToBytes("abc")),
              "4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45");
}

TEST(Keccak256Test, RateBoundaries) {
    EXPECT_EQ(DigestHex(Bytes(135, 'a')),
              "34367dc248bbd832f4e3e69dfaac2f92638bd0bbd18f2912ba4ef454919cf446");
    EXPECT_EQ(DigestHex(Bytes(136, 'a')),
              "a6c4d403279fe3e0af03729caada8374b5ca54d8065329a3ebcaeb4b60aa386e");
}

TEST(Keccak256Test, IncrementalMatchesOneShot) {
    Bytes data;
    for (int i = 0; i < 200; ++i) {
        data.push_back(static_cast<Byte>(i));
    }

    Keccak256 hasher;
    hasher.Write(data.data(), 1).Write(data.data() + 1, 150).Write(data.data() + 151, 49);
    std::array<Byte, Keccak256::OUTPUT_SIZE> out;
    hasher.Finalize(out.data());

    EXPECT_EQ(BytesToHex(out),
              "bfb0aa97863e797943cf7c33bb7e880bb4543f3d2703c0923c6901c2af57b890");
    EXPECT_EQ(BytesToHex(out), DigestHex(data));
}

TEST(Keccak256Test, ResetStartsOver) {
    Bytes abc = ToBytes("abc");
    Keccak256 hasher;
    hasher.Write(ToBytes("garbage").data(), 7);
    hasher.Reset();
    hasher.Write(abc.data(), abc.size());

    std::array<Byte, Keccak256::OUTPUT_SIZE> out;
    hasher.Finalize(out.data());
    EXPECT_EQ(BytesToHex(out), DigestHex(abc));
}

} // namespace test
} // namespace semaphore
