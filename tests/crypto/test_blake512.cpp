// SEMAPHORE - BLAKE-512 Tests
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License

#include <gtest/gtest.h>
#include "semaphore/crypto/blake512.h"
#include "semaphore/core/hex.h"
#include "semaphore/core/types.h"

#include <string>
#include <vector>

namespace semaphore {
namespace test {

namespace {

std::string DigestHex(const Bytes& data) {
    return BytesToHex(Blake512Hash(data));
}

} // namespace

TEST(Blake512Test, OutputSizeIs64Bytes) {
    EXPECT_EQ(Blake512::OUTPUT_SIZE, 64u);
}

TEST(Blake512Test, EmptyInput) {
    EXPECT_EQ(DigestHex({}),
              "a8cfbbd73726062df0c6864dda65defe58ef0cc52a5625090fa17601e1eecd1b"
              "628e94f396ae402a00acc9eab77b4d4c2e852aaaa25a636d80af3fc7913ef5b8");
}

TEST(Blake512Test, SingleZeroByte) {
    EXPECT_EQ(DigestHex(Bytes(1, 0)),
              "97961587f6d970faba6d2478045de6d1fabd09b61ae50932054d52bc29d31be4"
              "ff9102b9f69e2bbdb83be13d4b9c06091e5fa0b48bd081b634058be0ec49beb3");
}

TEST(Blake512Test, TwoBlockZeroInput) {
    EXPECT_EQ(DigestHex(Bytes(144, 0)),
              "313717d608e9cf758dcb1eb0f0c3cf9fc150b2d500fb33f51c52afc99d358a2f"
              "1374b8a38bba7974e7f6ef79cab16f22ce1e649d6e01ad9589c213045d545dde");
}

TEST(Blake512Test, PaddingBoundaries) {
    // 111 bytes pad within one block, 112 bytes spill into a second
    EXPECT_EQ(DigestHex(Bytes(111, 'a')),
              "93e94241778a8b6e7461f8567963aee4dc7ce2a8d6f187bb4341c889570e2e96"
              "f8598569281c813a4283487b3492d8797c389a7c8927e99186efabb68cccab1d");
    EXPECT_EQ(DigestHex(Bytes(112, 'a')),
              "2e09048abf211af05d6f9b76434798bfe3c6b89342fb3ba75c334062be9a9901"
              "ebf6197a223c570c7199205ea9a0d5c07b9541722c07513fa009d2445d6de61c");
}

TEST(Blake512Test, IncrementalMatchesOneShot) {
    Bytes data;
    for (int i = 0; i < 256; ++i) {
        data.push_back(static_cast<Byte>(i));
    }

    Blake512 hasher;
    hasher.Write(data.data(), 5).Write(data.data() + 5, 123).Write(data.data() + 128, 128);
    Hash512 out;
    hasher.Finalize(out.data());

    EXPECT_EQ(BytesToHex(out),
              "c0b4d984b15a33b656ad20d33f093bf85d344d26c10a51a0bcaef643fc8473fe"
              "6af0301dd1eae72dceed9894b7c79de48dc95ee6450f79326affff4544bd2254");
    EXPECT_EQ(BytesToHex(out), DigestHex(data));
}

TEST(Blake512Test, ResetStartsOver) {
    Bytes abc = ToBytes("abc");
    Blake512 hasher;
    hasher.Write(abc.data(), abc.size());
    hasher.Reset();
    hasher.Write(abc.data(), abc.size());

    Hash512 out;
    hasher.Finalize(out.data());
    EXPECT_EQ(BytesToHex(out),
              "14266c7c704a3b58fb421ee69fd005fcc6eeff742136be67435df995b7c986e7"
              "cbde4dbde135e7689c354d2bc5b8d260536c554b4f84c118e61efc576fed7cd3");
}

} // namespace test
} // namespace semaphore
