// SEMAPHORE - Circom Format Tests
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License

#include <gtest/gtest.h>

#include "semaphore/core/errors.h"
#include "semaphore/proof/circom.h"

#include <vector>

using namespace semaphore;
using namespace semaphore::proof;
using semaphore::util::JSONValue;

namespace {

std::vector<FieldElement> SampleWitness() {
    return {FieldElement::One(), FieldElement(uint64_t(5)), FieldElement(uint64_t(0xdeadbeef)),
            FieldElement::Zero() - FieldElement::One()};
}

Groth16Points SamplePoints() {
    Groth16Points points;
    points.a = {Uint256(1), Uint256(2)};
    points.b[0] = {Uint256(3), Uint256(4)};
    points.b[1] = {Uint256(5), Uint256(6)};
    points.c = {Uint256(7), Uint256(8)};
    return points;
}

} // namespace

// ============================================================================
// Circuit inputs
// ============================================================================

TEST(CircomInputsTest, DecimalStringsForEverySignal) {
    WitnessInputs inputs;
    inputs.trapdoor = FieldElement(uint64_t(11));
    inputs.identityNullifier = FieldElement(uint64_t(12));
    inputs.merkleProofLength = 1;
    inputs.merkleProofIndex = 1;
    inputs.merkleProofSiblings = {FieldElement(uint64_t(13)), FieldElement::Zero()};
    inputs.signalHash = FieldElement(uint64_t(14));
    inputs.scopeHash = FieldElement(uint64_t(15));
    inputs.depth = 2;

    JSONValue json = circom::CircuitInputsToJSON(inputs);
    ASSERT_TRUE(json.IsObject());
    EXPECT_EQ(json["identityTrapdoor"].GetString(), "11");
    EXPECT_EQ(json["identityNullifier"].GetString(), "12");
    EXPECT_EQ(json["merkleProofLength"].GetString(), "1");
    EXPECT_EQ(json["merkleProofIndex"].GetString(), "1");
    ASSERT_EQ(json["merkleProofSiblings"].Size(), 2u);
    EXPECT_EQ(json["merkleProofSiblings"][0].GetString(), "13");
    EXPECT_EQ(json["merkleProofSiblings"][1].GetString(), "0");
    EXPECT_EQ(json["message"].GetString(), "14");
    EXPECT_EQ(json["scope"].GetString(), "15");
    EXPECT_FALSE(json.HasKey("depth"));
}

// ============================================================================
// .wtns
// ============================================================================

TEST(WtnsTest, FileLayout) {
    Bytes file = circom::EncodeWtns(SampleWitness());

    // magic, version, sections, two section headers, n8 + prime + count, values
    ASSERT_EQ(file.size(), 12u + 12u + 40u + 12u + 4u * 32u);
    EXPECT_EQ(std::string(file.begin(), file.begin() + 4), "wtns");
    EXPECT_EQ(file[4], 2);
    EXPECT_EQ(file[8], 2);
    EXPECT_EQ(file[12], circom::WTNS_SECTION_HEADER);
    EXPECT_EQ(file[16], 40);
    EXPECT_EQ(file[24], 32);
    // Prime starts with the low byte of r
    EXPECT_EQ(file[28], 0x01);
    EXPECT_EQ(file[60], 4);
    EXPECT_EQ(file[64], circom::WTNS_SECTION_VALUES);
    EXPECT_EQ(file[68], 128);
    // First value is the constant 1, little-endian
    EXPECT_EQ(file[76], 1);
    EXPECT_EQ(file[77], 0);
}

TEST(WtnsTest, DecodeRestoresValues) {
    std::vector<FieldElement> values = SampleWitness();
    EXPECT_EQ(circom::DecodeWtns(circom::EncodeWtns(values)), values);
    EXPECT_TRUE(circom::DecodeWtns(circom::EncodeWtns({})).empty());
}

TEST(WtnsTest, RejectsBadHeaders) {
    Bytes file = circom::EncodeWtns(SampleWitness());

    Bytes badMagic = file;
    badMagic[0] = 'x';
    EXPECT_THROW(circom::DecodeWtns(badMagic), ProvingError);

    Bytes badVersion = file;
    badVersion[4] = 3;
    EXPECT_THROW(circom::DecodeWtns(badVersion), ProvingError);

    Bytes badPrime = file;
    badPrime[28] ^= 0x02;
    EXPECT_THROW(circom::DecodeWtns(badPrime), ProvingError);

    Bytes badCount = file;
    badCount[60] = 5;
    EXPECT_THROW(circom::DecodeWtns(badCount), ProvingError);
}

TEST(WtnsTest, RejectsTruncation) {
    Bytes file = circom::EncodeWtns(SampleWitness());
    for (size_t len : {size_t(0), size_t(3), size_t(11), size_t(30), file.size() - 1}) {
        Bytes cut(file.begin(), file.begin() + len);
        EXPECT_THROW(circom::DecodeWtns(cut), ProvingError) << "length " << len;
    }
}

TEST(WtnsTest, RejectsUnreducedValue) {
    Bytes file = circom::EncodeWtns(SampleWitness());
    // Last value becomes 2^256 - 1
    for (size_t i = file.size() - 32; i < file.size(); ++i) {
        file[i] = 0xff;
    }
    EXPECT_THROW(circom::DecodeWtns(file), ProvingError);
}

// ============================================================================
// snarkjs JSON
// ============================================================================

TEST(SnarkjsJsonTest, ProofLayout) {
    JSONValue json = circom::Groth16ToJSON(SamplePoints());

    ASSERT_EQ(json["pi_a"].Size(), 3u);
    EXPECT_EQ(json["pi_a"][0].GetString(), "1");
    EXPECT_EQ(json["pi_a"][2].GetString(), "1");
    ASSERT_EQ(json["pi_b"].Size(), 3u);
    EXPECT_EQ(json["pi_b"][0][0].GetString(), "3");
    EXPECT_EQ(json["pi_b"][0][1].GetString(), "4");
    EXPECT_EQ(json["pi_b"][1][1].GetString(), "6");
    EXPECT_EQ(json["pi_b"][2][0].GetString(), "1");
    EXPECT_EQ(json["pi_b"][2][1].GetString(), "0");
    EXPECT_EQ(json["pi_c"][1].GetString(), "8");
    EXPECT_EQ(json["protocol"].GetString(), "groth16");
    EXPECT_EQ(json["curve"].GetString(), "bn128");

    EXPECT_EQ(circom::Groth16FromJSON(json), SamplePoints());
}

TEST(SnarkjsJsonTest, ParsesProverOutput) {
    const char* text =
        "{\"pi_a\":[\"1\",\"2\",\"1\"],"
        "\"pi_b\":[[\"3\",\"4\"],[\"5\",\"6\"],[\"1\",\"0\"]],"
        "\"pi_c\":[\"7\",\"8\",\"1\"],\"protocol\":\"groth16\"}";
    EXPECT_EQ(circom::Groth16FromJSON(JSONValue::Parse(text)), SamplePoints());
}

TEST(SnarkjsJsonTest, RejectsMalformedProofs) {
    JSONValue good = circom::Groth16ToJSON(SamplePoints());

    JSONValue plonk = good;
    plonk.Set("protocol", "plonk");
    EXPECT_THROW(circom::Groth16FromJSON(plonk), ProvingError);

    JSONValue shortA = good;
    JSONValue one = JSONValue::MakeArray();
    one.Push("1");
    shortA.Set("pi_a", one);
    EXPECT_THROW(circom::Groth16FromJSON(shortA), ProvingError);

    JSONValue outOfField = good;
    JSONValue a = JSONValue::MakeArray();
    a.Push(BN254_BASE_MODULUS.ToDecimal());
    a.Push("2");
    outOfField.Set("pi_a", a);
    EXPECT_THROW(circom::Groth16FromJSON(outOfField), ProvingError);

    EXPECT_THROW(circom::Groth16FromJSON(JSONValue::MakeArray()), ProvingError);
}

TEST(SnarkjsJsonTest, PublicSignals) {
    std::vector<FieldElement> signals = {FieldElement(uint64_t(9)), FieldElement::Zero()};
    JSONValue json = circom::PublicSignalsToJSON(signals);
    ASSERT_EQ(json.Size(), 2u);
    EXPECT_EQ(json[0].GetString(), "9");
    EXPECT_EQ(circom::PublicSignalsFromJSON(json), signals);

    EXPECT_THROW(circom::PublicSignalsFromJSON(JSONValue::Parse("[1]")), ProvingError);
    EXPECT_THROW(circom::PublicSignalsFromJSON(JSONValue::Parse("[\"01\"]")), ProvingError);
    EXPECT_THROW(circom::PublicSignalsFromJSON(JSONValue::MakeObject()), ProvingError);
}
