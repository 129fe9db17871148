// SEMAPHORE - Poseidon Hash Tests
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License

#include <gtest/gtest.h>
#include "semaphore/crypto/poseidon.h"
#include "semaphore/core/types.h"

#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace semaphore {
namespace test {

namespace {

FieldElement Fe(uint64_t v) { return FieldElement(v); }

FieldElement Dec(const std::string& text) {
    return *FieldElement::FromDecimal(text);
}

std::vector<FieldElement> Range(uint64_t first, uint64_t count) {
    std::vector<FieldElement> values;
    for (uint64_t i = 0; i < count; ++i) {
        values.push_back(Fe(first + i));
    }
    return values;
}

} // namespace

// ============================================================================
// Parameters
// ============================================================================

TEST(PoseidonParamsTest, WidthFollowsInputCount) {
    PoseidonConfig two = PoseidonParams::ForInputs(2);
    EXPECT_EQ(two.width, 3u);
    EXPECT_EQ(two.fullRounds, 8u);
    EXPECT_EQ(two.partialRounds, 57u);

    EXPECT_EQ(PoseidonParams::ForInputs(1).partialRounds, 56u);
    EXPECT_EQ(PoseidonParams::ForInputs(4).partialRounds, 60u);
    EXPECT_EQ(PoseidonParams::ForInputs(16).width, 17u);
    EXPECT_EQ(PoseidonParams::ForInputs(16).partialRounds, 68u);
}

TEST(PoseidonParamsTest, RejectsUnsupportedArity) {
    EXPECT_THROW(PoseidonParams::ForInputs(0), std::invalid_argument);
    EXPECT_THROW(PoseidonParams::ForInputs(PoseidonParams::MAX_INPUTS + 1),
                 std::invalid_argument);
    EXPECT_THROW(Poseidon::Hash({}), std::invalid_argument);
    EXPECT_THROW(Poseidon::Hash(Range(0, 17)), std::invalid_argument);
}

TEST(PoseidonParamsTest, ConstantsMatchReferenceTables) {
    auto constants = Poseidon::ConstantsFor(PoseidonParams::ForInputs(2));
    ASSERT_EQ(constants->roundConstants.size(), 65u * 3u);
    EXPECT_EQ(constants->roundConstants[0],
              FieldElement::FromHex(
                  "0ee9a592ba9a9518d05986d656f40c2114c4993c11bb29938d21d47304cd8e6e"));

    ASSERT_EQ(constants->mds.size(), 3u);
    EXPECT_EQ(constants->mds[0][0],
              FieldElement::FromHex(
                  "109b7f411ba0e4c9b2b70caf5c36a7b194be7c11ad24378bfedb68592ba8118b"));

    auto wide = Poseidon::ConstantsFor(PoseidonParams::ForInputs(16));
    ASSERT_EQ(wide->roundConstants.size(), 76u * 17u);
    EXPECT_EQ(wide->roundConstants.back(),
              FieldElement::FromHex(
                  "2a437b970ff32645bd5303f9474b5743427333c6663d17f44d918e9f2ca005d4"));
}

TEST(PoseidonParamsTest, ConstantsAreCachedPerConfig) {
    auto first = Poseidon::ConstantsFor(PoseidonParams::ForInputs(2));
    auto second = Poseidon::ConstantsFor(PoseidonParams::ForInputs(2));
    EXPECT_EQ(first.get(), second.get());
    EXPECT_NE(first.get(), Poseidon::ConstantsFor(PoseidonParams::ForInputs(3)).get());
}

// ============================================================================
// Known Answers
// ============================================================================

TEST(PoseidonTest, KnownAnswers) {
    EXPECT_EQ(Poseidon::Hash({Fe(1)}),
              Dec("18586133768512220936620570745912940619677854269274689475585506675881198879027"));
    EXPECT_EQ(Poseidon::Hash2(Fe(1), Fe(2)),
              FieldElement::FromHex(
                  "115cc0f5e7d690413df64c6b9662e9cf2a3617f2743245519e19607a4417189a"));
    EXPECT_EQ(Poseidon::Hash({Fe(1), Fe(2), Fe(3)}),
              Dec("6542985608222806190361240322586112750744169038454362455181422643027100751666"));
    EXPECT_EQ(Poseidon::Hash(Range(1, 4)),
              Dec("18821383157269793795438455681495246036402687001665670618754263018637548127333"));
    EXPECT_EQ(Poseidon::Hash(Range(1, 16)),
              Dec("9989051620750914585850546081941653841776809718687451684622678807385399211877"));
}

TEST(PoseidonTest, ZeroPairHashesToZeroSubtreeRoot) {
    EXPECT_EQ(Poseidon::Hash2(FieldElement::Zero(), FieldElement::Zero()),
              Dec("14744269619966411208579211824598458697587494354926760081771325075741142829156"));
}

// ============================================================================
// Hashing
// ============================================================================

TEST(PoseidonTest, Hash2MatchesGenericHash) {
    EXPECT_EQ(Poseidon::Hash2(Fe(8), Fe(9)), Poseidon::Hash({Fe(8), Fe(9)}));
    EXPECT_EQ(PoseidonHash2(Fe(8), Fe(9)), Poseidon::Hash2(Fe(8), Fe(9)));
}

TEST(PoseidonTest, Hash2OrderMatters) {
    EXPECT_NE(Poseidon::Hash2(Fe(1), Fe(2)), Poseidon::Hash2(Fe(2), Fe(1)));
}

TEST(PoseidonTest, Hash2Distinct) {
    std::set<FieldElement> outputs;
    for (uint64_t i = 0; i < 16; ++i) {
        outputs.insert(Poseidon::Hash2(Fe(i), Fe(i + 1)));
    }
    EXPECT_EQ(outputs.size(), 16u);
}

TEST(PoseidonTest, ArityIsPartOfTheHash) {
    EXPECT_NE(Poseidon::Hash({Fe(5)}), Poseidon::Hash({Fe(5), FieldElement::Zero()}));
}

TEST(PoseidonTest, DigestChecksInputCount) {
    Poseidon hasher(3);
    EXPECT_EQ(hasher.Config().width, 4u);
    EXPECT_EQ(hasher.Digest({Fe(1), Fe(2), Fe(3)}), Poseidon::Hash({Fe(1), Fe(2), Fe(3)}));
    EXPECT_THROW(hasher.Digest({Fe(1), Fe(2)}), std::invalid_argument);
}

TEST(PoseidonTest, PermuteMatchesDigest) {
    Poseidon hasher(2);
    std::vector<FieldElement> state = {FieldElement::Zero(), Fe(1), Fe(2)};
    hasher.Permute(state);
    EXPECT_EQ(state[0], Poseidon::Hash2(Fe(1), Fe(2)));

    std::vector<FieldElement> narrow = {Fe(1), Fe(2)};
    EXPECT_THROW(hasher.Permute(narrow), std::invalid_argument);
}

} // namespace test
} // namespace semaphore
