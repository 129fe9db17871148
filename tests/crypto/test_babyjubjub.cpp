// SEMAPHORE - Baby Jubjub Tests
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License

#include <gtest/gtest.h>

#include "semaphore/crypto/babyjubjub.h"

#include <stdexcept>
#include <vector>

using namespace semaphore;
using namespace semaphore::babyjubjub;

namespace {

FieldElement Dec(const char* text) {
    return *FieldElement::FromDecimal(text);
}

Point P1() {
    return Point(Dec("17777552123799933955779906779655732241715742912184938656739573121738514868268"),
                 Dec("2626589144620713026669568689430873010625803728049924121243784502389097019475"));
}

Point P2() {
    return Point(Dec("16540640123574156134436876038791482806971768689494387082833631921987005038935"),
                 Dec("20819045374670962167435360035096875258406992893633759881276124905556507972311"));
}

} // namespace

// ============================================================================
// Points
// ============================================================================

TEST(BabyJubjubPointTest, IdentityIsNeutral) {
    Point id;
    EXPECT_TRUE(id.IsIdentity());
    EXPECT_TRUE(id.IsOnCurve());
    EXPECT_EQ(id, Point::Identity());
    EXPECT_EQ(P1() + id, P1());
}

TEST(BabyJubjubPointTest, CurveMembership) {
    EXPECT_TRUE(Point::Generator().IsOnCurve());
    EXPECT_TRUE(Point::Base8().IsOnCurve());
    EXPECT_TRUE(P1().IsOnCurve());
    EXPECT_TRUE(P2().IsOnCurve());

    EXPECT_FALSE(Point(FieldElement::Zero(), FieldElement::Zero()).IsOnCurve());
    EXPECT_FALSE(Point(FieldElement::One(), FieldElement::Zero()).IsOnCurve());
}

TEST(BabyJubjubPointTest, AdditionKnownAnswer) {
    Point sum = P1() + P2();
    EXPECT_EQ(sum.X(), Dec("7916061937171219682591368294088513039687205273691143098332585753343424131937"));
    EXPECT_EQ(sum.Y(), Dec("14035240266687799601661095864649209771790948434046947201833777492504781204499"));
    EXPECT_EQ(P2() + P1(), sum);
}

TEST(BabyJubjubPointTest, DoublingKnownAnswer) {
    Point doubled = P1().Double();
    EXPECT_EQ(doubled.X(), Dec("6890855772600357754907169075114257697580319025794532037257385534741338397365"));
    EXPECT_EQ(doubled.Y(), Dec("4338620300185947561074059802482547481416142213883829469920100239455078257889"));
    EXPECT_EQ(P1().Mul(Uint256(2)), doubled);
}

TEST(BabyJubjubPointTest, Base8IsEightTimesGenerator) {
    EXPECT_EQ(Point::Generator().Mul(Uint256(COFACTOR)), Point::Base8());
}

TEST(BabyJubjubPointTest, SubgroupOrderAnnihilatesBase8) {
    EXPECT_TRUE(Point::Base8().Mul(SUBGROUP_ORDER).IsIdentity());
    EXPECT_TRUE(Point::Base8().Mul(Uint256()).IsIdentity());
}

TEST(BabyJubjubPointTest, MulMatchesRepeatedAddition) {
    Point acc;
    for (uint64_t k = 1; k <= 10; ++k) {
        acc = acc + P1();
        EXPECT_EQ(P1().Mul(Uint256(k)), acc) << "k = " << k;
    }
}

TEST(BabyJubjubPointTest, ToStringIsDecimal) {
    EXPECT_EQ(Point::Identity().ToString(), "(0, 1)");
}

// ============================================================================
// Scalars
// ============================================================================

TEST(BabyJubjubScalarTest, ReductionModOrder) {
    EXPECT_TRUE(Scalar::FromUint256(SUBGROUP_ORDER).IsZero());

    bool carry = false;
    Uint256 orderPlusFive = Uint256::Add(SUBGROUP_ORDER, Uint256(5), carry);
    EXPECT_EQ(Scalar::FromUint256(orderPlusFive), Scalar::FromUint256(Uint256(5)));

    EXPECT_FALSE(Scalar::FromUint256Canonical(SUBGROUP_ORDER).has_value());
    EXPECT_TRUE(Scalar::FromUint256Canonical(Uint256(7)).has_value());
}

TEST(BabyJubjubScalarTest, ArithmeticWrapsAtOrder) {
    bool borrow = false;
    Scalar minusOne = Scalar::FromUint256(Uint256::Sub(SUBGROUP_ORDER, Uint256(1), borrow));
    Scalar one = Scalar::FromUint256(Uint256(1));

    EXPECT_TRUE((minusOne + one).IsZero());
    EXPECT_EQ(minusOne * minusOne, one);
    EXPECT_EQ(Scalar::FromUint256(Uint256(6)) * Scalar::FromUint256(Uint256(7)),
              Scalar::FromUint256(Uint256(42)));
}

TEST(BabyJubjubScalarTest, FromBytesLittleEndian) {
    std::vector<Byte> bytes(64, 0);
    bytes[0] = 0x2a;
    EXPECT_EQ(Scalar::FromBytesLE(bytes.data(), bytes.size()), Scalar::FromUint256(Uint256(42)));

    // 2^256 mod l taken from the upper half
    bytes[0] = 0;
    bytes[32] = 1;
    Scalar twoTo256 = Scalar::FromBytesLE(bytes.data(), bytes.size());
    Scalar twoTo128 = Scalar::FromUint256(Uint256(0, 0, 1, 0));
    EXPECT_EQ(twoTo256, twoTo128 * twoTo128);

    std::vector<Byte> tooLong(65, 0);
    EXPECT_THROW(Scalar::FromBytesLE(tooLong.data(), tooLong.size()), std::invalid_argument);
}

TEST(BabyJubjubScalarTest, DecimalParsing) {
    auto scalar = Scalar::FromDecimal("12345");
    ASSERT_TRUE(scalar.has_value());
    EXPECT_EQ(scalar->ToDecimal(), "12345");
    EXPECT_FALSE(Scalar::FromDecimal(SUBGROUP_ORDER.ToDecimal()).has_value());
    EXPECT_FALSE(Scalar::FromDecimal("-1").has_value());
}

TEST(BabyJubjubScalarTest, ScalarMulDistributes) {
    Scalar a = Scalar::FromUint256(Uint256(123456789));
    Scalar b = Scalar::FromUint256(Uint256(987654321));
    Point base = Point::Base8();
    EXPECT_EQ(base * (a + b), base * a + base * b);
}
