// SEMAPHORE - Baby Jubjub Implementation
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License

#include "semaphore/crypto/babyjubjub.h"

#include <openssl/crypto.h>

#include <stdexcept>

namespace semaphore {
namespace babyjubjub {

const Uint256 SUBGROUP_ORDER = *Uint256::FromDecimal(
    "2736030358979909402780800718157159386076813972158567259200215660948447373041");

namespace {

const char* const GENERATOR_X =
    "995203441582195749578291179787384436505546430278305826713579947235728471134";
const char* const GENERATOR_Y =
    "5472060717959818805561601436314318772137091100104008585924551046643952123905";
const char* const BASE8_X =
    "5299619240641551281634865583518297030282874472190772894086521144482721001553";
const char* const BASE8_Y =
    "16950150798460657717958625567821834550301663161624707787222815936182638968203";

const FieldElement& CurveA() {
    static const FieldElement a(CURVE_A);
    return a;
}

const FieldElement& CurveD() {
    static const FieldElement d(CURVE_D);
    return d;
}

/// Reduce hi * 2^256 + lo modulo l, one bit at a time from the top.
/// The running remainder stays below 2l < 2^253.
Uint256 ReduceWide(const Uint256& lo, const Uint256& hi) {
    Uint256 rem;
    const Uint256* words[2] = {&hi, &lo};
    for (const Uint256* word : words) {
        for (int bit = 255; bit >= 0; --bit) {
            rem = rem << 1;
            if ((word->limbs[bit / 64] >> (bit % 64)) & 1) {
                rem.limbs[0] |= 1;
            }
            if (rem >= SUBGROUP_ORDER) {
                bool borrow = false;
                rem = Uint256::Sub(rem, SUBGROUP_ORDER, borrow);
            }
        }
    }
    return rem;
}

/// Projective (X : Y : Z) with x = X/Z, y = Y/Z
struct ProjectivePoint {
    FieldElement x;
    FieldElement y;
    FieldElement z;
};

/// Unified addition, add-2008-bbjlp; also correct for doubling
ProjectivePoint ProjectiveAdd(const ProjectivePoint& p, const ProjectivePoint& q) {
    FieldElement a = p.z * q.z;
    FieldElement b = a.Square();
    FieldElement c = p.x * q.x;
    FieldElement d = p.y * q.y;
    FieldElement e = CurveD() * c * d;
    FieldElement f = b - e;
    FieldElement g = b + e;

    ProjectivePoint r;
    r.x = a * f * ((p.x + p.y) * (q.x + q.y) - c - d);
    r.y = a * g * (d - CurveA() * c);
    r.z = f * g;
    return r;
}

} // anonymous namespace

// ============================================================================
// Scalar Implementation
// ============================================================================

Scalar::~Scalar() {
    OPENSSL_cleanse(&value_, sizeof(value_));
}

Scalar Scalar::FromUint256(const Uint256& value) {
    Scalar result;
    result.value_ = ReduceWide(value, Uint256());
    return result;
}

std::optional<Scalar> Scalar::FromUint256Canonical(const Uint256& value) {
    if (value >= SUBGROUP_ORDER) {
        return std::nullopt;
    }
    Scalar result;
    result.value_ = value;
    return result;
}

std::optional<Scalar> Scalar::FromDecimal(const std::string& text) {
    auto value = Uint256::FromDecimal(text);
    if (!value) {
        return std::nullopt;
    }
    return FromUint256Canonical(*value);
}

Scalar Scalar::FromBytesLE(const Byte* data, size_t len) {
    if (len > 64) {
        throw std::invalid_argument("Scalar accepts at most 64 bytes, got " +
                                    std::to_string(len));
    }
    Uint256 lo(data, len < 32 ? len : 32);
    Uint256 hi;
    if (len > 32) {
        hi = Uint256(data + 32, len - 32);
    }

    Scalar result;
    result.value_ = ReduceWide(lo, hi);
    OPENSSL_cleanse(&lo, sizeof(lo));
    OPENSSL_cleanse(&hi, sizeof(hi));
    return result;
}

Scalar Scalar::operator+(const Scalar& other) const {
    // Both operands are below l < 2^252, so the sum cannot overflow
    bool carry = false;
    Uint256 sum = Uint256::Add(value_, other.value_, carry);
    if (sum >= SUBGROUP_ORDER) {
        bool borrow = false;
        sum = Uint256::Sub(sum, SUBGROUP_ORDER, borrow);
    }
    Scalar result;
    result.value_ = sum;
    return result;
}

Scalar Scalar::operator*(const Scalar& other) const {
    Uint256 hi;
    Uint256 lo = Uint256::Mul(value_, other.value_, hi);
    Scalar result;
    result.value_ = ReduceWide(lo, hi);
    return result;
}

// ============================================================================
// Point Implementation
// ============================================================================

Point::Point() : x_(FieldElement::Zero()), y_(FieldElement::One()) {}

Point::Point(const FieldElement& x, const FieldElement& y) : x_(x), y_(y) {}

Point Point::Identity() {
    return Point();
}

Point Point::Generator() {
    static const Point g(*FieldElement::FromDecimal(GENERATOR_X),
                         *FieldElement::FromDecimal(GENERATOR_Y));
    return g;
}

Point Point::Base8() {
    static const Point b8(*FieldElement::FromDecimal(BASE8_X),
                          *FieldElement::FromDecimal(BASE8_Y));
    return b8;
}

bool Point::IsIdentity() const {
    return x_.IsZero() && y_ == FieldElement::One();
}

bool Point::IsOnCurve() const {
    FieldElement xx = x_.Square();
    FieldElement yy = y_.Square();
    return CurveA() * xx + yy == FieldElement::One() + CurveD() * xx * yy;
}

Point Point::operator+(const Point& other) const {
    FieldElement x1x2 = x_ * other.x_;
    FieldElement y1y2 = y_ * other.y_;
    FieldElement k = CurveD() * x1x2 * y1y2;

    FieldElement x3 = (x_ * other.y_ + y_ * other.x_) * (FieldElement::One() + k).Inverse();
    FieldElement y3 = (y1y2 - CurveA() * x1x2) * (FieldElement::One() - k).Inverse();
    return Point(x3, y3);
}

Point Point::Double() const {
    return *this + *this;
}

Point Point::Mul(const Uint256& k) const {
    ProjectivePoint base{x_, y_, FieldElement::One()};
    ProjectivePoint acc{FieldElement::Zero(), FieldElement::One(), FieldElement::One()};

    for (int bit = 255; bit >= 0; --bit) {
        acc = ProjectiveAdd(acc, acc);
        if ((k.limbs[bit / 64] >> (bit % 64)) & 1) {
            acc = ProjectiveAdd(acc, base);
        }
    }

    FieldElement zInv = acc.z.Inverse();
    return Point(acc.x * zInv, acc.y * zInv);
}

std::string Point::ToString() const {
    return "(" + x_.ToDecimal() + ", " + y_.ToDecimal() + ")";
}

} // namespace babyjubjub
} // namespace semaphore
