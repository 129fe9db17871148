// SEMAPHORE - Baby Jubjub Curve Operations
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License
//
// Twisted Edwards curve a*x^2 + y^2 = 1 + d*x^2*y^2 defined over the BN254
// scalar field (EIP-2494), with a = 168700 and d = 168696. Its coordinates
// are FieldElements, so points can be hashed with Poseidon directly. Used
// for identity keys and EdDSA signatures.

#ifndef SEMAPHORE_CRYPTO_BABYJUBJUB_H
#define SEMAPHORE_CRYPTO_BABYJUBJUB_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "semaphore/core/types.h"
#include "semaphore/crypto/field.h"

namespace semaphore {
namespace babyjubjub {

// ============================================================================
// Constants
// ============================================================================

constexpr uint64_t CURVE_A = 168700;
constexpr uint64_t CURVE_D = 168696;
constexpr uint64_t COFACTOR = 8;

/// Order of the prime subgroup generated by Base8
/// l = 2736030358979909402780800718157159386076813972158567259200215660948447373041
extern const Uint256 SUBGROUP_ORDER;

// ============================================================================
// Scalar (integer mod l)
// ============================================================================

/**
 * An integer modulo the subgroup order l.
 * Used for secret scalars, nonces and signature responses.
 */
class Scalar {
public:
    /// Default constructor (zero)
    Scalar() = default;

    Scalar(const Scalar& other) = default;
    Scalar& operator=(const Scalar& other) = default;

    /// Destructor - securely clears memory
    ~Scalar();

    /// Reduces modulo l
    static Scalar FromUint256(const Uint256& value);

    /// Accepts only values already below l
    static std::optional<Scalar> FromUint256Canonical(const Uint256& value);

    /// Canonical decimal text below l
    static std::optional<Scalar> FromDecimal(const std::string& text);

    /// Up to 64 little-endian bytes, reduced modulo l.
    /// Throws std::invalid_argument for longer input.
    static Scalar FromBytesLE(const Byte* data, size_t len);

    const Uint256& Value() const { return value_; }

    bool IsZero() const { return value_.IsZero(); }

    std::string ToDecimal() const { return value_.ToDecimal(); }

    /// Arithmetic (mod l)
    Scalar operator+(const Scalar& other) const;
    Scalar operator*(const Scalar& other) const;

    bool operator==(const Scalar& other) const { return value_ == other.value_; }
    bool operator!=(const Scalar& other) const { return !(*this == other); }

private:
    Uint256 value_;
};

// ============================================================================
// Point (affine coordinates)
// ============================================================================

class Point {
public:
    /// Default constructor - the neutral element (0, 1)
    Point();

    /// Construct from affine coordinates; not checked against the curve
    Point(const FieldElement& x, const FieldElement& y);

    /// Neutral element (0, 1)
    static Point Identity();

    /// Generator of the full group (order 8 * l)
    static Point Generator();

    /// 8 * Generator; generates the prime subgroup used for keys
    static Point Base8();

    const FieldElement& X() const { return x_; }
    const FieldElement& Y() const { return y_; }

    bool IsIdentity() const;
    bool IsOnCurve() const;

    /// Twisted Edwards addition (complete for points on the curve)
    Point operator+(const Point& other) const;

    Point Double() const;

    /// Scalar multiplication by an arbitrary 256-bit integer
    Point Mul(const Uint256& k) const;

    Point operator*(const Scalar& scalar) const { return Mul(scalar.Value()); }

    bool operator==(const Point& other) const { return x_ == other.x_ && y_ == other.y_; }
    bool operator!=(const Point& other) const { return !(*this == other); }

    /// "(x, y)" in decimal
    std::string ToString() const;

private:
    FieldElement x_;
    FieldElement y_;
};

} // namespace babyjubjub
} // namespace semaphore

#endif // SEMAPHORE_CRYPTO_BABYJUBJUB_H
