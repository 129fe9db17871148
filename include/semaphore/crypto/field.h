// SEMAPHORE - Finite Field Arithmetic
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License
//
// Arithmetic over the BN254 scalar field. Every tree node, identity secret,
// commitment, nullifier and public signal is an element of this field.

#ifndef SEMAPHORE_CRYPTO_FIELD_H
#define SEMAPHORE_CRYPTO_FIELD_H

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include "semaphore/core/types.h"

namespace semaphore {

// ============================================================================
// 256-bit Unsigned Integer
// ============================================================================

/// 256-bit unsigned integer represented as 4 x 64-bit limbs (little-endian)
class Uint256 {
public:
    static constexpr size_t NUM_LIMBS = 4;

    /// Limbs in little-endian order (limb[0] is least significant)
    std::array<uint64_t, NUM_LIMBS> limbs;

    constexpr Uint256() : limbs{0, 0, 0, 0} {}

    constexpr Uint256(uint64_t l0, uint64_t l1, uint64_t l2, uint64_t l3)
        : limbs{l0, l1, l2, l3} {}

    explicit constexpr Uint256(uint64_t val) : limbs{val, 0, 0, 0} {}

    /// Construct from up to 32 little-endian bytes
    explicit Uint256(const Byte* data, size_t len);

    /// Construct from up to 32 big-endian bytes (right-aligned)
    static Uint256 FromBytesBE(const Byte* data, size_t len);

    /// Parse up to 64 hex digits, optional 0x prefix.
    /// Throws std::invalid_argument on bad input.
    static Uint256 FromHex(const std::string& hex);

    /**
     * Parse canonical base-10 text.
     *
     * Accepts only ASCII digits with no sign, whitespace or leading zero
     * (except the literal "0"). Returns nullopt for anything else or for
     * values that do not fit in 256 bits.
     */
    static std::optional<Uint256> FromDecimal(const std::string& str);

    /// 64 lowercase hex digits, most significant first
    std::string ToHex() const;

    /// Shortest base-10 form
    std::string ToDecimal() const;

    /// 32 bytes, little-endian
    std::array<Byte, 32> ToBytes() const;

    /// 32 bytes, big-endian
    std::array<Byte, 32> ToBytesBE() const;

    bool IsZero() const;

    bool operator==(const Uint256& other) const;
    bool operator!=(const Uint256& other) const;
    bool operator<(const Uint256& other) const;
    bool operator<=(const Uint256& other) const;
    bool operator>(const Uint256& other) const;
    bool operator>=(const Uint256& other) const;

    Uint256 operator<<(int shift) const;
    Uint256 operator>>(int shift) const;

    /// Carry-propagating arithmetic (modular arithmetic lives in FieldElement)
    static Uint256 Add(const Uint256& a, const Uint256& b, bool& carry);
    static Uint256 Sub(const Uint256& a, const Uint256& b, bool& borrow);
    static Uint256 Mul(const Uint256& a, const Uint256& b, Uint256& high);
};

// ============================================================================
// BN254 Base Field
// ============================================================================

/// Modulus of the BN254 base field, the coordinate field of proof points
/// q = 21888242871839275222246405745257275088696311157297823662689037894645226208583
extern const Uint256 BN254_BASE_MODULUS;

// ============================================================================
// Field Element over BN254 scalar field
// ============================================================================

/// Element of the BN254 scalar field
/// r = 21888242871839275222246405745257275088548364400416034343698204186575808495617
class FieldElement {
public:
    /// The BN254 scalar field modulus
    static const Uint256 MODULUS;

    /// R = 2^256 mod r (Montgomery radix)
    static const Uint256 R;

    /// R^2 mod r
    static const Uint256 R2;

    /// -r^(-1) mod 2^64
    static const uint64_t INV;

    /// Internal value, Montgomery form
    Uint256 value;

    FieldElement();

    /// Reduces modulo r and converts to Montgomery form
    explicit FieldElement(const Uint256& val);

    explicit FieldElement(uint64_t val);

    static FieldElement Zero();
    static FieldElement One();

    /// Accepts only values already below the modulus
    static std::optional<FieldElement> FromUint256Canonical(const Uint256& val);

    /// Canonical decimal text; nullopt if malformed or not below r
    static std::optional<FieldElement> FromDecimal(const std::string& str);

    /// Little-endian bytes, reduced modulo r
    static FieldElement FromBytes(const Byte* data, size_t len);

    static FieldElement FromHex(const std::string& hex);

    /// Standard (non-Montgomery) representation
    Uint256 ToUint256() const;

    std::string ToDecimal() const;
    std::string ToHex() const;

    /// 32 bytes, little-endian
    std::array<Byte, 32> ToBytes() const;

    bool IsZero() const;

    bool operator==(const FieldElement& other) const;
    bool operator!=(const FieldElement& other) const;

    /// Orders by canonical integer value
    bool operator<(const FieldElement& other) const;

    FieldElement operator+(const FieldElement& other) const;
    FieldElement operator-(const FieldElement& other) const;
    FieldElement operator*(const FieldElement& other) const;
    FieldElement operator-() const;

    FieldElement& operator+=(const FieldElement& other);
    FieldElement& operator-=(const FieldElement& other);
    FieldElement& operator*=(const FieldElement& other);

    FieldElement Square() const;
    FieldElement Pow(const Uint256& exp) const;

    /// Multiplicative inverse (returns 0 for 0)
    FieldElement Inverse() const;

    /// Poseidon S-box: x^5
    FieldElement PoseidonSbox() const;

private:
    static Uint256 MontMul(const Uint256& a, const Uint256& b);
    static Uint256 MontReduce(const Uint256& lo, const Uint256& hi);
    static Uint256 ModAdd(const Uint256& a, const Uint256& b);
    static Uint256 ModSub(const Uint256& a, const Uint256& b);
};

} // namespace semaphore

#endif // SEMAPHORE_CRYPTO_FIELD_H
