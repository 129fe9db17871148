// SEMAPHORE - Finite Field Arithmetic Implementation
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License
//
// Montgomery arithmetic over the BN254 scalar field

#include "semaphore/crypto/field.h"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <vector>

namespace semaphore {

// ============================================================================
// BN254 Constants
// ============================================================================

// q = 0x30644e72e131a029b85045b68181585d97816a916871ca8d3c208c16d87cfd47
const Uint256 BN254_BASE_MODULUS{
    0x3c208c16d87cfd47ULL,
    0x97816a916871ca8dULL,
    0xb85045b68181585dULL,
    0x30644e72e131a029ULL
};

// r = 0x30644e72e131a029b85045b68181585d2833e84879b9709143e1f593f0000001
const Uint256 FieldElement::MODULUS{
    0x43e1f593f0000001ULL,
    0x2833e84879b97091ULL,
    0xb85045b68181585dULL,
    0x30644e72e131a029ULL
};

// R = 2^256 mod r
const Uint256 FieldElement::R{
    0xac96341c4ffffffbULL,
    0x36fc76959f60cd29ULL,
    0x666ea36f7879462eULL,
    0x0e0a77c19a07df2fULL
};

// R^2 mod r
const Uint256 FieldElement::R2{
    0x1bb8e645ae216da7ULL,
    0x53fe3ab1e35c59e3ULL,
    0x8c49833d53bb8085ULL,
    0x0216d0b17f4e44a5ULL
};

const uint64_t FieldElement::INV = 0xc2e1f593efffffffULL;

namespace {

/// Largest power of ten that fits in a limb
constexpr uint64_t DECIMAL_CHUNK = 10000000000000000000ULL;
constexpr int DECIMAL_CHUNK_DIGITS = 19;

/// 2^256 has 78 decimal digits
constexpr size_t MAX_DECIMAL_DIGITS = 78;

uint64_t LoadLE64(const Byte* p) {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
        v = (v << 8) | p[i];
    }
    return v;
}

void StoreLE64(Byte* p, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        p[i] = static_cast<Byte>(v >> (8 * i));
    }
}

/// Divide in place by a single limb, returning the remainder
uint64_t DivModLimb(Uint256& n, uint64_t divisor) {
    __uint128_t rem = 0;
    for (int i = 3; i >= 0; --i) {
        __uint128_t cur = (rem << 64) | n.limbs[i];
        n.limbs[i] = static_cast<uint64_t>(cur / divisor);
        rem = cur % divisor;
    }
    return static_cast<uint64_t>(rem);
}

} // namespace

// ============================================================================
// Uint256 Implementation
// ============================================================================

Uint256::Uint256(const Byte* data, size_t len) : limbs{0, 0, 0, 0} {
    Byte temp[32] = {0};
    std::memcpy(temp, data, std::min(len, size_t(32)));
    for (size_t i = 0; i < NUM_LIMBS; ++i) {
        limbs[i] = LoadLE64(temp + i * 8);
    }
}

Uint256 Uint256::FromBytesBE(const Byte* data, size_t len) {
    Byte le[32] = {0};
    size_t n = std::min(len, size_t(32));
    // Least significant byte is the last input byte
    for (size_t i = 0; i < n; ++i) {
        le[i] = data[len - 1 - i];
    }
    return Uint256(le, 32);
}

Uint256 Uint256::FromHex(const std::string& hex) {
    std::string h = hex;
    if (h.size() >= 2 && h[0] == '0' && (h[1] == 'x' || h[1] == 'X')) {
        h = h.substr(2);
    }
    if (h.size() > 64) {
        throw std::invalid_argument("Hex value exceeds 256 bits");
    }
    h.insert(0, 64 - h.size(), '0');

    auto nibble = [](char c) -> uint8_t {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        throw std::invalid_argument("Invalid hex character");
    };

    Byte bytes[32];
    for (size_t i = 0; i < 32; ++i) {
        size_t idx = (31 - i) * 2;
        bytes[i] = static_cast<Byte>((nibble(h[idx]) << 4) | nibble(h[idx + 1]));
    }
    return Uint256(bytes, 32);
}

std::optional<Uint256> Uint256::FromDecimal(const std::string& str) {
    if (str.empty() || str.size() > MAX_DECIMAL_DIGITS) {
        return std::nullopt;
    }
    if (str.size() > 1 && str[0] == '0') {
        return std::nullopt;
    }

    const Uint256 ten(10);
    Uint256 result;
    for (char c : str) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        Uint256 high;
        Uint256 scaled = Mul(result, ten, high);
        if (!high.IsZero()) {
            return std::nullopt;
        }
        bool carry = false;
        result = Add(scaled, Uint256(static_cast<uint64_t>(c - '0')), carry);
        if (carry) {
            return std::nullopt;
        }
    }
    return result;
}

std::string Uint256::ToHex() const {
    static const char hexChars[] = "0123456789abcdef";
    std::string result;
    result.reserve(64);
    for (int i = 3; i >= 0; --i) {
        for (int j = 56; j >= 0; j -= 8) {
            uint8_t byte = (limbs[i] >> j) & 0xFF;
            result.push_back(hexChars[byte >> 4]);
            result.push_back(hexChars[byte & 0x0F]);
        }
    }
    return result;
}

std::string Uint256::ToDecimal() const {
    if (IsZero()) {
        return "0";
    }

    std::vector<uint64_t> chunks;
    Uint256 n = *this;
    while (!n.IsZero()) {
        chunks.push_back(DivModLimb(n, DECIMAL_CHUNK));
    }

    std::string out = std::to_string(chunks.back());
    for (auto it = chunks.rbegin() + 1; it != chunks.rend(); ++it) {
        std::string part = std::to_string(*it);
        out.append(DECIMAL_CHUNK_DIGITS - part.size(), '0');
        out += part;
    }
    return out;
}

std::array<Byte, 32> Uint256::ToBytes() const {
    std::array<Byte, 32> result;
    for (size_t i = 0; i < NUM_LIMBS; ++i) {
        StoreLE64(result.data() + i * 8, limbs[i]);
    }
    return result;
}

std::array<Byte, 32> Uint256::ToBytesBE() const {
    std::array<Byte, 32> le = ToBytes();
    std::reverse(le.begin(), le.end());
    return le;
}

bool Uint256::IsZero() const {
    return (limbs[0] | limbs[1] | limbs[2] | limbs[3]) == 0;
}

bool Uint256::operator==(const Uint256& other) const {
    return limbs == other.limbs;
}

bool Uint256::operator!=(const Uint256& other) const {
    return !(*this == other);
}

bool Uint256::operator<(const Uint256& other) const {
    for (int i = 3; i >= 0; --i) {
        if (limbs[i] < other.limbs[i]) return true;
        if (limbs[i] > other.limbs[i]) return false;
    }
    return false;
}

bool Uint256::operator<=(const Uint256& other) const {
    return !(other < *this);
}

bool Uint256::operator>(const Uint256& other) const {
    return other < *this;
}

bool Uint256::operator>=(const Uint256& other) const {
    return !(*this < other);
}

Uint256 Uint256::Add(const Uint256& a, const Uint256& b, bool& carry) {
    Uint256 result;
    uint64_t c = 0;
    for (size_t i = 0; i < NUM_LIMBS; ++i) {
        __uint128_t sum = static_cast<__uint128_t>(a.limbs[i]) + b.limbs[i] + c;
        result.limbs[i] = static_cast<uint64_t>(sum);
        c = static_cast<uint64_t>(sum >> 64);
    }
    carry = (c != 0);
    return result;
}

Uint256 Uint256::Sub(const Uint256& a, const Uint256& b, bool& borrow) {
    Uint256 result;
    uint64_t bw = 0;
    for (size_t i = 0; i < NUM_LIMBS; ++i) {
        __uint128_t diff = static_cast<__uint128_t>(a.limbs[i]) - b.limbs[i] - bw;
        result.limbs[i] = static_cast<uint64_t>(diff);
        bw = static_cast<uint64_t>(diff >> 127) & 1;
    }
    borrow = (bw != 0);
    return result;
}

Uint256 Uint256::Mul(const Uint256& a, const Uint256& b, Uint256& high) {
    // Schoolbook 256 x 256 -> 512
    __uint128_t products[8] = {0};
    for (size_t i = 0; i < NUM_LIMBS; ++i) {
        for (size_t j = 0; j < NUM_LIMBS; ++j) {
            __uint128_t prod = static_cast<__uint128_t>(a.limbs[i]) * b.limbs[j];
            products[i + j] += prod & 0xFFFFFFFFFFFFFFFFULL;
            products[i + j + 1] += prod >> 64;
        }
    }

    uint64_t out[8];
    __uint128_t carry = 0;
    for (int i = 0; i < 8; ++i) {
        __uint128_t sum = products[i] + carry;
        out[i] = static_cast<uint64_t>(sum);
        carry = sum >> 64;
    }

    high = Uint256(out[4], out[5], out[6], out[7]);
    return Uint256(out[0], out[1], out[2], out[3]);
}

Uint256 Uint256::operator<<(int shift) const {
    if (shift == 0) return *this;
    if (shift >= 256) return Uint256();

    Uint256 result;
    int limbShift = shift / 64;
    int bitShift = shift % 64;
    for (int i = 3; i >= limbShift; --i) {
        result.limbs[i] = limbs[i - limbShift] << bitShift;
        if (bitShift != 0 && i > limbShift) {
            result.limbs[i] |= limbs[i - limbShift - 1] >> (64 - bitShift);
        }
    }
    return result;
}

Uint256 Uint256::operator>>(int shift) const {
    if (shift == 0) return *this;
    if (shift >= 256) return Uint256();

    Uint256 result;
    int limbShift = shift / 64;
    int bitShift = shift % 64;
    for (int i = 0; i < 4 - limbShift; ++i) {
        result.limbs[i] = limbs[i + limbShift] >> bitShift;
        if (bitShift != 0 && i + limbShift + 1 < 4) {
            result.limbs[i] |= limbs[i + limbShift + 1] << (64 - bitShift);
        }
    }
    return result;
}

// ============================================================================
// FieldElement Implementation
// ============================================================================

FieldElement::FieldElement() : value() {}

FieldElement::FieldElement(const Uint256& val) : value(MontMul(val, R2)) {}

FieldElement::FieldElement(uint64_t val) : value(MontMul(Uint256(val), R2)) {}

FieldElement FieldElement::Zero() {
    return FieldElement();
}

FieldElement FieldElement::One() {
    FieldElement fe;
    fe.value = R;
    return fe;
}

std::optional<FieldElement> FieldElement::FromUint256Canonical(const Uint256& val) {
    if (val >= MODULUS) {
        return std::nullopt;
    }
    return FieldElement(val);
}

std::optional<FieldElement> FieldElement::FromDecimal(const std::string& str) {
    auto parsed = Uint256::FromDecimal(str);
    if (!parsed) {
        return std::nullopt;
    }
    return FromUint256Canonical(*parsed);
}

FieldElement FieldElement::FromBytes(const Byte* data, size_t len) {
    return FieldElement(Uint256(data, len));
}

FieldElement FieldElement::FromHex(const std::string& hex) {
    return FieldElement(Uint256::FromHex(hex));
}

Uint256 FieldElement::ToUint256() const {
    // Multiplying by 1 in Montgomery form strips one factor of R
    return MontMul(value, Uint256(1));
}

std::string FieldElement::ToDecimal() const {
    return ToUint256().ToDecimal();
}

std::string FieldElement::ToHex() const {
    return ToUint256().ToHex();
}

std::array<Byte, 32> FieldElement::ToBytes() const {
    return ToUint256().ToBytes();
}

bool FieldElement::IsZero() const {
    return value.IsZero();
}

bool FieldElement::operator==(const FieldElement& other) const {
    return value == other.value;
}

bool FieldElement::operator!=(const FieldElement& other) const {
    return value != other.value;
}

bool FieldElement::operator<(const FieldElement& other) const {
    return ToUint256() < other.ToUint256();
}

Uint256 FieldElement::ModAdd(const Uint256& a, const Uint256& b) {
    bool carry;
    Uint256 sum = Uint256::Add(a, b, carry);
    if (carry || sum >= MODULUS) {
        bool borrow;
        sum = Uint256::Sub(sum, MODULUS, borrow);
    }
    return sum;
}

Uint256 FieldElement::ModSub(const Uint256& a, const Uint256& b) {
    bool borrow;
    Uint256 diff = Uint256::Sub(a, b, borrow);
    if (borrow) {
        bool carry;
        diff = Uint256::Add(diff, MODULUS, carry);
    }
    return diff;
}

Uint256 FieldElement::MontMul(const Uint256& a, const Uint256& b) {
    Uint256 hi;
    Uint256 lo = Uint256::Mul(a, b, hi);
    return MontReduce(lo, hi);
}

Uint256 FieldElement::MontReduce(const Uint256& lo, const Uint256& hi) {
    Uint256 result = lo;
    Uint256 high = hi;

    for (int i = 0; i < 4; ++i) {
        uint64_t m = result.limbs[0] * INV;

        __uint128_t carry = 0;
        for (int j = 0; j < 4; ++j) {
            __uint128_t sum = static_cast<__uint128_t>(m) * MODULUS.limbs[j] +
                              result.limbs[j] + carry;
            result.limbs[j] = static_cast<uint64_t>(sum);
            carry = sum >> 64;
        }
        for (int j = 0; j < 4 && carry; ++j) {
            __uint128_t sum = static_cast<__uint128_t>(high.limbs[j]) + carry;
            high.limbs[j] = static_cast<uint64_t>(sum);
            carry = sum >> 64;
        }

        // result.limbs[0] is now zero; shift the 512-bit window down one limb
        result.limbs[0] = result.limbs[1];
        result.limbs[1] = result.limbs[2];
        result.limbs[2] = result.limbs[3];
        result.limbs[3] = high.limbs[0];
        high.limbs[0] = high.limbs[1];
        high.limbs[1] = high.limbs[2];
        high.limbs[2] = high.limbs[3];
        high.limbs[3] = 0;
    }

    if (result >= MODULUS) {
        bool borrow;
        result = Uint256::Sub(result, MODULUS, borrow);
    }
    return result;
}

FieldElement FieldElement::operator+(const FieldElement& other) const {
    FieldElement result;
    result.value = ModAdd(value, other.value);
    return result;
}

FieldElement FieldElement::operator-(const FieldElement& other) const {
    FieldElement result;
    result.value = ModSub(value, other.value);
    return result;
}

FieldElement FieldElement::operator*(const FieldElement& other) const {
    FieldElement result;
    result.value = MontMul(value, other.value);
    return result;
}

FieldElement FieldElement::operator-() const {
    if (IsZero()) return *this;
    FieldElement result;
    bool borrow;
    result.value = Uint256::Sub(MODULUS, value, borrow);
    return result;
}

FieldElement& FieldElement::operator+=(const FieldElement& other) {
    value = ModAdd(value, other.value);
    return *this;
}

FieldElement& FieldElement::operator-=(const FieldElement& other) {
    value = ModSub(value, other.value);
    return *this;
}

FieldElement& FieldElement::operator*=(const FieldElement& other) {
    value = MontMul(value, other.value);
    return *this;
}

FieldElement FieldElement::Square() const {
    return (*this) * (*this);
}

FieldElement FieldElement::Pow(const Uint256& exp) const {
    FieldElement result = One();
    FieldElement base = *this;

    // Square-and-multiply from the least significant bit
    for (size_t i = 0; i < Uint256::NUM_LIMBS; ++i) {
        uint64_t limb = exp.limbs[i];
        for (int j = 0; j < 64; ++j) {
            if (limb & 1) {
                result *= base;
            }
            base = base.Square();
            limb >>= 1;
        }
    }
    return result;
}

FieldElement FieldElement::Inverse() const {
    if (IsZero()) return Zero();

    // Fermat: a^(r-2)
    const Uint256 rMinus2(
        0x43e1f593efffffffULL,
        0x2833e84879b97091ULL,
        0xb85045b68181585dULL,
        0x30644e72e131a029ULL
    );
    return Pow(rMinus2);
}

FieldElement FieldElement::PoseidonSbox() const {
    FieldElement x2 = Square();
    FieldElement x4 = x2.Square();
    return x4 * (*this);
}

} // namespace semaphore
