// SEMAPHORE - Keccak-256 Implementation
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License

#include "semaphore/crypto/keccak.h"

#include <cstring>

namespace semaphore {

// ============================================================================
// Keccak-f[1600]
// ============================================================================

namespace {

constexpr uint64_t ROUND_CONSTANTS[24] = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808AULL,
    0x8000000080008000ULL, 0x000000000000808BULL, 0x0000000080000001ULL,
    0x8000000080008081ULL, 0x8000000000008009ULL, 0x000000000000008AULL,
    0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000AULL,
    0x000000008000808BULL, 0x800000000000008BULL, 0x8000000000008089ULL,
    0x8000000000008003ULL, 0x8000000000008002ULL, 0x8000000000000080ULL,
    0x000000000000800AULL, 0x800000008000000AULL, 0x8000000080008081ULL,
    0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL
};

/// Rotation offsets indexed by x + 5y
constexpr int RHO_OFFSETS[25] = {
     0,  1, 62, 28, 27,
    36, 44,  6, 55, 20,
     3, 10, 43, 25, 39,
    41, 45, 15, 21,  8,
    18,  2, 61, 56, 14
};

inline uint64_t ROTL64(uint64_t x, int n) {
    return n == 0 ? x : (x << n) | (x >> (64 - n));
}

inline uint64_t ReadLE64(const Byte* ptr) {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
        v = (v << 8) | ptr[i];
    }
    return v;
}

inline void WriteLE64(Byte* ptr, uint64_t val) {
    for (int i = 0; i < 8; ++i) {
        ptr[i] = static_cast<Byte>(val >> (8 * i));
    }
}

void KeccakF1600(uint64_t a[25]) {
    uint64_t b[25];
    uint64_t c[5];
    uint64_t d[5];

    for (int round = 0; round < 24; ++round) {
        // Theta
        for (int x = 0; x < 5; ++x) {
            c[x] = a[x] ^ a[x + 5] ^ a[x + 10] ^ a[x + 15] ^ a[x + 20];
        }
        for (int x = 0; x < 5; ++x) {
            d[x] = c[(x + 4) % 5] ^ ROTL64(c[(x + 1) % 5], 1);
        }
        for (int i = 0; i < 25; ++i) {
            a[i] ^= d[i % 5];
        }

        // Rho and pi
        for (int x = 0; x < 5; ++x) {
            for (int y = 0; y < 5; ++y) {
                int i = x + 5 * y;
                b[y + 5 * ((2 * x + 3 * y) % 5)] = ROTL64(a[i], RHO_OFFSETS[i]);
            }
        }

        // Chi
        for (int y = 0; y < 5; ++y) {
            for (int x = 0; x < 5; ++x) {
                a[x + 5 * y] = b[x + 5 * y] ^
                               (~b[(x + 1) % 5 + 5 * y] & b[(x + 2) % 5 + 5 * y]);
            }
        }

        // Iota
        a[0] ^= ROUND_CONSTANTS[round];
    }
}

} // anonymous namespace

// ============================================================================
// Keccak256 Implementation
// ============================================================================

Keccak256::Keccak256() {
    Reset();
}

Keccak256& Keccak256::Reset() {
    std::memset(state_, 0, sizeof(state_));
    std::memset(buffer_, 0, sizeof(buffer_));
    bufferLen_ = 0;
    return *this;
}

void Keccak256::AbsorbBlock(const Byte block[RATE]) {
    for (size_t i = 0; i < RATE / 8; ++i) {
        state_[i] ^= ReadLE64(block + 8 * i);
    }
    KeccakF1600(state_);
}

Keccak256& Keccak256::Write(const Byte* data, size_t len) {
    if (data == nullptr || len == 0) {
        return *this;
    }

    while (len > 0) {
        size_t take = RATE - bufferLen_;
        if (take > len) {
            take = len;
        }
        std::memcpy(buffer_ + bufferLen_, data, take);
        bufferLen_ += take;
        data += take;
        len -= take;

        if (bufferLen_ == RATE) {
            AbsorbBlock(buffer_);
            bufferLen_ = 0;
        }
    }
    return *this;
}

void Keccak256::Finalize(Byte hash[OUTPUT_SIZE]) {
    std::memset(buffer_ + bufferLen_, 0, RATE - bufferLen_);
    buffer_[bufferLen_] ^= 0x01;
    buffer_[RATE - 1] ^= 0x80;
    AbsorbBlock(buffer_);
    bufferLen_ = 0;

    for (size_t i = 0; i < OUTPUT_SIZE / 8; ++i) {
        WriteLE64(hash + 8 * i, state_[i]);
    }
}

// ============================================================================
// Convenience Functions
// ============================================================================

Hash256 Keccak256Hash(const Byte* data, size_t len) {
    Hash256 result;
    Keccak256().Write(data, len).Finalize(result.data());
    return result;
}

} // namespace semaphore
