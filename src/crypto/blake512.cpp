// SEMAPHORE - BLAKE-512 Implementation
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License

#include "semaphore/crypto/blake512.h"

#include <cstring>

namespace semaphore {

// ============================================================================
// BLAKE-512 Constants and Helper Functions
// ============================================================================

namespace {

/// Initial hash values (same as SHA-512)
constexpr uint64_t BLAKE512_INIT[8] = {
    0x6A09E667F3BCC908ULL, 0xBB67AE8584CAA73BULL, 0x3C6EF372FE94F82BULL,
    0xA54FF53A5F1D36F1ULL, 0x510E527FADE682D1ULL, 0x9B05688C2B3E6C1FULL,
    0x1F83D9ABFB41BD6BULL, 0x5BE0CD19137E2179ULL
};

/// Leading digits of pi
constexpr uint64_t U512[16] = {
    0x243F6A8885A308D3ULL, 0x13198A2E03707344ULL, 0xA4093822299F31D0ULL,
    0x082EFA98EC4E6C89ULL, 0x452821E638D01377ULL, 0xBE5466CF34E90C6CULL,
    0xC0AC29B7C97C50DDULL, 0x3F84D5B5B5470917ULL, 0x9216D5D98979FB1BULL,
    0xD1310BA698DFB5ACULL, 0x2FFD72DBD01ADFB7ULL, 0xB8E1AFED6A267E96ULL,
    0xBA7C9045F12C7F99ULL, 0x24A19947B3916CF7ULL, 0x0801F2E2858EFC16ULL,
    0x636920D871574E69ULL
};

constexpr uint8_t SIGMA[10][16] = {
    { 0,  1,  2,  3,  4,  5,  6,  7,  8,  9, 10, 11, 12, 13, 14, 15},
    {14, 10,  4,  8,  9, 15, 13,  6,  1, 12,  0,  2, 11,  7,  5,  3},
    {11,  8, 12,  0,  5,  2, 15, 13, 10, 14,  3,  6,  7,  1,  9,  4},
    { 7,  9,  3,  1, 13, 12, 11, 14,  2,  6,  5, 10,  4,  0, 15,  8},
    { 9,  0,  5,  7,  2,  4, 10, 15, 14,  1, 11, 12,  6,  8,  3, 13},
    { 2, 12,  6, 10,  0, 11,  8,  3,  4, 13,  7,  5, 15, 14,  1,  9},
    {12,  5,  1, 15, 14, 13,  4, 10,  0,  7,  6,  3,  9,  2,  8, 11},
    {13, 11,  7, 14, 12,  1,  3,  9,  5,  0, 15,  4,  8,  6,  2, 10},
    { 6, 15, 14,  9, 11,  3,  0,  8, 12,  2, 13,  7,  1,  4, 10,  5},
    {10,  2,  8,  4,  7,  6,  1,  5, 15, 11,  9, 14,  3, 12, 13,  0}
};

constexpr int NUM_ROUNDS = 16;

inline uint64_t ROTR64(uint64_t x, int n) { return (x >> n) | (x << (64 - n)); }

inline uint64_t ReadBE64(const Byte* ptr) {
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v = (v << 8) | ptr[i];
    }
    return v;
}

inline void WriteBE64(Byte* ptr, uint64_t val) {
    for (int i = 0; i < 8; ++i) {
        ptr[i] = static_cast<Byte>(val >> (56 - 8 * i));
    }
}

inline void G(uint64_t v[16], const uint64_t m[16], const uint8_t* s, int i,
              int a, int b, int c, int d) {
    v[a] += v[b] + (m[s[2 * i]] ^ U512[s[2 * i + 1]]);
    v[d] = ROTR64(v[d] ^ v[a], 32);
    v[c] += v[d];
    v[b] = ROTR64(v[b] ^ v[c], 25);
    v[a] += v[b] + (m[s[2 * i + 1]] ^ U512[s[2 * i]]);
    v[d] = ROTR64(v[d] ^ v[a], 16);
    v[c] += v[d];
    v[b] = ROTR64(v[b] ^ v[c], 11);
}

} // anonymous namespace

// ============================================================================
// Blake512 Implementation
// ============================================================================

Blake512::Blake512() {
    Reset();
}

Blake512& Blake512::Reset() {
    std::memcpy(state_, BLAKE512_INIT, sizeof(state_));
    std::memset(buffer_, 0, sizeof(buffer_));
    bufferLen_ = 0;
    bits_ = 0;
    return *this;
}

void Blake512::Compress(const Byte block[BLOCK_SIZE], uint64_t counter) {
    uint64_t m[16];
    for (int i = 0; i < 16; ++i) {
        m[i] = ReadBE64(block + 8 * i);
    }

    // The high counter word stays zero below 2^64 message bits
    uint64_t v[16];
    for (int i = 0; i < 8; ++i) {
        v[i] = state_[i];
    }
    v[8] = U512[0];
    v[9] = U512[1];
    v[10] = U512[2];
    v[11] = U512[3];
    v[12] = counter ^ U512[4];
    v[13] = counter ^ U512[5];
    v[14] = U512[6];
    v[15] = U512[7];

    for (int r = 0; r < NUM_ROUNDS; ++r) {
        const uint8_t* s = SIGMA[r % 10];
        G(v, m, s, 0, 0, 4, 8, 12);
        G(v, m, s, 1, 1, 5, 9, 13);
        G(v, m, s, 2, 2, 6, 10, 14);
        G(v, m, s, 3, 3, 7, 11, 15);
        G(v, m, s, 4, 0, 5, 10, 15);
        G(v, m, s, 5, 1, 6, 11, 12);
        G(v, m, s, 6, 2, 7, 8, 13);
        G(v, m, s, 7, 3, 4, 9, 14);
    }

    for (int i = 0; i < 8; ++i) {
        state_[i] ^= v[i] ^ v[i + 8];
    }
}

Blake512& Blake512::Write(const Byte* data, size_t len) {
    if (data == nullptr || len == 0) {
        return *this;
    }

    while (len > 0) {
        size_t take = BLOCK_SIZE - bufferLen_;
        if (take > len) {
            take = len;
        }
        std::memcpy(buffer_ + bufferLen_, data, take);
        bufferLen_ += take;
        bits_ += static_cast<uint64_t>(take) * 8;
        data += take;
        len -= take;

        if (bufferLen_ == BLOCK_SIZE) {
            Compress(buffer_, bits_);
            bufferLen_ = 0;
        }
    }
    return *this;
}

void Blake512::Finalize(Byte hash[OUTPUT_SIZE]) {
    // Blocks without message bits are compressed with a zero counter
    const uint64_t counter = bufferLen_ > 0 ? bits_ : 0;
    const size_t LENGTH_OFFSET = BLOCK_SIZE - 16;

    buffer_[bufferLen_++] = 0x80;
    if (bufferLen_ > LENGTH_OFFSET) {
        std::memset(buffer_ + bufferLen_, 0, BLOCK_SIZE - bufferLen_);
        Compress(buffer_, counter);
        std::memset(buffer_, 0, LENGTH_OFFSET);
        buffer_[LENGTH_OFFSET - 1] |= 0x01;
        WriteBE64(buffer_ + LENGTH_OFFSET, 0);
        WriteBE64(buffer_ + LENGTH_OFFSET + 8, bits_);
        Compress(buffer_, 0);
    } else {
        std::memset(buffer_ + bufferLen_, 0, LENGTH_OFFSET - bufferLen_);
        buffer_[LENGTH_OFFSET - 1] |= 0x01;
        WriteBE64(buffer_ + LENGTH_OFFSET, 0);
        WriteBE64(buffer_ + LENGTH_OFFSET + 8, bits_);
        Compress(buffer_, counter);
    }
    bufferLen_ = 0;

    for (int i = 0; i < 8; ++i) {
        WriteBE64(hash + 8 * i, state_[i]);
    }
}

// ============================================================================
// Convenience Functions
// ============================================================================

Hash512 Blake512Hash(const Byte* data, size_t len) {
    Hash512 result;
    Blake512().Write(data, len).Finalize(result.data());
    return result;
}

} // namespace semaphore
