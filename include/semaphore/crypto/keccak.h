// SEMAPHORE - Keccak-256 Hash Function
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License
//
// Keccak-256 as used by Ethereum: the original Keccak padding (0x01),
// not the FIPS 202 SHA3-256 padding (0x06).

#ifndef SEMAPHORE_CRYPTO_KECCAK_H
#define SEMAPHORE_CRYPTO_KECCAK_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "semaphore/core/types.h"

namespace semaphore {

/// Incremental Keccak-256 hasher
class Keccak256 {
public:
    static constexpr size_t OUTPUT_SIZE = 32;

    /// Sponge rate in bytes (1600 - 2 * 256 bits)
    static constexpr size_t RATE = 136;

    Keccak256();

    Keccak256& Write(const Byte* data, size_t len);

    /// Finalize the hash and write to output.
    /// The hasher must be Reset() before it is reused.
    void Finalize(Byte hash[OUTPUT_SIZE]);

    Keccak256& Reset();

private:
    uint64_t state_[25];
    Byte buffer_[RATE];
    size_t bufferLen_;

    void AbsorbBlock(const Byte block[RATE]);
};

/// Compute the Keccak-256 hash of data in a single call
Hash256 Keccak256Hash(const Byte* data, size_t len);

inline Hash256 Keccak256Hash(const std::vector<Byte>& data) {
    return Keccak256Hash(data.data(), data.size());
}

} // namespace semaphore

#endif // SEMAPHORE_CRYPTO_KECCAK_H
