// SEMAPHORE - BLAKE-512 Hash Function
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License
//
// BLAKE-512 (the SHA-3 finalist, not BLAKE2b). Baby Jubjub EdDSA expands
// private keys and derives nonces with it.

#ifndef SEMAPHORE_CRYPTO_BLAKE512_H
#define SEMAPHORE_CRYPTO_BLAKE512_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "semaphore/core/types.h"

namespace semaphore {

/// BLAKE-512 hasher class
class Blake512 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 64;

    /// Block size in bytes
    static constexpr size_t BLOCK_SIZE = 128;

    Blake512();

    /// Write data to the hasher
    /// @param data Pointer to input data
    /// @param len Length of input data
    /// @return Reference to this hasher (for chaining)
    Blake512& Write(const Byte* data, size_t len);

    /// Finalize the hash and write to output.
    /// The hasher must be Reset() before it is reused.
    /// @param hash Output buffer of at least OUTPUT_SIZE bytes
    void Finalize(Byte hash[OUTPUT_SIZE]);

    Blake512& Reset();

private:
    uint64_t state_[8];
    Byte buffer_[BLOCK_SIZE];
    size_t bufferLen_;

    /// Message bits hashed so far, including the buffered ones
    uint64_t bits_;

    /// @param counter Message bits up to the end of this block, 0 for a
    ///        block holding padding only
    void Compress(const Byte block[BLOCK_SIZE], uint64_t counter);
};

using Hash512 = std::array<Byte, Blake512::OUTPUT_SIZE>;

/// Compute the BLAKE-512 hash of data in a single call
Hash512 Blake512Hash(const Byte* data, size_t len);

inline Hash512 Blake512Hash(const std::vector<Byte>& data) {
    return Blake512Hash(data.data(), data.size());
}

} // namespace semaphore

#endif // SEMAPHORE_CRYPTO_BLAKE512_H
