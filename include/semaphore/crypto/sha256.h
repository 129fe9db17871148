// SEMAPHORE - SHA256 Hash Function
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License
//
// Incremental SHA-256 on top of the OpenSSL EVP digest interface.

#ifndef SEMAPHORE_CRYPTO_SHA256_H
#define SEMAPHORE_CRYPTO_SHA256_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "semaphore/core/types.h"

// Forward declaration to keep OpenSSL headers out of the public interface
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace semaphore {

/// SHA-256 hasher class
class SHA256 {
public:
    static constexpr size_t OUTPUT_SIZE = 32;

    /// Throws std::runtime_error if OpenSSL cannot allocate a digest context
    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Write data to the hasher
    /// @param data Pointer to input data
    /// @param len Length of input data
    /// @return Reference to this hasher (for chaining)
    SHA256& Write(const Byte* data, size_t len);

    /// Finalize the hash and write to output.
    /// The hasher must be Reset() before it is reused.
    /// @param hash Output buffer of at least OUTPUT_SIZE bytes
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Reset hasher to initial state
    SHA256& Reset();

private:
    EVP_MD_CTX* ctx_;
};

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

} // namespace semaphore

#endif // SEMAPHORE_CRYPTO_SHA256_H
