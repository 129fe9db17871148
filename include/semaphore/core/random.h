// SEMAPHORE - Secure Random Number Generation Header
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License
//
// Cryptographically secure random bytes from the OpenSSL DRBG, which is
// seeded from the operating system entropy source.

#ifndef SEMAPHORE_CORE_RANDOM_H
#define SEMAPHORE_CORE_RANDOM_H

#include <cstddef>
#include <cstdint>

namespace semaphore {

/// Fill buffer with cryptographically secure random bytes.
/// Throws std::runtime_error if the generator cannot be seeded.
void GetRandBytes(uint8_t* buf, size_t len);

} // namespace semaphore

#endif // SEMAPHORE_CORE_RANDOM_H
