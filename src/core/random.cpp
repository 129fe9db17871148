// SEMAPHORE - Secure Random Number Generation Implementation
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License

#include "semaphore/core/random.h"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <climits>
#include <stdexcept>
#include <string>

namespace semaphore {

void GetRandBytes(uint8_t* buf, size_t len) {
    while (len > 0) {
        int chunk = len > static_cast<size_t>(INT_MAX) ? INT_MAX : static_cast<int>(len);
        if (RAND_bytes(buf, chunk) != 1) {
            throw std::runtime_error("Failed to get random bytes: " +
                                     std::to_string(ERR_get_error()));
        }
        buf += chunk;
        len -= static_cast<size_t>(chunk);
    }
}

} // namespace semaphore
