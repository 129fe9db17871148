// SEMAPHORE - Signal Encoding Implementation
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License

#include "semaphore/proof/signal.h"

#include "semaphore/crypto/keccak.h"

#include <array>
#include <cstring>

namespace semaphore {
namespace proof {

Uint256 EncodeSignal(const Bytes& data) {
    if (data.size() > MAX_EMBEDDED_SIGNAL) {
        Hash256 digest = Keccak256Hash(data);
        return Uint256::FromBytesBE(digest.data(), digest.size());
    }

    std::array<Byte, 32> word{};
    if (!data.empty()) {
        std::memcpy(word.data(), data.data(), data.size());
    }
    return Uint256::FromBytesBE(word.data(), word.size());
}

FieldElement HashSignal(const Uint256& word) {
    auto encoded = word.ToBytesBE();
    size_t skip = 0;
    while (skip + 1 < encoded.size() && encoded[skip] == 0) {
        ++skip;
    }
    Hash256 digest = Keccak256Hash(encoded.data() + skip, encoded.size() - skip);
    Uint256 shifted = Uint256::FromBytesBE(digest.data(), digest.size()) >> 8;
    return FieldElement(shifted);
}

} // namespace proof
} // namespace semaphore
