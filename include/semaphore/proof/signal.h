// SEMAPHORE - Signal Encoding
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License
//
// Messages and scopes are arbitrary byte strings. They are carried in a
// proof as a 256-bit word and enter the circuit as a field element hash.

#ifndef SEMAPHORE_PROOF_SIGNAL_H
#define SEMAPHORE_PROOF_SIGNAL_H

#include "semaphore/core/types.h"
#include "semaphore/crypto/field.h"

#include <string>

namespace semaphore {
namespace proof {

/// Longest input embedded directly; longer inputs are digested first
constexpr size_t MAX_EMBEDDED_SIGNAL = 32;

/**
 * Encode a message or scope as a 256-bit word.
 *
 * Inputs of up to 32 bytes are copied to the front of a zero-filled 32-byte
 * buffer which is read big-endian. Longer inputs are replaced by their
 * Keccak-256 digest, read the same way.
 */
Uint256 EncodeSignal(const Bytes& data);

inline Uint256 EncodeSignal(const std::string& text) {
    return EncodeSignal(ToBytes(text));
}

/**
 * Keccak-256 of the word's minimal big-endian bytes (a single 0x00 for
 * zero), shifted right by 8 bits. The result is below 2^248 and therefore
 * a canonical field element.
 */
FieldElement HashSignal(const Uint256& word);

} // namespace proof
} // namespace semaphore

#endif // SEMAPHORE_PROOF_SIGNAL_H
