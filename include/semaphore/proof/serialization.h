// SEMAPHORE - Proof Serialization
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License
//
// JSON exchange format. Field elements and coordinates are written as
// decimal strings; keys always appear in this order:
//
//   {"merkleTreeDepth":<uint>,"merkleTreeRoot":"..","nullifier":"..",
//    "message":"..","scope":"..",
//    "points":{"a":[..],"b":[[..],[..]],"c":[..]},"version":1}

#ifndef SEMAPHORE_PROOF_SERIALIZATION_H
#define SEMAPHORE_PROOF_SERIALIZATION_H

#include "semaphore/proof/proof.h"
#include "semaphore/util/json.h"

#include <cstdint>
#include <string>

namespace semaphore {
namespace proof {

/// Current exchange format version
constexpr int64_t PROOF_FORMAT_VERSION = 1;

util::JSONValue ProofToJSON(const SemaphoreProof& proof);

/// Compact JSON; identical proofs give identical text
std::string ExportProof(const SemaphoreProof& proof);

/// @throws MalformedProofError on any schema or range violation
SemaphoreProof ProofFromJSON(const util::JSONValue& json);

/**
 * Parse an exported proof.
 *
 * Rejects malformed JSON, missing or unknown keys, wrong arities,
 * non-canonical decimal strings, a root or nullifier outside the scalar
 * field, point coordinates outside the base field, a depth that does not
 * fit 16 bits and any version other than PROOF_FORMAT_VERSION.
 *
 * @throws MalformedProofError
 */
SemaphoreProof ImportProof(const std::string& text);

} // namespace proof
} // namespace semaphore

#endif // SEMAPHORE_PROOF_SERIALIZATION_H
