// SEMAPHORE - Circom Interchange Formats
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License
//
// Data formats shared with the circom toolchain: the input object fed to
// the witness generator, the binary .wtns witness file, and the snarkjs
// JSON layout of Groth16 proofs and public signals.

#ifndef SEMAPHORE_PROOF_CIRCOM_H
#define SEMAPHORE_PROOF_CIRCOM_H

#include "semaphore/core/types.h"
#include "semaphore/crypto/field.h"
#include "semaphore/proof/backend.h"
#include "semaphore/proof/proof.h"
#include "semaphore/util/json.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace semaphore {
namespace proof {
namespace circom {

/// .wtns file constants
constexpr uint32_t WTNS_VERSION = 2;
constexpr uint32_t WTNS_FIELD_SIZE = 32;
constexpr uint32_t WTNS_SECTION_HEADER = 1;
constexpr uint32_t WTNS_SECTION_VALUES = 2;

/**
 * Input object for the membership circuit. Every value is a decimal
 * string:
 *
 *   {"identityTrapdoor":"..","identityNullifier":"..",
 *    "merkleProofLength":"..","merkleProofIndex":"..",
 *    "merkleProofSiblings":[..],"message":"..","scope":".."}
 *
 * "message" and "scope" carry the hashed signal and scope.
 */
util::JSONValue CircuitInputsToJSON(const WitnessInputs& inputs);

/// Serialize witness values as a .wtns file (values in standard form)
Bytes EncodeWtns(const std::vector<FieldElement>& values);

/**
 * Parse a .wtns file.
 *
 * @throws ProvingError on a bad magic, an unsupported version, a field
 *         other than the BN254 scalar field, a truncated section or a
 *         value that is not a canonical field element
 */
std::vector<FieldElement> DecodeWtns(const Byte* data, size_t len);

inline std::vector<FieldElement> DecodeWtns(const Bytes& data) {
    return DecodeWtns(data.data(), data.size());
}

/// {"pi_a":[x,y,"1"],"pi_b":[[x0,x1],[y0,y1],["1","0"]],"pi_c":[x,y,"1"],
///  "protocol":"groth16","curve":"bn128"}
util::JSONValue Groth16ToJSON(const Groth16Points& points);

/// @throws ProvingError if the layout or a coordinate is invalid
Groth16Points Groth16FromJSON(const util::JSONValue& json);

/// Array of decimal strings
util::JSONValue PublicSignalsToJSON(const std::vector<FieldElement>& signals);

/// @throws ProvingError unless every entry is a canonical decimal string
std::vector<FieldElement> PublicSignalsFromJSON(const util::JSONValue& json);

} // namespace circom
} // namespace proof
} // namespace semaphore

#endif // SEMAPHORE_PROOF_CIRCOM_H
