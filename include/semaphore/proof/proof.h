// SEMAPHORE - Semaphore Proof
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License
//
// The value produced by proof generation: public signals plus the Groth16
// curve points.

#ifndef SEMAPHORE_PROOF_PROOF_H
#define SEMAPHORE_PROOF_PROOF_H

#include "semaphore/crypto/field.h"

#include <array>
#include <cstdint>
#include <string>

namespace semaphore {
namespace proof {

/// Range of tree depths with precompiled circuits
constexpr uint16_t MIN_TREE_DEPTH = 1;
constexpr uint16_t MAX_TREE_DEPTH = 32;

inline bool IsSupportedDepth(uint64_t depth) {
    return depth >= MIN_TREE_DEPTH && depth <= MAX_TREE_DEPTH;
}

// ============================================================================
// Groth16 Points
// ============================================================================

/// Flat form used by on-chain verifiers
using PackedGroth16Proof = std::array<Uint256, 8>;

/**
 * Affine coordinates of a Groth16 proof over BN254.
 *
 * a and c are G1 points (x, y). b is a G2 point whose coordinates are
 * elements of Fq2, stored as b[0] = {x0, x1} and b[1] = {y0, y1}.
 */
struct Groth16Points {
    std::array<Uint256, 2> a;
    std::array<std::array<Uint256, 2>, 2> b;
    std::array<Uint256, 2> c;

    /// [a.x, a.y, b.x1, b.x0, b.y1, b.y0, c.x, c.y]
    PackedGroth16Proof Pack() const;

    static Groth16Points Unpack(const PackedGroth16Proof& packed);

    bool operator==(const Groth16Points& other) const {
        return a == other.a && b == other.b && c == other.c;
    }
    bool operator!=(const Groth16Points& other) const { return !(*this == other); }
};

// ============================================================================
// Semaphore Proof
// ============================================================================

struct SemaphoreProof {
    uint16_t merkleTreeDepth{0};
    FieldElement merkleTreeRoot;
    FieldElement nullifier;

    /// Encoded signal words (see EncodeSignal)
    Uint256 message;
    Uint256 scope;

    Groth16Points points;

    bool operator==(const SemaphoreProof& other) const;
    bool operator!=(const SemaphoreProof& other) const { return !(*this == other); }

    std::string ToString() const;
};

} // namespace proof
} // namespace semaphore

#endif // SEMAPHORE_PROOF_PROOF_H
