// SEMAPHORE - Poseidon Hash Function
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License
//
// ZK-friendly algebraic hash function over the BN254 scalar field
// Based on: "Poseidon: A New Hash Function for Zero-Knowledge Proof Systems"
// https://eprint.iacr.org/2019/458
//
// Parameters and constants match circomlib's Poseidon, so digests agree
// with the membership circuits: x^5 S-box, 8 full rounds, width t = n + 1
// for n inputs, round constants and Cauchy MDS matrix drawn from the Grain
// LFSR of the reference parameter script.

#ifndef SEMAPHORE_CRYPTO_POSEIDON_H
#define SEMAPHORE_CRYPTO_POSEIDON_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "semaphore/core/types.h"
#include "semaphore/crypto/field.h"

namespace semaphore {

// ============================================================================
// Poseidon Configuration
// ============================================================================

/// Poseidon permutation parameters
struct PoseidonConfig {
    /// State width (t)
    size_t width;

    /// Number of full rounds (R_F)
    size_t fullRounds;

    /// Number of partial rounds (R_P)
    size_t partialRounds;

    size_t totalRounds() const { return fullRounds + partialRounds; }

    bool operator==(const PoseidonConfig& other) const {
        return width == other.width && fullRounds == other.fullRounds &&
               partialRounds == other.partialRounds;
    }
};

namespace PoseidonParams {
    /// Largest input count with published parameters
    constexpr size_t MAX_INPUTS = 16;

    constexpr size_t FULL_ROUNDS = 8;

    /// Parameters for hashing `numInputs` elements.
    /// Throws std::invalid_argument outside [1, MAX_INPUTS].
    PoseidonConfig ForInputs(size_t numInputs);
}

/// Round constants and MDS matrix derived for one configuration
struct PoseidonConstants {
    /// totalRounds() * width values, round-major
    std::vector<FieldElement> roundConstants;
    std::vector<std::vector<FieldElement>> mds;
};

// ============================================================================
// Poseidon Hash Class
// ============================================================================

/// Fixed-arity Poseidon hash.
///
/// Constants are derived once per width and shared between hasher
/// instances. The state starts as [0, inputs...] and the digest is the
/// first state element after the permutation.
class Poseidon {
public:
    static constexpr size_t OUTPUT_SIZE = 32;

    /// Throws std::invalid_argument outside [1, MAX_INPUTS]
    explicit Poseidon(size_t numInputs);

    const PoseidonConfig& Config() const { return config_; }

    /// Throws std::invalid_argument if the input count differs from the
    /// one given at construction
    FieldElement Digest(const std::vector<FieldElement>& inputs) const;

    /// Apply the permutation in place; state.size() must equal the width
    void Permute(std::vector<FieldElement>& state) const;

    /// Hash 1 to MAX_INPUTS field elements
    static FieldElement Hash(const std::vector<FieldElement>& inputs);

    /// 2-to-1 compression used for Merkle nodes, commitments and nullifiers
    static FieldElement Hash2(const FieldElement& left, const FieldElement& right);

    /// Constants for a configuration (computed on first use, then cached)
    static std::shared_ptr<const PoseidonConstants> ConstantsFor(const PoseidonConfig& config);

private:
    PoseidonConfig config_;
    std::shared_ptr<const PoseidonConstants> constants_;

    void AddRoundConstants(std::vector<FieldElement>& state, size_t roundIdx) const;
    void MixColumns(std::vector<FieldElement>& state) const;
};

/// Hash two field elements (for Merkle trees)
inline FieldElement PoseidonHash2(const FieldElement& left, const FieldElement& right) {
    return Poseidon::Hash2(left, right);
}

} // namespace semaphore

#endif // SEMAPHORE_CRYPTO_POSEIDON_H
