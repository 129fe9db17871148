// SEMAPHORE - Proving Backend Interface
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License
//
// Boundary to the witness calculator and the Groth16 prover/verifier.
// Everything behind this interface works on one depth-specific circuit.

#ifndef SEMAPHORE_PROOF_BACKEND_H
#define SEMAPHORE_PROOF_BACKEND_H

#include "semaphore/crypto/field.h"
#include "semaphore/proof/artifacts.h"
#include "semaphore/proof/proof.h"

#include <cstdint>
#include <vector>

namespace semaphore {
namespace proof {

// ============================================================================
// Circuit Inputs
// ============================================================================

/**
 * Signal assignment for the membership circuit.
 *
 * The sibling list is padded with zeros to `depth`; `merkleProofLength`
 * gives the number of real siblings. The identity secrets are wiped on
 * destruction.
 */
struct WitnessInputs {
    WitnessInputs() = default;
    WitnessInputs(const WitnessInputs&) = default;
    WitnessInputs(WitnessInputs&&) = default;
    WitnessInputs& operator=(const WitnessInputs&) = default;
    WitnessInputs& operator=(WitnessInputs&&) = default;
    ~WitnessInputs();

    // Private
    FieldElement trapdoor;
    FieldElement identityNullifier;
    uint64_t merkleProofLength{0};
    uint64_t merkleProofIndex{0};
    std::vector<FieldElement> merkleProofSiblings;

    // Public
    FieldElement merkleTreeRoot;
    FieldElement nullifier;
    FieldElement signalHash;
    FieldElement scopeHash;
    uint16_t depth{0};

    /// [root, nullifier, signalHash, scopeHash, depth]; this order is fixed
    /// by the compiled circuits
    std::vector<FieldElement> PublicInputs() const;
};

/// Full signal assignment computed from the inputs
struct Witness {
    Witness() = default;
    Witness(const Witness&) = default;
    Witness(Witness&&) = default;
    Witness& operator=(const Witness&) = default;
    Witness& operator=(Witness&&) = default;
    ~Witness() { Wipe(); }

    std::vector<FieldElement> publicSignals;
    /// Includes the private signals
    std::vector<FieldElement> values;

    /// Zero the stored values, then empty the vector
    void Wipe();
};

/// Public input vector for a finished proof
std::vector<FieldElement> PublicInputsOf(const SemaphoreProof& proof);

// ============================================================================
// Backend Interface
// ============================================================================

/**
 * Interface for proving systems.
 *
 * Implementations must be safe to call concurrently from several threads;
 * artifacts are read-only.
 */
class IProvingBackend {
public:
    virtual ~IProvingBackend() = default;

    /// @throws ProvingError if the inputs violate the circuit constraints
    virtual Witness ComputeWitness(const CircuitArtifacts& circuit,
                                   const WitnessInputs& inputs) = 0;

    /// @throws ProvingError on failure
    virtual Groth16Points Prove(const CircuitArtifacts& circuit,
                                const Witness& witness) = 0;

    /// May throw on malformed keys or points; callers treat that as rejection
    virtual bool Verify(const CircuitArtifacts& circuit,
                        const std::vector<FieldElement>& publicInputs,
                        const Groth16Points& points) = 0;
};

} // namespace proof
} // namespace semaphore

#endif // SEMAPHORE_PROOF_BACKEND_H
