// SEMAPHORE - Native Development Backend
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License
//
// Evaluates the membership circuit in-process.
//
// WARNING: the proof points are Poseidon digests of the public inputs, not
// Groth16 proofs. They reveal nothing about the witness but anyone can
// compute them, so this backend offers no soundness. Use it for tests and
// local development only.

#ifndef SEMAPHORE_PROOF_NATIVE_BACKEND_H
#define SEMAPHORE_PROOF_NATIVE_BACKEND_H

#include "semaphore/proof/backend.h"

namespace semaphore {
namespace proof {

class NativeBackend : public IProvingBackend {
public:
    NativeBackend();
    ~NativeBackend() override;

    /**
     * Check every constraint of the membership statement:
     * - sibling list length equals the circuit depth
     * - merkleProofLength <= depth
     * - the path from Poseidon(trapdoor, nullifier) reaches the root
     * - nullifier == Poseidon(scopeHash, identityNullifier)
     *
     * @throws ProvingError naming the first violated constraint
     */
    Witness ComputeWitness(const CircuitArtifacts& circuit,
                           const WitnessInputs& inputs) override;

    Groth16Points Prove(const CircuitArtifacts& circuit,
                        const Witness& witness) override;

    bool Verify(const CircuitArtifacts& circuit,
                const std::vector<FieldElement>& publicInputs,
                const Groth16Points& points) override;

private:
    /// Points bound to the circuit depth and the public inputs
    static Groth16Points DerivePoints(const CircuitArtifacts& circuit,
                                      const std::vector<FieldElement>& publicInputs);
};

} // namespace proof
} // namespace semaphore

#endif // SEMAPHORE_PROOF_NATIVE_BACKEND_H
