// SEMAPHORE - Native Development Backend Implementation
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License

#include "semaphore/proof/native_backend.h"

#include "semaphore/core/errors.h"
#include "semaphore/crypto/poseidon.h"
#include "semaphore/crypto/sha256.h"
#include "semaphore/util/logging.h"

#include <cstring>
#include <string>

namespace semaphore {
namespace proof {

namespace {

constexpr size_t NUM_PUBLIC_INPUTS = 5;

const FieldElement& CircuitTag() {
    static const FieldElement tag = [] {
        const char* domain = "semaphore_native_groth16";
        Hash256 digest = SHA256Hash(reinterpret_cast<const Byte*>(domain), std::strlen(domain));
        return FieldElement::FromBytes(digest.data(), digest.size());
    }();
    return tag;
}

} // namespace

NativeBackend::NativeBackend() = default;

NativeBackend::~NativeBackend() = default;

// ============================================================================
// Witness
// ============================================================================

Witness NativeBackend::ComputeWitness(const CircuitArtifacts& circuit,
                                      const WitnessInputs& inputs) {
    if (inputs.depth != circuit.depth) {
        throw ProvingError("Inputs are for depth " + std::to_string(inputs.depth) +
                           " but the circuit has depth " + std::to_string(circuit.depth));
    }
    if (inputs.merkleProofSiblings.size() != circuit.depth) {
        throw ProvingError("Circuit of depth " + std::to_string(circuit.depth) + " expects " +
                           std::to_string(circuit.depth) + " siblings, got " +
                           std::to_string(inputs.merkleProofSiblings.size()));
    }
    if (inputs.merkleProofLength > circuit.depth) {
        throw ProvingError("Merkle proof length " + std::to_string(inputs.merkleProofLength) +
                           " exceeds the circuit depth");
    }

    // Membership: replay the lean path from the identity commitment
    FieldElement node = Poseidon::Hash2(inputs.trapdoor, inputs.identityNullifier);
    for (size_t i = 0; i < inputs.merkleProofLength; ++i) {
        const FieldElement& sibling = inputs.merkleProofSiblings[i];
        if ((inputs.merkleProofIndex >> i) & 1) {
            node = Poseidon::Hash2(sibling, node);
        } else {
            node = Poseidon::Hash2(node, sibling);
        }
    }
    if (node != inputs.merkleTreeRoot) {
        throw ProvingError("Merkle path does not lead to the tree root");
    }

    if (Poseidon::Hash2(inputs.scopeHash, inputs.identityNullifier) != inputs.nullifier) {
        throw ProvingError("Nullifier does not match the identity and scope");
    }

    Witness witness;
    witness.publicSignals = inputs.PublicInputs();

    witness.values.reserve(1 + NUM_PUBLIC_INPUTS + 4 + circuit.depth);
    witness.values.push_back(FieldElement::One());
    witness.values.insert(witness.values.end(),
                          witness.publicSignals.begin(), witness.publicSignals.end());
    witness.values.push_back(inputs.trapdoor);
    witness.values.push_back(inputs.identityNullifier);
    witness.values.push_back(FieldElement(inputs.merkleProofLength));
    witness.values.push_back(FieldElement(inputs.merkleProofIndex));
    witness.values.insert(witness.values.end(),
                          inputs.merkleProofSiblings.begin(), inputs.merkleProofSiblings.end());

    LOG_TRACE(util::LogCategory::Proof) << "Computed witness with " << witness.values.size()
                                        << " signals";
    return witness;
}

// ============================================================================
// Prove / Verify
// ============================================================================

Groth16Points NativeBackend::DerivePoints(const CircuitArtifacts& circuit,
                                          const std::vector<FieldElement>& publicInputs) {
    Groth16Points points;
    PackedGroth16Proof packed;
    for (size_t k = 0; k < packed.size(); ++k) {
        std::vector<FieldElement> preimage;
        preimage.reserve(3 + publicInputs.size());
        preimage.push_back(CircuitTag());
        preimage.push_back(FieldElement(static_cast<uint64_t>(circuit.depth)));
        preimage.push_back(FieldElement(static_cast<uint64_t>(k)));
        preimage.insert(preimage.end(), publicInputs.begin(), publicInputs.end());
        packed[k] = Poseidon::Hash(preimage).ToUint256();
    }
    return Groth16Points::Unpack(packed);
}

Groth16Points NativeBackend::Prove(const CircuitArtifacts& circuit, const Witness& witness) {
    if (witness.publicSignals.size() != NUM_PUBLIC_INPUTS) {
        throw ProvingError("Witness has " + std::to_string(witness.publicSignals.size()) +
                           " public signals, expected " + std::to_string(NUM_PUBLIC_INPUTS));
    }
    if (witness.publicSignals.back() != FieldElement(static_cast<uint64_t>(circuit.depth))) {
        throw ProvingError("Witness was computed for a different circuit depth");
    }
    return DerivePoints(circuit, witness.publicSignals);
}

bool NativeBackend::Verify(const CircuitArtifacts& circuit,
                           const std::vector<FieldElement>& publicInputs,
                           const Groth16Points& points) {
    if (publicInputs.size() != NUM_PUBLIC_INPUTS) {
        return false;
    }
    if (publicInputs.back() != FieldElement(static_cast<uint64_t>(circuit.depth))) {
        return false;
    }
    return DerivePoints(circuit, publicInputs) == points;
}

} // namespace proof
} // namespace semaphore
