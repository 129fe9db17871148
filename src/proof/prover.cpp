// SEMAPHORE - Proof Generation and Verification Implementation
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License

#include "semaphore/proof/prover.h"

#include "semaphore/core/errors.h"
#include "semaphore/crypto/poseidon.h"
#include "semaphore/proof/signal.h"
#include "semaphore/util/logging.h"
#include "semaphore/util/threadpool.h"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace semaphore {
namespace proof {

FieldElement ComputeNullifier(const identity::Identity& identity, const Uint256& scope) {
    return Poseidon::Hash2(HashSignal(scope), identity.Nullifier());
}

Prover::Prover(std::shared_ptr<IProvingBackend> backend,
               std::shared_ptr<const ArtifactRegistry> artifacts)
    : backend_(std::move(backend)), artifacts_(std::move(artifacts)) {
    if (!backend_ || !artifacts_) {
        throw std::invalid_argument("Prover requires a backend and an artifact registry");
    }
}

// ============================================================================
// Generation
// ============================================================================

SemaphoreProof Prover::GenerateProof(const identity::Identity& identity,
                                     const group::Group& group,
                                     const Bytes& message,
                                     const Bytes& scope,
                                     uint16_t depth) const {
    auto index = group.IndexOf(identity.Commitment());
    if (!index) {
        throw MemberNotFoundError("The identity is not a member of the group");
    }
    return GenerateProof(identity, group.GenerateMerkleProof(*index), message, scope, depth);
}

SemaphoreProof Prover::GenerateProof(const identity::Identity& identity,
                                     const group::Group& group,
                                     const Bytes& message,
                                     const Bytes& scope) const {
    uint16_t depth = static_cast<uint16_t>(std::max<size_t>(group.Depth(), MIN_TREE_DEPTH));
    return GenerateProof(identity, group, message, scope, depth);
}

SemaphoreProof Prover::GenerateProof(const identity::Identity& identity,
                                     const group::MerkleProof& merkleProof,
                                     const Bytes& message,
                                     const Bytes& scope,
                                     uint16_t depth) const {
    const CircuitArtifacts& circuit = artifacts_->Get(depth);

    if (merkleProof.siblings.size() > depth) {
        throw ProvingError("Membership path has " + std::to_string(merkleProof.siblings.size()) +
                           " siblings, more than the tree depth " + std::to_string(depth));
    }

    util::ScopedLogTimer timer(util::LogCategory::Proof,
                               "Proof generation (depth " + std::to_string(depth) + ")");

    SemaphoreProof proof;
    proof.merkleTreeDepth = depth;
    proof.merkleTreeRoot = merkleProof.root;
    proof.message = EncodeSignal(message);
    proof.scope = EncodeSignal(scope);
    proof.nullifier = ComputeNullifier(identity, proof.scope);

    WitnessInputs inputs;
    inputs.trapdoor = identity.Trapdoor();
    inputs.identityNullifier = identity.Nullifier();
    inputs.merkleProofLength = merkleProof.siblings.size();
    inputs.merkleProofIndex = merkleProof.index;
    inputs.merkleProofSiblings = merkleProof.siblings;
    inputs.merkleProofSiblings.resize(depth, FieldElement::Zero());
    inputs.merkleTreeRoot = proof.merkleTreeRoot;
    inputs.nullifier = proof.nullifier;
    inputs.signalHash = HashSignal(proof.message);
    inputs.scopeHash = HashSignal(proof.scope);
    inputs.depth = depth;

    Witness witness = backend_->ComputeWitness(circuit, inputs);
    proof.points = backend_->Prove(circuit, witness);

    LOG_DEBUG(util::LogCategory::Proof) << "Generated " << proof.ToString();
    return proof;
}

// ============================================================================
// Verification
// ============================================================================

bool Prover::VerifyProof(const SemaphoreProof& proof) const {
    if (!artifacts_->Has(proof.merkleTreeDepth)) {
        LOG_DEBUG(util::LogCategory::Proof) << "Rejecting proof with unsupported depth "
                                            << proof.merkleTreeDepth;
        return false;
    }

    try {
        const CircuitArtifacts& circuit = artifacts_->Get(proof.merkleTreeDepth);
        return backend_->Verify(circuit, PublicInputsOf(proof), proof.points);
    } catch (const std::exception& e) {
        LOG_DEBUG(util::LogCategory::Proof) << "Proof verification failed: " << e.what();
        return false;
    }
}

bool Prover::VerifyProof(const SemaphoreProof& proof, const FieldElement& expectedRoot) const {
    return proof.merkleTreeRoot == expectedRoot && VerifyProof(proof);
}

std::vector<bool> Prover::VerifyProofs(const std::vector<SemaphoreProof>& proofs) const {
    std::vector<bool> results;
    results.reserve(proofs.size());
    for (const auto& proof : proofs) {
        results.push_back(VerifyProof(proof));
    }
    return results;
}

std::vector<bool> Prover::VerifyProofs(const std::vector<SemaphoreProof>& proofs,
                                       util::ThreadPool& pool) const {
    util::ScopedLogTimer timer(util::LogCategory::Proof,
                               "Batch verification of " + std::to_string(proofs.size()) + " proofs");

    return util::ParallelMap(pool, proofs, [this](const SemaphoreProof& proof) {
        return VerifyProof(proof);
    });
}

} // namespace proof
} // namespace semaphore
