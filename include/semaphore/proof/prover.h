// SEMAPHORE - Proof Generation and Verification
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License
//
// Turns an identity, a membership path, a message and a scope into a
// SemaphoreProof, and checks such proofs. A Prover holds no mutable state;
// one instance can serve concurrent callers.

#ifndef SEMAPHORE_PROOF_PROVER_H
#define SEMAPHORE_PROOF_PROVER_H

#include "semaphore/core/types.h"
#include "semaphore/group/group.h"
#include "semaphore/group/lean_imt.h"
#include "semaphore/identity/identity.h"
#include "semaphore/proof/artifacts.h"
#include "semaphore/proof/backend.h"
#include "semaphore/proof/proof.h"

#include <memory>
#include <vector>

namespace semaphore {

namespace util {
class ThreadPool;
}

namespace proof {

/// Poseidon(scopeHash, identity nullifier)
FieldElement ComputeNullifier(const identity::Identity& identity, const Uint256& scope);

class Prover {
public:
    Prover(std::shared_ptr<IProvingBackend> backend,
           std::shared_ptr<const ArtifactRegistry> artifacts);

    /**
     * Prove membership of `identity` in `group`.
     *
     * @throws MemberNotFoundError if the commitment is not in the group
     * @throws UnsupportedDepthError if no circuit exists for `depth`
     * @throws ProvingError if the backend rejects the inputs, or the
     *         membership path is longer than `depth`
     */
    SemaphoreProof GenerateProof(const identity::Identity& identity,
                                 const group::Group& group,
                                 const Bytes& message,
                                 const Bytes& scope,
                                 uint16_t depth) const;

    /// Same as above, with a path produced elsewhere; the path is used as-is
    SemaphoreProof GenerateProof(const identity::Identity& identity,
                                 const group::MerkleProof& merkleProof,
                                 const Bytes& message,
                                 const Bytes& scope,
                                 uint16_t depth) const;

    /// Depth defaults to the group depth, at least MIN_TREE_DEPTH
    SemaphoreProof GenerateProof(const identity::Identity& identity,
                                 const group::Group& group,
                                 const Bytes& message,
                                 const Bytes& scope) const;

    /**
     * Check a proof against its own public signals.
     *
     * Never throws: unsupported depths, malformed points and backend errors
     * all yield false.
     */
    bool VerifyProof(const SemaphoreProof& proof) const;

    /// Additionally require the proof to be for `expectedRoot`
    bool VerifyProof(const SemaphoreProof& proof, const FieldElement& expectedRoot) const;

    /// Results in input order
    std::vector<bool> VerifyProofs(const std::vector<SemaphoreProof>& proofs) const;

    /// Verifies on the pool's workers; results in input order
    std::vector<bool> VerifyProofs(const std::vector<SemaphoreProof>& proofs,
                                   util::ThreadPool& pool) const;

    const ArtifactRegistry& Artifacts() const { return *artifacts_; }

private:
    std::shared_ptr<IProvingBackend> backend_;
    std::shared_ptr<const ArtifactRegistry> artifacts_;
};

} // namespace proof
} // namespace semaphore

#endif // SEMAPHORE_PROOF_PROVER_H
