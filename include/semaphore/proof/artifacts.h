// SEMAPHORE - Circuit Artifacts
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License
//
// Each supported tree depth has its own compiled circuit. The registry is
// the closed table of those artifacts, built once and then shared
// read-only by every prover and verifier.

#ifndef SEMAPHORE_PROOF_ARTIFACTS_H
#define SEMAPHORE_PROOF_ARTIFACTS_H

#include "semaphore/proof/proof.h"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace semaphore {
namespace proof {

/// Files produced by the circuit build for one depth
struct CircuitArtifacts {
    uint16_t depth{0};

    /// Witness generator (semaphore-<d>.wasm)
    std::string wasmPath;

    /// Proving key (semaphore-<d>.zkey)
    std::string zkeyPath;

    /// Verification key (semaphore-<d>.vkey.json)
    std::string vkeyPath;

    /// Artifacts named after the depth, inside `directory`
    static CircuitArtifacts ForDepth(const std::string& directory, uint16_t depth);
};

class ArtifactRegistry {
public:
    ArtifactRegistry() = default;

    /**
     * Add or replace the artifacts for a depth.
     *
     * @throws UnsupportedDepthError if the depth is outside
     *         [MIN_TREE_DEPTH, MAX_TREE_DEPTH]
     */
    void Register(const CircuitArtifacts& artifacts);

    /**
     * Registry covering every depth in [minDepth, maxDepth], with file names
     * derived from the depth. Files are not required to exist; a backend
     * reports missing files when it opens them.
     *
     * @throws UnsupportedDepthError for a range outside the supported one
     */
    static std::shared_ptr<const ArtifactRegistry> FromDirectory(
        const std::string& directory,
        uint16_t minDepth = MIN_TREE_DEPTH,
        uint16_t maxDepth = MAX_TREE_DEPTH);

    /// @throws UnsupportedDepthError if nothing is registered for the depth
    const CircuitArtifacts& Get(uint64_t depth) const;

    bool Has(uint64_t depth) const;

    std::vector<uint16_t> Depths() const;

    size_t Size() const { return artifacts_.size(); }

private:
    std::map<uint16_t, CircuitArtifacts> artifacts_;
};

} // namespace proof
} // namespace semaphore

#endif // SEMAPHORE_PROOF_ARTIFACTS_H
