// SEMAPHORE - Circuit Artifacts Implementation
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License

#include "semaphore/proof/artifacts.h"

#include "semaphore/core/errors.h"
#include "semaphore/util/logging.h"

#include <string>

namespace semaphore {
namespace proof {

namespace {

std::string UnsupportedMessage(uint64_t depth) {
    return "The tree depth must be a number between " + std::to_string(MIN_TREE_DEPTH) +
           " and " + std::to_string(MAX_TREE_DEPTH) + " (got " + std::to_string(depth) + ")";
}

} // namespace

CircuitArtifacts CircuitArtifacts::ForDepth(const std::string& directory, uint16_t depth) {
    std::string prefix = directory;
    if (!prefix.empty() && prefix.back() != '/') {
        prefix += '/';
    }
    prefix += "semaphore-" + std::to_string(depth);

    CircuitArtifacts artifacts;
    artifacts.depth = depth;
    artifacts.wasmPath = prefix + ".wasm";
    artifacts.zkeyPath = prefix + ".zkey";
    artifacts.vkeyPath = prefix + ".vkey.json";
    return artifacts;
}

void ArtifactRegistry::Register(const CircuitArtifacts& artifacts) {
    if (!IsSupportedDepth(artifacts.depth)) {
        throw UnsupportedDepthError(UnsupportedMessage(artifacts.depth));
    }
    artifacts_[artifacts.depth] = artifacts;
}

std::shared_ptr<const ArtifactRegistry> ArtifactRegistry::FromDirectory(
    const std::string& directory, uint16_t minDepth, uint16_t maxDepth) {
    if (!IsSupportedDepth(minDepth) || !IsSupportedDepth(maxDepth) || minDepth > maxDepth) {
        throw UnsupportedDepthError("Invalid depth range " + std::to_string(minDepth) + ".." +
                                    std::to_string(maxDepth));
    }

    auto registry = std::make_shared<ArtifactRegistry>();
    for (uint32_t depth = minDepth; depth <= maxDepth; ++depth) {
        registry->Register(CircuitArtifacts::ForDepth(directory, static_cast<uint16_t>(depth)));
    }

    LOG_DEBUG(util::LogCategory::Proof) << "Registered artifacts for depths " << minDepth
                                        << ".." << maxDepth << " from " << directory;
    return registry;
}

const CircuitArtifacts& ArtifactRegistry::Get(uint64_t depth) const {
    if (!IsSupportedDepth(depth)) {
        throw UnsupportedDepthError(UnsupportedMessage(depth));
    }
    auto it = artifacts_.find(static_cast<uint16_t>(depth));
    if (it == artifacts_.end()) {
        throw UnsupportedDepthError("No circuit artifacts registered for depth " +
                                    std::to_string(depth));
    }
    return it->second;
}

bool ArtifactRegistry::Has(uint64_t depth) const {
    return IsSupportedDepth(depth) && artifacts_.count(static_cast<uint16_t>(depth)) > 0;
}

std::vector<uint16_t> ArtifactRegistry::Depths() const {
    std::vector<uint16_t> depths;
    depths.reserve(artifacts_.size());
    for (const auto& [depth, artifacts] : artifacts_) {
        depths.push_back(depth);
    }
    return depths;
}

} // namespace proof
} // namespace semaphore
