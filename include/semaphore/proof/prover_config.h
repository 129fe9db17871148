// SEMAPHORE - Prover Configuration
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License
//
// Settings read from an INI file:
//
//   [prover]
//   artifactsdir = ~/.semaphore/artifacts
//   mindepth = 1
//   maxdepth = 32
//
//   [log]
//   level = info
//   proof = debug
//   console = true
//
// Keys in [log] other than level and console name a category whose
// threshold overrides the global one.

#ifndef SEMAPHORE_PROOF_PROVER_CONFIG_H
#define SEMAPHORE_PROOF_PROVER_CONFIG_H

#include "semaphore/proof/artifacts.h"
#include "semaphore/proof/proof.h"
#include "semaphore/util/config.h"
#include "semaphore/util/logging.h"

#include <cstdint>
#include <map>
#include <memory>
#include <string>

namespace semaphore {
namespace proof {

/// Default artifact location
constexpr const char* DEFAULT_ARTIFACTS_DIR = "~/.semaphore/artifacts";

struct ProverConfig {
    std::string artifactsDir;
    uint16_t minDepth{MIN_TREE_DEPTH};
    uint16_t maxDepth{MAX_TREE_DEPTH};
    util::LogLevel logLevel{util::LogLevel::Info};
    std::map<util::LogCategory, util::LogLevel> categoryLevels;
    bool logToStderr{false};

    /**
     * Read settings from a parsed configuration.
     *
     * @throws ConfigError if a depth is not an integer, the depth range is
     *         empty or outside [MIN_TREE_DEPTH, MAX_TREE_DEPTH], or a [log]
     *         key names an unknown level or category
     */
    static ProverConfig Load(const util::ConfigManager& config);

    /// Parse the file, then Load. Throws ConfigError on parse errors.
    static ProverConfig LoadFile(const std::string& path);

    /// Registry for [minDepth, maxDepth] rooted at artifactsDir
    std::shared_ptr<const ArtifactRegistry> BuildRegistry() const;

    /// Apply the levels and stderr switch to the global logger
    void ApplyLogging() const;
};

} // namespace proof
} // namespace semaphore

#endif // SEMAPHORE_PROOF_PROVER_CONFIG_H
