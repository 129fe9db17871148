// SEMAPHORE - Prover Configuration Implementation
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License

#include "semaphore/proof/prover_config.h"

#include "semaphore/core/errors.h"

#include <string>

namespace semaphore {
namespace proof {

namespace {

uint16_t ReadDepth(const util::ConfigManager& config, const std::string& key,
                   uint16_t defaultValue) {
    if (!config.HasKey(key, "prover")) {
        return defaultValue;
    }
    auto value = config.TryGetInt(key, "prover");
    if (!value || *value < 0 || !IsSupportedDepth(static_cast<uint64_t>(*value))) {
        throw ConfigError("[prover] " + key + " must be an integer between " +
                          std::to_string(MIN_TREE_DEPTH) + " and " +
                          std::to_string(MAX_TREE_DEPTH));
    }
    return static_cast<uint16_t>(*value);
}

util::LogLevel ReadLevel(const util::ConfigManager& config, const std::string& key) {
    std::string name = config.GetString(key, "", "log");
    auto level = util::ParseLogLevel(name);
    if (!level) {
        throw ConfigError("[log] " + key + " has unknown level '" + name + "'");
    }
    return *level;
}

} // namespace

ProverConfig ProverConfig::Load(const util::ConfigManager& config) {
    ProverConfig result;
    result.artifactsDir = config.GetPath("artifactsdir", DEFAULT_ARTIFACTS_DIR, "prover");
    result.minDepth = ReadDepth(config, "mindepth", MIN_TREE_DEPTH);
    result.maxDepth = ReadDepth(config, "maxdepth", MAX_TREE_DEPTH);
    if (result.minDepth > result.maxDepth) {
        throw ConfigError("[prover] mindepth must not exceed maxdepth");
    }

    for (const auto& key : config.GetKeys("log")) {
        if (key == "level") {
            result.logLevel = ReadLevel(config, key);
        } else if (key == "console") {
            auto enabled = config.TryGetBool(key, "log");
            if (!enabled) {
                throw ConfigError("[log] console must be a boolean");
            }
            result.logToStderr = *enabled;
        } else if (auto category = util::ParseLogCategory(key)) {
            result.categoryLevels[*category] = ReadLevel(config, key);
        } else {
            throw ConfigError("[log] " + key + " is not a log category");
        }
    }

    LOG_DEBUG(util::LogCategory::Config) << "Prover artifacts at " << result.artifactsDir
                                         << ", depths " << result.minDepth << ".."
                                         << result.maxDepth;
    return result;
}

ProverConfig ProverConfig::LoadFile(const std::string& path) {
    util::ConfigManager config;
    util::ConfigParseResult parsed = config.ParseFile(path);
    if (!parsed.success) {
        std::string where = parsed.errorFile.empty() ? path : parsed.errorFile;
        if (parsed.errorLine > 0) {
            where += ":" + std::to_string(parsed.errorLine);
        }
        throw ConfigError(where + ": " + parsed.errorMessage);
    }
    return Load(config);
}

std::shared_ptr<const ArtifactRegistry> ProverConfig::BuildRegistry() const {
    return ArtifactRegistry::FromDirectory(artifactsDir, minDepth, maxDepth);
}

void ProverConfig::ApplyLogging() const {
    util::Logger& logger = util::Logger::Instance();
    logger.SetLevel(logLevel);
    logger.ClearCategoryLevels();
    for (const auto& entry : categoryLevels) {
        logger.SetLevel(entry.first, entry.second);
    }
    logger.SetStderrOutput(logToStderr);
}

} // namespace proof
} // namespace semaphore
