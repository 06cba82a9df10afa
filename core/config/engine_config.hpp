#pragma once

#include "logging/logger.hpp"
#include "pipeline/optimizer.hpp"
#include "registry/morph_registry.hpp"
#include <string>

namespace morpheus {

// ─── Engine Config ────────────────────────────────────────────
// Process-level settings. Defaults are usable as is.

struct EngineConfig {
    LogLevel log_level = LogLevel::Warning;
    std::string log_file;  // empty: stderr only
    DuplicatePolicy duplicate_policy = DuplicatePolicy::Reject;
    OptimizerOptions optimizer;
};

/// Defaults overridden by MORPHEUS_LOG_LEVEL, MORPHEUS_LOG_FILE,
/// MORPHEUS_DUPLICATE_POLICY, MORPHEUS_OPTIMIZER_FUSE and
/// MORPHEUS_OPTIMIZER_STRIP_IDENTITY. Throws ConfigError on bad values.
EngineConfig loadConfigFromEnv();

/// Configure the logger, the global registry and the default optimizer options.
void applyConfig(const EngineConfig& config);

/// "trace", "debug", "info", "warning"/"warn", "error", "critical", "off";
/// case-insensitive. Throws ConfigError otherwise.
LogLevel parseLogLevel(const std::string& text);

/// "reject" or "overwrite", case-insensitive. Throws ConfigError otherwise.
DuplicatePolicy parseDuplicatePolicy(const std::string& text);

/// "1"/"true"/"on"/"yes" or "0"/"false"/"off"/"no". Throws ConfigError otherwise.
bool parseFlag(const std::string& text, const std::string& key);

} // namespace morpheus
