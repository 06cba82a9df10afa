#include "config/engine_config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace morpheus {

namespace {

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

const char* envValue(const char* key) {
    const char* value = std::getenv(key);
    return (value && *value) ? value : nullptr;
}

} // namespace

LogLevel parseLogLevel(const std::string& text) {
    std::string value = lower(text);
    if (value == "trace") return LogLevel::Trace;
    if (value == "debug") return LogLevel::Debug;
    if (value == "info") return LogLevel::Info;
    if (value == "warning" || value == "warn") return LogLevel::Warning;
    if (value == "error") return LogLevel::Error;
    if (value == "critical") return LogLevel::Critical;
    if (value == "off") return LogLevel::Off;
    throw ConfigError("Unknown log level: " + text);
}

DuplicatePolicy parseDuplicatePolicy(const std::string& text) {
    std::string value = lower(text);
    if (value == "reject") return DuplicatePolicy::Reject;
    if (value == "overwrite") return DuplicatePolicy::Overwrite;
    throw ConfigError("Unknown duplicate policy: " + text);
}

bool parseFlag(const std::string& text, const std::string& key) {
    std::string value = lower(text);
    if (value == "1" || value == "true" || value == "on" || value == "yes") return true;
    if (value == "0" || value == "false" || value == "off" || value == "no") return false;
    throw ConfigError("Invalid boolean for " + key + ": " + text);
}

EngineConfig loadConfigFromEnv() {
    EngineConfig config;

    if (const char* v = envValue("MORPHEUS_LOG_LEVEL")) {
        config.log_level = parseLogLevel(v);
    }
    if (const char* v = envValue("MORPHEUS_LOG_FILE")) {
        config.log_file = v;
    }
    if (const char* v = envValue("MORPHEUS_DUPLICATE_POLICY")) {
        config.duplicate_policy = parseDuplicatePolicy(v);
    }
    if (const char* v = envValue("MORPHEUS_OPTIMIZER_FUSE")) {
        config.optimizer.fuse = parseFlag(v, "MORPHEUS_OPTIMIZER_FUSE");
    }
    if (const char* v = envValue("MORPHEUS_OPTIMIZER_STRIP_IDENTITY")) {
        config.optimizer.strip_identity = parseFlag(v, "MORPHEUS_OPTIMIZER_STRIP_IDENTITY");
    }
    return config;
}

void applyConfig(const EngineConfig& config) {
    Logger& logger = Logger::instance();
    logger.setLevel(config.log_level);
    if (!config.log_file.empty()) {
        logger.setOutputFile(config.log_file);
    }
    globalRegistry()->setDuplicatePolicy(config.duplicate_policy);
    setDefaultOptimizerOptions(config.optimizer);
    MORPHEUS_LOG_INFO(std::string("Engine configured: duplicate policy ") +
                      duplicatePolicyName(config.duplicate_policy));
}

} // namespace morpheus
