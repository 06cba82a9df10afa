#include <gtest/gtest.h>
#include "config/engine_config.hpp"
#include <cstdlib>
#include <string>
#include <vector>

using namespace morpheus;

namespace {

const char* kConfigKeys[] = {
    "MORPHEUS_LOG_LEVEL",
    "MORPHEUS_LOG_FILE",
    "MORPHEUS_DUPLICATE_POLICY",
    "MORPHEUS_OPTIMIZER_FUSE",
    "MORPHEUS_OPTIMIZER_STRIP_IDENTITY",
};

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clearEnv(); }

    void TearDown() override {
        clearEnv();
        Logger::instance().setLevel(LogLevel::Warning);
        globalRegistry()->setDuplicatePolicy(DuplicatePolicy::Reject);
        setDefaultOptimizerOptions(OptimizerOptions{});
    }

    static void clearEnv() {
        for (const char* key : kConfigKeys) unsetenv(key);
    }
};

} // namespace

// ─── Parsers ──────────────────────────────────────────────────

TEST_F(ConfigTest, ParseLogLevel) {
    EXPECT_EQ(parseLogLevel("trace"), LogLevel::Trace);
    EXPECT_EQ(parseLogLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("Info"), LogLevel::Info);
    EXPECT_EQ(parseLogLevel("warn"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("error"), LogLevel::Error);
    EXPECT_EQ(parseLogLevel("critical"), LogLevel::Critical);
    EXPECT_EQ(parseLogLevel("off"), LogLevel::Off);
    EXPECT_THROW(parseLogLevel("verbose"), ConfigError);
}

TEST_F(ConfigTest, ParseDuplicatePolicy) {
    EXPECT_EQ(parseDuplicatePolicy("reject"), DuplicatePolicy::Reject);
    EXPECT_EQ(parseDuplicatePolicy("Overwrite"), DuplicatePolicy::Overwrite);
    EXPECT_THROW(parseDuplicatePolicy("merge"), ConfigError);
}

TEST_F(ConfigTest, ParseFlag) {
    for (const char* yes : {"1", "true", "ON", "yes"}) {
        EXPECT_TRUE(parseFlag(yes, "k")) << yes;
    }
    for (const char* no : {"0", "False", "off", "no"}) {
        EXPECT_FALSE(parseFlag(no, "k")) << no;
    }
    try {
        parseFlag("maybe", "MORPHEUS_OPTIMIZER_FUSE");
        FAIL() << "parseFlag should throw";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("MORPHEUS_OPTIMIZER_FUSE"), std::string::npos);
    }
}

// ─── Environment ──────────────────────────────────────────────

TEST_F(ConfigTest, DefaultsWithoutEnvironment) {
    EngineConfig config = loadConfigFromEnv();
    EXPECT_EQ(config.log_level, LogLevel::Warning);
    EXPECT_TRUE(config.log_file.empty());
    EXPECT_EQ(config.duplicate_policy, DuplicatePolicy::Reject);
    EXPECT_TRUE(config.optimizer.fuse);
    EXPECT_TRUE(config.optimizer.strip_identity);
}

TEST_F(ConfigTest, EnvironmentOverridesDefaults) {
    setenv("MORPHEUS_LOG_LEVEL", "debug", 1);
    setenv("MORPHEUS_DUPLICATE_POLICY", "overwrite", 1);
    setenv("MORPHEUS_OPTIMIZER_FUSE", "0", 1);
    setenv("MORPHEUS_OPTIMIZER_STRIP_IDENTITY", "no", 1);

    EngineConfig config = loadConfigFromEnv();
    EXPECT_EQ(config.log_level, LogLevel::Debug);
    EXPECT_EQ(config.duplicate_policy, DuplicatePolicy::Overwrite);
    EXPECT_FALSE(config.optimizer.fuse);
    EXPECT_FALSE(config.optimizer.strip_identity);
}

TEST_F(ConfigTest, EmptyValuesAreIgnored) {
    setenv("MORPHEUS_LOG_LEVEL", "", 1);
    setenv("MORPHEUS_OPTIMIZER_FUSE", "", 1);
    EngineConfig config = loadConfigFromEnv();
    EXPECT_EQ(config.log_level, LogLevel::Warning);
    EXPECT_TRUE(config.optimizer.fuse);
}

TEST_F(ConfigTest, BadEnvironmentValueThrows) {
    setenv("MORPHEUS_DUPLICATE_POLICY", "sometimes", 1);
    EXPECT_THROW(loadConfigFromEnv(), ConfigError);
}

// ─── Apply ────────────────────────────────────────────────────

TEST_F(ConfigTest, ApplyConfiguresLoggerAndGlobalRegistry) {
    EngineConfig config;
    config.log_level = LogLevel::Error;
    config.duplicate_policy = DuplicatePolicy::Overwrite;
    applyConfig(config);

    EXPECT_EQ(Logger::instance().level(), LogLevel::Error);
    EXPECT_FALSE(Logger::instance().shouldLog(LogLevel::Warning));
    EXPECT_TRUE(Logger::instance().shouldLog(LogLevel::Error));
    EXPECT_EQ(globalRegistry()->duplicatePolicy(), DuplicatePolicy::Overwrite);
}

TEST_F(ConfigTest, OptimizerHonorsConfiguredOptions) {
    setenv("MORPHEUS_OPTIMIZER_FUSE", "off", 1);
    EngineConfig config = loadConfigFromEnv();

    auto a = makeMorph<int, int>("a", [](int x) { return x + 1; });
    auto b = makeMorph<int, int>("b", [](int x) { return x * 2; });
    auto pipeline = MorphPipeline::fromSteps({a, b});
    auto optimized = PipelineOptimizer(config.optimizer).optimize(pipeline);
    EXPECT_EQ(optimized.getMorphs().size(), 2u);
}

TEST_F(ConfigTest, AppliedOptimizerOptionsReachFreeFunctions) {
    setenv("MORPHEUS_OPTIMIZER_FUSE", "false", 1);
    setenv("MORPHEUS_OPTIMIZER_STRIP_IDENTITY", "0", 1);
    applyConfig(loadConfigFromEnv());

    EXPECT_FALSE(defaultOptimizerOptions().fuse);
    EXPECT_FALSE(defaultOptimizerOptions().strip_identity);

    auto a = makeMorph<int, int>("a", [](int x) { return x + 1; });
    auto b = makeMorph<int, int>("b", [](int x) { return x * 2; });
    auto optimized = optimizePipeline(MorphPipeline::identity().then(a).then(b));
    EXPECT_EQ(optimized.stepNames(), (std::vector<std::string>{"IdentityMorph", "a", "b"}));
    EXPECT_EQ(createOptimizedPipeline({a, b}).getMorphs().size(), 3u);

    applyConfig(EngineConfig{});
    EXPECT_EQ(optimizePipeline(MorphPipeline::identity().then(a).then(b)).stepNames(),
              (std::vector<std::string>{"a ⊕ b"}));
}
