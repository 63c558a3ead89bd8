/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading
 */

#include <bubblegrade/Config.hpp>
#include <bubblegrade/Errors.hpp>

#include <gtest/gtest.h>

#include <cstdlib>

using namespace bubblegrade;

TEST(ConfigTest, DefaultsWhenKeysAbsent) {
    AppConfig cfg = parseConfig("{}");
    EXPECT_DOUBLE_EQ(cfg.decoder.absoluteThreshold, 0.35);
    EXPECT_DOUBLE_EQ(cfg.decoder.relativeThreshold, 0.6);
    EXPECT_DOUBLE_EQ(cfg.decoder.minDarkness, 0.08);
    EXPECT_EQ(cfg.logLevel, "info");
    EXPECT_TRUE(cfg.debugDir.empty());
}

TEST(ConfigTest, ReadsAllKeys) {
    AppConfig cfg = parseConfig(R"({
        "absolute_threshold": 0.4,
        "relative_threshold": 0.5,
        "min_darkness": 0.1,
        "log_level": "debug",
        "debug_dir": "/tmp/overlays",
        "unrelated": true
    })");
    EXPECT_DOUBLE_EQ(cfg.decoder.absoluteThreshold, 0.4);
    EXPECT_DOUBLE_EQ(cfg.decoder.relativeThreshold, 0.5);
    EXPECT_DOUBLE_EQ(cfg.decoder.minDarkness, 0.1);
    EXPECT_EQ(cfg.logLevel, "debug");
    EXPECT_EQ(cfg.debugDir, "/tmp/overlays");
}

TEST(ConfigTest, RejectsBadValues) {
    EXPECT_THROW(parseConfig("[1]"), ConfigError);
    EXPECT_THROW(parseConfig("{oops"), ConfigError);
    EXPECT_THROW(parseConfig(R"({"absolute_threshold": "high"})"), ConfigError);
    EXPECT_THROW(parseConfig(R"({"min_darkness": -0.1})"), ConfigError);
    EXPECT_THROW(parseConfig(R"({"log_level": "loud"})"), ConfigError);
    EXPECT_THROW(loadConfig("/nonexistent/bubblegrade.json"), ConfigError);
}

TEST(ConfigTest, EnvironmentOverridesLogLevel) {
    AppConfig cfg;
    ::setenv("BUBBLEGRADE_LOG_LEVEL", "warn", 1);
    applyEnvironment(cfg);
    ::unsetenv("BUBBLEGRADE_LOG_LEVEL");
    EXPECT_EQ(cfg.logLevel, "warn");

    applyEnvironment(cfg);
    EXPECT_EQ(cfg.logLevel, "warn");
}

TEST(ConfigTest, ParsesLogLevels) {
    EXPECT_EQ(parseLogLevel("debug"), spdlog::level::debug);
    EXPECT_EQ(parseLogLevel("off"), spdlog::level::off);
    EXPECT_THROW(parseLogLevel("verbose"), ConfigError);
}
