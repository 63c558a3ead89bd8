/**
 * @file test_command_line.cpp
 * @brief Unit tests for argument parsing and config precedence
 */

#include <bubblegrade/CommandLine.hpp>
#include <bubblegrade/Errors.hpp>

#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>
#include <sstream>

using namespace bubblegrade;

namespace {

std::string writeConfigFile(const std::string& name, const std::string& content) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream out(path);
    out << content;
    return path;
}

} // anonymous namespace

// =============================================================================
// Argument parsing
// =============================================================================

TEST(CommandLineTest, ParsesGradeInvocation) {
    CliOptions opt = parseArgs({"grade", "--layout", "l.json", "--key", "k.json", "--scan", "s.tif",
                                "--out", "g.csv", "--threshold", "0.4", "--log-level", "debug"});
    EXPECT_EQ(opt.command, "grade");
    EXPECT_EQ(opt.layoutPath, "l.json");
    EXPECT_EQ(opt.keyPath, "k.json");
    EXPECT_EQ(opt.scanPath, "s.tif");
    EXPECT_EQ(opt.outPath, "g.csv");
    ASSERT_TRUE(opt.threshold.has_value());
    EXPECT_DOUBLE_EQ(*opt.threshold, 0.4);
    EXPECT_FALSE(opt.minDarkness.has_value());
    EXPECT_EQ(opt.logLevel, std::optional<std::string>("debug"));
}

TEST(CommandLineTest, CollectsPositionalImages) {
    CliOptions opt = parseArgs({"scan", "a.png", "--layout", "l.json", "b.png"});
    EXPECT_EQ(opt.inputs, (std::vector<std::string>{"a.png", "b.png"}));
    EXPECT_EQ(opt.outPath, "gradebook.csv");
}

TEST(CommandLineTest, RejectsBadArguments) {
    EXPECT_THROW(parseArgs({}), UsageError);
    EXPECT_THROW(parseArgs({"scan", "a.png"}), UsageError);
    EXPECT_THROW(parseArgs({"scan", "--layout"}), UsageError);
    EXPECT_THROW(parseArgs({"scan", "--layout", "l.json", "--bogus"}), UsageError);
    EXPECT_THROW(parseArgs({"scan", "--layout", "l.json", "--threshold", "high"}), UsageError);
    EXPECT_THROW(parseArgs({"scan", "--layout", "l.json", "--threshold", "0.4x"}), UsageError);
}

TEST(CommandLineTest, UsageReturnsExitCodeTwo) {
    std::ostringstream os;
    EXPECT_EQ(printUsage(os), 2);
    EXPECT_NE(os.str().find("bubblegrade grade"), std::string::npos);
}

// =============================================================================
// Config precedence
// =============================================================================

TEST(CommandLineTest, FlagsOverrideEnvironmentOverrideFile) {
    std::string path = writeConfigFile("bubblegrade_cli.json", R"({
        "absolute_threshold": 0.4,
        "min_darkness": 0.1,
        "log_level": "error",
        "debug_dir": "/tmp/from-file"
    })");

    CliOptions opt = parseArgs({"scan", "--layout", "l.json", "--config", path,
                                "--threshold", "0.5", "--debug-dir", "/tmp/from-flag"});

    ::setenv("BUBBLEGRADE_LOG_LEVEL", "warn", 1);
    AppConfig cfg = resolveConfig(opt);
    EXPECT_EQ(cfg.logLevel, "warn");

    opt.logLevel = "debug";
    AppConfig flagged = resolveConfig(opt);
    ::unsetenv("BUBBLEGRADE_LOG_LEVEL");

    EXPECT_DOUBLE_EQ(cfg.decoder.absoluteThreshold, 0.5);
    EXPECT_DOUBLE_EQ(cfg.decoder.minDarkness, 0.1);
    EXPECT_DOUBLE_EQ(cfg.decoder.relativeThreshold, 0.6);
    EXPECT_EQ(cfg.debugDir, "/tmp/from-flag");
    EXPECT_EQ(flagged.logLevel, "debug");
}

TEST(CommandLineTest, DefaultsWithoutConfigFile) {
    AppConfig cfg = resolveConfig(parseArgs({"scan", "--layout", "l.json"}));
    EXPECT_DOUBLE_EQ(cfg.decoder.absoluteThreshold, 0.35);
    EXPECT_TRUE(cfg.debugDir.empty());
}

TEST(CommandLineTest, OutOfRangeFlagIsConfigError) {
    CliOptions opt = parseArgs({"scan", "--layout", "l.json", "--min-darkness", "1.5"});
    EXPECT_THROW(resolveConfig(opt), ConfigError);

    opt.minDarkness.reset();
    opt.configPath = "/nonexistent/bubblegrade.json";
    EXPECT_THROW(resolveConfig(opt), ConfigError);
}
