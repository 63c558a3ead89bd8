#pragma once
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "bubblegrade/Config.hpp"

namespace bubblegrade {

// Bad command line; the CLI prints usage and exits with kUsageExitCode.
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

constexpr int kUsageExitCode = 2;

struct CliOptions {
    std::string command;
    std::string layoutPath;
    std::string keyPath;
    std::string scanPath;
    std::string outPath = "gradebook.csv";
    std::string configPath;
    std::string debugDir;
    std::optional<double> threshold;
    std::optional<double> relativeThreshold;
    std::optional<double> minDarkness;
    std::optional<std::string> logLevel;
    std::vector<std::string> inputs;
};

// args[0] is the command. Throws UsageError.
CliOptions parseArgs(const std::vector<std::string>& args);

// Config file first, then BUBBLEGRADE_LOG_LEVEL, then flags. Throws ConfigError.
AppConfig resolveConfig(const CliOptions& options);

// Writes the usage text and returns kUsageExitCode.
int printUsage(std::ostream& os);

}
