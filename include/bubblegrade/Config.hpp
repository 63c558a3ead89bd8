#pragma once
#include <spdlog/common.h>
#include <string>
#include "bubblegrade/ResponseDecoder.hpp"

namespace bubblegrade {

struct AppConfig {
    DecoderConfig decoder;
    std::string logLevel = "info";
    std::string debugDir;  // empty: no debug overlays
};

// Reads an optional JSON config file; unknown keys are ignored. Throws ConfigError.
AppConfig loadConfig(const std::string& path);
AppConfig parseConfig(const std::string& text);

// BUBBLEGRADE_LOG_LEVEL, when set, replaces config.logLevel.
void applyEnvironment(AppConfig& config);

// "trace", "debug", "info", "warn", "error", "critical", "off". Throws ConfigError.
spdlog::level::level_enum parseLogLevel(const std::string& name);

}
