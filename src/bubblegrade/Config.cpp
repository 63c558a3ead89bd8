#include "bubblegrade/Config.hpp"
#include "bubblegrade/Errors.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace bubblegrade {

namespace {

void readNumber(const json& doc, const char* key, double& out) {
    if (!doc.contains(key)) return;
    if (!doc.at(key).is_number()) {
        throw ConfigError(std::string(key) + " must be a number");
    }
    out = doc.at(key).get<double>();
}

void readString(const json& doc, const char* key, std::string& out) {
    if (!doc.contains(key)) return;
    if (!doc.at(key).is_string()) {
        throw ConfigError(std::string(key) + " must be a string");
    }
    out = doc.at(key).get<std::string>();
}

} // namespace

AppConfig parseConfig(const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("not valid JSON: ") + e.what());
    }
    if (!doc.is_object()) {
        throw ConfigError("root must be an object");
    }

    AppConfig cfg;
    readNumber(doc, "absolute_threshold", cfg.decoder.absoluteThreshold);
    readNumber(doc, "relative_threshold", cfg.decoder.relativeThreshold);
    readNumber(doc, "min_darkness", cfg.decoder.minDarkness);
    readString(doc, "log_level", cfg.logLevel);
    readString(doc, "debug_dir", cfg.debugDir);

    cfg.decoder.validate();
    parseLogLevel(cfg.logLevel);
    return cfg;
}

AppConfig loadConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open " + path);
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return parseConfig(ss.str());
}

void applyEnvironment(AppConfig& config) {
    if (const char* level = std::getenv("BUBBLEGRADE_LOG_LEVEL")) {
        if (*level) config.logLevel = level;
    }
}

spdlog::level::level_enum parseLogLevel(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && name != "off") {
        throw ConfigError("unknown log level: " + name);
    }
    return level;
}

}
