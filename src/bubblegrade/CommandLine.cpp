#include "bubblegrade/CommandLine.hpp"
#include "bubblegrade/Errors.hpp"
#include <ostream>
#include <sstream>

namespace bubblegrade {

namespace {

double parseDouble(const std::string& flag, const std::string& value) {
    std::istringstream ss(value);
    double v = 0.0;
    if (!(ss >> v) || !ss.eof()) {
        throw UsageError(flag + " expects a number, got '" + value + "'");
    }
    return v;
}

} // namespace

int printUsage(std::ostream& os) {
    os << "usage:\n"
       << "  bubblegrade scan --layout <json> [options] <image>...\n"
       << "  bubblegrade grade --layout <json> --key <json> --scan <file> [options]\n"
       << "  bubblegrade help\n"
       << "\n"
       << "scan:\n"
       << "  --debug-dir <dir>            write bubble overlays as page_<n>.png\n"
       << "\n"
       << "grade:\n"
       << "  --key <path>                 answer key JSON array (required)\n"
       << "  --scan <path>                scanned document, multi-page TIFF or image (required)\n"
       << "  --out <path>                 default: gradebook.csv\n"
       << "\n"
       << "common:\n"
       << "  --layout <path>              sheet layout JSON (required)\n"
       << "  --config <path>              JSON config file\n"
       << "  --threshold <f>              default: 0.35\n"
       << "  --relative-threshold <f>     default: 0.6\n"
       << "  --min-darkness <f>           default: 0.08\n"
       << "  --log-level <name>           trace|debug|info|warn|error|off, default: info\n";
    return kUsageExitCode;
}

CliOptions parseArgs(const std::vector<std::string>& args) {
    if (args.empty()) throw UsageError("missing command");

    CliOptions opt;
    opt.command = args[0];

    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= args.size()) throw UsageError(arg + " requires a value");
            return args[++i];
        };

        if (arg == "--layout") opt.layoutPath = value();
        else if (arg == "--key") opt.keyPath = value();
        else if (arg == "--scan") opt.scanPath = value();
        else if (arg == "--out") opt.outPath = value();
        else if (arg == "--config") opt.configPath = value();
        else if (arg == "--debug-dir") opt.debugDir = value();
        else if (arg == "--threshold") opt.threshold = parseDouble(arg, value());
        else if (arg == "--relative-threshold") opt.relativeThreshold = parseDouble(arg, value());
        else if (arg == "--min-darkness") opt.minDarkness = parseDouble(arg, value());
        else if (arg == "--log-level") opt.logLevel = value();
        else if (arg.rfind("--", 0) == 0) throw UsageError("unknown option " + arg);
        else opt.inputs.push_back(arg);
    }

    if (opt.layoutPath.empty()) throw UsageError("--layout is required");
    return opt;
}

AppConfig resolveConfig(const CliOptions& opt) {
    AppConfig cfg = opt.configPath.empty() ? AppConfig() : loadConfig(opt.configPath);
    applyEnvironment(cfg);

    if (opt.threshold) cfg.decoder.absoluteThreshold = *opt.threshold;
    if (opt.relativeThreshold) cfg.decoder.relativeThreshold = *opt.relativeThreshold;
    if (opt.minDarkness) cfg.decoder.minDarkness = *opt.minDarkness;
    if (opt.logLevel) cfg.logLevel = *opt.logLevel;
    if (!opt.debugDir.empty()) cfg.debugDir = opt.debugDir;

    cfg.decoder.validate();
    return cfg;
}

}
