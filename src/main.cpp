#include "bubblegrade/AnswerKey.hpp"
#include "bubblegrade/CommandLine.hpp"
#include "bubblegrade/Config.hpp"
#include "bubblegrade/Errors.hpp"
#include "bubblegrade/GradingJobManager.hpp"
#include "bubblegrade/JobStore.hpp"
#include "bubblegrade/LayoutGuide.hpp"
#include "bubblegrade/RasterProvider.hpp"
#include "bubblegrade/SheetScanner.hpp"

#include <opencv2/imgcodecs.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace bubblegrade;

namespace {

/* =========================================================
   HELPERS
   ========================================================= */
std::vector<uint8_t> readBytes(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw Error("cannot open " + path);
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

json readJson(const std::string& path) {
    auto bytes = readBytes(path);
    try {
        return json::parse(bytes.begin(), bytes.end());
    } catch (const json::parse_error& e) {
        throw Error(path + " is not valid JSON: " + e.what());
    }
}

/* =========================================================
   COMMANDS
   ========================================================= */
int runScan(const CliOptions& opt, const AppConfig& cfg) {
    if (opt.inputs.empty()) throw UsageError("scan needs at least one image");

    LayoutGuide layout = loadLayoutGuide(readJson(opt.layoutPath));
    SheetScanner scanner(layout, cfg.decoder);
    scanner.setDebugMode(!cfg.debugDir.empty());

    ImageRasterProvider raster;
    json results = json::array();
    int pageNumber = 0;

    for (const auto& path : opt.inputs) {
        for (const auto& page : raster.rasterize(readBytes(path))) {
            ++pageNumber;
            PageOutcome outcome = scanner.scanPage(pageNumber, page.image);
            if (!outcome.ok) {
                results.push_back({{"page_number", pageNumber}, {"source", path}, {"error", outcome.error}});
                continue;
            }

            json j = toJson(outcome.result);
            j["source"] = path;
            results.push_back(j);

            if (!cfg.debugDir.empty()) {
                std::string out = cfg.debugDir + "/page_" + std::to_string(pageNumber) + ".png";
                if (!cv::imwrite(out, scanner.lastDebugVisualization())) {
                    spdlog::warn("could not write debug overlay {}", out);
                }
            }
        }
    }

    std::cout << results.dump(2) << "\n";
    return 0;
}

int runGrade(const CliOptions& opt, const AppConfig& cfg) {
    if (opt.keyPath.empty()) throw UsageError("--key is required");
    if (opt.scanPath.empty()) throw UsageError("--scan is required");

    const std::string testId = "cli";
    InMemoryJobStore store;
    store.addTest(testId);
    store.putLayout(testId, readJson(opt.layoutPath));
    store.putAnswerKey(testId, readJson(opt.keyPath));

    ImageRasterProvider raster;
    GradingJobManager manager(store, raster, cfg.decoder);

    std::string jobId = manager.createJob(testId);
    manager.uploadScans(jobId, readBytes(opt.scanPath));
    ScanSummary summary = manager.processScans(jobId);
    GradeStats stats = manager.gradeJob(jobId);

    auto csv = manager.getGradebook(jobId);
    std::ofstream out(opt.outPath, std::ios::binary);
    if (!out || !csv || !(out << *csv)) {
        throw Error("cannot write gradebook to " + opt.outPath);
    }

    json responses = json::array();
    for (const auto& r : manager.getResponses(jobId)) responses.push_back(toJson(r));

    json report = {
        {"job", toJson(*manager.getJob(jobId))},
        {"num_students", summary.numStudents},
        {"num_errors", summary.numErrors},
        {"stats", toJson(stats)},
        {"responses", responses},
        {"gradebook", opt.outPath}
    };
    std::cout << report.dump(2) << "\n";
    return 0;
}

} // namespace

/* =========================================================
   MAIN
   ========================================================= */
int main(int argc, char** argv) {
    spdlog::set_default_logger(spdlog::stderr_color_mt("bubblegrade"));

    if (argc < 2) return printUsage(std::cerr);

    const std::string cmd = argv[1];
    if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        printUsage(std::cout);
        return 0;
    }

    try {
        CliOptions opt = parseArgs(std::vector<std::string>(argv + 1, argv + argc));
        AppConfig cfg = resolveConfig(opt);
        spdlog::set_level(parseLogLevel(cfg.logLevel));

        if (cmd == "scan") return runScan(opt, cfg);
        if (cmd == "grade") return runGrade(opt, cfg);

        std::cerr << "unknown command: " << cmd << "\n";
        return printUsage(std::cerr);
    } catch (const UsageError& e) {
        std::cerr << "error: " << e.what() << "\n";
        return printUsage(std::cerr);
    } catch (const bubblegrade::Error& e) {
        spdlog::error("{}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("unexpected failure: {}", e.what());
        return 1;
    }
}
