#include "bubblegrade/GradingJobManager.hpp"
#include "bubblegrade/Errors.hpp"
#include "bubblegrade/LayoutGuide.hpp"
#include "bubblegrade/SheetScanner.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace bubblegrade {

namespace {

const char* kGradebook = "gradebook";

std::string timestamp(const char* format, bool withMicros) {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, format);
    if (withMicros) {
        auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;
        ss << "." << std::setw(6) << std::setfill('0') << micros;
    }
    return ss.str();
}

std::string randomHex8() {
    static std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<uint32_t> dist;
    std::ostringstream ss;
    ss << std::hex << std::setw(8) << std::setfill('0') << dist(rng);
    return ss.str();
}

std::map<std::string, std::string> answersByKey(const std::map<int, std::string>& answers) {
    std::map<std::string, std::string> out;
    for (const auto& kv : answers) out[std::to_string(kv.first)] = kv.second;
    return out;
}

} // namespace

GradingJobManager::GradingJobManager(JobStore& store, const RasterProvider& raster, const DecoderConfig& config)
    : store_(store), raster_(raster), config_(config) {
    config_.validate();
}

GradingJob GradingJobManager::requireJob(const std::string& jobId) const {
    auto job = store_.findJob(jobId);
    if (!job) {
        throw GradingJobError("Grading job not found: " + jobId);
    }
    return *job;
}

void GradingJobManager::failJob(GradingJob& job, const std::string& message) {
    job.status = JobStatus::Error;
    job.errorMessage = message;
    store_.updateJob(job);
    spdlog::error("job {} failed: {}", job.id, message);
    throw GradingJobError(message);
}

std::string GradingJobManager::createJob(const std::string& testId) {
    if (!store_.hasTest(testId)) {
        throw GradingJobError("Test not found: " + testId);
    }
    if (!store_.latestLayout(testId)) {
        throw GradingJobError("Test must have a bubble sheet with layout. Generate a sheet first.");
    }
    if (!store_.latestAnswerKey(testId)) {
        throw GradingJobError("Test must have an answer key. Set the answer key first.");
    }

    GradingJob job;
    job.id = "gj_" + timestamp("%Y%m%d_%H%M%S", false) + "_" + randomHex8();
    job.testId = testId;
    job.createdAt = timestamp("%Y-%m-%dT%H:%M:%S", true);
    job.status = JobStatus::Created;
    store_.insertJob(job);

    spdlog::info("created grading job {} for test {}", job.id, testId);
    return job.id;
}

int GradingJobManager::uploadScans(const std::string& jobId, const std::vector<uint8_t>& bytes) {
    GradingJob job = requireJob(jobId);
    if (job.status != JobStatus::Created && job.status != JobStatus::Uploaded) {
        throw GradingJobError(std::string("Job must be in CREATED or UPLOADED status for upload, got: ") +
                              toString(job.status));
    }

    int numPages = 0;
    try {
        numPages = raster_.countPages(bytes);
    } catch (const std::exception& e) {
        failJob(job, std::string("Failed to read scan document: ") + e.what());
    }

    job.scanBytes = bytes;
    job.numPages = numPages;
    job.status = JobStatus::Uploaded;
    job.errorMessage.clear();
    store_.updateJob(job);

    spdlog::info("job {}: uploaded {} page(s)", jobId, numPages);
    return numPages;
}

ScanSummary GradingJobManager::processScans(const std::string& jobId) {
    GradingJob job = requireJob(jobId);
    if (job.status != JobStatus::Uploaded && job.status != JobStatus::Scanning) {
        throw GradingJobError(std::string("Job must be UPLOADED for processing, got: ") + toString(job.status));
    }

    if (job.scanBytes.empty()) {
        failJob(job, "No scan document uploaded for this job");
    }

    auto layoutDoc = store_.latestLayout(job.testId);
    if (!layoutDoc) {
        failJob(job, "No bubble sheet layout found for test");
    }

    LayoutGuide layout;
    try {
        layout = loadLayoutGuide(*layoutDoc);
    } catch (const MalformedLayoutError& e) {
        failJob(job, e.what());
    }

    job.status = JobStatus::Scanning;
    store_.updateJob(job);
    store_.clearResponses(jobId);

    std::vector<RasterPage> pages;
    try {
        pages = raster_.rasterize(job.scanBytes);
    } catch (const std::exception& e) {
        failJob(job, std::string("Scan processing failed: ") + e.what());
    }

    SheetScanner scanner(layout, config_);
    ScanSummary summary;

    for (const auto& page : pages) {
        PageOutcome outcome = scanner.scanPage(page.pageNumber, page.image);

        StudentResponse row;
        row.jobId = jobId;
        row.pageNumber = page.pageNumber;

        if (!outcome.ok) {
            row.studentId = ResponseDecoder::kUnresolvedId;
            row.scanStatus = ScanStatus::Error;
            row.warnings = {outcome.error};
            summary.numErrors++;
        } else {
            const ScanResult& r = outcome.result;
            row.studentId = r.studentId;
            row.answers = answersByKey(r.answers);
            row.warnings = r.warnings;
            if (r.studentId == ResponseDecoder::kUnresolvedId) {
                row.scanStatus = ScanStatus::Error;
                summary.numErrors++;
            } else {
                row.scanStatus = ScanStatus::Ok;
                summary.numStudents++;
            }
        }
        store_.insertResponse(row);
    }

    job.status = JobStatus::Scanned;
    job.numStudents = summary.numStudents;
    job.numErrors = summary.numErrors;
    store_.updateJob(job);

    spdlog::info("job {}: scanned {} page(s), {} student(s), {} error(s)",
                 jobId, pages.size(), summary.numStudents, summary.numErrors);
    return summary;
}

GradeStats GradingJobManager::gradeJob(const std::string& jobId) {
    GradingJob job = requireJob(jobId);
    if (job.status != JobStatus::Scanned && job.status != JobStatus::Grading) {
        throw GradingJobError(std::string("Job must be SCANNED for grading, got: ") + toString(job.status));
    }

    auto keyDoc = store_.latestAnswerKey(job.testId);
    if (!keyDoc) {
        failJob(job, "No answer key found for test");
    }

    std::optional<AnswerKey> key;
    try {
        key.emplace(*keyDoc);
    } catch (const InvalidAnswerKeyError& e) {
        failJob(job, e.what());
    }

    job.status = JobStatus::Grading;
    store_.updateJob(job);

    std::vector<GradedResponse> graded;
    for (auto row : store_.responses(jobId)) {
        if (row.scanStatus != ScanStatus::Ok) continue;

        try {
            GradeResult result = key->grade(row.answers);
            row.score = result.totalScore;
            row.percentGrade = result.percent;
        } catch (const Error& e) {
            row.warnings.push_back(std::string("Grading error: ") + e.what());
            spdlog::warn("job {} page {}: grading error: {}", jobId, row.pageNumber, e.what());
        }
        store_.updateResponse(row);

        graded.push_back({row.studentId, row.answers, row.score, row.percentGrade});
    }

    Report report;
    report.jobId = jobId;
    report.type = kGradebook;
    report.filename = "gradebook.csv";
    report.content = key->gradebookCsv(graded);
    report.createdAt = timestamp("%Y-%m-%dT%H:%M:%S", true);
    store_.putReport(report);

    job.status = JobStatus::Completed;
    store_.updateJob(job);

    GradeStats stats = key->stats(graded);
    spdlog::info("job {}: graded {} response(s), mean {:.2f}%", jobId, graded.size(), stats.meanPercent);
    return stats;
}

std::optional<GradingJob> GradingJobManager::getJob(const std::string& jobId) const {
    return store_.findJob(jobId);
}

std::map<std::string, int> GradingJobManager::responseCounts(const std::string& jobId) const {
    std::map<std::string, int> counts;
    for (const auto& r : store_.responses(jobId)) counts[toString(r.scanStatus)]++;
    return counts;
}

std::vector<GradingJob> GradingJobManager::listJobs(const std::string& testId, size_t limit) const {
    return store_.listJobs(testId, limit);
}

std::vector<StudentResponse> GradingJobManager::getResponses(const std::string& jobId) const {
    return store_.responses(jobId);
}

std::optional<std::string> GradingJobManager::getGradebook(const std::string& jobId) const {
    auto report = store_.report(jobId, kGradebook);
    if (!report) return std::nullopt;
    return report->content;
}

}
