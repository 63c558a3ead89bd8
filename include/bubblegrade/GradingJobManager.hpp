#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "bubblegrade/AnswerKey.hpp"
#include "bubblegrade/JobStore.hpp"
#include "bubblegrade/RasterProvider.hpp"
#include "bubblegrade/ResponseDecoder.hpp"

namespace bubblegrade {

struct ScanSummary {
    int numStudents = 0;
    int numErrors = 0;
};

/*
  Job state machine:
    CREATED -> UPLOADED -> SCANNING -> SCANNED -> GRADING -> COMPLETED
  with ERROR reachable from any step that fails at job level.
  Every failure raises GradingJobError.
*/
class GradingJobManager {
public:
    GradingJobManager(JobStore& store, const RasterProvider& raster,
                      const DecoderConfig& config = DecoderConfig());

    // Returns the new job id, "gj_<YYYYmmdd_HHMMSS>_<8 hex>".
    std::string createJob(const std::string& testId);

    // Returns the page count of the uploaded document.
    int uploadScans(const std::string& jobId, const std::vector<uint8_t>& bytes);

    // Re-runnable: previous responses of the job are replaced.
    ScanSummary processScans(const std::string& jobId);

    GradeStats gradeJob(const std::string& jobId);

    std::optional<GradingJob> getJob(const std::string& jobId) const;
    // Response rows per scan status ("OK" -> 12, "ERROR" -> 1)
    std::map<std::string, int> responseCounts(const std::string& jobId) const;
    std::vector<GradingJob> listJobs(const std::string& testId, size_t limit = 20) const;
    std::vector<StudentResponse> getResponses(const std::string& jobId) const;
    std::optional<std::string> getGradebook(const std::string& jobId) const;

private:
    GradingJob requireJob(const std::string& jobId) const;
    [[noreturn]] void failJob(GradingJob& job, const std::string& message);

    JobStore& store_;
    const RasterProvider& raster_;
    DecoderConfig config_;
};

}
