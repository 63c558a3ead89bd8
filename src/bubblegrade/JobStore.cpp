#include "bubblegrade/JobStore.hpp"
#include "bubblegrade/Errors.hpp"
#include <algorithm>

using json = nlohmann::json;

namespace bubblegrade {

const char* toString(JobStatus status) {
    switch (status) {
        case JobStatus::Created:   return "CREATED";
        case JobStatus::Uploaded:  return "UPLOADED";
        case JobStatus::Scanning:  return "SCANNING";
        case JobStatus::Scanned:   return "SCANNED";
        case JobStatus::Grading:   return "GRADING";
        case JobStatus::Completed: return "COMPLETED";
        case JobStatus::Error:     return "ERROR";
    }
    return "UNKNOWN";
}

const char* toString(ScanStatus status) {
    switch (status) {
        case ScanStatus::Pending: return "PENDING";
        case ScanStatus::Ok:      return "OK";
        case ScanStatus::Error:   return "ERROR";
    }
    return "UNKNOWN";
}

json toJson(const GradingJob& job) {
    json j = {
        {"id", job.id},
        {"test_id", job.testId},
        {"created_at", job.createdAt},
        {"status", toString(job.status)},
        {"num_pages", job.numPages},
        {"num_students", job.numStudents},
        {"num_errors", job.numErrors}
    };
    j["error_message"] = job.errorMessage.empty() ? json(nullptr) : json(job.errorMessage);
    return j;
}

json toJson(const StudentResponse& response) {
    json j = {
        {"id", response.id},
        {"page_number", response.pageNumber},
        {"student_id", response.studentId},
        {"answers", response.answers},
        {"scan_status", toString(response.scanStatus)},
        {"warnings", response.warnings}
    };
    j["score"] = response.score ? json(*response.score) : json(nullptr);
    j["percent_grade"] = response.percentGrade ? json(*response.percentGrade) : json(nullptr);
    return j;
}

void InMemoryJobStore::addTest(const std::string& testId) {
    tests_[testId];
}

void InMemoryJobStore::putLayout(const std::string& testId, const json& layout) {
    tests_[testId].layouts.push_back(layout);
}

void InMemoryJobStore::putAnswerKey(const std::string& testId, const json& keyData) {
    tests_[testId].answerKeys.push_back(keyData);
}

bool InMemoryJobStore::hasTest(const std::string& testId) const {
    return tests_.count(testId) > 0;
}

std::optional<json> InMemoryJobStore::latestLayout(const std::string& testId) const {
    auto it = tests_.find(testId);
    if (it == tests_.end() || it->second.layouts.empty()) return std::nullopt;
    const json& latest = it->second.layouts.back();
    if (latest.is_null()) return std::nullopt;
    return latest;
}

std::optional<json> InMemoryJobStore::latestAnswerKey(const std::string& testId) const {
    auto it = tests_.find(testId);
    if (it == tests_.end() || it->second.answerKeys.empty()) return std::nullopt;
    return it->second.answerKeys.back();
}

void InMemoryJobStore::insertJob(const GradingJob& job) {
    if (findJob(job.id)) {
        throw GradingJobError("Grading job already exists: " + job.id);
    }
    jobs_.push_back(job);
}

std::optional<GradingJob> InMemoryJobStore::findJob(const std::string& jobId) const {
    for (const auto& j : jobs_) {
        if (j.id == jobId) return j;
    }
    return std::nullopt;
}

void InMemoryJobStore::updateJob(const GradingJob& job) {
    for (auto& j : jobs_) {
        if (j.id == job.id) {
            j = job;
            return;
        }
    }
    throw GradingJobError("Grading job not found: " + job.id);
}

std::vector<GradingJob> InMemoryJobStore::listJobs(const std::string& testId, size_t limit) const {
    std::vector<GradingJob> out;
    for (auto it = jobs_.rbegin(); it != jobs_.rend(); ++it) {
        if (it->testId == testId) out.push_back(*it);
    }
    std::stable_sort(out.begin(), out.end(), [](const GradingJob& a, const GradingJob& b) {
        return a.createdAt > b.createdAt;
    });
    if (out.size() > limit) out.resize(limit);
    return out;
}

void InMemoryJobStore::clearResponses(const std::string& jobId) {
    responses_.erase(std::remove_if(responses_.begin(), responses_.end(),
                                    [&](const StudentResponse& r) { return r.jobId == jobId; }),
                     responses_.end());
}

int64_t InMemoryJobStore::insertResponse(const StudentResponse& response) {
    StudentResponse row = response;
    row.id = nextResponseId_++;
    responses_.push_back(row);
    return row.id;
}

void InMemoryJobStore::updateResponse(const StudentResponse& response) {
    for (auto& r : responses_) {
        if (r.id == response.id) {
            r = response;
            return;
        }
    }
    throw GradingJobError("Student response not found: " + std::to_string(response.id));
}

std::vector<StudentResponse> InMemoryJobStore::responses(const std::string& jobId) const {
    std::vector<StudentResponse> out;
    for (const auto& r : responses_) {
        if (r.jobId == jobId) out.push_back(r);
    }
    std::stable_sort(out.begin(), out.end(), [](const StudentResponse& a, const StudentResponse& b) {
        return a.pageNumber < b.pageNumber;
    });
    return out;
}

void InMemoryJobStore::putReport(const Report& report) {
    reports_.erase(std::remove_if(reports_.begin(), reports_.end(),
                                  [&](const Report& r) { return r.jobId == report.jobId && r.type == report.type; }),
                   reports_.end());
    reports_.push_back(report);
}

std::optional<Report> InMemoryJobStore::report(const std::string& jobId, const std::string& type) const {
    for (const auto& r : reports_) {
        if (r.jobId == jobId && r.type == type) return r;
    }
    return std::nullopt;
}

}
