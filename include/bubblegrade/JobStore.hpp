#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace bubblegrade {

enum class JobStatus {
    Created,
    Uploaded,
    Scanning,
    Scanned,
    Grading,
    Completed,
    Error
};

enum class ScanStatus {
    Pending,
    Ok,
    Error
};

const char* toString(JobStatus status);
const char* toString(ScanStatus status);

struct GradingJob {
    std::string id;
    std::string testId;
    std::string createdAt;  // ISO-8601 local time
    JobStatus status = JobStatus::Created;
    std::vector<uint8_t> scanBytes;
    int numPages = 0;
    int numStudents = 0;
    int numErrors = 0;
    std::string errorMessage;
};

struct StudentResponse {
    int64_t id = 0;  // assigned by the store
    std::string jobId;
    int pageNumber = 0;
    std::string studentId;
    std::map<std::string, std::string> answers;
    std::optional<double> score;
    std::optional<double> percentGrade;
    ScanStatus scanStatus = ScanStatus::Pending;
    std::vector<std::string> warnings;
};

struct Report {
    std::string jobId;
    std::string type;      // "gradebook"
    std::string filename;
    std::string content;
    std::string createdAt;
};

nlohmann::json toJson(const GradingJob& job);
nlohmann::json toJson(const StudentResponse& response);

// Persistence used by GradingJobManager. Tests own their layouts and answer keys.
class JobStore {
public:
    virtual ~JobStore() = default;

    virtual bool hasTest(const std::string& testId) const = 0;
    virtual std::optional<nlohmann::json> latestLayout(const std::string& testId) const = 0;
    virtual std::optional<nlohmann::json> latestAnswerKey(const std::string& testId) const = 0;

    virtual void insertJob(const GradingJob& job) = 0;
    virtual std::optional<GradingJob> findJob(const std::string& jobId) const = 0;
    virtual void updateJob(const GradingJob& job) = 0;
    // Newest first
    virtual std::vector<GradingJob> listJobs(const std::string& testId, size_t limit) const = 0;

    virtual void clearResponses(const std::string& jobId) = 0;
    virtual int64_t insertResponse(const StudentResponse& response) = 0;
    virtual void updateResponse(const StudentResponse& response) = 0;
    // Ordered by page number
    virtual std::vector<StudentResponse> responses(const std::string& jobId) const = 0;

    // Replaces any report of the same job and type.
    virtual void putReport(const Report& report) = 0;
    virtual std::optional<Report> report(const std::string& jobId, const std::string& type) const = 0;
};

class InMemoryJobStore : public JobStore {
public:
    void addTest(const std::string& testId);
    void putLayout(const std::string& testId, const nlohmann::json& layout);
    void putAnswerKey(const std::string& testId, const nlohmann::json& keyData);

    bool hasTest(const std::string& testId) const override;
    std::optional<nlohmann::json> latestLayout(const std::string& testId) const override;
    std::optional<nlohmann::json> latestAnswerKey(const std::string& testId) const override;

    void insertJob(const GradingJob& job) override;
    std::optional<GradingJob> findJob(const std::string& jobId) const override;
    void updateJob(const GradingJob& job) override;
    std::vector<GradingJob> listJobs(const std::string& testId, size_t limit) const override;

    void clearResponses(const std::string& jobId) override;
    int64_t insertResponse(const StudentResponse& response) override;
    void updateResponse(const StudentResponse& response) override;
    std::vector<StudentResponse> responses(const std::string& jobId) const override;

    void putReport(const Report& report) override;
    std::optional<Report> report(const std::string& jobId, const std::string& type) const override;

private:
    struct TestRecord {
        std::vector<nlohmann::json> layouts;
        std::vector<nlohmann::json> answerKeys;
    };

    std::map<std::string, TestRecord> tests_;
    std::vector<GradingJob> jobs_;  // insertion order
    std::vector<StudentResponse> responses_;
    std::vector<Report> reports_;
    int64_t nextResponseId_ = 1;
};

}
