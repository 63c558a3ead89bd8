#pragma once
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace bubblegrade {

struct QuestionSpec {
    std::string questionId;                // upper-cased, trimmed ("Q1")
    std::set<std::string> correctOptions;  // lowercase tokens, never empty
    double points = 1.0;

    bool isMultiple() const { return correctOptions.size() > 1; }
    int numCorrect() const { return static_cast<int>(correctOptions.size()); }
};

struct GradeResult {
    double totalScore = 0.0;
    double percent = 0.0;
    std::map<std::string, double> perQuestion;  // keyed by questionId
};

// One response row as the gradebook sees it.
struct GradedResponse {
    std::string studentId;
    std::map<std::string, std::string> answers;  // "1" / "Q1" / "Q01" -> "a,b"
    std::optional<double> score;
    std::optional<double> percent;
};

struct GradeStats {
    double meanScore = 0.0;
    double minScore = 0.0;
    double maxScore = 0.0;
    double meanPercent = 0.0;
};

nlohmann::json toJson(const GradeStats& stats);

// "A, c,,B " -> {"a", "c", "b"}
std::vector<std::string> tokenizeAnswers(const std::string& value);

// Canvas formula: max(0, (hits - extras) * points / correctOptions), 2 decimals.
// Throws InvalidScoreError on negative inputs or hits > correctOptions.
double scoreMultipleSelect(double totalPoints, int correctOptions, int selectedCorrect, int selectedIncorrect);

double roundTo2(double value);

/*
  Weighted answer key. Built from a JSON array of
  {"question": "Q1", "answer": "a,c", "points": 2}.
*/
class AnswerKey {
public:
    explicit AnswerKey(const nlohmann::json& keyData);

    static AnswerKey parse(const std::string& text);

    // Throws InvalidAnswerKeyError.
    static std::vector<QuestionSpec> buildSpecs(const nlohmann::json& keyData);

    GradeResult grade(const std::map<std::string, std::string>& answers) const;

    std::string gradebookCsv(const std::vector<GradedResponse>& responses) const;

    GradeStats stats(const std::vector<GradedResponse>& responses) const;

    // Matches "Q1", "q1", "1" and "Q01" against questionId "Q1".
    static std::optional<std::string> findStudentAnswer(const std::map<std::string, std::string>& answers,
                                                        const std::string& questionId);

    double totalPoints() const { return totalPoints_; }

private:
    std::vector<QuestionSpec> specs_;
    double totalPoints_ = 0.0;
};

}
