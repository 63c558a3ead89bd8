#pragma once
#include <map>
#include <string>
#include <vector>

namespace bubblegrade {

// Confidence policy shared by student ID and answer decoding.
struct DecoderConfig {
    double absoluteThreshold = 0.35;  // fill at or above this counts as marked
    double relativeThreshold = 0.6;   // runner-up / fallback ratio against the best fill
    double minDarkness = 0.08;        // below this the best mark is treated as blank

    // Throws ConfigError when a value is outside [0, 1].
    void validate() const;
};

struct BubbleScore {
    std::string label;
    double score = 0.0;
};

struct ColumnScores {
    int digitIndex = 0;
    std::vector<BubbleScore> scores;
};

struct QuestionScores {
    int number = 0;
    std::vector<BubbleScore> scores;
};

struct DecodedStudentId {
    std::string studentId;
    std::vector<std::string> warnings;
};

struct DecodedAnswers {
    std::map<int, std::string> answers;
    std::vector<std::string> warnings;
};

/*
  Decision rules over fill scores. Ambiguity never throws: it produces a
  deterministic fallback value and a warning.
*/
class ResponseDecoder {
public:
    static constexpr const char* kUnresolvedId = "ERROR";

    explicit ResponseDecoder(const DecoderConfig& config = DecoderConfig());

    // Columns are read in digitIndex order regardless of input order.
    DecodedStudentId decodeStudentId(const std::vector<ColumnScores>& columns) const;

    DecodedAnswers decodeAnswers(const std::vector<QuestionScores>& questions) const;

    const DecoderConfig& config() const { return config_; }

private:
    DecoderConfig config_;
};

}
