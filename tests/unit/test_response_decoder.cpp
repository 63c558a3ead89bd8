/**
 * @file test_response_decoder.cpp
 * @brief Unit tests for student ID and answer decision rules
 */

#include <bubblegrade/Errors.hpp>
#include <bubblegrade/ResponseDecoder.hpp>

#include <gtest/gtest.h>

using namespace bubblegrade;

namespace {

ColumnScores column(int digit, std::vector<double> scores) {
    ColumnScores c;
    c.digitIndex = digit;
    for (size_t v = 0; v < scores.size(); ++v) c.scores.push_back({std::to_string(v), scores[v]});
    return c;
}

QuestionScores question(int number, std::vector<double> scores) {
    QuestionScores q;
    q.number = number;
    for (size_t i = 0; i < scores.size(); ++i) {
        q.scores.push_back({std::string(1, static_cast<char>('a' + i)), scores[i]});
    }
    return q;
}

} // anonymous namespace

// =============================================================================
// Student ID
// =============================================================================

TEST(ResponseDecoderTest, DecodesDigitsInColumnOrder) {
    ResponseDecoder decoder;
    // Supplied out of order on purpose
    auto id = decoder.decodeStudentId({
        column(1, {0.0, 0.0, 0.9, 0.0}),
        column(0, {0.0, 0.8, 0.0, 0.0}),
        column(2, {0.0, 0.0, 0.0, 0.7})
    });
    EXPECT_EQ(id.studentId, "123");
    EXPECT_TRUE(id.warnings.empty());
}

TEST(ResponseDecoderTest, LightColumnMakesIdUnresolved) {
    ResponseDecoder decoder;
    auto id = decoder.decodeStudentId({
        column(0, {0.0, 0.9, 0.0}),
        column(1, {0.02, 0.05, 0.01})
    });
    EXPECT_EQ(id.studentId, "ERROR");
    ASSERT_EQ(id.warnings.size(), 2u);
    EXPECT_EQ(id.warnings[0], "Digit 1: no bubble above threshold and best mark too light (best 1=0.05).");
    EXPECT_EQ(id.warnings[1], "Student ID unresolved.");
}

TEST(ResponseDecoderTest, DoubleMarkedColumnIsAmbiguous) {
    ResponseDecoder decoder;
    auto id = decoder.decodeStudentId({column(0, {0.0, 0.9, 0.8})});
    EXPECT_EQ(id.studentId, "ERROR");
    ASSERT_EQ(id.warnings.size(), 2u);
    EXPECT_EQ(id.warnings[0], "Digit 0: ambiguous fill (1=0.90, next=0.80).");
}

TEST(ResponseDecoderTest, FaintButClearColumnUsesBest) {
    ResponseDecoder decoder;
    // Nothing reaches 0.35, but 0.30 clearly beats 0.10
    auto id = decoder.decodeStudentId({column(0, {0.1, 0.3, 0.05})});
    EXPECT_EQ(id.studentId, "1");
    EXPECT_TRUE(id.warnings.empty());
}

TEST(ResponseDecoderTest, NoColumnsIsUnresolved) {
    ResponseDecoder decoder;
    auto id = decoder.decodeStudentId({});
    EXPECT_EQ(id.studentId, "ERROR");
    ASSERT_EQ(id.warnings.size(), 1u);
    EXPECT_EQ(id.warnings[0], "Student ID unresolved.");
}

// =============================================================================
// Answers
// =============================================================================

TEST(ResponseDecoderTest, SelectsAllAboveAbsoluteThreshold) {
    ResponseDecoder decoder;
    auto out = decoder.decodeAnswers({question(1, {0.9, 0.1, 0.8, 0.0})});
    EXPECT_EQ(out.answers.at(1), "a,c");
    EXPECT_TRUE(out.warnings.empty());
}

TEST(ResponseDecoderTest, AbsoluteThresholdIsInclusive) {
    ResponseDecoder decoder;
    auto out = decoder.decodeAnswers({question(4, {0.35, 0.0})});
    EXPECT_EQ(out.answers.at(4), "a");
    EXPECT_TRUE(out.warnings.empty());
}

TEST(ResponseDecoderTest, BlankQuestionIsEmpty) {
    ResponseDecoder decoder;
    auto out = decoder.decodeAnswers({question(2, {0.01, 0.03, 0.02})});
    EXPECT_EQ(out.answers.at(2), "");
    ASSERT_EQ(out.warnings.size(), 1u);
    EXPECT_EQ(out.warnings[0], "Question 2: no selection above threshold and best mark too light (best b=0.03).");
}

TEST(ResponseDecoderTest, RelativeFallbackIncludesTiesAtCutoff) {
    DecoderConfig cfg;
    cfg.absoluteThreshold = 0.6;
    ResponseDecoder decoder(cfg);
    // cutoff = max(0.6 * 0.5, 0.5 * 0.6) = 0.3; 0.3 is selected, 0.29 is not
    auto out = decoder.decodeAnswers({question(3, {0.3, 0.5, 0.29, 0.0})});
    EXPECT_EQ(out.answers.at(3), "a,b");
    ASSERT_EQ(out.warnings.size(), 1u);
    EXPECT_EQ(out.warnings[0], "Question 3: using relative threshold fallback (best b=0.50).");
}

TEST(ResponseDecoderTest, EqualBestScoresPickBoth) {
    ResponseDecoder decoder;
    auto out = decoder.decodeAnswers({question(5, {0.0, 0.2, 0.2})});
    EXPECT_EQ(out.answers.at(5), "b,c");
    EXPECT_EQ(out.warnings[0], "Question 5: using relative threshold fallback (best b=0.20).");
}

TEST(ResponseDecoderTest, CustomThresholds) {
    DecoderConfig cfg;
    cfg.absoluteThreshold = 0.5;
    ResponseDecoder decoder(cfg);
    auto out = decoder.decodeAnswers({question(1, {0.45, 0.0})});
    // Below the raised threshold: falls back, still selects a
    EXPECT_EQ(out.answers.at(1), "a");
    EXPECT_EQ(out.warnings.size(), 1u);
}

TEST(ResponseDecoderTest, RejectsOutOfRangeConfig) {
    DecoderConfig cfg;
    cfg.relativeThreshold = 1.5;
    EXPECT_THROW(ResponseDecoder{cfg}, ConfigError);
}
