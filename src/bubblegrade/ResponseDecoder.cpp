#include "bubblegrade/ResponseDecoder.hpp"
#include "bubblegrade/Errors.hpp"
#include <algorithm>
#include <functional>
#include <iomanip>
#include <sstream>

namespace bubblegrade {

namespace {

std::string fmt2(double v) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << v;
    return ss.str();
}

// First bubble with the highest score; ties keep layout order.
const BubbleScore* best(const std::vector<BubbleScore>& scores) {
    const BubbleScore* b = nullptr;
    for (const auto& s : scores) {
        if (!b || s.score > b->score) b = &s;
    }
    return b;
}

double runnerUp(const std::vector<BubbleScore>& scores) {
    if (scores.size() < 2) return 0.0;
    std::vector<double> values;
    values.reserve(scores.size());
    for (const auto& s : scores) values.push_back(s.score);
    std::sort(values.begin(), values.end(), std::greater<double>());
    return values[1];
}

std::string joinSorted(std::vector<std::string> labels) {
    std::sort(labels.begin(), labels.end());
    std::string out;
    for (size_t i = 0; i < labels.size(); ++i) {
        if (i > 0) out += ",";
        out += labels[i];
    }
    return out;
}

void checkUnit(double v, const char* name) {
    if (!(v >= 0.0 && v <= 1.0)) {
        throw ConfigError(std::string(name) + " must be within [0, 1], got " + fmt2(v));
    }
}

} // namespace

void DecoderConfig::validate() const {
    checkUnit(absoluteThreshold, "absolute_threshold");
    checkUnit(relativeThreshold, "relative_threshold");
    checkUnit(minDarkness, "min_darkness");
}

ResponseDecoder::ResponseDecoder(const DecoderConfig& config) : config_(config) {
    config_.validate();
}

DecodedStudentId ResponseDecoder::decodeStudentId(const std::vector<ColumnScores>& columns) const {
    DecodedStudentId out;

    std::vector<const ColumnScores*> ordered;
    for (const auto& c : columns) ordered.push_back(&c);
    std::stable_sort(ordered.begin(), ordered.end(), [](const ColumnScores* a, const ColumnScores* b) {
        return a->digitIndex < b->digitIndex;
    });

    std::string digits;
    bool unresolved = false;

    for (const ColumnScores* col : ordered) {
        std::vector<const BubbleScore*> hits;
        for (const auto& s : col->scores) {
            if (s.score >= config_.absoluteThreshold) hits.push_back(&s);
        }
        if (hits.size() == 1) {
            digits += hits[0]->label;
            continue;
        }

        const BubbleScore* b = best(col->scores);
        if (!b) {
            out.warnings.push_back("Digit " + std::to_string(col->digitIndex) + ": column has no bubbles.");
            unresolved = true;
            continue;
        }

        double rival = runnerUp(col->scores);

        if (b->score < config_.minDarkness) {
            out.warnings.push_back("Digit " + std::to_string(col->digitIndex) +
                                   ": no bubble above threshold and best mark too light (best " +
                                   b->label + "=" + fmt2(b->score) + ").");
            unresolved = true;
            continue;
        }

        if (rival >= b->score * config_.relativeThreshold) {
            out.warnings.push_back("Digit " + std::to_string(col->digitIndex) + ": ambiguous fill (" +
                                   b->label + "=" + fmt2(b->score) + ", next=" + fmt2(rival) + ").");
            unresolved = true;
            continue;
        }

        digits += b->label;
    }

    if (unresolved || digits.empty()) {
        out.warnings.push_back("Student ID unresolved.");
        out.studentId = kUnresolvedId;
    } else {
        out.studentId = digits;
    }
    return out;
}

DecodedAnswers ResponseDecoder::decodeAnswers(const std::vector<QuestionScores>& questions) const {
    DecodedAnswers out;

    for (const auto& q : questions) {
        std::vector<std::string> selections;
        for (const auto& s : q.scores) {
            if (s.score >= config_.absoluteThreshold) selections.push_back(s.label);
        }
        if (!selections.empty()) {
            out.answers[q.number] = joinSorted(selections);
            continue;
        }

        const BubbleScore* b = best(q.scores);
        if (!b) {
            out.warnings.push_back("Question " + std::to_string(q.number) + ": question has no bubbles.");
            out.answers[q.number] = "";
            continue;
        }

        if (b->score < config_.minDarkness) {
            out.warnings.push_back("Question " + std::to_string(q.number) +
                                   ": no selection above threshold and best mark too light (best " +
                                   b->label + "=" + fmt2(b->score) + ").");
            out.answers[q.number] = "";
            continue;
        }

        // Inclusive cutoff: every bubble tied at the cutoff is selected.
        double cutoff = std::max(config_.absoluteThreshold * 0.5, b->score * config_.relativeThreshold);
        std::vector<std::string> fallback;
        for (const auto& s : q.scores) {
            if (s.score >= cutoff) fallback.push_back(s.label);
        }
        if (fallback.empty()) fallback.push_back(b->label);

        out.answers[q.number] = joinSorted(fallback);
        out.warnings.push_back("Question " + std::to_string(q.number) +
                               ": using relative threshold fallback (best " +
                               b->label + "=" + fmt2(b->score) + ").");
    }

    return out;
}

}
