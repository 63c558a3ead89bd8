#include "bubblegrade/AnswerKey.hpp"
#include "bubblegrade/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <sstream>

using json = nlohmann::json;

namespace bubblegrade {

namespace {

std::string trim(const std::string& s) {
    size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) a++;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) b--;
    return s.substr(a, b - a);
}

std::string upper(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string stripLeadingQ(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && (s[i] == 'Q' || s[i] == 'q')) i++;
    return s.substr(i);
}

// Decimal value of the part after any leading Q's, with leading zeros removed.
std::optional<std::string> numericSuffix(const std::string& key) {
    std::string digits = trim(stripLeadingQ(trim(key)));
    if (digits.empty()) return std::nullopt;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    size_t nz = digits.find_first_not_of('0');
    return nz == std::string::npos ? std::string("0") : digits.substr(nz);
}

// Shortest of "5.0", "3.67", "73.4" for a 2-decimal value.
std::string formatNumber(double v) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f", roundTo2(v));
    std::string s(buf);
    while (s.size() > 1 && s.back() == '0' && s[s.size() - 2] != '.') s.pop_back();
    return s;
}

std::string csvField(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) return field;
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += "\"\"";
        else out += c;
    }
    out += "\"";
    return out;
}

void writeRow(std::ostringstream& os, const std::vector<std::string>& row) {
    for (size_t i = 0; i < row.size(); ++i) {
        if (i > 0) os << ",";
        os << csvField(row[i]);
    }
    os << "\r\n";
}

} // namespace

json toJson(const GradeStats& stats) {
    return {
        {"mean_score", stats.meanScore},
        {"min_score", stats.minScore},
        {"max_score", stats.maxScore},
        {"mean_percent", stats.meanPercent}
    };
}

// printf rounds the exact binary value, so exact halves go to even (0.125 -> 0.12).
double roundTo2(double value) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f", value);
    return std::strtod(buf, nullptr);
}

std::vector<std::string> tokenizeAnswers(const std::string& value) {
    std::vector<std::string> out;
    std::stringstream ss(value);
    std::string tok;
    while (std::getline(ss, tok, ',')) {
        tok = trim(tok);
        if (!tok.empty()) out.push_back(lower(tok));
    }
    return out;
}

double scoreMultipleSelect(double totalPoints, int correctOptions, int selectedCorrect, int selectedIncorrect) {
    if (totalPoints < 0.0) {
        throw InvalidScoreError("total points cannot be negative");
    }
    if (correctOptions <= 0) return 0.0;
    if (selectedCorrect < 0 || selectedIncorrect < 0) {
        throw InvalidScoreError("selection counts cannot be negative");
    }
    if (selectedCorrect > correctOptions) {
        throw InvalidScoreError("selected correct options exceed the number of correct options");
    }

    double perOption = totalPoints / correctOptions;
    double raw = (selectedCorrect - selectedIncorrect) * perOption;
    return roundTo2(std::max(0.0, raw) + 1e-12);
}

std::vector<QuestionSpec> AnswerKey::buildSpecs(const json& keyData) {
    if (!keyData.is_array()) {
        throw InvalidAnswerKeyError("root must be an array");
    }

    std::vector<QuestionSpec> specs;
    std::set<std::string> seen;

    for (size_t i = 0; i < keyData.size(); ++i) {
        const std::string where = "root[" + std::to_string(i) + "]";
        const json& item = keyData.at(i);
        if (!item.is_object()) {
            throw InvalidAnswerKeyError(where + " must be an object");
        }

        if (!item.contains("question")) {
            throw InvalidAnswerKeyError(where + " missing required field: question");
        }
        const json& q = item.at("question");
        std::string question;
        if (q.is_string()) question = q.get<std::string>();
        else if (q.is_number_integer()) question = std::to_string(q.get<long long>());
        else throw InvalidAnswerKeyError(where + ".question must be a string or integer");

        if (!item.contains("answer")) {
            throw InvalidAnswerKeyError(where + " missing required field: answer");
        }
        if (!item.at("answer").is_string()) {
            throw InvalidAnswerKeyError(where + ".answer must be a string");
        }

        QuestionSpec spec;
        spec.questionId = upper(trim(question));
        if (spec.questionId.empty()) {
            throw InvalidAnswerKeyError(where + ".question must not be empty");
        }

        if (item.contains("points")) {
            const json& p = item.at("points");
            if (!p.is_number()) {
                throw InvalidAnswerKeyError(where + ".points must be a number");
            }
            spec.points = p.get<double>();
            if (spec.points < 0.0) {
                throw InvalidAnswerKeyError(where + ".points must not be negative");
            }
        }

        auto tokens = tokenizeAnswers(item.at("answer").get<std::string>());
        if (tokens.empty()) {
            throw InvalidAnswerKeyError("question '" + spec.questionId + "' has no valid correct answers");
        }
        spec.correctOptions.insert(tokens.begin(), tokens.end());

        if (!seen.insert(spec.questionId).second) {
            throw InvalidAnswerKeyError(where + " duplicates question '" + spec.questionId + "'");
        }
        specs.push_back(spec);
    }
    return specs;
}

AnswerKey::AnswerKey(const json& keyData) : specs_(buildSpecs(keyData)) {
    for (const auto& s : specs_) totalPoints_ += s.points;
}

AnswerKey AnswerKey::parse(const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        throw InvalidAnswerKeyError(std::string("not valid JSON: ") + e.what());
    }
    return AnswerKey(doc);
}

std::optional<std::string> AnswerKey::findStudentAnswer(const std::map<std::string, std::string>& answers,
                                                        const std::string& questionId) {
    const auto qidNum = numericSuffix(questionId);
    for (const auto& kv : answers) {
        std::string normalized = upper(kv.first);
        if (normalized.empty() || normalized[0] != 'Q') normalized = "Q" + normalized;
        if (normalized == questionId) return kv.second;

        auto keyNum = numericSuffix(kv.first);
        if (keyNum && qidNum && *keyNum == *qidNum) return kv.second;
    }
    return std::nullopt;
}

GradeResult AnswerKey::grade(const std::map<std::string, std::string>& answers) const {
    GradeResult R;
    double total = 0.0;

    for (const auto& spec : specs_) {
        auto tokens = tokenizeAnswers(findStudentAnswer(answers, spec.questionId).value_or(""));
        std::set<std::string> selected(tokens.begin(), tokens.end());

        double score = 0.0;
        if (!spec.isMultiple()) {
            score = selected == spec.correctOptions ? spec.points : 0.0;
        } else {
            int hits = 0, extras = 0;
            for (const auto& t : selected) {
                if (spec.correctOptions.count(t)) hits++;
                else extras++;
            }
            score = scoreMultipleSelect(spec.points, spec.numCorrect(), hits, extras);
        }

        R.perQuestion[spec.questionId] = roundTo2(score);
        total += score;
    }

    R.totalScore = roundTo2(total);
    R.percent = totalPoints_ > 0.0 ? roundTo2(R.totalScore / totalPoints_ * 100.0) : 0.0;
    return R;
}

std::string AnswerKey::gradebookCsv(const std::vector<GradedResponse>& responses) const {
    std::ostringstream os;

    std::vector<std::string> header = {"Student_ID"};
    for (const auto& spec : specs_) header.push_back("Q" + stripLeadingQ(spec.questionId));
    header.push_back("Total_Score");
    header.push_back("Total_Possible");
    header.push_back("Percent_Grade");
    writeRow(os, header);

    for (const auto& r : responses) {
        std::vector<std::string> row = {r.studentId};
        for (const auto& spec : specs_) {
            row.push_back(upper(findStudentAnswer(r.answers, spec.questionId).value_or("")));
        }
        row.push_back(r.score ? formatNumber(*r.score) : "");
        row.push_back(formatNumber(totalPoints_));
        row.push_back(r.percent ? formatNumber(*r.percent) : "");
        writeRow(os, row);
    }
    return os.str();
}

GradeStats AnswerKey::stats(const std::vector<GradedResponse>& responses) const {
    GradeStats S;
    if (responses.empty()) return S;

    double sumScore = 0.0, sumPercent = 0.0;
    double lo = responses.front().score.value_or(0.0);
    double hi = lo;
    for (const auto& r : responses) {
        double s = r.score.value_or(0.0);
        sumScore += s;
        sumPercent += r.percent.value_or(0.0);
        lo = std::min(lo, s);
        hi = std::max(hi, s);
    }

    const double n = static_cast<double>(responses.size());
    S.meanScore = roundTo2(sumScore / n);
    S.minScore = roundTo2(lo);
    S.maxScore = roundTo2(hi);
    S.meanPercent = roundTo2(sumPercent / n);
    return S;
}

}
