#include "bubblegrade/SheetScanner.hpp"
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

using namespace cv;

namespace bubblegrade {

namespace {

// Rescales 16-bit and floating-point gray pages to the 8-bit range.
Mat to8Bit(int pageNumber, const Mat& gray) {
    double alpha = 0.0;
    switch (gray.depth()) {
    case CV_16U:
        alpha = 255.0 / 65535.0;
        break;
    case CV_32F:
    case CV_64F: {
        // Float pages come either normalized to [0, 1] or already on the 0..255 scale
        double lo = 0.0, hi = 0.0;
        minMaxLoc(gray, &lo, &hi);
        alpha = hi <= 1.0 ? 255.0 : 1.0;
        break;
    }
    default:
        throw std::invalid_argument("page " + std::to_string(pageNumber) + ": unsupported pixel depth " +
                                    std::to_string(gray.depth()));
    }

    Mat converted;
    gray.convertTo(converted, CV_8U, alpha);
    return converted;
}

} // namespace

nlohmann::json toJson(const ScanResult& result) {
    nlohmann::json answers = nlohmann::json::object();
    for (const auto& kv : result.answers) {
        answers[std::to_string(kv.first)] = kv.second;
    }
    return {
        {"page_number", result.pageNumber},
        {"student_id", result.studentId},
        {"answers", answers},
        {"warnings", result.warnings}
    };
}

SheetScanner::SheetScanner(const LayoutGuide& layout, const DecoderConfig& config)
    : layout_(layout), decoder_(config) {}

void SheetScanner::setDebugMode(bool enabled) {
    debugMode_ = enabled;
}

Mat SheetScanner::lastDebugVisualization() const {
    return lastDebugVis_.clone();
}

std::vector<int> SheetScanner::questionNumbers() const {
    std::vector<int> out;
    out.reserve(layout_.questions.size());
    for (const auto& q : layout_.questions) out.push_back(q.number);
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<SampledBubble> SheetScanner::sampleAll(const Mat& gray, const LayoutTransform& transform,
                                                   const std::vector<BubbleDef>& bubbles) {
    std::vector<SampledBubble> out;
    out.reserve(bubbles.size());
    for (const auto& b : bubbles) {
        SampledBubble s = sampler_.sampleBubble(gray, transform, b);
        s.selected = s.fill >= decoder_.config().absoluteThreshold;
        out.push_back(s);
    }
    if (debugMode_) {
        debugBubbles_.insert(debugBubbles_.end(), out.begin(), out.end());
    }
    return out;
}

ScanResult SheetScanner::scanImage(int pageNumber, const Mat& image) {
    if (image.empty()) {
        throw std::invalid_argument("page " + std::to_string(pageNumber) + " has no image data");
    }

    Mat gray;
    if (image.channels() == 1) {
        gray = image;
    } else if (image.channels() == 3) {
        cvtColor(image, gray, COLOR_BGR2GRAY);
    } else if (image.channels() == 4) {
        cvtColor(image, gray, COLOR_BGRA2GRAY);
    } else {
        throw std::invalid_argument("page " + std::to_string(pageNumber) + ": unsupported channel count " +
                                    std::to_string(image.channels()));
    }
    if (gray.depth() != CV_8U) {
        gray = to8Bit(pageNumber, gray);
    }

    debugBubbles_.clear();
    lastDebugVis_.release();

    Alignment alignment = estimator_.estimate(gray, layout_);

    std::vector<ColumnScores> columns;
    for (const auto& col : layout_.studentIdColumns) {
        ColumnScores cs;
        cs.digitIndex = col.digitIndex;
        for (const auto& s : sampleAll(gray, alignment.transform, col.bubbles)) {
            cs.scores.push_back({s.label, s.fill});
        }
        columns.push_back(cs);
    }

    std::vector<QuestionScores> questions;
    for (const auto& q : layout_.questions) {
        QuestionScores qs;
        qs.number = q.number;
        for (const auto& s : sampleAll(gray, alignment.transform, q.bubbles)) {
            qs.scores.push_back({s.label, s.fill});
        }
        questions.push_back(qs);
    }

    DecodedStudentId id = decoder_.decodeStudentId(columns);
    DecodedAnswers answers = decoder_.decodeAnswers(questions);

    ScanResult R;
    R.pageNumber = pageNumber;
    R.studentId = id.studentId;
    R.answers = answers.answers;
    R.warnings = alignment.warnings;
    R.warnings.insert(R.warnings.end(), id.warnings.begin(), id.warnings.end());
    R.warnings.insert(R.warnings.end(), answers.warnings.begin(), answers.warnings.end());

    if (debugMode_) {
        cvtColor(gray, lastDebugVis_, COLOR_GRAY2BGR);
        BubbleSampler::drawBubbleDebug(lastDebugVis_, debugBubbles_);
    }

    spdlog::debug("page {}: student {} via {}, {} warning(s)", pageNumber, R.studentId,
                  toString(alignment.method), R.warnings.size());
    return R;
}

PageOutcome SheetScanner::scanPage(int pageNumber, const Mat& image) {
    PageOutcome out;
    try {
        out.result = scanImage(pageNumber, image);
        out.ok = true;
    } catch (const cv::Exception& e) {
        out.error = e.what();
    } catch (const std::exception& e) {
        out.error = e.what();
    }
    if (!out.ok) {
        out.result.pageNumber = pageNumber;
        spdlog::warn("page {} failed: {}", pageNumber, out.error);
    }
    return out;
}

}
