#pragma once
#include <opencv2/core.hpp>
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>
#include "bubblegrade/AlignmentEstimator.hpp"
#include "bubblegrade/BubbleSampler.hpp"
#include "bubblegrade/LayoutGuide.hpp"
#include "bubblegrade/ResponseDecoder.hpp"

namespace bubblegrade {

struct ScanResult {
    int pageNumber = 0;
    std::string studentId;               // digits, or "ERROR"
    std::map<int, std::string> answers;  // question number -> "a,c" (may be empty)
    std::vector<std::string> warnings;
};

nlohmann::json toJson(const ScanResult& result);

// Result of one page: either a decoded ScanResult or the reason it failed.
struct PageOutcome {
    bool ok = false;
    ScanResult result;
    std::string error;
};

class SheetScanner {
public:
    SheetScanner(const LayoutGuide& layout, const DecoderConfig& config = DecoderConfig());

    // Full per-page pipeline. 16-bit and float pages are rescaled to 8 bits.
    // Throws std::invalid_argument on an empty image or an unsupported channel count or depth.
    ScanResult scanImage(int pageNumber, const cv::Mat& image);

    // Same as scanImage but never throws: failures come back as !ok.
    PageOutcome scanPage(int pageNumber, const cv::Mat& image);

    std::vector<int> questionNumbers() const;

    // Debug overlay of the last scanned page
    void setDebugMode(bool enabled);
    cv::Mat lastDebugVisualization() const;

private:
    std::vector<SampledBubble> sampleAll(const cv::Mat& gray, const LayoutTransform& transform,
                                         const std::vector<BubbleDef>& bubbles);

    LayoutGuide layout_;
    AlignmentEstimator estimator_;
    BubbleSampler sampler_;
    ResponseDecoder decoder_;

    bool debugMode_ = false;
    cv::Mat lastDebugVis_;
    std::vector<SampledBubble> debugBubbles_;
};

}
