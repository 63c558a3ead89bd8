#pragma once
#include <opencv2/core.hpp>
#include <string>
#include <vector>
#include "bubblegrade/CornerFinder.hpp"
#include "bubblegrade/LayoutGuide.hpp"
#include "bubblegrade/LayoutTransform.hpp"

namespace bubblegrade {

enum class AlignmentMethod {
    Markers,
    GuidedMarkers,
    InnerBorderFrame,
    PageBorder,
    Proportional
};

const char* toString(AlignmentMethod method);

struct Alignment {
    LayoutTransform transform;
    std::vector<std::string> warnings;
    AlignmentMethod method = AlignmentMethod::Proportional;
};

/*
  Layout -> image transform, trying in order:
  detected markers, guided marker search, page border (optionally the
  inner margin frame), plain proportional scaling. Always returns a transform.
*/
class AlignmentEstimator {
public:
    AlignmentEstimator() = default;
    explicit AlignmentEstimator(const CornerFinder& finder) : finder_(finder) {}

    Alignment estimate(const cv::Mat& gray, const LayoutGuide& layout) const;

private:
    bool solveFromBorder(const cv::Mat& gray, const LayoutGuide& layout, Alignment& out) const;

    CornerFinder finder_;
};

}
