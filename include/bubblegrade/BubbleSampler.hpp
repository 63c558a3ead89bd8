#pragma once
#include <opencv2/core.hpp>
#include <string>
#include <vector>
#include "bubblegrade/LayoutGuide.hpp"
#include "bubblegrade/LayoutTransform.hpp"

namespace bubblegrade {

// One bubble after projection into the page image.
struct SampledBubble {
    std::string label;
    cv::Point2d center;
    double radius = 0.0;  // pixels
    double fill = 0.0;    // 0 = blank paper, 1 = solid ink
    bool selected = false;
};

class BubbleSampler {
public:
    // Fill score of one layout bubble on a grayscale page.
    double sample(const cv::Mat& gray, const LayoutTransform& transform, const BubbleDef& bubble) const;

    SampledBubble sampleBubble(const cv::Mat& gray, const LayoutTransform& transform,
                               const BubbleDef& bubble) const;

    // Mean of the projected distances of (x+r, y) and (x, y+r) from the projected centre.
    static double estimatePixelRadius(const LayoutTransform& transform, const BubbleDef& bubble);

    // 1 - mean/255 over a disc; 0 when the disc misses the image.
    static double measureFill(const cv::Mat& gray, const cv::Point2d& center, double radius);

    // Grey rings for every bubble, green ring and score for the selected ones.
    static void drawBubbleDebug(cv::Mat& debugImg, const std::vector<SampledBubble>& bubbles);
};

}
