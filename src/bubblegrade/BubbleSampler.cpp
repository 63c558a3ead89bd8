#include "bubblegrade/BubbleSampler.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace bubblegrade {

double BubbleSampler::estimatePixelRadius(const LayoutTransform& transform, const BubbleDef& bubble) {
    cv::Point2d c = transform.toImage(bubble.x, bubble.y);
    cv::Point2d px = transform.toImage(bubble.x + bubble.radius, bubble.y);
    cv::Point2d py = transform.toImage(bubble.x, bubble.y + bubble.radius);

    double avg = (cv::norm(px - c) + cv::norm(py - c)) / 2.0;
    return std::max(1.0, avg);
}

double BubbleSampler::measureFill(const cv::Mat& gray, const cv::Point2d& center, double radius) {
    if (gray.empty()) return 0.0;

    const int w = gray.cols;
    const int h = gray.rows;
    const int cx = static_cast<int>(std::lround(center.x));
    const int cy = static_cast<int>(std::lround(center.y));
    const int r = std::max(1, static_cast<int>(std::lround(radius)));

    if (cx + r < 0 || cx - r > w || cy + r < 0 || cy - r > h) return 0.0;

    // Only the disc's bounding box is masked
    cv::Rect box(cx - r, cy - r, 2 * r + 1, 2 * r + 1);
    box &= cv::Rect(0, 0, w, h);
    if (box.width <= 0 || box.height <= 0) return 0.0;

    cv::Mat mask = cv::Mat::zeros(box.size(), CV_8UC1);
    cv::circle(mask, cv::Point(cx - box.x, cy - box.y), r, cv::Scalar(255), cv::FILLED);
    if (cv::countNonZero(mask) == 0) return 0.0;

    double mean = cv::mean(gray(box), mask)[0];
    return 1.0 - mean / 255.0;
}

SampledBubble BubbleSampler::sampleBubble(const cv::Mat& gray, const LayoutTransform& transform,
                                          const BubbleDef& bubble) const {
    SampledBubble s;
    s.label = bubble.label;
    s.center = transform.toImage(bubble.x, bubble.y);
    s.radius = estimatePixelRadius(transform, bubble);
    s.fill = measureFill(gray, s.center, s.radius);
    return s;
}

double BubbleSampler::sample(const cv::Mat& gray, const LayoutTransform& transform,
                             const BubbleDef& bubble) const {
    return sampleBubble(gray, transform, bubble).fill;
}

void BubbleSampler::drawBubbleDebug(cv::Mat& debugImg, const std::vector<SampledBubble>& bubbles) {
    if (debugImg.empty()) return;

    for (const auto& b : bubbles) {
        cv::Point center(static_cast<int>(std::lround(b.center.x)),
                         static_cast<int>(std::lround(b.center.y)));
        int radius = std::max(1, static_cast<int>(std::lround(b.radius)));

        if (b.selected) {
            cv::circle(debugImg, center, radius + 2, cv::Scalar(0, 255, 0), 2, cv::LINE_AA);
            std::string scoreTxt = std::to_string(static_cast<int>(b.fill * 100));
            cv::putText(debugImg, scoreTxt, center + cv::Point(radius + 4, 5),
                        cv::FONT_HERSHEY_SIMPLEX, 0.40, cv::Scalar(0, 255, 0), 1);
        } else {
            cv::circle(debugImg, center, radius, cv::Scalar(100, 100, 100), 1, cv::LINE_AA);
        }
    }
}

}
