#pragma once
#include <opencv2/core.hpp>
#include <optional>
#include <vector>

namespace bubblegrade {

// Contour searches for printed fiducials and the physical page outline.
class CornerFinder {
public:
    explicit CornerFinder(int maxMarkers = 4) : maxMarkers_(maxMarkers) {}

    // Square blobs over the whole image, largest first.
    std::vector<cv::Point2f> findCornerSquares(const cv::Mat& gray) const;

    // Largest blob inside a square window around each approximate centre.
    // Windows that yield nothing are skipped, so the result may be shorter than the input.
    std::vector<cv::Point2f> findCornerSquaresNear(const cv::Mat& gray,
                                                   const std::vector<cv::Point2f>& approxCenters,
                                                   int windowRadius) const;

    // Largest 4-sided edge contour, vertices in contour order.
    std::optional<std::vector<cv::Point2f>> findPageBorder(const cv::Mat& gray) const;

    // TL, TR, BR, BL from coordinate sum/difference extremes. Expects exactly 4 points.
    static std::vector<cv::Point2f> orderTLTRBRBL(const std::vector<cv::Point2f>& pts);

    int maxMarkers() const { return maxMarkers_; }

private:
    int maxMarkers_;
};

}
