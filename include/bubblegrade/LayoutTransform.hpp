#pragma once
#include <opencv2/core.hpp>
#include <vector>

namespace bubblegrade {

// Projective mapping from layout space (y flipped to top-left origin) to image pixels.
class LayoutTransform {
public:
    LayoutTransform() = default;
    LayoutTransform(const cv::Matx33d& matrix, double layoutHeight)
        : matrix_(matrix), layoutHeight_(layoutHeight) {}

    // Pure axis-aligned scale, no skew correction.
    static LayoutTransform proportional(double scaleX, double scaleY, double layoutHeight);

    // Solves the homography from 4 top-left-origin layout points to 4 image points.
    static LayoutTransform fromCorrespondences(const std::vector<cv::Point2f>& layoutPts,
                                               const std::vector<cv::Point2f>& imagePts,
                                               double layoutHeight);

    // Maps a bottom-left-origin layout point to pixel coordinates.
    cv::Point2d toImage(double x, double y) const;

    // Applies the matrix to a point already in top-left layout coordinates.
    cv::Point2d apply(const cv::Point2d& p) const;

private:
    cv::Matx33d matrix_ = cv::Matx33d::eye();
    double layoutHeight_ = 0.0;
};

}
