#include "bubblegrade/LayoutTransform.hpp"
#include <opencv2/imgproc.hpp>

namespace bubblegrade {

LayoutTransform LayoutTransform::proportional(double scaleX, double scaleY, double layoutHeight) {
    cv::Matx33d m(scaleX, 0.0,    0.0,
                  0.0,    scaleY, 0.0,
                  0.0,    0.0,    1.0);
    return LayoutTransform(m, layoutHeight);
}

LayoutTransform LayoutTransform::fromCorrespondences(const std::vector<cv::Point2f>& layoutPts,
                                                     const std::vector<cv::Point2f>& imagePts,
                                                     double layoutHeight) {
    cv::Mat H = cv::getPerspectiveTransform(layoutPts, imagePts);
    cv::Mat H64;
    H.convertTo(H64, CV_64F);

    cv::Matx33d m;
    for (int r = 0; r < 3; ++r)
        for (int c = 0; c < 3; ++c)
            m(r, c) = H64.at<double>(r, c);
    return LayoutTransform(m, layoutHeight);
}

cv::Point2d LayoutTransform::apply(const cv::Point2d& p) const {
    const cv::Matx33d& H = matrix_;
    double w = H(2, 0) * p.x + H(2, 1) * p.y + H(2, 2);
    if (w == 0.0) w = 1e-12;
    return {
        (H(0, 0) * p.x + H(0, 1) * p.y + H(0, 2)) / w,
        (H(1, 0) * p.x + H(1, 1) * p.y + H(1, 2)) / w
    };
}

cv::Point2d LayoutTransform::toImage(double x, double y) const {
    return apply(cv::Point2d(x, layoutHeight_ - y));
}

}
