#include "bubblegrade/CornerFinder.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

using namespace cv;

namespace bubblegrade {

namespace {

const double kMinWindowContrast = 40.0;

struct Blob {
    double area;
    Point2f center;
};

Mat binarizeInverse(const Mat& gray) {
    Mat th;
    GaussianBlur(gray, th, Size(5, 5), 0);
    threshold(th, th, 0, 255, THRESH_BINARY_INV | THRESH_OTSU);
    return th;
}

bool centroid(const std::vector<Point>& c, Point2f& out) {
    Moments m = moments(c);
    if (m.m00 == 0) return false;
    out = Point2f(static_cast<float>(m.m10 / m.m00), static_cast<float>(m.m01 / m.m00));
    return true;
}

std::vector<Point2f> largestCenters(std::vector<Blob>& blobs, int maxCount) {
    std::stable_sort(blobs.begin(), blobs.end(), [](const Blob& a, const Blob& b) {
        return a.area > b.area;
    });
    std::vector<Point2f> out;
    for (size_t i = 0; i < blobs.size() && static_cast<int>(i) < maxCount; ++i) {
        out.push_back(blobs[i].center);
    }
    return out;
}

} // namespace

std::vector<Point2f> CornerFinder::orderTLTRBRBL(const std::vector<Point2f>& pts) {
    if (pts.size() != 4) {
        return pts;
    }

    size_t tl = 0, br = 0, tr = 0, bl = 0;
    for (size_t i = 1; i < pts.size(); ++i) {
        float s = pts[i].x + pts[i].y;
        float d = pts[i].y - pts[i].x;
        if (s < pts[tl].x + pts[tl].y) tl = i;
        if (s > pts[br].x + pts[br].y) br = i;
        if (d < pts[tr].y - pts[tr].x) tr = i;
        if (d > pts[bl].y - pts[bl].x) bl = i;
    }

    return {pts[tl], pts[tr], pts[br], pts[bl]};
}

std::vector<Point2f> CornerFinder::findCornerSquares(const Mat& gray) const {
    double lo = 0.0, hi = 0.0;
    minMaxLoc(gray, &lo, &hi);
    if (hi - lo < kMinWindowContrast) return {};

    Mat th = binarizeInverse(gray);

    std::vector<std::vector<Point>> contours;
    findContours(th, contours, RETR_EXTERNAL, CHAIN_APPROX_SIMPLE);

    std::vector<Blob> candidates;

    for (auto& c : contours) {
        double area = contourArea(c);
        if (area < 200) continue;

        double peri = arcLength(c, true);
        std::vector<Point> approx;
        approxPolyDP(c, approx, 0.04 * peri, true);
        if (approx.size() != 4) continue;

        RotatedRect rr = minAreaRect(c);
        float shortSide = std::min(rr.size.width, rr.size.height);
        float longSide = std::max(rr.size.width, rr.size.height);
        if (shortSide <= 0.f) continue;
        if (longSide / shortSide > 1.3f) continue;

        Point2f center;
        if (!centroid(c, center)) continue;

        candidates.push_back({area, center});
    }

    return largestCenters(candidates, maxMarkers_);
}

std::vector<Point2f> CornerFinder::findCornerSquaresNear(const Mat& gray,
                                                         const std::vector<Point2f>& approxCenters,
                                                         int windowRadius) const {
    std::vector<Blob> guided;

    for (size_t i = 0; i < approxCenters.size() && static_cast<int>(i) < maxMarkers_; ++i) {
        const Point2f& a = approxCenters[i];
        int x1 = std::max(0, static_cast<int>(std::lround(a.x - windowRadius)));
        int y1 = std::max(0, static_cast<int>(std::lround(a.y - windowRadius)));
        int x2 = std::min(gray.cols, static_cast<int>(std::lround(a.x + windowRadius)));
        int y2 = std::min(gray.rows, static_cast<int>(std::lround(a.y + windowRadius)));
        if (x2 <= x1 || y2 <= y1) continue;

        Mat window = gray(Rect(x1, y1, x2 - x1, y2 - y1));

        // Blank paper: Otsu would split sensor noise into blobs
        double lo = 0.0, hi = 0.0;
        minMaxLoc(window, &lo, &hi);
        if (hi - lo < kMinWindowContrast) continue;

        Mat th = binarizeInverse(window);

        std::vector<std::vector<Point>> contours;
        findContours(th, contours, RETR_EXTERNAL, CHAIN_APPROX_SIMPLE);

        double bestArea = 0.0;
        Point2f best;
        bool found = false;
        for (auto& c : contours) {
            double area = contourArea(c);
            if (area < 50) continue;
            Point2f center;
            if (!centroid(c, center)) continue;
            if (area > bestArea) {
                bestArea = area;
                best = center + Point2f(static_cast<float>(x1), static_cast<float>(y1));
                found = true;
            }
        }

        if (found) guided.push_back({bestArea, best});
    }

    return largestCenters(guided, maxMarkers_);
}

std::optional<std::vector<Point2f>> CornerFinder::findPageBorder(const Mat& gray) const {
    Mat edged;
    GaussianBlur(gray, edged, Size(5, 5), 0);
    Canny(edged, edged, 50, 150);
    dilate(edged, edged, Mat(), Point(-1, -1), 2);
    erode(edged, edged, Mat(), Point(-1, -1), 1);

    std::vector<std::vector<Point>> contours;
    findContours(edged, contours, RETR_EXTERNAL, CHAIN_APPROX_SIMPLE);

    std::vector<double> areas(contours.size());
    std::vector<size_t> order(contours.size());
    for (size_t i = 0; i < contours.size(); ++i) {
        areas[i] = contourArea(contours[i]);
        order[i] = i;
    }
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return areas[a] > areas[b];
    });

    for (size_t idx : order) {
        if (areas[idx] < 1000) continue;
        double peri = arcLength(contours[idx], true);
        std::vector<Point> approx;
        approxPolyDP(contours[idx], approx, 0.02 * peri, true);
        if (approx.size() != 4) continue;

        std::vector<Point2f> corners;
        for (const auto& p : approx) corners.emplace_back(static_cast<float>(p.x), static_cast<float>(p.y));
        return corners;
    }
    return std::nullopt;
}

}
