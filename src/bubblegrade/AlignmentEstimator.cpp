#include "bubblegrade/AlignmentEstimator.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

using namespace cv;

namespace bubblegrade {

namespace {

// Layout corner in top-left image orientation.
Point2f topLeftOrigin(double x, double y, double layoutHeight) {
    return Point2f(static_cast<float>(x), static_cast<float>(layoutHeight - y));
}

std::vector<Point2f> layoutRectangle(double left, double bottom, double right, double top,
                                     double layoutHeight) {
    return CornerFinder::orderTLTRBRBL({
        topLeftOrigin(left, top, layoutHeight),
        topLeftOrigin(right, top, layoutHeight),
        topLeftOrigin(right, bottom, layoutHeight),
        topLeftOrigin(left, bottom, layoutHeight)
    });
}

} // namespace

const char* toString(AlignmentMethod method) {
    switch (method) {
        case AlignmentMethod::Markers:          return "markers";
        case AlignmentMethod::GuidedMarkers:    return "guided-markers";
        case AlignmentMethod::InnerBorderFrame: return "inner-border-frame";
        case AlignmentMethod::PageBorder:       return "page-border";
        case AlignmentMethod::Proportional:     return "proportional";
    }
    return "unknown";
}

bool AlignmentEstimator::solveFromBorder(const Mat& gray, const LayoutGuide& layout, Alignment& out) const {
    auto border = finder_.findPageBorder(gray);
    if (!border) return false;

    const double imageW = gray.cols;
    const double imageH = gray.rows;
    const double H = layout.height;

    std::vector<Point2f> pageOrdered = CornerFinder::orderTLTRBRBL(*border);

    bool useFrame = false;
    const double offset = layout.margin().value_or(0.0) / 2.0;
    if (offset > 0.0) {
        float minX = pageOrdered[0].x, maxX = pageOrdered[0].x;
        float minY = pageOrdered[0].y, maxY = pageOrdered[0].y;
        for (const auto& p : pageOrdered) {
            minX = std::min(minX, p.x); maxX = std::max(maxX, p.x);
            minY = std::min(minY, p.y); maxY = std::max(maxY, p.y);
        }

        double insetX = std::max(0.0, static_cast<double>(minX)) + std::max(0.0, imageW - maxX);
        double insetY = std::max(0.0, static_cast<double>(minY)) + std::max(0.0, imageH - maxY);
        double ratioX = insetX / std::max(1.0, imageW);
        double ratioY = insetY / std::max(1.0, imageH);

        double expectedX = (2.0 * offset) / layout.width;
        double expectedY = (2.0 * offset) / layout.height;
        double tolX = std::max(0.02, expectedX * 0.6);
        double tolY = std::max(0.02, expectedY * 0.6);

        useFrame = std::abs(ratioX - expectedX) <= tolX && std::abs(ratioY - expectedY) <= tolY;
        spdlog::debug("border insets ratio=({:.3f}, {:.3f}) expected=({:.3f}, {:.3f})",
                      ratioX, ratioY, expectedX, expectedY);
    }

    std::vector<Point2f> layoutCorners;
    if (useFrame) {
        layoutCorners = layoutRectangle(offset, offset, layout.width - offset, H - offset, H);
        out.warnings.push_back("Detected inner border frame for alignment.");
        out.method = AlignmentMethod::InnerBorderFrame;
    } else {
        layoutCorners = layoutRectangle(0.0, 0.0, layout.width, H, H);
        out.warnings.push_back("Using page border for alignment.");
        out.method = AlignmentMethod::PageBorder;
    }

    out.transform = LayoutTransform::fromCorrespondences(layoutCorners, pageOrdered, H);
    return true;
}

Alignment AlignmentEstimator::estimate(const Mat& gray, const LayoutGuide& layout) const {
    Alignment R;
    const int imageW = gray.cols;
    const int imageH = gray.rows;
    const double H = layout.height;

    const auto& layoutMarkers = layout.alignmentMarkers;
    std::vector<Point2f> detected;
    if (!layoutMarkers.empty()) detected = finder_.findCornerSquares(gray);

    bool guidedUsed = false;
    if (layoutMarkers.size() == 4 && detected.size() < 4) {
        int window = static_cast<int>(std::max(imageW, imageH) * 0.12);
        double scaleX = imageW / layout.width;
        double scaleY = imageH / layout.height;

        std::vector<Point2f> approx;
        for (const auto& m : layoutMarkers) {
            approx.emplace_back(static_cast<float>(m.centerX() * scaleX),
                                static_cast<float>((H - m.centerY()) * scaleY));
        }

        auto guided = finder_.findCornerSquaresNear(gray, approx, window);
        spdlog::debug("guided marker search: {} of 4 found (window {} px)", guided.size(), window);
        if (guided.size() == 4) {
            detected = guided;
            guidedUsed = true;
        }
    }

    if (layoutMarkers.size() == 4 && detected.size() == 4) {
        std::vector<Point2f> layoutPts;
        for (const auto& m : layoutMarkers) {
            layoutPts.push_back(topLeftOrigin(m.centerX(), m.centerY(), H));
        }
        std::vector<Point2f> layoutOrdered = CornerFinder::orderTLTRBRBL(layoutPts);
        std::vector<Point2f> detectedOrdered = CornerFinder::orderTLTRBRBL(detected);

        float minX = detectedOrdered[0].x, maxX = minX;
        float minY = detectedOrdered[0].y, maxY = minY;
        for (const auto& p : detectedOrdered) {
            minX = std::min(minX, p.x); maxX = std::max(maxX, p.x);
            minY = std::min(minY, p.y); maxY = std::max(maxY, p.y);
        }

        if (maxX - minX >= imageW * 0.25 && maxY - minY >= imageH * 0.25) {
            R.transform = LayoutTransform::fromCorrespondences(layoutOrdered, detectedOrdered, H);
            if (guidedUsed) {
                R.warnings.push_back("Alignment markers recovered via guided search.");
                R.method = AlignmentMethod::GuidedMarkers;
            } else {
                R.method = AlignmentMethod::Markers;
            }
            spdlog::debug("alignment: {}", toString(R.method));
            return R;
        }
        R.warnings.push_back("Detected markers cover too small an area; using proportional mapping.");
    }

    if (solveFromBorder(gray, layout, R)) {
        spdlog::debug("alignment: {}", toString(R.method));
        return R;
    }

    if (layoutMarkers.size() < 4) {
        R.warnings.push_back("Insufficient layout markers; using proportional mapping.");
    } else if (detected.size() < 4) {
        R.warnings.push_back("Failed to detect alignment markers; using proportional mapping.");
    }

    R.transform = LayoutTransform::proportional(imageW / layout.width, imageH / layout.height, H);
    R.method = AlignmentMethod::Proportional;
    spdlog::debug("alignment: {}", toString(R.method));
    return R;
}

}
