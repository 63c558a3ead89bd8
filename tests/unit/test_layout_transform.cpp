/**
 * @file test_layout_transform.cpp
 * @brief Unit tests for the layout -> image projective mapping
 */

#include <bubblegrade/LayoutTransform.hpp>

#include <gtest/gtest.h>

using namespace bubblegrade;

TEST(LayoutTransformTest, DefaultIsIdentityWithoutFlip) {
    LayoutTransform t;
    cv::Point2d p = t.apply({12.5, 40.0});
    EXPECT_DOUBLE_EQ(p.x, 12.5);
    EXPECT_DOUBLE_EQ(p.y, 40.0);
}

TEST(LayoutTransformTest, ProportionalFlipsY) {
    LayoutTransform t = LayoutTransform::proportional(2.0, 3.0, 100.0);

    cv::Point2d bottomLeft = t.toImage(0.0, 0.0);
    EXPECT_DOUBLE_EQ(bottomLeft.x, 0.0);
    EXPECT_DOUBLE_EQ(bottomLeft.y, 300.0);

    cv::Point2d p = t.toImage(10.0, 90.0);
    EXPECT_DOUBLE_EQ(p.x, 20.0);
    EXPECT_DOUBLE_EQ(p.y, 30.0);
}

TEST(LayoutTransformTest, CorrespondencesReproduceCorners) {
    std::vector<cv::Point2f> layoutPts = {{0, 0}, {100, 0}, {100, 50}, {0, 50}};
    std::vector<cv::Point2f> imagePts = {{10, 20}, {215, 25}, {205, 130}, {5, 120}};

    LayoutTransform t = LayoutTransform::fromCorrespondences(layoutPts, imagePts, 50.0);
    for (size_t i = 0; i < 4; ++i) {
        cv::Point2d p = t.apply(cv::Point2d(layoutPts[i].x, layoutPts[i].y));
        EXPECT_NEAR(p.x, imagePts[i].x, 1e-3);
        EXPECT_NEAR(p.y, imagePts[i].y, 1e-3);
    }

    // toImage works in bottom-left coordinates: layout (0, 50) is the top-left corner
    cv::Point2d tl = t.toImage(0.0, 50.0);
    EXPECT_NEAR(tl.x, 10.0, 1e-3);
    EXPECT_NEAR(tl.y, 20.0, 1e-3);
}
