/**
 * @file test_bubble_sampler.cpp
 * @brief Unit tests for disc fill measurement
 */

#include <bubblegrade/BubbleSampler.hpp>

#include <gtest/gtest.h>
#include <opencv2/imgproc.hpp>

#include "support/SyntheticSheet.hpp"

using namespace bubblegrade;

TEST(BubbleSamplerTest, BlankAndSolidDiscs) {
    cv::Mat gray(100, 100, CV_8UC1, cv::Scalar(255));
    cv::circle(gray, cv::Point(70, 70), 10, cv::Scalar(0), cv::FILLED);

    EXPECT_NEAR(BubbleSampler::measureFill(gray, {30.0, 30.0}, 8.0), 0.0, 1e-9);
    EXPECT_NEAR(BubbleSampler::measureFill(gray, {70.0, 70.0}, 8.0), 1.0, 1e-9);
}

TEST(BubbleSamplerTest, FillIsInkDarkness) {
    cv::Mat gray(50, 50, CV_8UC1, cv::Scalar(102));
    // mean 102 -> 1 - 102/255 = 0.6
    EXPECT_NEAR(BubbleSampler::measureFill(gray, {25.0, 25.0}, 6.0), 0.6, 1e-9);
}

TEST(BubbleSamplerTest, DiscOutsideImageScoresZero) {
    cv::Mat gray(50, 50, CV_8UC1, cv::Scalar(0));
    EXPECT_DOUBLE_EQ(BubbleSampler::measureFill(gray, {-30.0, 25.0}, 5.0), 0.0);
    EXPECT_DOUBLE_EQ(BubbleSampler::measureFill(gray, {25.0, 200.0}, 5.0), 0.0);
    EXPECT_DOUBLE_EQ(BubbleSampler::measureFill(cv::Mat(), {0.0, 0.0}, 5.0), 0.0);
}

TEST(BubbleSamplerTest, PartiallyClippedDiscUsesVisiblePixels) {
    cv::Mat gray(50, 50, CV_8UC1, cv::Scalar(0));
    EXPECT_NEAR(BubbleSampler::measureFill(gray, {0.0, 25.0}, 6.0), 1.0, 1e-9);
}

TEST(BubbleSamplerTest, PixelRadiusFollowsTransformScale) {
    LayoutTransform t = LayoutTransform::proportional(2.0, 3.0, 100.0);
    BubbleDef b{"a", 10.0, 10.0, 4.0};
    // (8 + 12) / 2
    EXPECT_DOUBLE_EQ(BubbleSampler::estimatePixelRadius(t, b), 10.0);

    BubbleDef tiny{"b", 10.0, 10.0, 0.0};
    EXPECT_DOUBLE_EQ(BubbleSampler::estimatePixelRadius(t, tiny), 1.0);
}

TEST(BubbleSamplerTest, SamplesProjectedBubble) {
    synth::LayoutOptions opt;
    opt.withMarkers = false;
    LayoutGuide layout = synth::makeLayout(opt);
    cv::Mat img = synth::renderSheet(layout, {"", {{1, "b"}}});

    LayoutTransform t = LayoutTransform::proportional(synth::kScale, synth::kScale, synth::kHeight);
    BubbleSampler sampler;

    const auto& bubbles = layout.questions[0].bubbles;
    EXPECT_GT(sampler.sample(img, t, bubbles[1]), 0.95);
    EXPECT_LT(sampler.sample(img, t, bubbles[0]), 0.05);

    SampledBubble s = sampler.sampleBubble(img, t, bubbles[1]);
    EXPECT_EQ(s.label, "b");
    EXPECT_NEAR(s.radius, synth::kBubbleRadius * synth::kScale, 1e-9);
}

TEST(BubbleSamplerTest, DebugOverlayMarksSelectedBubbles) {
    cv::Mat canvas(60, 60, CV_8UC3, cv::Scalar(255, 255, 255));
    SampledBubble selected{"a", {20.0, 20.0}, 6.0, 0.9, true};
    SampledBubble empty{"b", {45.0, 45.0}, 6.0, 0.0, false};

    BubbleSampler::drawBubbleDebug(canvas, {selected, empty});

    // Green ring at radius + 2 around the selected bubble
    cv::Vec3b ring = canvas.at<cv::Vec3b>(20, 28);
    EXPECT_EQ(ring[1], 255);
    EXPECT_LT(ring[0], 128);
    cv::Vec3b grey = canvas.at<cv::Vec3b>(45, 51);
    EXPECT_LT(grey[0], 255);
}
