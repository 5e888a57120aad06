#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include "feature_flow.hpp"

namespace {

/// Smooth random texture with plenty of trackable corners
cv::Mat makeTexture(const cv::Size& size, uint64 seed) {
    cv::Mat texture(size, CV_8UC1);
    cv::RNG rng(seed);
    rng.fill(texture, cv::RNG::UNIFORM, 0, 256);
    cv::GaussianBlur(texture, texture, cv::Size(7, 7), 2.0);
    return texture;
}

const cv::Size FRAME_SIZE(320, 240);

}  // namespace

TEST(FeatureFlow, RecoversTranslation) {
    cv::Mat scene = makeTexture(cv::Size(400, 320), 42);
    cv::Mat prev = scene(cv::Rect(40, 40, FRAME_SIZE.width, FRAME_SIZE.height)).clone();
    // Content moves by (+4, +3) between the two crops
    cv::Mat curr = scene(cv::Rect(36, 37, FRAME_SIZE.width, FRAME_SIZE.height)).clone();

    FeatureFlow flow = sampleAndTrack(prev, curr, nullptr, cv::Mat());
    ASSERT_FALSE(flow.empty());
    ASSERT_EQ(flow.currPoints.size(), flow.prevPoints.size());
    EXPECT_LE(flow.size(), static_cast<size_t>(FlowParams::MAX_POINTS));

    size_t consistent = 0;
    for (size_t i = 0; i < flow.size(); i++) {
        cv::Point2f d = flow.currPoints[i] - flow.prevPoints[i];
        if (std::abs(d.x - 4.0f) < 0.5f && std::abs(d.y - 3.0f) < 0.5f) consistent++;
    }
    EXPECT_GE(consistent, flow.size() * 8 / 10);
}

TEST(FeatureFlow, TexturelessFrameYieldsNoPairs) {
    cv::Mat uniform(FRAME_SIZE, CV_8UC1, cv::Scalar(128));
    FeatureFlow flow = sampleAndTrack(uniform, uniform, nullptr, cv::Mat());
    EXPECT_TRUE(flow.empty());
    EXPECT_EQ(flow.size(), 0u);
}

TEST(FeatureFlow, FullyMaskedFrameYieldsNoPairs) {
    cv::Mat frame = makeTexture(FRAME_SIZE, 7);
    cv::Mat mask = cv::Mat::zeros(FRAME_SIZE, CV_8UC1);
    FeatureFlow flow = sampleAndTrack(frame, frame, nullptr, mask);
    EXPECT_TRUE(flow.empty());
}

TEST(FeatureFlow, MaskedRegionIsNotSampled) {
    cv::Mat frame = makeTexture(FRAME_SIZE, 11);
    cv::Mat mask(FRAME_SIZE, CV_8UC1, cv::Scalar(1));
    mask(cv::Rect(0, 0, FRAME_SIZE.width / 2, FRAME_SIZE.height)).setTo(cv::Scalar(0));

    FeatureFlow flow = sampleAndTrack(frame, frame, nullptr, mask);
    ASSERT_FALSE(flow.empty());
    for (const auto& p : flow.prevPoints) {
        EXPECT_GE(p.x, FRAME_SIZE.width / 2);
    }
}

TEST(FeatureFlow, MismatchedMaskIsIgnored) {
    cv::Mat frame = makeTexture(FRAME_SIZE, 13);
    cv::Mat mask = cv::Mat::zeros(cv::Size(10, 10), CV_8UC1);
    FeatureFlow flow = sampleAndTrack(frame, frame, nullptr, mask);
    EXPECT_FALSE(flow.empty());
}

TEST(FeatureFlow, RespectsMaxPoints) {
    cv::Mat frame = makeTexture(FRAME_SIZE, 17);
    FlowSettings settings;
    settings.maxPoints = 10;
    FeatureFlow flow = sampleAndTrack(frame, frame, nullptr, cv::Mat(), settings);
    EXPECT_GT(flow.size(), 0u);
    EXPECT_LE(flow.size(), 10u);
}

TEST(FeatureFlow, ReusesSuppliedPoints) {
    cv::Mat frame = makeTexture(FRAME_SIZE, 19);
    std::vector<cv::Point2f> points = {{100.0f, 80.0f}, {200.0f, 120.0f}, {150.0f, 160.0f}};

    FeatureFlow flow = sampleAndTrack(frame, frame, &points, cv::Mat());
    ASSERT_LE(flow.size(), points.size());
    for (const auto& p : flow.prevPoints) {
        EXPECT_NE(std::find(points.begin(), points.end(), p), points.end());
    }
}
