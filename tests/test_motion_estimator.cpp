#include <gtest/gtest.h>
#include "motion_estimator.hpp"

namespace {

const cv::Size FRAME_SIZE(320, 240);

cv::Mat makeScene() {
    cv::Mat texture(cv::Size(420, 340), CV_8UC1);
    cv::RNG rng(1234);
    rng.fill(texture, cv::RNG::UNIFORM, 0, 256);
    cv::GaussianBlur(texture, texture, cv::Size(7, 7), 2.0);
    return texture;
}

/// Frame k of a camera pan: scene content moves by (+4k, +3k)
cv::Mat panFrame(const cv::Mat& scene, int k) {
    cv::Mat gray = scene(cv::Rect(40 - 4 * k, 40 - 3 * k, FRAME_SIZE.width, FRAME_SIZE.height)).clone();
    cv::Mat bgr;
    cv::cvtColor(gray, bgr, cv::COLOR_GRAY2BGR);
    return bgr;
}

HomographySettings alwaysRenew() {
    HomographySettings settings;
    settings.proportionThreshold = 1.1;
    return settings;
}

bool sameMatrix(const cv::Matx33d& a, const cv::Matx33d& b) {
    for (int i = 0; i < 9; i++) {
        if (a.val[i] != b.val[i]) return false;
    }
    return true;
}

}  // namespace

TEST(MotionEstimator, FirstFrameIsIdentity) {
    MotionEstimator estimator;
    EXPECT_EQ(estimator.state(), MotionEstimator::State::Uninitialized);

    cv::Mat scene = makeScene();
    cv::Mat frame = panFrame(scene, 0);
    CoordinateTransformation t = estimator.update(frame);

    EXPECT_EQ(estimator.state(), MotionEstimator::State::Active);
    EXPECT_EQ(estimator.lastUpdate().status, EstimationStatus::Initialized);
    EXPECT_FALSE(estimator.lastUpdate().fallback);
    EXPECT_TRUE(sameMatrix(t.getMatrix(), cv::Matx33d::eye()));
}

TEST(MotionEstimator, CompensatesCameraPan) {
    MotionEstimator estimator;
    cv::Mat scene = makeScene();

    cv::Mat f0 = panFrame(scene, 0);
    cv::Mat f1 = panFrame(scene, 1);
    estimator.update(f0);
    CoordinateTransformation t = estimator.update(f1);

    ASSERT_EQ(estimator.lastUpdate().status, EstimationStatus::Ok);
    cv::Point2d abs = t.relativeToAbsolute(cv::Point2d(160, 120));
    EXPECT_NEAR(abs.x, 156.0, 0.5);
    EXPECT_NEAR(abs.y, 117.0, 0.5);
}

TEST(MotionEstimator, DriftIsChainedAcrossRenewals) {
    MotionEstimator estimator(FlowSettings(), alwaysRenew());
    cv::Mat scene = makeScene();

    cv::Mat f0 = panFrame(scene, 0);
    cv::Mat f1 = panFrame(scene, 1);
    cv::Mat f2 = panFrame(scene, 2);
    estimator.update(f0);
    estimator.update(f1);
    ASSERT_TRUE(estimator.lastUpdate().referenceRenewed);

    CoordinateTransformation t = estimator.update(f2);
    ASSERT_EQ(estimator.lastUpdate().status, EstimationStatus::Ok);
    EXPECT_TRUE(estimator.lastUpdate().referenceRenewed);

    // Relative to frame 0, not to the renewed reference
    cv::Point2d abs = t.relativeToAbsolute(cv::Point2d(160, 120));
    EXPECT_NEAR(abs.x, 152.0, 0.5);
    EXPECT_NEAR(abs.y, 114.0, 0.5);
}

TEST(MotionEstimator, PersistentReferenceWithoutRenewal) {
    HomographySettings settings;
    settings.proportionThreshold = 0.0;
    MotionEstimator estimator(FlowSettings(), settings);
    cv::Mat scene = makeScene();

    cv::Mat f0 = panFrame(scene, 0);
    cv::Mat f1 = panFrame(scene, 1);
    cv::Mat f2 = panFrame(scene, 2);
    estimator.update(f0);
    estimator.update(f1);
    EXPECT_FALSE(estimator.lastUpdate().referenceRenewed);
    CoordinateTransformation t = estimator.update(f2);
    EXPECT_FALSE(estimator.lastUpdate().referenceRenewed);

    cv::Point2d abs = t.relativeToAbsolute(cv::Point2d(160, 120));
    EXPECT_NEAR(abs.x, 152.0, 0.5);
    EXPECT_NEAR(abs.y, 114.0, 0.5);
}

TEST(MotionEstimator, NoFeaturesFallsBackToPreviousTransform) {
    MotionEstimator estimator(FlowSettings(), alwaysRenew());
    cv::Mat scene = makeScene();

    cv::Mat f0 = panFrame(scene, 0);
    cv::Mat f1 = panFrame(scene, 1);
    cv::Mat f2 = panFrame(scene, 2);
    cv::Mat blocked = cv::Mat::zeros(FRAME_SIZE, CV_8UC1);

    estimator.update(f0);
    // Frame 1 becomes the reference with a mask that blocks all sampling
    CoordinateTransformation previous = estimator.update(f1, blocked);
    ASSERT_EQ(estimator.lastUpdate().status, EstimationStatus::Ok);
    ASSERT_TRUE(estimator.lastUpdate().referenceRenewed);

    CoordinateTransformation t;
    ASSERT_NO_THROW(t = estimator.update(f2));
    EXPECT_EQ(estimator.lastUpdate().status, EstimationStatus::NoCorrespondences);
    EXPECT_TRUE(estimator.lastUpdate().fallback);
    EXPECT_TRUE(sameMatrix(t.getMatrix(), previous.getMatrix()));
}

TEST(MotionEstimator, TexturelessSceneFallsBackToIdentity) {
    MotionEstimator estimator;
    cv::Mat uniform(FRAME_SIZE, CV_8UC3, cv::Scalar(90, 90, 90));
    cv::Mat next = uniform.clone();

    estimator.update(uniform);
    CoordinateTransformation t = estimator.update(next);
    EXPECT_EQ(estimator.lastUpdate().status, EstimationStatus::NoCorrespondences);
    EXPECT_TRUE(estimator.lastUpdate().fallback);
    EXPECT_TRUE(sameMatrix(t.getMatrix(), cv::Matx33d::eye()));
}

TEST(MotionEstimator, TooFewPairsFallsBackToPreviousTransform) {
    MotionEstimator estimator(FlowSettings(), alwaysRenew());
    cv::Mat scene = makeScene();

    cv::Mat f0 = panFrame(scene, 0);
    cv::Mat f1 = panFrame(scene, 1);
    cv::Mat f2 = panFrame(scene, 2);

    estimator.update(f0);
    CoordinateTransformation previous = estimator.update(f1);
    ASSERT_EQ(estimator.lastUpdate().status, EstimationStatus::Ok);

    FlowSettings sparse;
    sparse.maxPoints = 3;
    estimator.setFlowSettings(sparse);

    CoordinateTransformation t = estimator.update(f2);
    EXPECT_EQ(estimator.lastUpdate().status, EstimationStatus::InsufficientCorrespondences);
    EXPECT_TRUE(estimator.lastUpdate().fallback);
    EXPECT_TRUE(sameMatrix(t.getMatrix(), previous.getMatrix()));
    EXPECT_TRUE(sameMatrix(estimator.lastTransform().getMatrix(), previous.getMatrix()));
}

TEST(MotionEstimator, RecoversAfterTooFewPairs) {
    MotionEstimator estimator(FlowSettings(), alwaysRenew());
    cv::Mat scene = makeScene();

    cv::Mat f0 = panFrame(scene, 0);
    cv::Mat f1 = panFrame(scene, 1);
    cv::Mat f2 = panFrame(scene, 2);
    cv::Mat f3 = panFrame(scene, 3);

    estimator.update(f0);
    estimator.update(f1);

    FlowSettings sparse;
    sparse.maxPoints = 3;
    estimator.setFlowSettings(sparse);
    estimator.update(f2);
    ASSERT_TRUE(estimator.lastUpdate().fallback);
    EXPECT_TRUE(estimator.lastUpdate().referenceRenewed);

    // Frame 2 is the new reference and is re-sampled with the full budget
    estimator.setFlowSettings(FlowSettings());
    CoordinateTransformation t = estimator.update(f3);
    ASSERT_EQ(estimator.lastUpdate().status, EstimationStatus::Ok);
    EXPECT_FALSE(estimator.lastUpdate().fallback);

    // Motion during the failed frame is not observed: frame 2 inherits frame 1's transform
    cv::Point2d abs = t.relativeToAbsolute(cv::Point2d(160, 120));
    EXPECT_NEAR(abs.x, 152.0, 0.5);
    EXPECT_NEAR(abs.y, 114.0, 0.5);
}

TEST(MotionEstimator, RecoversFromBlankFirstFrame) {
    MotionEstimator estimator;
    cv::Mat scene = makeScene();
    cv::Mat black = cv::Mat::zeros(FRAME_SIZE, CV_8UC3);
    cv::Mat f0 = panFrame(scene, 0);
    cv::Mat f1 = panFrame(scene, 1);

    estimator.update(black);
    estimator.update(f0);
    EXPECT_EQ(estimator.lastUpdate().status, EstimationStatus::NoCorrespondences);
    EXPECT_TRUE(estimator.lastUpdate().fallback);

    CoordinateTransformation t = estimator.update(f1);
    ASSERT_EQ(estimator.lastUpdate().status, EstimationStatus::Ok);
    cv::Point2d abs = t.relativeToAbsolute(cv::Point2d(160, 120));
    EXPECT_NEAR(abs.x, 156.0, 0.5);
    EXPECT_NEAR(abs.y, 117.0, 0.5);
}

TEST(MotionEstimator, FailedFitFallsBackAndRecovers) {
    MotionEstimator estimator;
    cv::Mat scene = makeScene();

    cv::Mat f0 = panFrame(scene, 0);
    cv::Mat f1 = panFrame(scene, 1);
    cv::Mat f2 = panFrame(scene, 2);
    cv::Mat f3 = panFrame(scene, 3);

    estimator.update(f0);
    CoordinateTransformation previous = estimator.update(f1);
    ASSERT_EQ(estimator.lastUpdate().status, EstimationStatus::Ok);

    HomographySettings broken;
    broken.method = 1000;  // findHomography rejects unknown methods
    estimator.setHomographySettings(broken);

    CoordinateTransformation t;
    ASSERT_NO_THROW(t = estimator.update(f2));
    EXPECT_EQ(estimator.lastUpdate().status, EstimationStatus::DegenerateCorrespondences);
    EXPECT_TRUE(estimator.lastUpdate().fallback);
    EXPECT_TRUE(sameMatrix(t.getMatrix(), previous.getMatrix()));

    estimator.setHomographySettings(HomographySettings());
    estimator.update(f3);
    EXPECT_EQ(estimator.lastUpdate().status, EstimationStatus::Ok);
    EXPECT_FALSE(estimator.lastUpdate().fallback);
}

TEST(MotionEstimator, ResetStartsOver) {
    MotionEstimator estimator;
    cv::Mat scene = makeScene();
    cv::Mat f0 = panFrame(scene, 0);
    cv::Mat f1 = panFrame(scene, 1);
    estimator.update(f0);
    estimator.update(f1);

    estimator.reset();
    EXPECT_EQ(estimator.state(), MotionEstimator::State::Uninitialized);

    CoordinateTransformation t = estimator.update(f1);
    EXPECT_EQ(estimator.lastUpdate().status, EstimationStatus::Initialized);
    EXPECT_TRUE(sameMatrix(t.getMatrix(), cv::Matx33d::eye()));
}

TEST(MotionEstimator, DrawsFlowArrowsWhenEnabled) {
    MotionEstimator estimator;
    estimator.setDrawFlow(true);
    cv::Mat scene = makeScene();
    cv::Mat f0 = panFrame(scene, 0);
    cv::Mat f1 = panFrame(scene, 1);
    cv::Mat untouched = f1.clone();

    estimator.update(f0);
    estimator.update(f1);
    EXPECT_GT(cv::norm(f1, untouched, cv::NORM_L1), 0.0);
}
