/**
 * @file feature_flow.hpp
 * @brief Sparse feature sampling and pyramidal Lucas-Kanade tracking.
 *
 * Samples strong corners in a reference frame and tracks them into the
 * current frame. The resulting point pairs are the motion evidence used to
 * fit the camera homography.
 */

#pragma once

#include <vector>
#include <opencv2/opencv.hpp>

/// Default sampling and tracking parameters
namespace FlowParams {
    constexpr int MAX_POINTS = 200;
    constexpr double MIN_DISTANCE = 15.0;
    constexpr int BLOCK_SIZE = 3;
    constexpr double QUALITY_LEVEL = 0.01;
    constexpr int WINDOW_SIZE = 21;
    constexpr int PYRAMID_LEVELS = 3;
}

/**
 * @struct FlowSettings
 * @brief Tunable parameters for corner sampling and optical flow.
 */
struct FlowSettings {
    int maxPoints = FlowParams::MAX_POINTS;        ///< Upper bound on sampled corners
    double minDistance = FlowParams::MIN_DISTANCE; ///< Minimum pixel distance between corners
    int blockSize = FlowParams::BLOCK_SIZE;        ///< Corner detector averaging block
    double qualityLevel = FlowParams::QUALITY_LEVEL; ///< Relative to the strongest corner
    int windowSize = FlowParams::WINDOW_SIZE;
    int pyramidLevels = FlowParams::PYRAMID_LEVELS;
};

/**
 * @struct FeatureFlow
 * @brief Paired correspondences, always of equal length (possibly empty).
 */
struct FeatureFlow {
    std::vector<cv::Point2f> currPoints;  ///< Positions in the current frame
    std::vector<cv::Point2f> prevPoints;  ///< Matching positions in the reference frame

    bool empty() const { return currPoints.empty(); }
    size_t size() const { return currPoints.size(); }
};

/**
 * @brief Sample corners in the reference frame and track them into the current one.
 * @param prevGray Reference frame in grayscale
 * @param currGray Current frame in grayscale
 * @param prevPoints Points previously sampled from prevGray, or nullptr/empty to re-sample
 * @param mask Sampling mask; zero pixels are excluded. An empty Mat disables masking
 * @param settings Sampling and tracking parameters
 * @return Correspondences whose tracking status succeeded
 *
 * A textureless scene or a fully masked frame yields an empty result. Callers
 * treat that as "no motion evidence".
 */
FeatureFlow sampleAndTrack(const cv::Mat& prevGray, const cv::Mat& currGray,
                           const std::vector<cv::Point2f>* prevPoints, const cv::Mat& mask,
                           const FlowSettings& settings = FlowSettings());
