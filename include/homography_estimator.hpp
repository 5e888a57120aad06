/**
 * @file homography_estimator.hpp
 * @brief Robust homography fitting with drift detection.
 *
 * Fits a planar homography between the reference frame's sample points and
 * their tracked positions in the current frame. A low inlier ratio signals
 * that the reference frame has drifted too far and should be renewed.
 * The fitted matrix is chained onto the transform accumulated since the first
 * reference frame, so absolute coordinates stay anchored to it.
 */

#pragma once

#include <string>
#include <vector>
#include <opencv2/opencv.hpp>

/// Homography fitting defaults
namespace HomographyParams {
    constexpr int MIN_CORRESPONDENCES = 4;
    constexpr double REPROJ_THRESHOLD = 3.0;
    constexpr int MAX_ITERS = 2000;
    constexpr double CONFIDENCE = 0.995;
    constexpr double PROPORTION_THRESHOLD = 0.9;
    constexpr double SINGULAR_EPSILON = 1e-12;
}

/**
 * @enum EstimationStatus
 * @brief Outcome of one motion estimation step.
 */
enum class EstimationStatus {
    Ok,                          ///< Transform fitted successfully
    Initialized,                 ///< First frame adopted as reference, identity returned
    NoCorrespondences,           ///< Optical flow produced no point pairs
    InsufficientCorrespondences, ///< Fewer than 4 pairs, or mismatched arrays
    DegenerateCorrespondences,   ///< OpenCV could not fit a matrix to the pairs
    NonInvertibleTransform       ///< Composed matrix is singular
};

/// Human-readable status name for logging
std::string toString(EstimationStatus status);

/**
 * @struct HomographySettings
 * @brief Parameters forwarded to cv::findHomography plus the renewal threshold.
 */
struct HomographySettings {
    int method = cv::RANSAC;
    double reprojThreshold = HomographyParams::REPROJ_THRESHOLD;
    int maxIters = HomographyParams::MAX_ITERS;
    double confidence = HomographyParams::CONFIDENCE;
    double proportionThreshold = HomographyParams::PROPORTION_THRESHOLD;  ///< Renew below this inlier ratio
};

/**
 * @struct HomographyEstimate
 * @brief Result of fitting and composing one homography.
 */
struct HomographyEstimate {
    EstimationStatus status = EstimationStatus::InsufficientCorrespondences;
    bool renewReference = false;   ///< Inlier ratio fell below the threshold
    cv::Matx33d transform = cv::Matx33d::eye();  ///< fitted * prior (valid only when status is Ok)
    double inlierRatio = 0.0;
    int inlierCount = 0;
    int correspondences = 0;

    bool ok() const { return status == EstimationStatus::Ok; }
};

/**
 * @class HomographyEstimator
 * @brief Stateless robust homography fitter.
 *
 * The accumulated transform is owned by the caller and passed in as the
 * prior, so the same estimator can serve any number of sessions.
 */
class HomographyEstimator {
public:
    HomographyEstimator();
    explicit HomographyEstimator(const HomographySettings& settings);

    /**
     * @brief Fit the homography mapping prevPoints onto currPoints.
     * @param currPoints Points in the current frame
     * @param prevPoints Matching points in the reference frame
     * @param prior Transform accumulated up to the reference frame, or nullptr
     * @return Estimate with status, renewal decision and composed transform
     */
    HomographyEstimate estimate(const std::vector<cv::Point2f>& currPoints,
                                const std::vector<cv::Point2f>& prevPoints,
                                const cv::Matx33d* prior) const;

    const HomographySettings& getSettings() const { return settings; }
    void setProportionThreshold(double threshold) { settings.proportionThreshold = threshold; }

private:
    HomographySettings settings;
};
