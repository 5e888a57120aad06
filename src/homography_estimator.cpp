/**
 * @file homography_estimator.cpp
 * @brief Robust homography fitting with drift detection.
 */

#include "homography_estimator.hpp"
#include <cmath>
#include <iostream>

std::string toString(EstimationStatus status) {
    switch (status) {
        case EstimationStatus::Ok: return "OK";
        case EstimationStatus::Initialized: return "INITIALIZED";
        case EstimationStatus::NoCorrespondences: return "NO_CORRESPONDENCES";
        case EstimationStatus::InsufficientCorrespondences: return "INSUFFICIENT_CORRESPONDENCES";
        case EstimationStatus::DegenerateCorrespondences: return "DEGENERATE_CORRESPONDENCES";
        case EstimationStatus::NonInvertibleTransform: return "NON_INVERTIBLE_TRANSFORM";
    }
    return "UNKNOWN";
}

HomographyEstimator::HomographyEstimator() {
}

HomographyEstimator::HomographyEstimator(const HomographySettings& settings)
    : settings(settings) {
}

/**
 * @brief Fit, measure drift, and compose.
 *
 * Algorithm:
 * 1. Reject fewer than 4 pairs
 * 2. Robust fit (RANSAC by default) with inlier mask
 * 3. inlierRatio < proportionThreshold requests a reference renewal
 * 4. Chain the fit onto the prior: result = fitted * prior
 */
HomographyEstimate HomographyEstimator::estimate(const std::vector<cv::Point2f>& currPoints,
                                                 const std::vector<cv::Point2f>& prevPoints,
                                                 const cv::Matx33d* prior) const {
    HomographyEstimate result;
    result.correspondences = static_cast<int>(currPoints.size());

    if (currPoints.size() != prevPoints.size() ||
        currPoints.size() < static_cast<size_t>(HomographyParams::MIN_CORRESPONDENCES)) {
        result.status = EstimationStatus::InsufficientCorrespondences;
        return result;
    }

    cv::Mat inlierMask;
    cv::Mat fitted;
    try {
        fitted = cv::findHomography(prevPoints, currPoints, settings.method,
                                    settings.reprojThreshold, inlierMask,
                                    settings.maxIters, settings.confidence);
    } catch (const cv::Exception& e) {
        std::cerr << "HomographyEstimator: findHomography failed: " << e.what() << std::endl;
        result.status = EstimationStatus::DegenerateCorrespondences;
        return result;
    }

    if (fitted.empty()) {
        result.status = EstimationStatus::DegenerateCorrespondences;
        return result;
    }

    result.inlierCount = inlierMask.empty() ? result.correspondences : cv::countNonZero(inlierMask);
    result.inlierRatio = static_cast<double>(result.inlierCount) / result.correspondences;
    result.renewReference = result.inlierRatio < settings.proportionThreshold;

    cv::Mat fitted64;
    fitted.convertTo(fitted64, CV_64F);
    cv::Matx33d homography(fitted64.ptr<double>());

    result.transform = prior ? homography * (*prior) : homography;

    if (std::abs(cv::determinant(result.transform)) < HomographyParams::SINGULAR_EPSILON) {
        result.status = EstimationStatus::NonInvertibleTransform;
        result.renewReference = false;
        return result;
    }

    result.status = EstimationStatus::Ok;
    return result;
}
