/**
 * @file motion_estimator.cpp
 * @brief Camera motion estimation against a persistent reference frame.
 */

#include "motion_estimator.hpp"
#include "visualization.hpp"
#include <iostream>

MotionEstimator::MotionEstimator()
    : currentState(State::Uninitialized), accumulated(cv::Matx33d::eye()),
      hasAccumulated(false), drawFlow(false), flowColor(255, 0, 0) {
}

MotionEstimator::MotionEstimator(const FlowSettings& flowSettings,
                                 const HomographySettings& homographySettings)
    : flowSettings(flowSettings), homographyEstimator(homographySettings),
      currentState(State::Uninitialized), accumulated(cv::Matx33d::eye()),
      hasAccumulated(false), drawFlow(false), flowColor(255, 0, 0) {
}

void MotionEstimator::reset() {
    currentState = State::Uninitialized;
    reference = ReferenceFrame();
    accumulated = cv::Matx33d::eye();
    hasAccumulated = false;
    previousTransform = CoordinateTransformation::identity();
    lastDiagnostics = MotionUpdate();
}

/**
 * @brief Keep the previous transform, record why, and restart from this frame.
 *
 * The held reference produced no usable fit, so re-tracking it would fail
 * again. The current frame becomes the reference and is re-sampled on the
 * next call; the previous transform is its baseline.
 */
CoordinateTransformation MotionEstimator::fallbackTo(EstimationStatus status, const FeatureFlow& flow,
                                                     const cv::Mat& gray, const cv::Mat& mask) {
    lastDiagnostics.status = status;
    lastDiagnostics.fallback = true;
    lastDiagnostics.correspondences = static_cast<int>(flow.size());
    std::cerr << "MotionEstimator: " << toString(status) << " (" << flow.size()
              << " pairs), keeping previous transform" << std::endl;

    adoptReference(gray, mask);
    accumulated = previousTransform.getMatrix();
    hasAccumulated = true;
    lastDiagnostics.referenceRenewed = true;

    return previousTransform;
}

void MotionEstimator::adoptReference(const cv::Mat& gray, const cv::Mat& mask) {
    reference.gray = gray;
    reference.mask = mask.empty() ? cv::Mat() : mask.clone();
    reference.points.clear();
}

/**
 * @brief Process one frame.
 *
 * 1. Convert to grayscale
 * 2. First frame: adopt it as reference and return identity
 * 3. Track reference points into the frame
 * 4. Fit the homography and compose it onto the accumulated transform
 * 5. Renew the reference when the inlier ratio dropped, or after any failure
 */
CoordinateTransformation MotionEstimator::update(cv::Mat& frame, const cv::Mat& mask) {
    lastDiagnostics = MotionUpdate();

    cv::Mat gray;
    if (frame.channels() == 1) {
        gray = frame.clone();
    } else {
        cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
    }

    if (currentState == State::Uninitialized) {
        adoptReference(gray, mask);
        currentState = State::Active;
        previousTransform = CoordinateTransformation::identity();
        lastDiagnostics.status = EstimationStatus::Initialized;
        return previousTransform;
    }

    FeatureFlow flow = sampleAndTrack(reference.gray, gray, &reference.points,
                                      reference.mask, flowSettings);
    // Surviving points carry over; an empty set forces re-sampling next call
    reference.points = flow.prevPoints;

    if (drawFlow) {
        drawFlowArrows(frame, flow.currPoints, flow.prevPoints, flowColor);
    }

    if (flow.empty()) {
        return fallbackTo(EstimationStatus::NoCorrespondences, flow, gray, mask);
    }

    HomographyEstimate estimate = homographyEstimator.estimate(
        flow.currPoints, flow.prevPoints, hasAccumulated ? &accumulated : nullptr);
    lastDiagnostics.inlierRatio = estimate.inlierRatio;

    if (!estimate.ok()) {
        return fallbackTo(estimate.status, flow, gray, mask);
    }

    CoordinateTransformation transform(estimate.transform);
    if (!transform.isValid()) {
        return fallbackTo(EstimationStatus::NonInvertibleTransform, flow, gray, mask);
    }

    if (estimate.renewReference) {
        adoptReference(gray, mask);
        accumulated = estimate.transform;
        hasAccumulated = true;
        lastDiagnostics.referenceRenewed = true;
    }

    lastDiagnostics.status = EstimationStatus::Ok;
    lastDiagnostics.correspondences = estimate.correspondences;
    previousTransform = transform;
    return transform;
}
