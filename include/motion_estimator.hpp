/**
 * @file motion_estimator.hpp
 * @brief Camera motion estimation against a persistent reference frame.
 *
 * Comparing consecutive frames gives displacements too small to estimate a
 * homography reliably, so the reference frame is kept fixed as the video
 * progresses and is only replaced once the fitted homography stops matching
 * enough points. Every returned transform relates the current frame to the
 * very first reference frame.
 */

#pragma once

#include <vector>
#include <opencv2/opencv.hpp>

#include "coordinate_transformation.hpp"
#include "feature_flow.hpp"
#include "homography_estimator.hpp"

/**
 * @struct MotionUpdate
 * @brief Diagnostics of the last update() call.
 */
struct MotionUpdate {
    EstimationStatus status = EstimationStatus::Initialized;
    bool fallback = false;          ///< Previous transform returned unchanged
    bool referenceRenewed = false;  ///< Reference frame replaced during this call (also on fallback)
    int correspondences = 0;
    double inlierRatio = 0.0;
};

/**
 * @class MotionEstimator
 * @brief Per-session camera motion state machine (Uninitialized -> Active).
 *
 * Owns the reference frame, its sample points and the transform accumulated
 * over past renewals. One instance per video stream.
 */
class MotionEstimator {
public:
    enum class State { Uninitialized, Active };

    MotionEstimator();
    MotionEstimator(const FlowSettings& flowSettings, const HomographySettings& homographySettings);

    /**
     * @brief Estimate camera motion for the next frame.
     * @param frame Current frame (BGR or grayscale). Flow arrows are drawn on it when enabled
     * @param mask Optional {0,1} mask; zero pixels are not sampled for features
     * @return Transformation between this frame and absolute coordinates
     *
     * On estimation failure the previous transform is returned and lastUpdate()
     * reports the reason with fallback set. The failing frame becomes the new
     * reference so the next call starts from fresh samples.
     */
    CoordinateTransformation update(cv::Mat& frame, const cv::Mat& mask = cv::Mat());

    /// Forget the reference frame and accumulated transform
    void reset();

    State state() const { return currentState; }
    const MotionUpdate& lastUpdate() const { return lastDiagnostics; }
    const CoordinateTransformation& lastTransform() const { return previousTransform; }

    void setDrawFlow(bool enabled) { drawFlow = enabled; }
    void setFlowColor(const cv::Scalar& color) { flowColor = color; }
    void setFlowSettings(const FlowSettings& settings) { flowSettings = settings; }
    void setHomographySettings(const HomographySettings& settings) {
        homographyEstimator = HomographyEstimator(settings);
    }

private:
    /// Reference frame record; replaced as a whole on renewal
    struct ReferenceFrame {
        cv::Mat gray;
        cv::Mat mask;
        std::vector<cv::Point2f> points;  ///< Empty until sampled
    };

    CoordinateTransformation fallbackTo(EstimationStatus status, const FeatureFlow& flow,
                                        const cv::Mat& gray, const cv::Mat& mask);
    void adoptReference(const cv::Mat& gray, const cv::Mat& mask);

    FlowSettings flowSettings;
    HomographyEstimator homographyEstimator;

    State currentState;
    ReferenceFrame reference;
    cv::Matx33d accumulated;
    bool hasAccumulated;

    CoordinateTransformation previousTransform;
    MotionUpdate lastDiagnostics;

    // Debug overlay
    bool drawFlow;
    cv::Scalar flowColor;
};
