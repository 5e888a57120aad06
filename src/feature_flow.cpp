/**
 * @file feature_flow.cpp
 * @brief Sparse feature sampling and pyramidal Lucas-Kanade tracking.
 */

#include "feature_flow.hpp"
#include <iostream>

namespace {

/// Convert a {0,1} (or {0,255}) occupancy mask into the 8-bit mask goodFeaturesToTrack expects
cv::Mat toSamplingMask(const cv::Mat& mask, const cv::Size& frameSize) {
    if (mask.empty()) return cv::Mat();
    if (mask.size() != frameSize) {
        std::cerr << "FeatureFlow: mask size " << mask.size() << " does not match frame "
                  << frameSize << ", ignoring mask" << std::endl;
        return cv::Mat();
    }

    cv::Mat mask8u;
    if (mask.type() == CV_8UC1) {
        mask8u = mask;
    } else {
        cv::Mat single = mask;
        if (mask.channels() > 1) {
            cv::extractChannel(mask, single, 0);
        }
        single.convertTo(mask8u, CV_8U);
    }
    return mask8u;
}

}  // namespace

/**
 * @brief Sample and track feature points.
 *
 * Algorithm:
 * 1. Reuse the supplied reference points, or sample Shi-Tomasi corners
 * 2. Track them with pyramidal Lucas-Kanade optical flow
 * 3. Keep only pairs whose status flag is set
 */
FeatureFlow sampleAndTrack(const cv::Mat& prevGray, const cv::Mat& currGray,
                           const std::vector<cv::Point2f>* prevPoints, const cv::Mat& mask,
                           const FlowSettings& settings) {
    FeatureFlow flow;

    std::vector<cv::Point2f> samples;
    if (prevPoints && !prevPoints->empty()) {
        samples = *prevPoints;
    } else {
        cv::goodFeaturesToTrack(prevGray, samples, settings.maxPoints, settings.qualityLevel,
                                settings.minDistance, toSamplingMask(mask, prevGray.size()),
                                settings.blockSize);
    }

    if (samples.empty()) return flow;

    std::vector<cv::Point2f> tracked;
    std::vector<uchar> status;
    std::vector<float> err;
    cv::calcOpticalFlowPyrLK(prevGray, currGray, samples, tracked, status, err,
                             cv::Size(settings.windowSize, settings.windowSize),
                             settings.pyramidLevels);

    flow.currPoints.reserve(samples.size());
    flow.prevPoints.reserve(samples.size());
    for (size_t i = 0; i < status.size(); i++) {
        if (!status[i]) continue;
        flow.currPoints.push_back(tracked[i]);
        flow.prevPoints.push_back(samples[i]);
    }

    return flow;
}
