/**
 * @file coordinate_transformation.hpp
 * @brief Conversion between relative (current frame) and absolute (reference) coordinates.
 *
 * Relative coordinates are pixel positions in the current frame. Absolute
 * coordinates are positions in the fixed space of the first reference frame,
 * with accumulated camera motion compensated.
 */

#pragma once

#include <vector>
#include <opencv2/opencv.hpp>

/**
 * @class CoordinateTransformation
 * @brief Homography wrapper with a precomputed inverse.
 *
 * The wrapped matrix maps absolute coordinates to relative ones (the direction
 * in which the homography is fitted, reference frame to current frame).
 * relativeToAbsolute() therefore applies the inverse.
 */
class CoordinateTransformation {
public:
    /// Identity transform (no camera motion observed)
    CoordinateTransformation();

    /// Wrap a transform; a singular matrix leaves the object invalid
    explicit CoordinateTransformation(const cv::Matx33d& absoluteToRelative);

    static CoordinateTransformation identity() { return CoordinateTransformation(); }

    bool isValid() const { return valid; }

    std::vector<cv::Point2d> relativeToAbsolute(const std::vector<cv::Point2d>& points) const;
    std::vector<cv::Point2d> absoluteToRelative(const std::vector<cv::Point2d>& points) const;

    cv::Point2d relativeToAbsolute(const cv::Point2d& point) const;
    cv::Point2d absoluteToRelative(const cv::Point2d& point) const;

    const cv::Matx33d& getMatrix() const { return matrix; }
    const cv::Matx33d& getInverse() const { return inverse; }

private:
    static std::vector<cv::Point2d> apply(const cv::Matx33d& m, const std::vector<cv::Point2d>& points);

    cv::Matx33d matrix;   ///< absolute -> relative
    cv::Matx33d inverse;  ///< relative -> absolute
    bool valid;
};
