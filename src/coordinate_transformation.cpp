/**
 * @file coordinate_transformation.cpp
 * @brief Relative/absolute coordinate conversion through a homography.
 */

#include "coordinate_transformation.hpp"

CoordinateTransformation::CoordinateTransformation()
    : matrix(cv::Matx33d::eye()), inverse(cv::Matx33d::eye()), valid(true) {
}

CoordinateTransformation::CoordinateTransformation(const cv::Matx33d& absoluteToRelative)
    : matrix(absoluteToRelative), inverse(cv::Matx33d::eye()), valid(false) {
    // cv::invert returns 0 for a singular matrix
    cv::Mat inv;
    double det = cv::invert(cv::Mat(matrix), inv, cv::DECOMP_LU);
    if (det != 0.0) {
        inverse = cv::Matx33d(inv.ptr<double>());
        valid = true;
    }
}

/// Homogenize, multiply, and divide by the homogeneous coordinate
std::vector<cv::Point2d> CoordinateTransformation::apply(const cv::Matx33d& m,
                                                         const std::vector<cv::Point2d>& points) {
    std::vector<cv::Point2d> out;
    if (points.empty()) return out;
    cv::perspectiveTransform(points, out, m);
    return out;
}

std::vector<cv::Point2d> CoordinateTransformation::relativeToAbsolute(
        const std::vector<cv::Point2d>& points) const {
    return apply(inverse, points);
}

std::vector<cv::Point2d> CoordinateTransformation::absoluteToRelative(
        const std::vector<cv::Point2d>& points) const {
    return apply(matrix, points);
}

cv::Point2d CoordinateTransformation::relativeToAbsolute(const cv::Point2d& point) const {
    return relativeToAbsolute(std::vector<cv::Point2d>{point}).front();
}

cv::Point2d CoordinateTransformation::absoluteToRelative(const cv::Point2d& point) const {
    return absoluteToRelative(std::vector<cv::Point2d>{point}).front();
}
