/**
 * @file visualization.hpp
 * @brief Overlay drawing: optical flow arrows, counting zones, absolute paths.
 */

#pragma once

#include <deque>
#include <map>
#include <vector>
#include <opencv2/opencv.hpp>

#include "coordinate_transformation.hpp"
#include "zone_counter.hpp"

/// Visualization constants for drawing parameters
namespace VisConst {
    // Flow arrows
    constexpr int FLOW_THICKNESS = 2;
    constexpr double FLOW_TIP_RATIO = 0.5;

    // Zone lines
    constexpr int ZONE_THICKNESS = 4;
    constexpr int FLASH_EXTRA_THICKNESS = 20;
    constexpr double COUNT_FONT_SCALE = 1.0;
    constexpr int COUNT_TEXT_THICKNESS = 2;
    constexpr int COUNT_TEXT_OFFSET = 10;  ///< Pixels above the line

    // Paths
    constexpr int PATH_HISTORY = 70;
    constexpr int PATH_THICKNESS = 2;
    constexpr int PATH_HEAD_RADIUS = 3;

    // Tracked boxes
    constexpr double ID_FONT_SCALE = 0.5;

    // Colors (BGR)
    const cv::Scalar ZONE_COLOR(0, 0, 255);
    const cv::Scalar FLASH_COLOR(0, 255, 0);
    const cv::Scalar COUNT_TEXT_COLOR(255, 0, 0);
}

/**
 * @brief Draw optical flow correspondences as arrows.
 * @param frame Frame to draw on
 * @param currPoints Tracked positions in this frame (arrow tails)
 * @param prevPoints Matching reference positions (arrow heads)
 * @param color Arrow color
 */
void drawFlowArrows(cv::Mat& frame, const std::vector<cv::Point2f>& currPoints,
                    const std::vector<cv::Point2f>& prevPoints, const cv::Scalar& color);

/**
 * @brief Draw a counting zone line with its "In"/"Out" label.
 * @param frame Frame to draw on
 * @param zone Zone geometry
 * @param count Count shown in the label
 * @param highlighted Draw in flash color with increased thickness
 */
void drawZone(cv::Mat& frame, const CountingZone& zone, int count, bool highlighted);

/// Stable per-track color derived from the id
cv::Scalar trackColor(const TrackId& id);

/**
 * @brief Draw tracked boxes with their ids.
 */
void drawTrackedObjects(cv::Mat& frame, const std::vector<TrackedObject>& objects);

/**
 * @class AbsolutePaths
 * @brief Path history kept in absolute coordinates.
 *
 * Centers are stored compensated for camera motion and projected back into
 * the current frame for drawing, so paths stay attached to the road while
 * the camera moves.
 */
class AbsolutePaths {
public:
    explicit AbsolutePaths(int maxHistory = VisConst::PATH_HISTORY,
                           int thickness = VisConst::PATH_THICKNESS);

    /**
     * @brief Record the objects of this frame and draw their paths.
     * @param frame Frame to draw on
     * @param objects Objects tracked in this frame
     * @param transform Transformation of this frame
     */
    void draw(cv::Mat& frame, const std::vector<TrackedObject>& objects,
              const CoordinateTransformation& transform);

    /// Absolute path of a track (empty if unknown)
    std::vector<cv::Point2d> getPath(const TrackId& id) const;

private:
    struct History {
        std::deque<cv::Point2d> points;  ///< Absolute coordinates
        int lastSeen = 0;
    };

    int maxHistory;
    int thickness;
    int frameIndex;
    std::map<TrackId, History> histories;
};
