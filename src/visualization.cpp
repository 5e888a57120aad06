/**
 * @file visualization.cpp
 * @brief Overlay drawing for flow, zones and paths.
 */

#include "visualization.hpp"
#include <algorithm>
#include <functional>

void drawFlowArrows(cv::Mat& frame, const std::vector<cv::Point2f>& currPoints,
                    const std::vector<cv::Point2f>& prevPoints, const cv::Scalar& color) {
    size_t n = std::min(currPoints.size(), prevPoints.size());
    for (size_t i = 0; i < n; i++) {
        cv::Point curr(static_cast<int>(currPoints[i].x), static_cast<int>(currPoints[i].y));
        cv::Point prev(static_cast<int>(prevPoints[i].x), static_cast<int>(prevPoints[i].y));
        cv::arrowedLine(frame, curr, prev, color, VisConst::FLOW_THICKNESS, cv::LINE_8, 0,
                        VisConst::FLOW_TIP_RATIO);
    }
}

/**
 * @brief Draw a zone line and its count label.
 *
 * The label sits above the line, starting at the segment's first endpoint.
 * A highlighted zone is the one-frame flash shown when a new crossing is
 * registered.
 */
void drawZone(cv::Mat& frame, const CountingZone& zone, int count, bool highlighted) {
    if (highlighted) {
        cv::line(frame, zone.start, zone.end, VisConst::FLASH_COLOR,
                 VisConst::ZONE_THICKNESS + VisConst::FLASH_EXTRA_THICKNESS);
    } else {
        cv::line(frame, zone.start, zone.end, VisConst::ZONE_COLOR, VisConst::ZONE_THICKNESS);
    }

    std::string label = (isEntry(zone.direction) ? "In: " : "Out: ") + std::to_string(count);
    cv::Point textPos(zone.start.x, zone.end.y - VisConst::COUNT_TEXT_OFFSET);
    cv::putText(frame, label, textPos, cv::FONT_HERSHEY_SIMPLEX, VisConst::COUNT_FONT_SCALE,
                VisConst::COUNT_TEXT_COLOR, VisConst::COUNT_TEXT_THICKNESS, cv::LINE_AA);
}

cv::Scalar trackColor(const TrackId& id) {
    cv::RNG rng(static_cast<uint64>(std::hash<TrackId>()(id)));
    return cv::Scalar(rng.uniform(64, 256), rng.uniform(64, 256), rng.uniform(64, 256));
}

void drawTrackedObjects(cv::Mat& frame, const std::vector<TrackedObject>& objects) {
    for (const auto& obj : objects) {
        if (obj.extent.size() < 2) continue;
        cv::Scalar color = trackColor(obj.id);
        cv::Point p1(static_cast<int>(obj.extent[0].x), static_cast<int>(obj.extent[0].y));
        cv::Point p2(static_cast<int>(obj.extent[1].x), static_cast<int>(obj.extent[1].y));
        cv::rectangle(frame, p1, p2, color, 2);
        cv::putText(frame, "#" + obj.id, cv::Point(std::min(p1.x, p2.x), std::min(p1.y, p2.y) - 10),
                    cv::FONT_HERSHEY_SIMPLEX, VisConst::ID_FONT_SCALE, color, 2);
    }
}

// ============================================================================
// AbsolutePaths
// ============================================================================

AbsolutePaths::AbsolutePaths(int maxHistory, int thickness)
    : maxHistory(maxHistory), thickness(thickness), frameIndex(0) {
}

std::vector<cv::Point2d> AbsolutePaths::getPath(const TrackId& id) const {
    auto it = histories.find(id);
    if (it == histories.end()) return {};
    return std::vector<cv::Point2d>(it->second.points.begin(), it->second.points.end());
}

/**
 * @brief Record and draw absolute paths.
 *
 * 1. Convert each object's center to absolute coordinates and append it
 * 2. Drop histories not updated for maxHistory frames
 * 3. Project each visible history back into the frame and draw it, fading
 *    older segments
 */
void AbsolutePaths::draw(cv::Mat& frame, const std::vector<TrackedObject>& objects,
                         const CoordinateTransformation& transform) {
    frameIndex++;

    for (const auto& obj : objects) {
        if (obj.extent.size() < 2) continue;
        cv::Point2d center((obj.extent[0].x + obj.extent[1].x) / 2.0,
                           (obj.extent[0].y + obj.extent[1].y) / 2.0);

        History& history = histories[obj.id];
        history.points.push_back(transform.relativeToAbsolute(center));
        if (static_cast<int>(history.points.size()) > maxHistory) {
            history.points.pop_front();
        }
        history.lastSeen = frameIndex;
    }

    for (auto it = histories.begin(); it != histories.end();) {
        if (frameIndex - it->second.lastSeen > maxHistory) {
            it = histories.erase(it);
        } else {
            ++it;
        }
    }

    for (const auto& obj : objects) {
        auto it = histories.find(obj.id);
        if (it == histories.end() || it->second.points.empty()) continue;

        std::vector<cv::Point2d> absolute(it->second.points.begin(), it->second.points.end());
        std::vector<cv::Point2d> relative = transform.absoluteToRelative(absolute);
        cv::Scalar color = trackColor(obj.id);

        for (size_t i = 1; i < relative.size(); i++) {
            // Fade older parts of the path
            double alpha = static_cast<double>(i) / relative.size();
            cv::Scalar faded(color[0] * alpha, color[1] * alpha, color[2] * alpha);
            cv::line(frame, relative[i - 1], relative[i], faded, thickness, cv::LINE_AA);
        }
        cv::circle(frame, relative.back(), VisConst::PATH_HEAD_RADIUS, color, -1);
    }
}
