/**
 * @file zone_counter.cpp
 * @brief Directional vehicle counting over four configured crossing zones.
 */

#include "zone_counter.hpp"
#include "visualization.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

std::string toString(ZoneDirection direction) {
    switch (direction) {
        case ZoneDirection::LeftEntry: return "left_entry";
        case ZoneDirection::LeftExit: return "left_exit";
        case ZoneDirection::RightEntry: return "right_entry";
        case ZoneDirection::RightExit: return "right_exit";
    }
    return "unknown";
}

// ============================================================================
// CountingZone
// ============================================================================

/**
 * @brief Band test.
 *
 * Along the dominant axis the point must lie between start and end. Across
 * it, the distance to the segment's line at that position must not exceed
 * the band half-width.
 */
bool CountingZone::contains(const cv::Point& point) const {
    if (isHorizontal()) {
        if (point.x < start.x || point.x > end.x) return false;
        double t = static_cast<double>(point.x - start.x) / (end.x - start.x);
        double lineY = start.y + t * (end.y - start.y);
        return std::abs(point.y - lineY) <= bandHalfWidth;
    }

    if (point.y < start.y || point.y > end.y) return false;
    double t = static_cast<double>(point.y - start.y) / (end.y - start.y);
    double lineX = start.x + t * (end.x - start.x);
    return std::abs(point.x - lineX) <= bandHalfWidth;
}

bool validateZone(const CountingZone& zone, const cv::Size& frameSize, std::string& error) {
    const std::string name = toString(zone.direction);

    if (zone.start == zone.end) {
        error = name + ": zero-length segment";
        return false;
    }

    bool inverted = zone.isHorizontal() ? zone.end.x <= zone.start.x : zone.end.y <= zone.start.y;
    if (inverted) {
        error = name + ": start must precede end along the segment";
        return false;
    }

    if (zone.bandHalfWidth < 0) {
        error = name + ": negative band half-width";
        return false;
    }

    if (!frameSize.empty()) {
        for (const cv::Point& p : {zone.start, zone.end}) {
            if (p.x < 0 || p.x > frameSize.width || p.y < 0 || p.y > frameSize.height) {
                error = name + ": endpoint (" + std::to_string(p.x) + ", " + std::to_string(p.y) +
                        ") outside frame " + std::to_string(frameSize.width) + "x" +
                        std::to_string(frameSize.height);
                return false;
            }
        }
    }

    return true;
}

// ============================================================================
// CrossingRegistry
// ============================================================================

bool CrossingRegistry::add(ZoneDirection direction, const TrackId& id) {
    return registries[static_cast<size_t>(direction)].insert(id).second;
}

bool CrossingRegistry::contains(ZoneDirection direction, const TrackId& id) const {
    return registries[static_cast<size_t>(direction)].count(id) > 0;
}

int CrossingRegistry::count(ZoneDirection direction) const {
    return static_cast<int>(registries[static_cast<size_t>(direction)].size());
}

// ============================================================================
// ZoneCounter
// ============================================================================

ZoneCounter::ZoneCounter()
    : configured(false), rejected(0) {
}

bool ZoneCounter::init(const std::vector<CountingZone>& newZones, const cv::Size& frameSize) {
    configured = false;

    if (newZones.size() != static_cast<size_t>(ZoneParams::ZONE_COUNT)) {
        std::cerr << "ZoneCounter: expected " << ZoneParams::ZONE_COUNT << " zones, got "
                  << newZones.size() << std::endl;
        return false;
    }

    std::array<bool, ZoneParams::ZONE_COUNT> seen{};
    for (const auto& zone : newZones) {
        std::string error;
        if (!validateZone(zone, frameSize, error)) {
            std::cerr << "ZoneCounter: invalid zone " << error << std::endl;
            return false;
        }
        size_t index = static_cast<size_t>(zone.direction);
        if (seen[index]) {
            std::cerr << "ZoneCounter: duplicate zone " << toString(zone.direction) << std::endl;
            return false;
        }
        seen[index] = true;
    }

    zones = newZones;
    configured = true;
    return true;
}

/**
 * @brief Register an object against all zones.
 *
 * The object's center is the integer midpoint of its two extent corners.
 * Registration is idempotent: an id already in a zone's registry is not
 * reported again.
 */
std::vector<ZoneDirection> ZoneCounter::registerObject(const TrackId& id,
                                                       const std::vector<cv::Point2f>& extent) {
    std::vector<ZoneDirection> crossed;

    if (extent.size() < 2) {
        rejected++;
        std::cerr << "ZoneCounter: track " << id << " has " << extent.size()
                  << " extent points, skipped" << std::endl;
        return crossed;
    }

    cv::Point center(static_cast<int>((extent[0].x + extent[1].x) / 2),
                     static_cast<int>((extent[0].y + extent[1].y) / 2));

    for (const auto& zone : zones) {
        if (zone.contains(center) && registry.add(zone.direction, id)) {
            crossed.push_back(zone.direction);
        }
    }
    return crossed;
}

void ZoneCounter::render(cv::Mat& frame, const std::vector<ZoneDirection>& flashed) const {
    for (const auto& zone : zones) {
        bool highlighted = std::find(flashed.begin(), flashed.end(), zone.direction) != flashed.end();
        drawZone(frame, zone, registry.count(zone.direction), highlighted);
    }
}

cv::Mat& ZoneCounter::registerAndRender(const TrackId& id, const std::vector<cv::Point2f>& extent,
                                        cv::Mat& frame) {
    std::vector<ZoneDirection> crossed = registerObject(id, extent);
    render(frame, crossed);
    return frame;
}

void ZoneCounter::processFrame(const std::vector<TrackedObject>& objects, cv::Mat& frame) {
    std::vector<ZoneDirection> flashed;
    for (const auto& obj : objects) {
        std::vector<ZoneDirection> crossed = registerObject(obj.id, obj.extent);
        flashed.insert(flashed.end(), crossed.begin(), crossed.end());
    }
    render(frame, flashed);
}

ZoneCounts ZoneCounter::counts() const {
    ZoneCounts result;
    result.leftEntry = registry.count(ZoneDirection::LeftEntry);
    result.leftExit = registry.count(ZoneDirection::LeftExit);
    result.rightEntry = registry.count(ZoneDirection::RightEntry);
    result.rightExit = registry.count(ZoneDirection::RightExit);
    return result;
}
