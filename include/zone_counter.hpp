/**
 * @file zone_counter.hpp
 * @brief Directional vehicle counting over four configured crossing zones.
 *
 * Each zone is a line segment with a narrow band perpendicular to its
 * dominant orientation. A tracked object whose center falls inside the band
 * is registered once per zone for the whole session; the zone's count is the
 * number of distinct registered track ids.
 */

#pragma once

#include <array>
#include <cstdlib>
#include <string>
#include <unordered_set>
#include <vector>
#include <opencv2/opencv.hpp>

/// Identifier assigned by the external tracker
using TrackId = std::string;

/// Zone counting defaults
namespace ZoneParams {
    constexpr int ZONE_COUNT = 4;
    constexpr int BAND_HALF_WIDTH = 1;  ///< Pixels on each side of the line
}

/**
 * @enum ZoneDirection
 * @brief Which lane side and crossing direction a zone counts.
 */
enum class ZoneDirection {
    LeftEntry = 0,
    LeftExit = 1,
    RightEntry = 2,
    RightExit = 3
};

std::string toString(ZoneDirection direction);

/// True for entry zones (labelled "In"), false for exit zones ("Out")
inline bool isEntry(ZoneDirection direction) {
    return direction == ZoneDirection::LeftEntry || direction == ZoneDirection::RightEntry;
}

/**
 * @struct CountingZone
 * @brief Immutable zone geometry.
 *
 * start must precede end along the segment's dominant axis (x for
 * horizontal-ish segments, y for vertical-ish ones).
 */
struct CountingZone {
    ZoneDirection direction;
    cv::Point start;
    cv::Point end;
    int bandHalfWidth = ZoneParams::BAND_HALF_WIDTH;

    CountingZone() : direction(ZoneDirection::LeftEntry) {}
    CountingZone(ZoneDirection direction, cv::Point start, cv::Point end,
                 int bandHalfWidth = ZoneParams::BAND_HALF_WIDTH)
        : direction(direction), start(start), end(end), bandHalfWidth(bandHalfWidth) {}

    bool isHorizontal() const { return std::abs(end.x - start.x) >= std::abs(end.y - start.y); }

    /// Whether a point lies within the segment's span and inside the band
    bool contains(const cv::Point& point) const;
};

/**
 * @brief Validate zone geometry once, at configuration time.
 * @param zone Zone to check
 * @param frameSize Frame dimensions; an empty size skips the bounds check
 * @param error Receives a description of the problem
 * @return true if the zone is usable
 */
bool validateZone(const CountingZone& zone, const cv::Size& frameSize, std::string& error);

/**
 * @struct ZoneCounts
 * @brief Snapshot of the four running counts.
 */
struct ZoneCounts {
    int leftEntry = 0;
    int leftExit = 0;
    int rightEntry = 0;
    int rightExit = 0;
};

/**
 * @struct TrackedObject
 * @brief One object reported by the external tracker for the current frame.
 */
struct TrackedObject {
    TrackId id;
    std::vector<cv::Point2f> extent;  ///< Two opposite bounding-box corners
};

/**
 * @class CrossingRegistry
 * @brief Add-only sets of track ids, one per zone, for one processing session.
 */
class CrossingRegistry {
public:
    /// Insert id; returns true when it was not registered yet
    bool add(ZoneDirection direction, const TrackId& id);
    bool contains(ZoneDirection direction, const TrackId& id) const;
    int count(ZoneDirection direction) const;

private:
    std::array<std::unordered_set<TrackId>, ZoneParams::ZONE_COUNT> registries;
};

/**
 * @class ZoneCounter
 * @brief Evaluates tracked objects against the zones and renders the overlay.
 *
 * Not shareable between sessions: each video stream owns its own counter.
 */
class ZoneCounter {
public:
    ZoneCounter();

    /**
     * @brief Configure and validate the four zones.
     * @param zones One zone per ZoneDirection
     * @param frameSize Frame dimensions used for bounds validation (empty to skip)
     * @return false if any zone is malformed; the counter stays unconfigured
     */
    bool init(const std::vector<CountingZone>& zones, const cv::Size& frameSize = cv::Size());

    bool isConfigured() const { return configured; }

    /**
     * @brief Register a tracked object against every zone.
     * @param id Track identifier
     * @param extent Two bounding corners; fewer points reject the object for this frame
     * @return Zones this id crossed for the first time
     */
    std::vector<ZoneDirection> registerObject(const TrackId& id, const std::vector<cv::Point2f>& extent);

    /**
     * @brief Draw zone lines and counts.
     * @param frame Frame to draw on
     * @param flashed Zones newly crossed in this frame, drawn highlighted
     */
    void render(cv::Mat& frame, const std::vector<ZoneDirection>& flashed = {}) const;

    /// Register one object and draw the overlay
    cv::Mat& registerAndRender(const TrackId& id, const std::vector<cv::Point2f>& extent, cv::Mat& frame);

    /// Register all objects of a frame, then draw the overlay once
    void processFrame(const std::vector<TrackedObject>& objects, cv::Mat& frame);

    int count(ZoneDirection direction) const { return registry.count(direction); }
    ZoneCounts counts() const;
    int rejectedObjects() const { return rejected; }

    const std::vector<CountingZone>& getZones() const { return zones; }
    const CrossingRegistry& getRegistry() const { return registry; }

private:
    std::vector<CountingZone> zones;
    CrossingRegistry registry;
    bool configured;
    int rejected;
};
