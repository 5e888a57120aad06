/**
 * @file track_source.hpp
 * @brief Tracked objects supplied by an external tracker, read from a track file.
 *
 * The file uses the MOT-challenge text layout, one object per line:
 *   frame,id,left,top,width,height[,confidence,...]
 * Frame numbers are 1-based. Ids are kept as text ("7.0" is read as "7").
 * Extra columns are ignored; blank lines and lines starting with '#' are
 * skipped.
 */

#pragma once

#include <map>
#include <string>
#include <vector>
#include <opencv2/opencv.hpp>

#include "zone_counter.hpp"

/**
 * @class TrackSource
 * @brief Per-frame lookup of tracked objects.
 */
class TrackSource {
public:
    TrackSource();

    /**
     * @brief Load a track file.
     * @param path Path to the MOT text file
     * @return false if the file cannot be opened
     *
     * Malformed lines are skipped with a warning and counted.
     */
    bool load(const std::string& path);

    /**
     * @brief Parse one track line.
     * @param line Text line
     * @param frameNumber Receives the 1-based frame number
     * @param object Receives the id and two-corner extent
     * @return false if the line is malformed
     */
    static bool parseLine(const std::string& line, int& frameNumber, TrackedObject& object);

    /// Objects tracked in a frame (empty if none)
    std::vector<TrackedObject> objectsAt(int frameNumber) const;

    bool isLoaded() const { return loaded; }
    int lastFrame() const;
    size_t objectCount() const { return totalObjects; }
    size_t skippedLines() const { return skipped; }

private:
    std::map<int, std::vector<TrackedObject>> frames;
    bool loaded;
    size_t totalObjects;
    size_t skipped;
};

/**
 * @brief Build an occupancy mask that excludes tracked objects from feature sampling.
 * @param frameSize Frame dimensions
 * @param objects Objects of the current frame
 * @return CV_8UC1 mask, 1 for background, 0 inside tracked boxes
 */
cv::Mat buildOccupancyMask(const cv::Size& frameSize, const std::vector<TrackedObject>& objects);
