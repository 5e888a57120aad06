/**
 * @file config.hpp
 * @brief Centralized configuration for all tunable parameters.
 *
 * Provides default values and runtime configuration for camera motion
 * estimation, counting zones, display options and input/output paths.
 * Can load settings from YAML config file.
 */

#pragma once

#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include <iostream>

#include "feature_flow.hpp"
#include "homography_estimator.hpp"
#include "zone_counter.hpp"

/**
 * @struct Config
 * @brief Centralized configuration for all tunable parameters.
 */
struct Config {
    // Feature sampling / optical flow
    int maxPoints = 900;              // Corners sampled per reference frame
    double minDistance = 14.0;        // Minimum distance between corners (px)
    int blockSize = FlowParams::BLOCK_SIZE;
    double qualityLevel = FlowParams::QUALITY_LEVEL;
    int flowWindowSize = FlowParams::WINDOW_SIZE;
    int flowPyramidLevels = FlowParams::PYRAMID_LEVELS;

    // Homography
    double reprojThreshold = HomographyParams::REPROJ_THRESHOLD;
    int maxIters = HomographyParams::MAX_ITERS;
    double confidence = HomographyParams::CONFIDENCE;
    double proportionThreshold = HomographyParams::PROPORTION_THRESHOLD;  // Renew reference below this

    // Motion estimator behaviour
    bool drawFlow = false;            // Draw optical flow arrows
    bool maskTrackedObjects = true;   // Exclude tracked boxes from feature sampling

    // Counting zones (camera-specific)
    std::vector<CountingZone> zones = defaultZones();

    // Display settings
    int targetFps = 30;
    bool showWindow = true;
    bool drawObjects = true;
    bool drawPaths = true;
    int pathHistory = 70;

    // Input / output
    std::string videoSource = "demo/traffic.mp4";
    std::string tracksPath = "demo/traffic_tracks.txt";
    std::string outputPath;           // Empty = do not write video

    /// Zones of the reference deployment camera
    static std::vector<CountingZone> defaultZones() {
        return {
            CountingZone(ZoneDirection::LeftEntry, cv::Point(0, 650), cv::Point(1130, 650)),
            CountingZone(ZoneDirection::LeftExit, cv::Point(0, 170), cv::Point(630, 170)),
            CountingZone(ZoneDirection::RightEntry, cv::Point(800, 260), cv::Point(1260, 260)),
            CountingZone(ZoneDirection::RightExit, cv::Point(1000, 500), cv::Point(19000, 500))
        };
    }

    /// Parse a zone direction name ("left_entry", ...)
    static bool parseDirection(const std::string& name, ZoneDirection& direction) {
        const ZoneDirection all[] = {ZoneDirection::LeftEntry, ZoneDirection::LeftExit,
                                     ZoneDirection::RightEntry, ZoneDirection::RightExit};
        for (ZoneDirection d : all) {
            if (toString(d) == name) {
                direction = d;
                return true;
            }
        }
        return false;
    }

    FlowSettings flowSettings() const {
        FlowSettings settings;
        settings.maxPoints = maxPoints;
        settings.minDistance = minDistance;
        settings.blockSize = blockSize;
        settings.qualityLevel = qualityLevel;
        settings.windowSize = flowWindowSize;
        settings.pyramidLevels = flowPyramidLevels;
        return settings;
    }

    HomographySettings homographySettings() const {
        HomographySettings settings;
        settings.reprojThreshold = reprojThreshold;
        settings.maxIters = maxIters;
        settings.confidence = confidence;
        settings.proportionThreshold = proportionThreshold;
        return settings;
    }

    // Load configuration from YAML file (OpenCV YAML requires %YAML:1.0 header)
    bool loadFromFile(const std::string& configPath) {
        cv::FileStorage fs;
        try {
            fs.open(configPath, cv::FileStorage::READ);
        } catch (const cv::Exception&) {
            std::cerr << "Warning: Invalid config file: " << configPath << std::endl;
            return false;
        }
        if (!fs.isOpened()) {
            std::cerr << "Warning: Could not open config file: " << configPath << std::endl;
            return false;
        }

        std::cout << "Loading config from: " << configPath << std::endl;

        // Optical flow settings
        if (!fs["flow"].empty()) {
            cv::FileNode flow = fs["flow"];
            if (!flow["max_points"].empty()) flow["max_points"] >> maxPoints;
            if (!flow["min_distance"].empty()) flow["min_distance"] >> minDistance;
            if (!flow["block_size"].empty()) flow["block_size"] >> blockSize;
            if (!flow["quality_level"].empty()) flow["quality_level"] >> qualityLevel;
            if (!flow["window_size"].empty()) flow["window_size"] >> flowWindowSize;
            if (!flow["pyramid_levels"].empty()) flow["pyramid_levels"] >> flowPyramidLevels;
        }

        // Homography settings
        if (!fs["homography"].empty()) {
            cv::FileNode homography = fs["homography"];
            if (!homography["reproj_threshold"].empty()) homography["reproj_threshold"] >> reprojThreshold;
            if (!homography["max_iters"].empty()) homography["max_iters"] >> maxIters;
            if (!homography["confidence"].empty()) homography["confidence"] >> confidence;
            if (!homography["proportion_threshold"].empty()) homography["proportion_threshold"] >> proportionThreshold;
        }

        // Motion estimator behaviour
        if (!fs["motion"].empty()) {
            cv::FileNode motion = fs["motion"];
            if (!motion["draw_flow"].empty()) motion["draw_flow"] >> drawFlow;
            if (!motion["mask_tracked_objects"].empty()) motion["mask_tracked_objects"] >> maskTrackedObjects;
        }

        // Zones: a present section replaces all defaults
        if (!fs["zones"].empty()) {
            cv::FileNode zoneList = fs["zones"];
            zones.clear();
            for (auto it = zoneList.begin(); it != zoneList.end(); ++it) {
                cv::FileNode node = *it;
                std::string name;
                node["direction"] >> name;

                ZoneDirection direction;
                if (!parseDirection(name, direction)) {
                    std::cerr << "Warning: Unknown zone direction '" << name << "', zone ignored" << std::endl;
                    continue;
                }

                std::vector<int> start, end;
                if (!node["start"].empty()) node["start"] >> start;
                if (!node["end"].empty()) node["end"] >> end;
                if (start.size() != 2 || end.size() != 2) {
                    std::cerr << "Warning: Zone " << name << " needs [x, y] start and end, zone ignored" << std::endl;
                    continue;
                }

                int band = ZoneParams::BAND_HALF_WIDTH;
                if (!node["band"].empty()) node["band"] >> band;

                zones.emplace_back(direction, cv::Point(start[0], start[1]), cv::Point(end[0], end[1]), band);
            }
        }

        // Display settings
        if (!fs["display"].empty()) {
            cv::FileNode display = fs["display"];
            if (!display["target_fps"].empty()) display["target_fps"] >> targetFps;
            if (!display["show_window"].empty()) display["show_window"] >> showWindow;
            if (!display["draw_objects"].empty()) display["draw_objects"] >> drawObjects;
            if (!display["draw_paths"].empty()) display["draw_paths"] >> drawPaths;
            if (!display["path_history"].empty()) display["path_history"] >> pathHistory;
        }

        // Input / output
        if (!fs["io"].empty()) {
            cv::FileNode io = fs["io"];
            if (!io["video"].empty()) io["video"] >> videoSource;
            if (!io["tracks"].empty()) io["tracks"] >> tracksPath;
            if (!io["output"].empty()) io["output"] >> outputPath;
        }

        fs.release();
        return true;
    }

    /**
     * @brief Override io paths from positional arguments.
     * @return false when help was requested
     *
     * Arguments are [video_source] [tracks_file] [output_video]; missing ones
     * keep the configured values.
     */
    bool applyCommandLine(int argc, char** argv) {
        if (argc > 1) {
            std::string first = argv[1];
            if (first == "-h" || first == "--help") return false;
            videoSource = first;
        }
        if (argc > 2) tracksPath = argv[2];
        if (argc > 3) outputPath = argv[3];
        return true;
    }

    // Print current configuration
    void print() const {
        std::cout << "=== TrafficCounter Configuration ===" << std::endl;
        std::cout << "Flow:" << std::endl;
        std::cout << "  max_points: " << maxPoints << std::endl;
        std::cout << "  min_distance: " << minDistance << std::endl;
        std::cout << "  quality_level: " << qualityLevel << std::endl;
        std::cout << "Homography:" << std::endl;
        std::cout << "  reproj_threshold: " << reprojThreshold << std::endl;
        std::cout << "  proportion_threshold: " << proportionThreshold << std::endl;
        std::cout << "Motion:" << std::endl;
        std::cout << "  draw_flow: " << (drawFlow ? "yes" : "no") << std::endl;
        std::cout << "  mask_tracked_objects: " << (maskTrackedObjects ? "yes" : "no") << std::endl;
        std::cout << "Zones:" << std::endl;
        for (const auto& zone : zones) {
            std::cout << "  " << toString(zone.direction) << ": " << zone.start << " -> " << zone.end
                      << " (band " << zone.bandHalfWidth << ")" << std::endl;
        }
        std::cout << "Display:" << std::endl;
        std::cout << "  target_fps: " << targetFps << std::endl;
        std::cout << "  draw_paths: " << (drawPaths ? "yes" : "no") << std::endl;
        std::cout << "IO:" << std::endl;
        std::cout << "  video: " << videoSource << std::endl;
        std::cout << "  tracks: " << tracksPath << std::endl;
        std::cout << "  output: " << (outputPath.empty() ? "(none)" : outputPath) << std::endl;
        std::cout << "====================================" << std::endl;
    }
};
