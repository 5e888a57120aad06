/**
 * @file application.hpp
 * @brief Main application class for the TrafficCounter vehicle counting system.
 *
 * Runs one processing session over a video: camera motion is estimated for
 * every frame, the external tracker's objects for that frame are counted
 * against the configured zones, and the annotated frame is shown and/or
 * written to disk. Frames are processed strictly in order on one thread.
 */

#pragma once

#include <string>
#include <vector>
#include <opencv2/opencv.hpp>

#include "config.hpp"
#include "coordinate_transformation.hpp"
#include "motion_estimator.hpp"
#include "track_source.hpp"
#include "visualization.hpp"
#include "zone_counter.hpp"

/**
 * @class Application
 * @brief Main application controller for one video processing session.
 *
 * Owns the session state (motion estimator, zone counter, path history);
 * a second video needs a second Application.
 */
class Application {
public:
    Application();
    ~Application();

    bool init(int argc, char** argv);
    int run();

    const ZoneCounter& getZoneCounter() const { return zoneCounter; }

private:
    void processFrame();
    void render();
    void handleInput(char key);
    void printSummary() const;

    // Video
    cv::VideoCapture cap;
    cv::VideoWriter writer;
    cv::Mat frame;

    // Configuration and external tracker output
    Config config;
    TrackSource trackSource;
    std::vector<TrackedObject> currentObjects;

    // Session state
    MotionEstimator motionEstimator;
    ZoneCounter zoneCounter;
    AbsolutePaths pathDrawer;
    CoordinateTransformation currentTransform;

    // State
    bool running;
    bool paused;
    int frameCount;
    int fallbackCount;
    int renewalCount;
    int targetFps;
    double actualFps;

    static constexpr int MIN_FPS = 1;
    static constexpr int MAX_FPS = 120;
    static constexpr const char* WINDOW_NAME = "TrafficCounter";
};
