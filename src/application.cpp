/**
 * @file application.cpp
 * @brief Implementation of the main Application class.
 *
 * Handles video capture, per-frame motion estimation, zone counting and
 * rendering for one processing session.
 */

#include "application.hpp"
#include <algorithm>
#include <iostream>

// ============================================================================
// Constructor / Destructor
// ============================================================================

Application::Application()
    : running(false), paused(false), frameCount(0), fallbackCount(0),
      renewalCount(0), targetFps(30), actualFps(0) {
}

Application::~Application() {
    writer.release();
    cap.release();
    if (config.showWindow) {
        cv::destroyAllWindows();
    }
}

// ============================================================================
// Initialization
// ============================================================================

/**
 * @brief Initialize the application.
 * @param argc Command line argument count
 * @param argv Command line arguments: [video_source] [tracks_file] [output_video]
 * @return true if initialization successful, false otherwise
 *
 * Missing arguments keep the values from the config file (io section).
 * Zone validation happens here, against the real frame size; a malformed
 * zone aborts the session before any frame is processed.
 */
bool Application::init(int argc, char** argv) {
    // Look for config in common locations
    std::vector<std::string> configPaths = {
        "config/traffic_counter.yaml",
        "../config/traffic_counter.yaml",
        "traffic_counter.yaml"
    };

    for (const auto& path : configPaths) {
        if (config.loadFromFile(path)) {
            break;
        }
    }

    // Parse command line arguments (override config)
    if (!config.applyCommandLine(argc, argv)) {
        std::cout << "Usage: " << argv[0] << " [video_source] [tracks_file] [output_video]" << std::endl;
        std::cout << "  video_source: path to video file or '0' for webcam (default: io.video)" << std::endl;
        std::cout << "  tracks_file: tracker output, one 'frame,id,left,top,width,height' per line"
                  << " (default: io.tracks)" << std::endl;
        return false;
    }

    targetFps = config.targetFps;
    config.print();

    // Open video
    if (config.videoSource == "0") {
        cap.open(0);
    } else {
        cap.open(config.videoSource);
    }

    if (!cap.isOpened()) {
        std::cerr << "Error: Cannot open video source: " << config.videoSource << std::endl;
        return false;
    }

    if (!trackSource.load(config.tracksPath)) {
        return false;
    }

    cv::Size frameSize(static_cast<int>(cap.get(cv::CAP_PROP_FRAME_WIDTH)),
                       static_cast<int>(cap.get(cv::CAP_PROP_FRAME_HEIGHT)));

    if (!zoneCounter.init(config.zones, frameSize)) {
        std::cerr << "Error: Zone configuration rejected for " << frameSize.width << "x"
                  << frameSize.height << " video" << std::endl;
        return false;
    }

    motionEstimator = MotionEstimator(config.flowSettings(), config.homographySettings());
    motionEstimator.setDrawFlow(config.drawFlow);
    pathDrawer = AbsolutePaths(config.pathHistory);

    if (!config.outputPath.empty()) {
        double fps = cap.get(cv::CAP_PROP_FPS);
        if (fps <= 0) fps = config.targetFps;
        writer.open(config.outputPath, cv::VideoWriter::fourcc('m', 'p', '4', 'v'), fps, frameSize);
        if (!writer.isOpened()) {
            std::cerr << "Error: Cannot open output video: " << config.outputPath << std::endl;
            return false;
        }
        std::cout << "Writing annotated video to: " << config.outputPath << std::endl;
    }

    if (config.showWindow) {
        std::cout << "Controls: 'q' quit, SPACE pause, 'f' flow arrows, 'p' paths, +/- fps" << std::endl;
    }

    running = true;
    return true;
}

// ============================================================================
// Main Loop
// ============================================================================

/**
 * @brief Main application loop.
 * @return Exit code (0 for success)
 *
 * Runs the capture-process-render loop until the user quits or the video
 * ends, then prints the final counts.
 */
int Application::run() {
    while (running) {
        if (!paused) {
            cap >> frame;
            if (frame.empty()) {
                std::cout << "End of video" << std::endl;
                break;
            }
            processFrame();
            if (writer.isOpened()) {
                writer.write(frame);
            }
        }

        if (config.showWindow) {
            render();
            int delay = 1000 / targetFps;
            char key = static_cast<char>(cv::waitKey(delay));
            handleInput(key);
        }
    }

    printSummary();
    return 0;
}

/**
 * @brief Process a single frame.
 *
 * 1. Look up the tracker's objects for this frame
 * 2. Estimate camera motion, masking out tracked objects
 * 3. Draw objects and absolute paths
 * 4. Register zone crossings and draw the zone overlay
 */
void Application::processFrame() {
    double timer = cv::getTickCount();
    frameCount++;

    currentObjects = trackSource.objectsAt(frameCount);

    cv::Mat mask;
    if (config.maskTrackedObjects) {
        mask = buildOccupancyMask(frame.size(), currentObjects);
    }

    currentTransform = motionEstimator.update(frame, mask);
    const MotionUpdate& motion = motionEstimator.lastUpdate();
    if (motion.fallback) fallbackCount++;
    if (motion.referenceRenewed) renewalCount++;

    if (config.drawObjects) {
        drawTrackedObjects(frame, currentObjects);
    }
    if (config.drawPaths) {
        pathDrawer.draw(frame, currentObjects, currentTransform);
    }

    zoneCounter.processFrame(currentObjects, frame);

    actualFps = cv::getTickFrequency() / (cv::getTickCount() - timer);

    std::string statusText = "Frame " + std::to_string(frameCount) +
                             " | Objects: " + std::to_string(currentObjects.size()) +
                             " | Motion: " + toString(motion.status);
    cv::putText(frame, statusText, cv::Point(20, 30),
                cv::FONT_HERSHEY_SIMPLEX, 0.6, cv::Scalar(255, 255, 0), 2);
}

// ============================================================================
// Rendering
// ============================================================================

void Application::render() {
    if (frame.empty()) return;

    cv::Mat display = frame.clone();
    std::string fpsText = "FPS: " + std::to_string(targetFps) +
                          " (processing: " + std::to_string(static_cast<int>(actualFps)) + ")";
    cv::putText(display, fpsText, cv::Point(20, 55),
                cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(255, 100, 0), 1);

    if (paused) {
        cv::putText(display, "PAUSED", cv::Point(20, 80),
                    cv::FONT_HERSHEY_SIMPLEX, 0.8, cv::Scalar(0, 165, 255), 2);
    }

    cv::imshow(WINDOW_NAME, display);
}

// ============================================================================
// Input Handling
// ============================================================================

/**
 * @brief Handle keyboard input.
 * @param key Pressed key character
 *
 * Controls:
 * - q/ESC: Quit
 * - SPACE: Pause/resume
 * - f: Toggle optical flow arrows
 * - p: Toggle path history
 * - +/-: Adjust target FPS
 */
void Application::handleInput(char key) {
    switch (key) {
        case 'q':
        case 27:  // ESC
            running = false;
            break;

        case ' ':
            paused = !paused;
            std::cout << (paused ? "Paused" : "Resumed") << std::endl;
            break;

        case 'f':
            config.drawFlow = !config.drawFlow;
            motionEstimator.setDrawFlow(config.drawFlow);
            std::cout << "Flow arrows: " << (config.drawFlow ? "ON" : "OFF") << std::endl;
            break;

        case 'p':
            config.drawPaths = !config.drawPaths;
            std::cout << "Paths: " << (config.drawPaths ? "ON" : "OFF") << std::endl;
            break;

        case '+':
        case '=':
            targetFps = std::min(targetFps + 5, MAX_FPS);
            std::cout << "Target FPS: " << targetFps << std::endl;
            break;

        case '-':
        case '_':
            targetFps = std::max(targetFps - 5, MIN_FPS);
            std::cout << "Target FPS: " << targetFps << std::endl;
            break;
    }
}

void Application::printSummary() const {
    ZoneCounts counts = zoneCounter.counts();
    std::cout << "=== Counts after " << frameCount << " frames ===" << std::endl;
    std::cout << "  left entry:  " << counts.leftEntry << std::endl;
    std::cout << "  left exit:   " << counts.leftExit << std::endl;
    std::cout << "  right entry: " << counts.rightEntry << std::endl;
    std::cout << "  right exit:  " << counts.rightExit << std::endl;
    std::cout << "Motion fallbacks: " << fallbackCount << ", reference renewals: " << renewalCount << std::endl;
    if (zoneCounter.rejectedObjects() > 0) {
        std::cout << "Rejected tracked objects: " << zoneCounter.rejectedObjects() << std::endl;
    }
}
