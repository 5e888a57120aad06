/**
 * @file track_source.cpp
 * @brief MOT-format track file reader and occupancy mask builder.
 */

#include "track_source.hpp"
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>

namespace {

/**
 * @brief Track id text with surrounding whitespace removed.
 *
 * Ids are opaque. Trackers that write integer ids as floats ("7.0") get the
 * zero fraction stripped so the id matches its integer spelling; any other
 * text, "7.5" or "car-1" included, is kept as written.
 */
std::string normalizeTrackId(const std::string& field) {
    const char* whitespace = " \t";
    size_t first = field.find_first_not_of(whitespace);
    if (first == std::string::npos) return std::string();
    size_t last = field.find_last_not_of(whitespace);
    std::string id = field.substr(first, last - first + 1);

    size_t dot = id.find('.');
    if (dot == std::string::npos || dot == 0) return id;
    bool zeroFraction = id.find_first_not_of('0', dot + 1) == std::string::npos;
    size_t digitsStart = (id[0] == '-' || id[0] == '+') ? 1 : 0;
    bool integerPart = dot > digitsStart &&
        id.find_first_not_of("0123456789", digitsStart) == dot;
    if (zeroFraction && integerPart) {
        id.erase(dot);
    }
    return id;
}

}  // namespace

TrackSource::TrackSource()
    : loaded(false), totalObjects(0), skipped(0) {
}

bool TrackSource::parseLine(const std::string& line, int& frameNumber, TrackedObject& object) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        fields.push_back(field);
    }
    if (fields.size() < 6) return false;

    try {
        frameNumber = std::stoi(fields[0]);
        float left = std::stof(fields[2]);
        float top = std::stof(fields[3]);
        float width = std::stof(fields[4]);
        float height = std::stof(fields[5]);

        if (frameNumber < 1) return false;
        if (!std::isfinite(left) || !std::isfinite(top) ||
            !std::isfinite(width) || !std::isfinite(height)) return false;
        if (width < 0 || height < 0) return false;

        object.id = normalizeTrackId(fields[1]);
        if (object.id.empty()) return false;
        object.extent = {cv::Point2f(left, top), cv::Point2f(left + width, top + height)};
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

bool TrackSource::load(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        std::cerr << "TrackSource: Cannot open track file: " << path << std::endl;
        return false;
    }

    frames.clear();
    totalObjects = 0;
    skipped = 0;

    std::string line;
    int lineNumber = 0;
    while (std::getline(ifs, line)) {
        lineNumber++;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;

        int frameNumber = 0;
        TrackedObject object;
        if (!parseLine(line, frameNumber, object)) {
            std::cerr << "TrackSource: skipping malformed line " << lineNumber << ": " << line << std::endl;
            skipped++;
            continue;
        }
        frames[frameNumber].push_back(object);
        totalObjects++;
    }

    loaded = true;
    std::cout << "Track file loaded: " << path << " (" << totalObjects << " objects, "
              << frames.size() << " frames)" << std::endl;
    return true;
}

std::vector<TrackedObject> TrackSource::objectsAt(int frameNumber) const {
    auto it = frames.find(frameNumber);
    if (it == frames.end()) return {};
    return it->second;
}

int TrackSource::lastFrame() const {
    return frames.empty() ? 0 : frames.rbegin()->first;
}

cv::Mat buildOccupancyMask(const cv::Size& frameSize, const std::vector<TrackedObject>& objects) {
    cv::Mat mask(frameSize, CV_8UC1, cv::Scalar(1));
    cv::Rect frameRect(cv::Point(0, 0), frameSize);

    for (const auto& obj : objects) {
        if (obj.extent.size() < 2) continue;
        cv::Rect box(cv::Point(static_cast<int>(obj.extent[0].x), static_cast<int>(obj.extent[0].y)),
                     cv::Point(static_cast<int>(obj.extent[1].x), static_cast<int>(obj.extent[1].y)));
        box &= frameRect;
        if (box.area() > 0) {
            mask(box).setTo(cv::Scalar(0));
        }
    }
    return mask;
}
