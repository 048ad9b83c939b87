/**
 * @file LandmarkRecording.cpp
 * @brief YAML landmark recording loader
 */

#include "handctl/gesture/LandmarkRecording.hpp"
#include "handctl/core/exception.h"
#include "handctl/core/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>

namespace handctl {
namespace gesture {

namespace {

HandLandmarks parse_landmarks(const YAML::Node& node, std::size_t tick_index) {
    if (!node.IsSequence() || node.size() != NUM_HAND_LANDMARKS) {
        HANDCTL_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_FORMAT,
                           "Tick " + std::to_string(tick_index) + ": expected " +
                           std::to_string(NUM_HAND_LANDMARKS) + " landmarks");
    }

    HandLandmarks hand;
    for (std::size_t i = 0; i < NUM_HAND_LANDMARKS; ++i) {
        const YAML::Node point = node[i];
        if (!point.IsSequence() || point.size() < 2 || point.size() > 3) {
            HANDCTL_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_FORMAT,
                               "Tick " + std::to_string(tick_index) + ": landmark " +
                               std::to_string(i) + " must be [x, y] or [x, y, z]");
        }
        hand.points[i].x = point[0].as<float>();
        hand.points[i].y = point[1].as<float>();
        hand.points[i].z = point.size() == 3 ? point[2].as<float>() : 0.0f;
    }
    return hand;
}

std::vector<RecordedTick> parse_document(const YAML::Node& root) {
    const YAML::Node ticks = root["ticks"];
    if (!ticks || !ticks.IsSequence()) {
        HANDCTL_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_FORMAT,
                           "Recording has no 'ticks' sequence");
    }

    std::vector<RecordedTick> recording;
    recording.reserve(ticks.size());

    for (std::size_t i = 0; i < ticks.size(); ++i) {
        const YAML::Node entry = ticks[i];
        if (!entry.IsMap() || !entry["video_time"]) {
            HANDCTL_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_FORMAT,
                               "Tick " + std::to_string(i) + ": missing video_time");
        }

        RecordedTick tick;
        tick.video_time = entry["video_time"].as<double>();
        tick.wall_time = entry["wall_time"] ? entry["wall_time"].as<double>() : tick.video_time;
        tick.locked = entry["locked"] ? entry["locked"].as<bool>() : false;

        const YAML::Node landmarks = entry["landmarks"];
        if (landmarks && !landmarks.IsNull()) {
            tick.landmarks = parse_landmarks(landmarks, i);
        }
        recording.push_back(std::move(tick));
    }

    return recording;
}

} // namespace

std::vector<RecordedTick> parse_landmark_recording(const std::string& text) {
    try {
        return parse_document(YAML::Load(text));
    } catch (const YAML::Exception& e) {
        HANDCTL_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_FORMAT,
                           std::string("Malformed recording: ") + e.what());
    }
}

std::vector<RecordedTick> load_landmark_recording(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        HANDCTL_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_NOT_FOUND,
                           "Cannot open recording: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    std::vector<RecordedTick> recording = parse_landmark_recording(buffer.str());
    LOG_INFO("Loaded " + std::to_string(recording.size()) + " ticks from " + path);
    return recording;
}

} // namespace gesture
} // namespace handctl
