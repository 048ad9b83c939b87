/**
 * @file FrameGate.cpp
 * @brief Implementation of timestamp de-duplication
 */

#include "handctl/gesture/FrameGate.hpp"

namespace handctl {
namespace gesture {

std::optional<float> FrameGate::admit(double video_time_s, Clock::time_point now) {
    if (last_video_time_ && *last_video_time_ == video_time_s) {
        skipped_++;
        return std::nullopt;
    }

    float elapsed = 0.0f;
    if (last_wall_time_) {
        elapsed = std::chrono::duration<float>(now - *last_wall_time_).count();
    }

    last_video_time_ = video_time_s;
    last_wall_time_ = now;
    admitted_++;
    return elapsed;
}

void FrameGate::reset(Clock::time_point now) {
    last_video_time_.reset();
    last_wall_time_ = now;
    admitted_ = 0;
    skipped_ = 0;
}

} // namespace gesture
} // namespace handctl
