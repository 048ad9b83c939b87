/**
 * @file PinchDebouncer.cpp
 * @brief Implementation of pinch debouncing
 */

#include "handctl/gesture/PinchDebouncer.hpp"
#include <cmath>

namespace handctl {
namespace gesture {

void PinchDebouncer::advance(float elapsed_seconds) {
    if (cooldown_remaining_ > 0.0f && std::isfinite(elapsed_seconds)) {
        cooldown_remaining_ -= elapsed_seconds;
    }
}

std::optional<cv::Point2f> PinchDebouncer::try_fire(const cv::Point2f& position,
                                                    const GesturePipelineConfig& config) {
    bool position_changed = !last_trigger_pos_ ||
        std::abs(position.x - last_trigger_pos_->x) > config.pinch_min_displacement ||
        std::abs(position.y - last_trigger_pos_->y) > config.pinch_min_displacement;

    if (active_ || cooldown_remaining_ > 0.0f || !position_changed) {
        return std::nullopt;
    }

    active_ = true;
    cooldown_remaining_ = config.pinch_cooldown_s;
    last_trigger_pos_ = position;
    return position;
}

void PinchDebouncer::release(GestureLabel raw_label) {
    active_ = false;
    if (raw_label == GestureLabel::NONE) {
        last_trigger_pos_.reset();
    }
}

} // namespace gesture
} // namespace handctl
