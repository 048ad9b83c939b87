/**
 * @file GestureStabilizer.cpp
 * @brief Implementation of the gesture streak state machine
 */

#include "handctl/gesture/GestureStabilizer.hpp"
#include <limits>

namespace handctl {
namespace gesture {

StabilityStatus GestureStabilizer::update(GestureLabel label, const GesturePipelineConfig& config) {
    if (label == GestureLabel::NONE) {
        reset();
    } else if (state_ == State::ACCUMULATING && label == label_) {
        if (count_ < std::numeric_limits<std::uint32_t>::max()) {
            count_++;
        }
    } else {
        state_ = State::ACCUMULATING;
        label_ = label;
        count_ = 1;
    }

    StabilityStatus status;
    status.label = label_;
    status.count = count_;
    status.threshold = config.stability_threshold(label);

    if (state_ == State::ACCUMULATING && status.threshold > 0) {
        const auto required = static_cast<std::uint32_t>(status.threshold);
        status.stable = count_ >= required;
        status.onset = count_ == required;
    }

    return status;
}

void GestureStabilizer::reset() {
    state_ = State::IDLE;
    label_ = GestureLabel::NONE;
    count_ = 0;
}

} // namespace gesture
} // namespace handctl
