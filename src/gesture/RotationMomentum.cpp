/**
 * @file RotationMomentum.cpp
 * @brief Implementation of rotation momentum decay
 */

#include "handctl/gesture/RotationMomentum.hpp"
#include <cmath>

namespace handctl {
namespace gesture {

float RotationMomentum::update(GestureLabel raw_label,
                               bool locked,
                               bool hand_present,
                               const GesturePipelineConfig& config) {
    if (locked || raw_label == GestureLabel::PINCH || raw_label == GestureLabel::OPEN_PALM) {
        value_ = 0.0f;
    } else {
        value_ *= config.momentum_decay;
        if (std::abs(value_) < config.momentum_snap_threshold) {
            value_ = 0.0f;
        }
    }

    float damping = hand_present ? config.momentum_damping_hand : config.momentum_damping_no_hand;
    return value_ * damping;
}

void RotationMomentum::add_impulse(float amount) {
    if (std::isfinite(amount)) {
        value_ += amount;
    }
}

} // namespace gesture
} // namespace handctl
