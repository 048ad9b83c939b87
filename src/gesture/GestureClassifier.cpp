/**
 * @file GestureClassifier.cpp
 * @brief Implementation of the gesture decision rules
 */

#include "handctl/gesture/GestureClassifier.hpp"
#include "handctl/gesture/FingerStateClassifier.hpp"
#include "handctl/gesture/HandGeometry.hpp"

namespace handctl {
namespace gesture {

GestureLabel decide_gesture(const FingerState& fingers,
                            const HandFeatures& features,
                            const GesturePipelineConfig& config) {
    const int extended = fingers.extended_count();

    if (features.is_pinching && fingers.middle) {
        return GestureLabel::PINCH;
    }

    if (extended == 4 && fingers.thumb) {
        return GestureLabel::OPEN_PALM;
    }

    // Tolerates one finger that did not fully curl
    if (extended <= 1 && !fingers.thumb) {
        return GestureLabel::CLOSED_FIST;
    }

    if (extended == 0 && fingers.thumb) {
        // Image y grows downward: a raised thumb has a negative offset
        if (features.thumb_vertical_offset < -config.thumb_vertical_threshold) {
            return GestureLabel::THUMB_UP;
        }
        if (features.thumb_vertical_offset > config.thumb_vertical_threshold) {
            return GestureLabel::THUMB_DOWN;
        }
        return GestureLabel::CLOSED_FIST;
    }

    if (fingers.index && fingers.middle && !fingers.ring && !fingers.pinky) {
        return GestureLabel::VICTORY;
    }

    if (fingers.index && !fingers.middle && !fingers.ring && !fingers.pinky) {
        return GestureLabel::POINTING_UP;
    }

    if (fingers.thumb && fingers.index && !fingers.middle && !fingers.ring && fingers.pinky) {
        return GestureLabel::I_LOVE_YOU;
    }

    return GestureLabel::NONE;
}

GestureLabel classify_hand(const LandmarkFrame& frame, const GesturePipelineConfig& config) {
    if (!frame) {
        return GestureLabel::NONE;
    }
    FingerState fingers = classify_fingers(*frame, config);
    HandFeatures features = extract_features(*frame, config);
    return decide_gesture(fingers, features, config);
}

} // namespace gesture
} // namespace handctl
