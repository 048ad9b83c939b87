/**
 * @file RotationMomentum.hpp
 * @brief Decaying ambient rotation momentum
 *
 * @copyright 2025 handctl Project
 * @license MIT License
 */

#ifndef HANDCTL_GESTURE_ROTATION_MOMENTUM_HPP
#define HANDCTL_GESTURE_ROTATION_MOMENTUM_HPP

#include "GestureTypes.hpp"

namespace handctl {
namespace gesture {

/**
 * @brief Residual rotation velocity, decaying when nothing steers the view
 *
 * Per tick:
 * - interaction locked, raw PINCH or raw OPEN_PALM: snap to 0
 * - otherwise: multiply by momentum_decay and snap to 0 once the magnitude
 *   drops below momentum_snap_threshold
 *
 * The consumed rotation speed is the momentum times a damping constant
 * (momentum_damping_hand with a hand in view, momentum_damping_no_hand
 * without).
 */
class RotationMomentum {
public:
    RotationMomentum() = default;

    /**
     * @brief Advance one tick
     *
     * @return Rotation speed for this tick
     */
    float update(GestureLabel raw_label,
                 bool locked,
                 bool hand_present,
                 const GesturePipelineConfig& config = GesturePipelineConfig());

    /**
     * @brief Add momentum (e.g. from a keyboard spin shortcut)
     */
    void add_impulse(float amount);

    float value() const { return value_; }

    void reset() { value_ = 0.0f; }

private:
    float value_ = 0.0f;
};

} // namespace gesture
} // namespace handctl

#endif // HANDCTL_GESTURE_ROTATION_MOMENTUM_HPP
