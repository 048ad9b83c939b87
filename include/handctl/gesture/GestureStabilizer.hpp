/**
 * @file GestureStabilizer.hpp
 * @brief Run-length stabilization of raw per-frame gesture labels
 *
 * @copyright 2025 handctl Project
 * @license MIT License
 */

#ifndef HANDCTL_GESTURE_STABILIZER_HPP
#define HANDCTL_GESTURE_STABILIZER_HPP

#include <cstdint>
#include "GestureTypes.hpp"

namespace handctl {
namespace gesture {

/**
 * @brief Result of feeding one raw label to the stabilizer
 */
struct StabilityStatus {
    GestureLabel label = GestureLabel::NONE; ///< Label of the current streak
    std::uint32_t count = 0;                 ///< Consecutive ticks of that label
    int threshold = 0;                       ///< Ticks required for stability
    bool stable = false;                     ///< count >= threshold (never for NONE)
    bool onset = false;                      ///< count == threshold on this tick
};

/**
 * @brief Gesture streak state machine
 *
 * States: IDLE (no streak) and ACCUMULATING(label, count).
 * - Same label as the streak: count + 1
 * - Different non-NONE label: ACCUMULATING(label, 1)
 * - NONE: back to IDLE with count 0
 *
 * Thresholds are per label (see GesturePipelineConfig::stability_thresholds):
 * fast-response gestures need few ticks, accident-prone ones need more.
 *
 * Thread-safety: Not thread-safe. Owned by one pipeline instance.
 */
class GestureStabilizer {
public:
    enum class State {
        IDLE,
        ACCUMULATING
    };

    GestureStabilizer() = default;

    /**
     * @brief Feed one raw label
     */
    StabilityStatus update(GestureLabel label,
                           const GesturePipelineConfig& config = GesturePipelineConfig());

    /**
     * @brief Drop the streak (no hand detected)
     */
    void reset();

    State state() const { return state_; }

    /// Label of the current streak, NONE when idle
    GestureLabel label() const { return label_; }

    std::uint32_t count() const { return count_; }

private:
    State state_ = State::IDLE;
    GestureLabel label_ = GestureLabel::NONE;
    std::uint32_t count_ = 0;
};

} // namespace gesture
} // namespace handctl

#endif // HANDCTL_GESTURE_STABILIZER_HPP
