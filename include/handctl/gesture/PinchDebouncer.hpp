/**
 * @file PinchDebouncer.hpp
 * @brief Rate limiting of pinch selection events
 *
 * @copyright 2025 handctl Project
 * @license MIT License
 */

#ifndef HANDCTL_GESTURE_PINCH_DEBOUNCER_HPP
#define HANDCTL_GESTURE_PINCH_DEBOUNCER_HPP

#include <optional>
#include "GestureTypes.hpp"

namespace handctl {
namespace gesture {

/**
 * @brief Pinch event debouncer
 *
 * A stable pinch fires iff all hold:
 * - no pinch is currently held (active is false)
 * - the cooldown has expired
 * - there is no previous trigger position, or the new position differs
 *   from it by more than pinch_min_displacement on either axis
 *
 * Firing sets active, restarts the cooldown and records the position.
 * Any tick whose raw label is not PINCH releases active; a NONE label
 * also forgets the trigger position. A pinch held at an unchanged position
 * therefore never re-fires, even after the cooldown, until the hand moves
 * or is lost.
 *
 * The cooldown is wall-time based and decays every tick, with or without a
 * hand.
 */
class PinchDebouncer {
public:
    PinchDebouncer() = default;

    /**
     * @brief Decay the cooldown by the tick's elapsed wall time
     */
    void advance(float elapsed_seconds);

    /**
     * @brief Offer a stable pinch at @p position
     *
     * @return The position when the event fires, empty when suppressed
     */
    std::optional<cv::Point2f> try_fire(const cv::Point2f& position,
                                        const GesturePipelineConfig& config = GesturePipelineConfig());

    /**
     * @brief Handle a tick whose raw label is not PINCH
     */
    void release(GestureLabel raw_label);

    bool is_active() const { return active_; }

    float cooldown_remaining() const { return cooldown_remaining_; }

    std::optional<cv::Point2f> last_trigger_position() const { return last_trigger_pos_; }

private:
    bool active_ = false;
    float cooldown_remaining_ = 0.0f;
    std::optional<cv::Point2f> last_trigger_pos_;
};

} // namespace gesture
} // namespace handctl

#endif // HANDCTL_GESTURE_PINCH_DEBOUNCER_HPP
