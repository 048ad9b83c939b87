/**
 * @file GestureClassifier.hpp
 * @brief Rule-based mapping from finger state and hand features to a label
 *
 * @copyright 2025 handctl Project
 * @license MIT License
 */

#ifndef HANDCTL_GESTURE_CLASSIFIER_HPP
#define HANDCTL_GESTURE_CLASSIFIER_HPP

#include "GestureTypes.hpp"

namespace handctl {
namespace gesture {

/**
 * @brief Decide the gesture label for one frame
 *
 * Rules are evaluated in fixed priority order, first match wins:
 * 1. Pinching and middle extended                   -> PINCH
 * 2. Four fingers and thumb extended                -> OPEN_PALM
 * 3. At most one finger extended, thumb curled      -> CLOSED_FIST
 * 4. No finger extended, thumb extended             -> THUMB_UP / THUMB_DOWN by
 *    thumb vertical offset, CLOSED_FIST when the thumb is roughly level
 * 5. Index and middle only                          -> VICTORY
 * 6. Index only                                     -> POINTING_UP
 * 7. Thumb, index and pinky                         -> I_LOVE_YOU
 * 8. Anything else                                  -> NONE
 */
GestureLabel decide_gesture(const FingerState& fingers,
                            const HandFeatures& features,
                            const GesturePipelineConfig& config = GesturePipelineConfig());

/**
 * @brief Classify a possibly-absent frame
 *
 * Returns NONE for an absent hand without evaluating the rules.
 */
GestureLabel classify_hand(const LandmarkFrame& frame,
                           const GesturePipelineConfig& config = GesturePipelineConfig());

} // namespace gesture
} // namespace handctl

#endif // HANDCTL_GESTURE_CLASSIFIER_HPP
