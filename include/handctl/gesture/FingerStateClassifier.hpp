/**
 * @file FingerStateClassifier.hpp
 * @brief Extended/curled classification of the five fingers
 *
 * Landmark indices follow the MediaPipe convention:
 * 0: Wrist
 * 1-4: Thumb (CMC, MCP, IP, TIP)
 * 5-8: Index finger (MCP, PIP, DIP, TIP)
 * 9-12: Middle finger (MCP, PIP, DIP, TIP)
 * 13-16: Ring finger (MCP, PIP, DIP, TIP)
 * 17-20: Pinky (MCP, PIP, DIP, TIP)
 *
 * @copyright 2025 handctl Project
 * @license MIT License
 */

#ifndef HANDCTL_GESTURE_FINGER_STATE_CLASSIFIER_HPP
#define HANDCTL_GESTURE_FINGER_STATE_CLASSIFIER_HPP

#include "GestureTypes.hpp"

namespace handctl {
namespace gesture {

/**
 * @brief Check whether a non-thumb finger is curled
 *
 * A finger is curled when either:
 * - its tip is closer to the wrist than curl_tip_wrist_ratio x (MCP to wrist), or
 * - its tip is closer to the MCP than severe_bend_ratio x (PIP to MCP).
 *
 * Degenerate reference lengths (below config.min_denominator) or non-finite
 * distances report the finger as curled.
 *
 * @param hand Landmark frame
 * @param tip Tip landmark index
 * @param pip PIP joint landmark index
 * @param mcp MCP (knuckle) landmark index
 */
bool is_finger_curled(const HandLandmarks& hand, int tip, int pip, int mcp,
                      const GesturePipelineConfig& config = GesturePipelineConfig());

/**
 * @brief Check whether the thumb is extended
 *
 * Extended iff the tip is farther than thumb_out_ratio x palm width from
 * the pinky MCP and the tip-to-IP distance is not below thumb_curl_ratio x
 * palm width. Palm width is index MCP to pinky MCP; a degenerate palm width
 * reports the thumb as curled.
 */
bool is_thumb_extended(const HandLandmarks& hand,
                       const GesturePipelineConfig& config = GesturePipelineConfig());

/**
 * @brief Classify all five fingers of one frame
 */
FingerState classify_fingers(const HandLandmarks& hand,
                             const GesturePipelineConfig& config = GesturePipelineConfig());

} // namespace gesture
} // namespace handctl

#endif // HANDCTL_GESTURE_FINGER_STATE_CLASSIFIER_HPP
