/**
 * @file DebugOverlay.hpp
 * @brief Diagnostic drawing of a landmark frame and its tick output
 *
 * @copyright 2025 handctl Project
 * @license MIT License
 */

#ifndef HANDCTL_GESTURE_DEBUG_OVERLAY_HPP
#define HANDCTL_GESTURE_DEBUG_OVERLAY_HPP

#include <array>
#include <utility>
#include <opencv2/core.hpp>
#include "GestureTypes.hpp"

namespace handctl {
namespace gesture {

/// Landmark index pairs forming the hand skeleton
extern const std::array<std::pair<int, int>, 21> HAND_CONNECTIONS;

/**
 * @brief Draw skeleton, landmarks, labels and pinch marker onto @p image
 *
 * Landmarks are scaled by the image size. The pinch event is in mirrored
 * screen space; its marker is mapped back to camera image coordinates.
 *
 * @param image BGR image, modified in place (no-op if empty)
 * @param hand Landmark frame of this tick, or empty
 * @param output Pipeline output of this tick
 */
void draw_debug_overlay(cv::Mat& image,
                        const LandmarkFrame& hand,
                        const TickOutput& output);

} // namespace gesture
} // namespace handctl

#endif // HANDCTL_GESTURE_DEBUG_OVERLAY_HPP
