/**
 * @file HandGeometry.hpp
 * @brief Geometric feature extraction from a hand landmark frame
 *
 * @copyright 2025 handctl Project
 * @license MIT License
 */

#ifndef HANDCTL_GESTURE_HAND_GEOMETRY_HPP
#define HANDCTL_GESTURE_HAND_GEOMETRY_HPP

#include "GestureTypes.hpp"

namespace handctl {
namespace gesture {

/**
 * @brief Euclidean distance in the image plane (z ignored)
 */
float planar_distance(const cv::Point3f& a, const cv::Point3f& b);

/**
 * @brief Compute pinch, palm, scale and thumb features for one frame
 *
 * - pinch distance: thumb tip to index tip, pinching below config.pinch_distance
 * - pinch position: tip midpoint with x mirrored (camera image is mirrored)
 * - palm centroid: unweighted mean of wrist, index MCP, pinky MCP
 * - hand scale: wrist to middle MCP
 * - thumb vertical offset: thumb tip y minus thumb MCP y
 *
 * Pure function of the frame.
 */
HandFeatures extract_features(const HandLandmarks& hand,
                              const GesturePipelineConfig& config = GesturePipelineConfig());

} // namespace gesture
} // namespace handctl

#endif // HANDCTL_GESTURE_HAND_GEOMETRY_HPP
