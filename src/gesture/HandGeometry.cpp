/**
 * @file HandGeometry.cpp
 * @brief Implementation of geometric hand features
 */

#include "handctl/gesture/HandGeometry.hpp"
#include <cmath>

namespace handctl {
namespace gesture {

float planar_distance(const cv::Point3f& a, const cv::Point3f& b) {
    return std::hypot(a.x - b.x, a.y - b.y);
}

HandFeatures extract_features(const HandLandmarks& hand, const GesturePipelineConfig& config) {
    HandFeatures features;

    const cv::Point3f& thumb_tip = hand[landmark::THUMB_TIP];
    const cv::Point3f& index_tip = hand[landmark::INDEX_TIP];

    features.pinch_distance = planar_distance(thumb_tip, index_tip);
    features.is_pinching = features.pinch_distance < config.pinch_distance;
    features.pinch_position = cv::Point2f(
        1.0f - (thumb_tip.x + index_tip.x) / 2.0f,
        (thumb_tip.y + index_tip.y) / 2.0f
    );

    const cv::Point3f& wrist = hand[landmark::WRIST];
    const cv::Point3f& index_mcp = hand[landmark::INDEX_MCP];
    const cv::Point3f& pinky_mcp = hand[landmark::PINKY_MCP];
    features.palm_centroid = cv::Point2f(
        (wrist.x + index_mcp.x + pinky_mcp.x) / 3.0f,
        (wrist.y + index_mcp.y + pinky_mcp.y) / 3.0f
    );

    features.hand_scale = planar_distance(wrist, hand[landmark::MIDDLE_MCP]);

    features.thumb_vertical_offset = thumb_tip.y - hand[landmark::THUMB_MCP].y;

    return features;
}

} // namespace gesture
} // namespace handctl
