/**
 * @file FingerStateClassifier.cpp
 * @brief Implementation of the finger-state classifier
 */

#include "handctl/gesture/FingerStateClassifier.hpp"
#include "handctl/gesture/HandGeometry.hpp"
#include <cmath>

namespace handctl {
namespace gesture {

namespace {

bool all_finite(float a, float b, float c, float d) {
    return std::isfinite(a) && std::isfinite(b) && std::isfinite(c) && std::isfinite(d);
}

} // namespace

bool is_finger_curled(const HandLandmarks& hand, int tip, int pip, int mcp,
                      const GesturePipelineConfig& config) {
    const cv::Point3f& wrist = hand[landmark::WRIST];

    float tip_to_wrist = planar_distance(hand[tip], wrist);
    float mcp_to_wrist = planar_distance(hand[mcp], wrist);
    float tip_to_mcp = planar_distance(hand[tip], hand[mcp]);
    float pip_to_mcp = planar_distance(hand[pip], hand[mcp]);

    if (!all_finite(tip_to_wrist, mcp_to_wrist, tip_to_mcp, pip_to_mcp)) {
        return true;
    }
    if (mcp_to_wrist < config.min_denominator || pip_to_mcp < config.min_denominator) {
        return true;
    }

    // Primary test: tip pulled back toward the wrist
    bool distance_check = tip_to_wrist < mcp_to_wrist * config.curl_tip_wrist_ratio;

    // Override: tip folded onto its own knuckle
    bool severely_bent = tip_to_mcp < pip_to_mcp * config.severe_bend_ratio;

    return distance_check || severely_bent;
}

bool is_thumb_extended(const HandLandmarks& hand, const GesturePipelineConfig& config) {
    const cv::Point3f& thumb_tip = hand[landmark::THUMB_TIP];
    const cv::Point3f& pinky_mcp = hand[landmark::PINKY_MCP];

    float palm_width = planar_distance(hand[landmark::INDEX_MCP], pinky_mcp);
    float thumb_out = planar_distance(thumb_tip, pinky_mcp);
    float tip_to_ip = planar_distance(thumb_tip, hand[landmark::THUMB_IP]);

    if (!std::isfinite(palm_width) || !std::isfinite(thumb_out) || !std::isfinite(tip_to_ip)) {
        return false;
    }
    if (palm_width < config.min_denominator) {
        return false;
    }

    // Splayed but folded thumbs still sit far from the pinky
    bool thumb_curled = tip_to_ip < palm_width * config.thumb_curl_ratio;

    return thumb_out > palm_width * config.thumb_out_ratio && !thumb_curled;
}

FingerState classify_fingers(const HandLandmarks& hand, const GesturePipelineConfig& config) {
    FingerState state;
    state.thumb = is_thumb_extended(hand, config);
    state.index = !is_finger_curled(hand, landmark::INDEX_TIP, landmark::INDEX_PIP, landmark::INDEX_MCP, config);
    state.middle = !is_finger_curled(hand, landmark::MIDDLE_TIP, landmark::MIDDLE_PIP, landmark::MIDDLE_MCP, config);
    state.ring = !is_finger_curled(hand, landmark::RING_TIP, landmark::RING_PIP, landmark::RING_MCP, config);
    state.pinky = !is_finger_curled(hand, landmark::PINKY_TIP, landmark::PINKY_PIP, landmark::PINKY_MCP, config);
    return state;
}

} // namespace gesture
} // namespace handctl
