/**
 * @file GestureTypes.hpp
 * @brief Core data types for the hand gesture pipeline
 *
 * Defines the landmark frame, the closed gesture label set, the per-tick
 * input/output records and the pipeline configuration shared by every stage.
 *
 * @copyright 2025 handctl Project
 * @license MIT License
 */

#ifndef HANDCTL_GESTURE_TYPES_HPP
#define HANDCTL_GESTURE_TYPES_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <opencv2/core.hpp>

namespace handctl {
namespace gesture {

/// Number of keypoints in one hand landmark frame
constexpr std::size_t NUM_HAND_LANDMARKS = 21;

/**
 * @brief Landmark indices (MediaPipe hand model convention)
 */
namespace landmark {
constexpr int WRIST = 0;
constexpr int THUMB_CMC = 1;
constexpr int THUMB_MCP = 2;
constexpr int THUMB_IP = 3;
constexpr int THUMB_TIP = 4;
constexpr int INDEX_MCP = 5;
constexpr int INDEX_PIP = 6;
constexpr int INDEX_DIP = 7;
constexpr int INDEX_TIP = 8;
constexpr int MIDDLE_MCP = 9;
constexpr int MIDDLE_PIP = 10;
constexpr int MIDDLE_DIP = 11;
constexpr int MIDDLE_TIP = 12;
constexpr int RING_MCP = 13;
constexpr int RING_PIP = 14;
constexpr int RING_DIP = 15;
constexpr int RING_TIP = 16;
constexpr int PINKY_MCP = 17;
constexpr int PINKY_PIP = 18;
constexpr int PINKY_DIP = 19;
constexpr int PINKY_TIP = 20;
} // namespace landmark

/**
 * @brief Closed set of gesture labels produced by the decision function
 */
enum class GestureLabel {
    NONE = 0,       ///< No hand, or a pose outside the closed set
    OPEN_PALM,      ///< All five fingers extended (drives pan/zoom)
    CLOSED_FIST,    ///< Fingers curled, thumb tucked or horizontal
    POINTING_UP,    ///< Only the index finger extended
    THUMB_UP,       ///< Fist with thumb pointing up
    THUMB_DOWN,     ///< Fist with thumb pointing down
    VICTORY,        ///< Index and middle extended
    I_LOVE_YOU,     ///< Thumb, index and pinky extended
    PINCH           ///< Thumb and index tips touching, middle extended
};

/**
 * @brief One hand's 21 normalized keypoints for a single detector tick
 *
 * x and y are in [0, 1] relative to the camera image; z is the detector's
 * relative depth and is carried but not used for classification.
 * Frames are validated by the acquisition layer before they get here.
 */
struct HandLandmarks {
    std::array<cv::Point3f, NUM_HAND_LANDMARKS> points;

    const cv::Point3f& operator[](int index) const { return points[static_cast<std::size_t>(index)]; }
    cv::Point3f& operator[](int index) { return points[static_cast<std::size_t>(index)]; }
};

/// A landmark frame, absent when no hand was detected this tick
using LandmarkFrame = std::optional<HandLandmarks>;

/**
 * @brief Extended/curled flags for the five fingers
 */
struct FingerState {
    bool thumb = false;
    bool index = false;
    bool middle = false;
    bool ring = false;
    bool pinky = false;

    /// Number of extended non-thumb fingers [0, 4]
    int extended_count() const {
        return (index ? 1 : 0) + (middle ? 1 : 0) + (ring ? 1 : 0) + (pinky ? 1 : 0);
    }
};

/**
 * @brief Auxiliary scalars derived from one landmark frame
 */
struct HandFeatures {
    float pinch_distance = 0.0f;        ///< Thumb tip to index tip (image plane)
    bool is_pinching = false;           ///< pinch_distance below the pinch threshold
    cv::Point2f pinch_position;         ///< Thumb/index tip midpoint, x mirrored
    cv::Point2f palm_centroid;          ///< Mean of wrist, index MCP and pinky MCP
    float hand_scale = 0.0f;            ///< Wrist to middle MCP distance
    float thumb_vertical_offset = 0.0f; ///< thumb_tip.y - thumb_mcp.y (negative = up)
};

/**
 * @brief Per-tick input supplied by the landmark acquisition layer
 */
struct TickInput {
    LandmarkFrame landmarks;            ///< Empty when no hand is detected
    float elapsed_seconds = 0.0f;       ///< Wall-clock delta since previous tick
    bool interaction_locked = false;    ///< External UI interaction suppresses palm control
    float pan_speed = 25.0f;            ///< Pan output multiplier
    float zoom_speed = 100.0f;          ///< Zoom output multiplier
};

/**
 * @brief Per-tick output routed to camera, selection and effect consumers
 */
struct TickOutput {
    /// Raw (unstabilized) label for this tick
    GestureLabel raw_gesture = GestureLabel::NONE;

    /// Present while the current streak has reached its threshold
    std::optional<GestureLabel> stable_gesture;

    /// True only on the tick the streak first reaches its threshold
    bool gesture_onset = false;

    /// Camera pan delta, zero when palm control is inactive
    cv::Point2f pan_delta{0.0f, 0.0f};

    /// Camera zoom delta, zero when inactive or below the noise threshold
    float zoom_delta = 0.0f;

    /// Ambient rotation speed
    float rotation_speed = 0.0f;

    /// Normalized screen position of a pinch, present only on the tick it fires
    std::optional<cv::Point2f> pinch_event;

    /// Diagnostic state string (only when debug labels are enabled)
    std::optional<std::string> debug_label;
};

/**
 * @brief Gesture pipeline configuration
 *
 * Defaults reproduce the tuned behavior; every value can be overridden from
 * the `gesture:` section of the YAML configuration.
 */
struct GesturePipelineConfig {
    // Finger-state classifier
    float curl_tip_wrist_ratio = 1.4f;  ///< Curled if tip-wrist < ratio * mcp-wrist
    float severe_bend_ratio = 0.8f;     ///< Curled if tip-mcp < ratio * pip-mcp
    float thumb_out_ratio = 0.9f;       ///< Thumb tip must be farther than ratio * palm width from pinky MCP
    float thumb_curl_ratio = 0.3f;      ///< Thumb curled if tip-IP < ratio * palm width
    float min_denominator = 1e-6f;      ///< Reference lengths below this are degenerate

    // Geometric features / decision
    float pinch_distance = 0.08f;           ///< Thumb-index tip distance for pinching
    float thumb_vertical_threshold = 0.05f; ///< Thumb up/down offset threshold

    // Temporal stabilizer
    int default_stability_threshold = 3;
    std::map<GestureLabel, int> stability_thresholds = {
        {GestureLabel::PINCH, 2},
        {GestureLabel::OPEN_PALM, 2},
        {GestureLabel::CLOSED_FIST, 2},
        {GestureLabel::VICTORY, 4},
        {GestureLabel::THUMB_UP, 5},
        {GestureLabel::THUMB_DOWN, 5},
        {GestureLabel::I_LOVE_YOU, 5}
    };

    // Continuous control
    std::size_t palm_history_capacity = 4; ///< Moving-average window (samples)
    float palm_move_threshold = 0.001f;    ///< Minimum smoothed-centroid change to pan
    float scale_retain = 0.9f;             ///< EMA weight of the previous hand scale
    float zoom_threshold = 0.001f;         ///< Minimum smoothed-scale change to zoom

    // Pinch debouncer
    float pinch_cooldown_s = 0.3f;
    float pinch_min_displacement = 0.1f;   ///< Per-axis distance from the last trigger

    // Rotation momentum
    float momentum_decay = 0.9f;
    float momentum_snap_threshold = 0.01f;
    float momentum_damping_hand = 0.08f;
    float momentum_damping_no_hand = 0.05f;

    /// Emit TickOutput::debug_label
    bool debug_labels = false;

    /**
     * @brief Required consecutive ticks before @p label is stable
     */
    int stability_threshold(GestureLabel label) const {
        auto it = stability_thresholds.find(label);
        return it != stability_thresholds.end() ? it->second : default_stability_threshold;
    }

    /**
     * @brief Validate configuration
     * @return true if configuration is valid
     */
    bool is_valid() const {
        for (const auto& entry : stability_thresholds) {
            if (entry.second < 1) {
                return false;
            }
        }
        return curl_tip_wrist_ratio > 0.0f &&
               severe_bend_ratio > 0.0f &&
               thumb_out_ratio > 0.0f &&
               thumb_curl_ratio > 0.0f &&
               min_denominator > 0.0f &&
               pinch_distance > 0.0f &&
               thumb_vertical_threshold >= 0.0f &&
               default_stability_threshold >= 1 &&
               palm_history_capacity >= 1 &&
               palm_move_threshold >= 0.0f &&
               scale_retain >= 0.0f && scale_retain < 1.0f &&
               zoom_threshold >= 0.0f &&
               pinch_cooldown_s >= 0.0f &&
               pinch_min_displacement >= 0.0f &&
               momentum_decay >= 0.0f && momentum_decay < 1.0f &&
               momentum_snap_threshold >= 0.0f &&
               momentum_damping_hand >= 0.0f &&
               momentum_damping_no_hand >= 0.0f;
    }
};

/**
 * @brief Convert GestureLabel enum to its wire name
 */
inline std::string gesture_label_to_string(GestureLabel label) {
    switch (label) {
        case GestureLabel::NONE: return "None";
        case GestureLabel::OPEN_PALM: return "Open_Palm";
        case GestureLabel::CLOSED_FIST: return "Closed_Fist";
        case GestureLabel::POINTING_UP: return "Pointing_Up";
        case GestureLabel::THUMB_UP: return "Thumb_Up";
        case GestureLabel::THUMB_DOWN: return "Thumb_Down";
        case GestureLabel::VICTORY: return "Victory";
        case GestureLabel::I_LOVE_YOU: return "ILoveYou";
        case GestureLabel::PINCH: return "Pinch";
        default: return "Invalid";
    }
}

/**
 * @brief Parse a wire name back into a GestureLabel
 * @return false if @p name is not a known label
 */
inline bool gesture_label_from_string(const std::string& name, GestureLabel& label) {
    static const std::array<GestureLabel, 9> all = {
        GestureLabel::NONE, GestureLabel::OPEN_PALM, GestureLabel::CLOSED_FIST,
        GestureLabel::POINTING_UP, GestureLabel::THUMB_UP, GestureLabel::THUMB_DOWN,
        GestureLabel::VICTORY, GestureLabel::I_LOVE_YOU, GestureLabel::PINCH
    };
    for (GestureLabel candidate : all) {
        if (gesture_label_to_string(candidate) == name) {
            label = candidate;
            return true;
        }
    }
    return false;
}

} // namespace gesture
} // namespace handctl

#endif // HANDCTL_GESTURE_TYPES_HPP
