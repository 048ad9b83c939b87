/**
 * @file PalmControlExtractor.hpp
 * @brief Continuous pan/zoom control from an open palm
 *
 * @copyright 2025 handctl Project
 * @license MIT License
 */

#ifndef HANDCTL_GESTURE_PALM_CONTROL_EXTRACTOR_HPP
#define HANDCTL_GESTURE_PALM_CONTROL_EXTRACTOR_HPP

#include <optional>
#include "GestureTypes.hpp"
#include "PalmHistory.hpp"

namespace handctl {
namespace gesture {

/**
 * @brief Pan/zoom deltas produced for one tick
 */
struct PalmControl {
    cv::Point2f pan_delta{0.0f, 0.0f};
    float zoom_delta = 0.0f;
};

/**
 * @brief Open-palm pan and zoom extractor
 *
 * Pan: the palm centroid is smoothed by a moving average (PalmHistory); the
 * per-tick pan is the change of the smoothed centroid since the previous
 * palm tick, x mirrored, scaled by the caller's pan speed. Changes at or
 * below palm_move_threshold on both axes are dropped.
 *
 * Zoom: once the palm is stable, hand scale is smoothed with an exponential
 * average (scale_retain old, 1 - scale_retain new); the zoom delta is the
 * change of that estimate times the caller's zoom speed, emitted only above
 * zoom_threshold. The first stable tick seeds the estimate.
 *
 * Tracking needs only a raw OPEN_PALM label; stability gates zoom only.
 * While the interaction is locked everything is cleared, not paused.
 */
class PalmControlExtractor {
public:
    explicit PalmControlExtractor(const GesturePipelineConfig& config = GesturePipelineConfig());

    /**
     * @brief Record this tick's raw palm centroid (every tick with a hand)
     */
    void observe(const cv::Point2f& raw_centroid);

    /**
     * @brief Produce pan/zoom for a tick whose raw label is OPEN_PALM
     *
     * @param features Features of this tick's frame
     * @param palm_stable Whether OPEN_PALM has reached its stability threshold
     * @param locked External interaction lock
     * @param pan_speed Pan output multiplier
     * @param zoom_speed Zoom output multiplier
     */
    PalmControl track(const HandFeatures& features,
                      bool palm_stable,
                      bool locked,
                      float pan_speed,
                      float zoom_speed,
                      const GesturePipelineConfig& config = GesturePipelineConfig());

    /**
     * @brief End palm control (raw label is not OPEN_PALM)
     *
     * Forgets the previous smoothed centroid and the scale estimate; the
     * centroid window is kept.
     */
    void release();

    /**
     * @brief Clear everything (no hand, or interaction locked)
     */
    void reset();

    const PalmHistory& history() const { return history_; }

    std::optional<cv::Point2f> last_smoothed_centroid() const { return last_smoothed_; }

    std::optional<float> hand_scale_estimate() const { return smoothed_scale_; }

private:
    PalmHistory history_;
    std::optional<cv::Point2f> last_smoothed_;
    std::optional<float> smoothed_scale_;
};

} // namespace gesture
} // namespace handctl

#endif // HANDCTL_GESTURE_PALM_CONTROL_EXTRACTOR_HPP
