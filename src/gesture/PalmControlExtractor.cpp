/**
 * @file PalmControlExtractor.cpp
 * @brief Implementation of open-palm pan/zoom extraction
 */

#include "handctl/gesture/PalmControlExtractor.hpp"
#include <cmath>

namespace handctl {
namespace gesture {

PalmControlExtractor::PalmControlExtractor(const GesturePipelineConfig& config)
    : history_(config.palm_history_capacity) {
}

void PalmControlExtractor::observe(const cv::Point2f& raw_centroid) {
    if (!std::isfinite(raw_centroid.x) || !std::isfinite(raw_centroid.y)) {
        return;
    }
    history_.push(raw_centroid);
}

PalmControl PalmControlExtractor::track(const HandFeatures& features,
                                        bool palm_stable,
                                        bool locked,
                                        float pan_speed,
                                        float zoom_speed,
                                        const GesturePipelineConfig& config) {
    PalmControl control;

    if (locked) {
        reset();
        return control;
    }

    // Zoom (stable palm only)
    if (palm_stable && std::isfinite(features.hand_scale)) {
        float current = smoothed_scale_
            ? *smoothed_scale_ * config.scale_retain + features.hand_scale * (1.0f - config.scale_retain)
            : features.hand_scale;

        if (smoothed_scale_) {
            float delta = current - *smoothed_scale_;
            if (std::abs(delta) > config.zoom_threshold) {
                control.zoom_delta = delta * zoom_speed;
            }
        }
        smoothed_scale_ = current;
    } else {
        smoothed_scale_.reset();
    }

    // Pan
    if (history_.is_empty()) {
        return control;
    }
    cv::Point2f smoothed = history_.mean();
    if (last_smoothed_) {
        // Camera image is mirrored: moving the hand right moves x left
        float dx = -(smoothed.x - last_smoothed_->x);
        float dy = smoothed.y - last_smoothed_->y;
        if (std::abs(dx) > config.palm_move_threshold || std::abs(dy) > config.palm_move_threshold) {
            control.pan_delta = cv::Point2f(dx * pan_speed, dy * pan_speed);
        }
    }
    last_smoothed_ = smoothed;

    return control;
}

void PalmControlExtractor::release() {
    last_smoothed_.reset();
    smoothed_scale_.reset();
}

void PalmControlExtractor::reset() {
    history_.clear();
    release();
}

} // namespace gesture
} // namespace handctl
