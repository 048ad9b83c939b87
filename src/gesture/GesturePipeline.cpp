/**
 * @file GesturePipeline.cpp
 * @brief Implementation of the per-tick gesture pipeline
 */

#include "handctl/gesture/GesturePipeline.hpp"
#include "handctl/gesture/FingerStateClassifier.hpp"
#include "handctl/gesture/GestureClassifier.hpp"
#include "handctl/gesture/HandGeometry.hpp"
#include "handctl/core/Configuration.hpp"
#include "handctl/core/exception.h"
#include "handctl/core/Logger.hpp"
#include <chrono>
#include <mutex>
#include <sstream>

namespace handctl {
namespace gesture {

namespace {

std::string format_point(const cv::Point2f& p) {
    std::ostringstream oss;
    oss << "(" << p.x << ", " << p.y << ")";
    return oss.str();
}

} // namespace

std::string format_debug_label(GestureLabel label,
                               const StabilityStatus& status,
                               const FingerState& fingers) {
    std::ostringstream oss;
    oss << gesture_label_to_string(label)
        << " (" << status.count << "/" << status.threshold << ")"
        << " T:" << (fingers.thumb ? 1 : 0)
        << " I:" << (fingers.index ? 1 : 0)
        << " M:" << (fingers.middle ? 1 : 0)
        << " R:" << (fingers.ring ? 1 : 0)
        << " P:" << (fingers.pinky ? 1 : 0);
    return oss.str();
}

TickOutput process_tick(GesturePipelineState& state,
                        const GesturePipelineConfig& config,
                        const TickInput& input) {
    TickOutput output;
    const bool locked = input.interaction_locked;

    state.pinch.advance(input.elapsed_seconds);

    if (locked != state.was_locked) {
        LOG_DEBUG(std::string("GesturePipeline: interaction ") + (locked ? "locked" : "unlocked"));
        state.was_locked = locked;
    }

    if (!input.landmarks) {
        state.stabilizer.reset();
        state.palm.reset();
        state.pinch.release(GestureLabel::NONE);
        output.rotation_speed = state.momentum.update(GestureLabel::NONE, locked, false, config);
        if (config.debug_labels) {
            output.debug_label = std::string("No hand");
        }
        return output;
    }

    const HandLandmarks& hand = *input.landmarks;
    const FingerState fingers = classify_fingers(hand, config);
    const HandFeatures features = extract_features(hand, config);
    const GestureLabel raw = decide_gesture(fingers, features, config);
    const StabilityStatus status = state.stabilizer.update(raw, config);

    output.raw_gesture = raw;

    state.palm.observe(features.palm_centroid);
    if (raw == GestureLabel::OPEN_PALM) {
        PalmControl control = state.palm.track(features, status.stable, locked,
                                               input.pan_speed, input.zoom_speed, config);
        output.pan_delta = control.pan_delta;
        output.zoom_delta = control.zoom_delta;
    } else {
        state.palm.release();
    }

    output.rotation_speed = state.momentum.update(raw, locked, true, config);

    if (status.stable) {
        output.stable_gesture = raw;
        output.gesture_onset = status.onset;
        if (status.onset) {
            LOG_DEBUG("GesturePipeline: stable gesture " + gesture_label_to_string(raw) +
                      " after " + std::to_string(status.count) + " ticks");
        }
    }

    if (raw == GestureLabel::PINCH) {
        if (status.stable) {
            output.pinch_event = state.pinch.try_fire(features.pinch_position, config);
            if (output.pinch_event) {
                LOG_DEBUG("GesturePipeline: pinch at " + format_point(*output.pinch_event));
            }
        }
    } else {
        state.pinch.release(raw);
    }

    if (config.debug_labels) {
        output.debug_label = format_debug_label(raw, status, fingers);
    }

    return output;
}

GesturePipelineConfig load_pipeline_config(const core::Configuration& configuration) {
    GesturePipelineConfig config;

    config.curl_tip_wrist_ratio = configuration.get<float>("gesture.fingers.curl_tip_wrist_ratio", config.curl_tip_wrist_ratio);
    config.severe_bend_ratio = configuration.get<float>("gesture.fingers.severe_bend_ratio", config.severe_bend_ratio);
    config.thumb_out_ratio = configuration.get<float>("gesture.fingers.thumb_out_ratio", config.thumb_out_ratio);
    config.thumb_curl_ratio = configuration.get<float>("gesture.fingers.thumb_curl_ratio", config.thumb_curl_ratio);
    config.min_denominator = configuration.get<float>("gesture.fingers.min_denominator", config.min_denominator);

    config.pinch_distance = configuration.get<float>("gesture.pinch.distance", config.pinch_distance);
    config.pinch_cooldown_s = configuration.get<float>("gesture.pinch.cooldown_s", config.pinch_cooldown_s);
    config.pinch_min_displacement = configuration.get<float>("gesture.pinch.min_displacement", config.pinch_min_displacement);

    config.thumb_vertical_threshold = configuration.get<float>("gesture.thumb.vertical_threshold", config.thumb_vertical_threshold);

    config.default_stability_threshold = configuration.get<int>("gesture.stabilizer.default_threshold",
                                                                config.default_stability_threshold);
    for (const std::string& name : configuration.keys("gesture.stabilizer.thresholds")) {
        GestureLabel label;
        if (!gesture_label_from_string(name, label) || label == GestureLabel::NONE) {
            HANDCTL_THROW(core::ConfigurationException,
                          "Unknown gesture label in stabilizer thresholds: " + name);
        }
        config.stability_thresholds[label] =
            configuration.get<int>("gesture.stabilizer.thresholds." + name, config.stability_threshold(label));
    }

    int capacity = configuration.get<int>("gesture.palm.history_capacity",
                                          static_cast<int>(config.palm_history_capacity));
    if (capacity < 1) {
        HANDCTL_THROW(core::ConfigurationException,
                      "gesture.palm.history_capacity must be at least 1, got " + std::to_string(capacity));
    }
    config.palm_history_capacity = static_cast<std::size_t>(capacity);
    config.palm_move_threshold = configuration.get<float>("gesture.palm.move_threshold", config.palm_move_threshold);
    config.scale_retain = configuration.get<float>("gesture.palm.scale_retain", config.scale_retain);
    config.zoom_threshold = configuration.get<float>("gesture.palm.zoom_threshold", config.zoom_threshold);

    config.momentum_decay = configuration.get<float>("gesture.momentum.decay", config.momentum_decay);
    config.momentum_snap_threshold = configuration.get<float>("gesture.momentum.snap_threshold", config.momentum_snap_threshold);
    config.momentum_damping_hand = configuration.get<float>("gesture.momentum.damping_hand", config.momentum_damping_hand);
    config.momentum_damping_no_hand = configuration.get<float>("gesture.momentum.damping_no_hand", config.momentum_damping_no_hand);

    config.debug_labels = configuration.get<bool>("gesture.debug_labels", config.debug_labels);

    if (!config.is_valid()) {
        LOG_ERROR("Gesture pipeline configuration rejected");
        HANDCTL_THROW(core::ConfigurationException, "Invalid gesture pipeline configuration");
    }

    LOG_INFO("Gesture pipeline configuration loaded");
    LOG_INFO("  pinch_distance=" + std::to_string(config.pinch_distance) +
             " cooldown=" + std::to_string(config.pinch_cooldown_s) + "s");
    LOG_INFO("  palm_history_capacity=" + std::to_string(config.palm_history_capacity) +
             " scale_retain=" + std::to_string(config.scale_retain));
    LOG_INFO("  momentum_decay=" + std::to_string(config.momentum_decay) +
             " default_stability_threshold=" + std::to_string(config.default_stability_threshold));

    return config;
}

// PIMPL implementation
class GesturePipeline::Impl {
public:
    explicit Impl(const GesturePipelineConfig& cfg)
        : config(cfg)
        , state(cfg) {
    }

    mutable std::mutex mutex;
    GesturePipelineConfig config;
    GesturePipelineState state;

    // Performance stats
    std::size_t tick_count = 0;
    double avg_tick_time_us = 0.0;
};

GesturePipeline::GesturePipeline(const GesturePipelineConfig& config) {
    if (!config.is_valid()) {
        HANDCTL_THROW(core::ConfigurationException, "Invalid gesture pipeline configuration");
    }
    pImpl = std::make_unique<Impl>(config);
    LOG_INFO("GesturePipeline initialized (palm window=" +
             std::to_string(config.palm_history_capacity) + ", pinch cooldown=" +
             std::to_string(config.pinch_cooldown_s) + "s)");
}

GesturePipeline::~GesturePipeline() = default;

TickOutput GesturePipeline::process(const TickInput& input) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);

    auto start = std::chrono::steady_clock::now();
    TickOutput output = process_tick(pImpl->state, pImpl->config, input);
    auto end = std::chrono::steady_clock::now();

    double tick_us = std::chrono::duration<double, std::micro>(end - start).count();
    pImpl->avg_tick_time_us = (pImpl->avg_tick_time_us * pImpl->tick_count + tick_us) /
                              (pImpl->tick_count + 1);
    pImpl->tick_count++;

    return output;
}

void GesturePipeline::add_rotation_impulse(float amount) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->state.momentum.add_impulse(amount);
}

void GesturePipeline::reset() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->state = GesturePipelineState(pImpl->config);
}

GesturePipelineConfig GesturePipeline::get_config() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->config;
}

bool GesturePipeline::set_config(const GesturePipelineConfig& config) {
    if (!config.is_valid()) {
        LOG_WARNING("GesturePipeline: rejected invalid configuration update");
        return false;
    }

    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->config = config;
    pImpl->state = GesturePipelineState(config);
    return true;
}

void GesturePipeline::get_performance_stats(std::size_t& ticks_processed, double& avg_tick_time_us) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    ticks_processed = pImpl->tick_count;
    avg_tick_time_us = pImpl->avg_tick_time_us;
}

void GesturePipeline::reset_performance_stats() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->tick_count = 0;
    pImpl->avg_tick_time_us = 0.0;
}

} // namespace gesture
} // namespace handctl
