/**
 * @file GesturePipeline.hpp
 * @brief Per-tick gesture classification, stabilization and control pipeline
 *
 * Turns one hand landmark frame per tick into a debounced gesture label,
 * continuous pan/zoom deltas, a pinch selection event and an ambient
 * rotation speed.
 *
 * @copyright 2025 handctl Project
 * @license MIT License
 */

#ifndef HANDCTL_GESTURE_PIPELINE_HPP
#define HANDCTL_GESTURE_PIPELINE_HPP

#include <cstddef>
#include <memory>
#include <string>
#include "GestureTypes.hpp"
#include "GestureStabilizer.hpp"
#include "PalmControlExtractor.hpp"
#include "PinchDebouncer.hpp"
#include "RotationMomentum.hpp"

namespace handctl {
namespace core {
class Configuration;
}
}

namespace handctl {
namespace gesture {

/**
 * @brief All cross-tick state of one pipeline instance
 *
 * Owned by the caller and mutated in place by process_tick(). Not copyable:
 * every field depends on the others within a tick, so the state is only
 * ever moved as a whole.
 */
struct GesturePipelineState {
    explicit GesturePipelineState(const GesturePipelineConfig& config = GesturePipelineConfig())
        : palm(config) {}

    GesturePipelineState(const GesturePipelineState&) = delete;
    GesturePipelineState& operator=(const GesturePipelineState&) = delete;
    GesturePipelineState(GesturePipelineState&&) = default;
    GesturePipelineState& operator=(GesturePipelineState&&) = default;

    GestureStabilizer stabilizer;
    PalmControlExtractor palm;
    PinchDebouncer pinch;
    RotationMomentum momentum;

    /// Lock flag seen on the previous tick (transition logging only)
    bool was_locked = false;
};

/**
 * @brief Process one tick
 *
 * Outputs for tick N depend only on tick N's input and the state left by
 * tick N-1. Never throws; @p config must satisfy is_valid().
 *
 * Order within a tick:
 * 1. pinch cooldown decays by elapsed_seconds
 * 2. no hand: streak, palm window, scale and pinch position reset; momentum decays
 * 3. hand: fingers + features -> raw label -> stabilizer
 * 4. raw OPEN_PALM drives pan/zoom, anything else releases palm control
 * 5. momentum update
 * 6. stable PINCH is offered to the debouncer, other labels release it
 */
TickOutput process_tick(GesturePipelineState& state,
                        const GesturePipelineConfig& config,
                        const TickInput& input);

/**
 * @brief Format the diagnostic label "Label (count/threshold) T:1 I:0 M:0 R:0 P:0"
 */
std::string format_debug_label(GestureLabel label,
                               const StabilityStatus& status,
                               const FingerState& fingers);

/**
 * @brief Build a pipeline configuration from the `gesture:` section
 *
 * Keys missing from @p configuration keep their defaults.
 *
 * @throws core::ConfigurationException if the result fails is_valid() or a
 *         stability threshold names an unknown label
 */
GesturePipelineConfig load_pipeline_config(const core::Configuration& configuration);

/**
 * @brief Thread-confined pipeline instance
 *
 * Owns one GesturePipelineState and serializes every call on a single
 * mutex, so a multi-threaded host treats the whole instance as one unit of
 * mutual exclusion.
 *
 * Example usage:
 * @code
 * GesturePipeline pipeline(load_pipeline_config(core::Configuration::getInstance()));
 * TickInput input;
 * input.landmarks = detector_output;
 * input.elapsed_seconds = dt;
 * TickOutput out = pipeline.process(input);
 * if (out.pinch_event) {
 *     select_photo_at(*out.pinch_event);
 * }
 * @endcode
 */
class GesturePipeline {
public:
    /**
     * @brief Constructor
     *
     * @throws core::ConfigurationException if @p config is invalid
     */
    explicit GesturePipeline(const GesturePipelineConfig& config = GesturePipelineConfig());

    ~GesturePipeline();

    // Disable copy and move
    GesturePipeline(const GesturePipeline&) = delete;
    GesturePipeline& operator=(const GesturePipeline&) = delete;
    GesturePipeline(GesturePipeline&&) = delete;
    GesturePipeline& operator=(GesturePipeline&&) = delete;

    /**
     * @brief Process one tick (see process_tick())
     */
    TickOutput process(const TickInput& input);

    /**
     * @brief Inject rotation momentum, decayed by subsequent ticks
     */
    void add_rotation_impulse(float amount);

    /**
     * @brief Drop all cross-tick state
     */
    void reset();

    GesturePipelineConfig get_config() const;

    /**
     * @brief Replace configuration and reset state
     *
     * @return false (configuration unchanged) if @p config is invalid
     */
    bool set_config(const GesturePipelineConfig& config);

    /**
     * @brief Get performance statistics
     *
     * @param ticks_processed Number of process() calls since the last reset
     * @param avg_tick_time_us Average process() duration in microseconds
     */
    void get_performance_stats(std::size_t& ticks_processed, double& avg_tick_time_us) const;

    void reset_performance_stats();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;  ///< PIMPL idiom for implementation hiding
};

} // namespace gesture
} // namespace handctl

#endif // HANDCTL_GESTURE_PIPELINE_HPP
