/**
 * @file FrameGate.hpp
 * @brief De-duplication of detector ticks by video timestamp
 *
 * @copyright 2025 handctl Project
 * @license MIT License
 */

#ifndef HANDCTL_GESTURE_FRAME_GATE_HPP
#define HANDCTL_GESTURE_FRAME_GATE_HPP

#include <chrono>
#include <cstddef>
#include <optional>

namespace handctl {
namespace gesture {

/**
 * @brief Admits a tick only when the video timestamp advanced
 *
 * The render loop usually runs faster than the camera. A tick whose video
 * timestamp equals the previously admitted one is skipped entirely: no
 * state is touched and no output is produced. Admitted ticks report the
 * wall-clock seconds since the previously admitted tick, which feed
 * TickInput::elapsed_seconds.
 */
class FrameGate {
public:
    using Clock = std::chrono::steady_clock;

    FrameGate() = default;

    /**
     * @brief Offer one tick
     *
     * @param video_time_s Timestamp of the current video frame (seconds)
     * @param now Wall-clock time of this tick
     * @return Elapsed seconds since the last admitted tick, or empty if the
     *         frame is a duplicate
     */
    std::optional<float> admit(double video_time_s, Clock::time_point now);

    /**
     * @brief Forget the last video timestamp and prime the wall clock
     */
    void reset(Clock::time_point now);

    std::size_t admitted_frames() const { return admitted_; }

    std::size_t skipped_frames() const { return skipped_; }

private:
    std::optional<double> last_video_time_;
    std::optional<Clock::time_point> last_wall_time_;
    std::size_t admitted_ = 0;
    std::size_t skipped_ = 0;
};

} // namespace gesture
} // namespace handctl

#endif // HANDCTL_GESTURE_FRAME_GATE_HPP
