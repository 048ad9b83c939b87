/**
 * @file LandmarkRecording.hpp
 * @brief Recorded landmark streams for offline replay
 *
 * A recording is a YAML document with a `ticks:` sequence. Each tick holds
 * the video timestamp, the wall-clock time, the interaction lock flag and
 * either 21 `[x, y, z]` triples or `null` when no hand was detected:
 *
 * @code
 * ticks:
 *   - video_time: 0.033
 *     wall_time: 0.034
 *     locked: false
 *     landmarks: [[0.5, 0.8, 0.0], [0.45, 0.75, 0.0], ...]
 *   - video_time: 0.066
 *     wall_time: 0.068
 *     landmarks: null
 * @endcode
 *
 * @copyright 2025 handctl Project
 * @license MIT License
 */

#ifndef HANDCTL_GESTURE_LANDMARK_RECORDING_HPP
#define HANDCTL_GESTURE_LANDMARK_RECORDING_HPP

#include <string>
#include <vector>
#include "GestureTypes.hpp"

namespace handctl {
namespace gesture {

/**
 * @brief One recorded detector tick
 */
struct RecordedTick {
    double video_time = 0.0;      ///< Video frame timestamp (seconds)
    double wall_time = 0.0;       ///< Wall-clock time since recording start (seconds)
    bool locked = false;          ///< Interaction lock flag (optional, default false)
    LandmarkFrame landmarks;      ///< Empty when no hand was detected
};

/**
 * @brief Parse a recording from YAML text
 *
 * @throws core::FileException (ERROR_FILE_FORMAT) on malformed input
 */
std::vector<RecordedTick> parse_landmark_recording(const std::string& text);

/**
 * @brief Load a recording from disk
 *
 * @throws core::FileException (ERROR_FILE_NOT_FOUND / ERROR_FILE_FORMAT)
 */
std::vector<RecordedTick> load_landmark_recording(const std::string& path);

} // namespace gesture
} // namespace handctl

#endif // HANDCTL_GESTURE_LANDMARK_RECORDING_HPP
