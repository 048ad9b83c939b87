/**
 * @file PalmHistory.hpp
 * @brief Fixed-capacity sliding window of palm centroid samples
 *
 * Smooths the raw palm centroid with a moving average before pan deltas
 * are derived from it.
 *
 * @copyright 2025 handctl Project
 * @license MIT License
 */

#ifndef HANDCTL_GESTURE_PALM_HISTORY_HPP
#define HANDCTL_GESTURE_PALM_HISTORY_HPP

#include <cstddef>
#include <memory>
#include <vector>
#include <opencv2/core.hpp>

namespace handctl {
namespace gesture {

/**
 * @brief Sliding window of palm centroids
 *
 * When full, pushing evicts the oldest sample (FIFO).
 *
 * Typical usage:
 * - capacity 4 at 30 FPS = ~130 ms of history
 * - one sample pushed per tick with a hand, cleared when the hand is lost
 *
 * Thread-safety: Not thread-safe. External synchronization required.
 *
 * Performance: O(1) push, O(N) mean.
 */
class PalmHistory {
public:
    /**
     * @brief Constructor with capacity
     *
     * @param capacity Maximum number of samples (at least 1)
     */
    explicit PalmHistory(std::size_t capacity = 4);

    ~PalmHistory();

    // Disable copy, allow move
    PalmHistory(const PalmHistory&) = delete;
    PalmHistory& operator=(const PalmHistory&) = delete;
    PalmHistory(PalmHistory&&) noexcept;
    PalmHistory& operator=(PalmHistory&&) noexcept;

    /**
     * @brief Push a centroid sample, evicting the oldest when full
     */
    void push(const cv::Point2f& centroid);

    std::size_t size() const;

    bool is_full() const;

    bool is_empty() const;

    void clear();

    std::size_t capacity() const;

    /**
     * @brief Arithmetic mean of the stored samples
     *
     * @return Smoothed centroid, (0, 0) when empty
     */
    cv::Point2f mean() const;

    /**
     * @brief Samples in chronological order (oldest first)
     */
    std::vector<cv::Point2f> samples() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;  ///< PIMPL idiom for implementation hiding
};

} // namespace gesture
} // namespace handctl

#endif // HANDCTL_GESTURE_PALM_HISTORY_HPP
