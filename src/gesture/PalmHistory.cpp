/**
 * @file PalmHistory.cpp
 * @brief Implementation of the palm centroid window
 */

#include "handctl/gesture/PalmHistory.hpp"
#include <algorithm>
#include <deque>

namespace handctl {
namespace gesture {

/**
 * @brief PIMPL implementation for PalmHistory
 */
class PalmHistory::Impl {
public:
    std::deque<cv::Point2f> buffer;
    std::size_t max_capacity;

    explicit Impl(std::size_t capacity)
        : max_capacity(std::max<std::size_t>(capacity, 1)) {
    }

    void push(const cv::Point2f& centroid) {
        if (buffer.size() >= max_capacity) {
            buffer.pop_front();
        }
        buffer.push_back(centroid);
    }

    cv::Point2f mean() const {
        if (buffer.empty()) {
            return cv::Point2f(0.0f, 0.0f);
        }

        cv::Point2f sum(0.0f, 0.0f);
        for (const auto& sample : buffer) {
            sum += sample;
        }
        return sum / static_cast<float>(buffer.size());
    }
};

PalmHistory::PalmHistory(std::size_t capacity)
    : pImpl(std::make_unique<Impl>(capacity)) {
}

PalmHistory::~PalmHistory() = default;

PalmHistory::PalmHistory(PalmHistory&&) noexcept = default;
PalmHistory& PalmHistory::operator=(PalmHistory&&) noexcept = default;

void PalmHistory::push(const cv::Point2f& centroid) {
    pImpl->push(centroid);
}

std::size_t PalmHistory::size() const {
    return pImpl->buffer.size();
}

bool PalmHistory::is_full() const {
    return pImpl->buffer.size() >= pImpl->max_capacity;
}

bool PalmHistory::is_empty() const {
    return pImpl->buffer.empty();
}

void PalmHistory::clear() {
    pImpl->buffer.clear();
}

std::size_t PalmHistory::capacity() const {
    return pImpl->max_capacity;
}

cv::Point2f PalmHistory::mean() const {
    return pImpl->mean();
}

std::vector<cv::Point2f> PalmHistory::samples() const {
    return std::vector<cv::Point2f>(pImpl->buffer.begin(), pImpl->buffer.end());
}

} // namespace gesture
} // namespace handctl
