/**
 * @file DebugOverlay.cpp
 * @brief Implementation of the diagnostic overlay
 */

#include "handctl/gesture/DebugOverlay.hpp"
#include <opencv2/imgproc.hpp>
#include <string>

namespace handctl {
namespace gesture {

const std::array<std::pair<int, int>, 21> HAND_CONNECTIONS = {{
    {landmark::WRIST, landmark::THUMB_CMC},
    {landmark::THUMB_CMC, landmark::THUMB_MCP},
    {landmark::THUMB_MCP, landmark::THUMB_IP},
    {landmark::THUMB_IP, landmark::THUMB_TIP},
    {landmark::WRIST, landmark::INDEX_MCP},
    {landmark::INDEX_MCP, landmark::INDEX_PIP},
    {landmark::INDEX_PIP, landmark::INDEX_DIP},
    {landmark::INDEX_DIP, landmark::INDEX_TIP},
    {landmark::INDEX_MCP, landmark::MIDDLE_MCP},
    {landmark::MIDDLE_MCP, landmark::MIDDLE_PIP},
    {landmark::MIDDLE_PIP, landmark::MIDDLE_DIP},
    {landmark::MIDDLE_DIP, landmark::MIDDLE_TIP},
    {landmark::MIDDLE_MCP, landmark::RING_MCP},
    {landmark::RING_MCP, landmark::RING_PIP},
    {landmark::RING_PIP, landmark::RING_DIP},
    {landmark::RING_DIP, landmark::RING_TIP},
    {landmark::RING_MCP, landmark::PINKY_MCP},
    {landmark::WRIST, landmark::PINKY_MCP},
    {landmark::PINKY_MCP, landmark::PINKY_PIP},
    {landmark::PINKY_PIP, landmark::PINKY_DIP},
    {landmark::PINKY_DIP, landmark::PINKY_TIP}
}};

namespace {

cv::Point to_pixel(const cv::Point3f& p, int w, int h) {
    return cv::Point(static_cast<int>(p.x * w), static_cast<int>(p.y * h));
}

} // namespace

void draw_debug_overlay(cv::Mat& image,
                        const LandmarkFrame& hand,
                        const TickOutput& output) {
    if (image.empty()) {
        return;
    }

    int h = image.rows;
    int w = image.cols;

    if (hand) {
        // Skeleton
        for (const auto& connection : HAND_CONNECTIONS) {
            cv::line(image,
                     to_pixel((*hand)[connection.first], w, h),
                     to_pixel((*hand)[connection.second], w, h),
                     cv::Scalar(0, 255, 0), 2);
        }

        // Landmarks
        for (std::size_t i = 0; i < NUM_HAND_LANDMARKS; ++i) {
            cv::circle(image, to_pixel(hand->points[i], w, h), 5, cv::Scalar(0, 0, 255), -1);
        }
    }

    std::string label = output.debug_label ? *output.debug_label
                                           : gesture_label_to_string(output.raw_gesture);
    cv::putText(image, label, cv::Point(10, 30),
                cv::FONT_HERSHEY_SIMPLEX, 0.7, cv::Scalar(0, 255, 0), 2);

    if (output.stable_gesture) {
        cv::putText(image, "Stable: " + gesture_label_to_string(*output.stable_gesture),
                    cv::Point(10, 60), cv::FONT_HERSHEY_SIMPLEX, 0.7, cv::Scalar(255, 255, 0), 2);
    }

    if (output.pinch_event) {
        // Pinch position is mirrored for screen space; undo it for the camera image
        cv::Point center(static_cast<int>((1.0f - output.pinch_event->x) * w),
                         static_cast<int>(output.pinch_event->y * h));
        cv::circle(image, center, 14, cv::Scalar(0, 255, 255), 3);
    }
}

} // namespace gesture
} // namespace handctl
