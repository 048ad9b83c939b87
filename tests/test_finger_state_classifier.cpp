/**
 * @file test_finger_state_classifier.cpp
 * @brief Unit tests for finger-state classification and hand geometry
 *
 * Validates:
 * - Extended/curled decision per finger
 * - Thumb extension (distance from pinky knuckle, IP fold)
 * - Scale and translation invariance
 * - Degenerate and non-finite geometry resolves to curled
 * - Geometric features (pinch, centroid, scale, thumb offset)
 */

#include <gtest/gtest.h>
#include <handctl/gesture/FingerStateClassifier.hpp>
#include <handctl/gesture/HandGeometry.hpp>
#include "HandPoseFixtures.hpp"
#include <cmath>
#include <limits>

using namespace handctl::gesture;
using namespace handctl::test;

TEST(FingerStateClassifierTest, OpenPalmHasAllFingersExtended) {
    FingerState fingers = classify_fingers(make_pose(GestureLabel::OPEN_PALM));

    EXPECT_TRUE(fingers.thumb);
    EXPECT_TRUE(fingers.index);
    EXPECT_TRUE(fingers.middle);
    EXPECT_TRUE(fingers.ring);
    EXPECT_TRUE(fingers.pinky);
    EXPECT_EQ(fingers.extended_count(), 4);
}

TEST(FingerStateClassifierTest, FistHasAllFingersCurled) {
    FingerState fingers = classify_fingers(make_pose(GestureLabel::CLOSED_FIST));

    EXPECT_FALSE(fingers.thumb);
    EXPECT_FALSE(fingers.index);
    EXPECT_FALSE(fingers.middle);
    EXPECT_FALSE(fingers.ring);
    EXPECT_FALSE(fingers.pinky);
    EXPECT_EQ(fingers.extended_count(), 0);
}

TEST(FingerStateClassifierTest, MixedFingers) {
    FingerState fingers = classify_fingers(make_hand(ThumbPose::TUCKED, true, false, true, false));

    EXPECT_FALSE(fingers.thumb);
    EXPECT_TRUE(fingers.index);
    EXPECT_FALSE(fingers.middle);
    EXPECT_TRUE(fingers.ring);
    EXPECT_FALSE(fingers.pinky);
    EXPECT_EQ(fingers.extended_count(), 2);
}

TEST(FingerStateClassifierTest, TipNearWristIsCurled) {
    HandLandmarks hand = make_pose(GestureLabel::OPEN_PALM);
    EXPECT_FALSE(is_finger_curled(hand, landmark::INDEX_TIP, landmark::INDEX_PIP, landmark::INDEX_MCP));

    // Pull the tip just inside 1.4x the knuckle-to-wrist distance
    float mcp_to_wrist = planar_distance(hand[landmark::INDEX_MCP], hand[landmark::WRIST]);
    hand[landmark::INDEX_TIP] = hand[landmark::WRIST] + cv::Point3f(0.0f, -1.35f * mcp_to_wrist, 0.0f);

    EXPECT_TRUE(is_finger_curled(hand, landmark::INDEX_TIP, landmark::INDEX_PIP, landmark::INDEX_MCP));
}

TEST(FingerStateClassifierTest, SevereBendOverridesDistance) {
    HandLandmarks hand = make_pose(GestureLabel::OPEN_PALM);

    // Far from the wrist, but folded onto its own knuckle
    hand[landmark::INDEX_MCP] = cv::Point3f(0.44f, 0.70f, 0.0f);
    hand[landmark::INDEX_PIP] = cv::Point3f(0.44f, 0.40f, 0.0f);
    hand[landmark::INDEX_TIP] = cv::Point3f(0.44f, 0.50f, 0.0f);

    float tip_to_wrist = planar_distance(hand[landmark::INDEX_TIP], hand[landmark::WRIST]);
    float mcp_to_wrist = planar_distance(hand[landmark::INDEX_MCP], hand[landmark::WRIST]);
    ASSERT_GT(tip_to_wrist, mcp_to_wrist * 1.4f);

    EXPECT_TRUE(is_finger_curled(hand, landmark::INDEX_TIP, landmark::INDEX_PIP, landmark::INDEX_MCP));
}

TEST(FingerStateClassifierTest, ThumbPoses) {
    EXPECT_TRUE(is_thumb_extended(make_hand(ThumbPose::SIDE, false, false, false, false)));
    EXPECT_TRUE(is_thumb_extended(make_hand(ThumbPose::UP, false, false, false, false)));
    EXPECT_TRUE(is_thumb_extended(make_hand(ThumbPose::DOWN, false, false, false, false)));
    EXPECT_FALSE(is_thumb_extended(make_hand(ThumbPose::TUCKED, false, false, false, false)));
}

TEST(FingerStateClassifierTest, ThumbFoldedAtIpIsNotExtended) {
    HandLandmarks hand = make_hand(ThumbPose::SIDE, false, false, false, false);

    // Tip far from the pinky but almost on top of the IP joint
    hand[landmark::THUMB_TIP] = hand[landmark::THUMB_IP] + cv::Point3f(-0.01f, 0.0f, 0.0f);

    EXPECT_FALSE(is_thumb_extended(hand));
}

TEST(FingerStateClassifierTest, ScaleAndTranslationInvariant) {
    const GestureLabel labels[] = {
        GestureLabel::OPEN_PALM, GestureLabel::CLOSED_FIST, GestureLabel::VICTORY,
        GestureLabel::I_LOVE_YOU, GestureLabel::POINTING_UP
    };

    for (GestureLabel label : labels) {
        FingerState reference = classify_fingers(make_pose(label));
        FingerState moved = classify_fingers(make_pose(label, 0.7f, cv::Point2f(0.15f, -0.1f)));

        EXPECT_EQ(reference.thumb, moved.thumb) << gesture_label_to_string(label);
        EXPECT_EQ(reference.index, moved.index) << gesture_label_to_string(label);
        EXPECT_EQ(reference.middle, moved.middle) << gesture_label_to_string(label);
        EXPECT_EQ(reference.ring, moved.ring) << gesture_label_to_string(label);
        EXPECT_EQ(reference.pinky, moved.pinky) << gesture_label_to_string(label);
    }
}

TEST(FingerStateClassifierTest, CollapsedHandIsAllCurled) {
    HandLandmarks hand;
    for (auto& p : hand.points) {
        p = cv::Point3f(0.5f, 0.5f, 0.0f);
    }

    FingerState fingers = classify_fingers(hand);

    EXPECT_FALSE(fingers.thumb);
    EXPECT_EQ(fingers.extended_count(), 0);
}

TEST(FingerStateClassifierTest, ZeroPalmWidthThumbNotExtended) {
    HandLandmarks hand = make_pose(GestureLabel::OPEN_PALM);
    hand[landmark::PINKY_MCP] = hand[landmark::INDEX_MCP];

    EXPECT_FALSE(is_thumb_extended(hand));
}

TEST(FingerStateClassifierTest, NonFiniteLandmarkIsCurled) {
    HandLandmarks hand = make_pose(GestureLabel::OPEN_PALM);
    hand[landmark::MIDDLE_TIP].x = std::numeric_limits<float>::quiet_NaN();
    hand[landmark::THUMB_TIP].y = std::numeric_limits<float>::infinity();

    FingerState fingers = classify_fingers(hand);

    EXPECT_FALSE(fingers.middle);
    EXPECT_FALSE(fingers.thumb);
    EXPECT_TRUE(fingers.index);
}

TEST(HandGeometryTest, PlanarDistanceIgnoresDepth) {
    cv::Point3f a(0.0f, 0.0f, 0.0f);
    cv::Point3f b(0.3f, 0.4f, 5.0f);

    EXPECT_FLOAT_EQ(planar_distance(a, b), 0.5f);
}

TEST(HandGeometryTest, FeaturesOfOpenPalm) {
    HandFeatures features = extract_features(make_pose(GestureLabel::OPEN_PALM));

    EXPECT_FALSE(features.is_pinching);
    EXPECT_NEAR(features.palm_centroid.x, (0.5f + 0.44f + 0.56f) / 3.0f, 1e-6f);
    EXPECT_NEAR(features.palm_centroid.y, (0.8f + 0.6f + 0.6f) / 3.0f, 1e-6f);
    EXPECT_NEAR(features.hand_scale, std::hypot(0.02f, 0.2f), 1e-6f);
    EXPECT_NEAR(features.thumb_vertical_offset, 0.67f - 0.70f, 1e-6f);
}

TEST(HandGeometryTest, PinchPositionIsMirrored) {
    HandFeatures features = extract_features(make_pose(GestureLabel::PINCH));

    EXPECT_TRUE(features.is_pinching);
    EXPECT_NEAR(features.pinch_distance, std::hypot(0.02f, 0.01f), 1e-5f);
    EXPECT_NEAR(features.pinch_position.x, 1.0f - 0.38f, 1e-5f);
    EXPECT_NEAR(features.pinch_position.y, 0.545f, 1e-5f);
}

TEST(HandGeometryTest, PinchThresholdFromConfig) {
    GesturePipelineConfig config;
    config.pinch_distance = 0.01f;

    HandFeatures features = extract_features(make_pose(GestureLabel::PINCH), config);

    EXPECT_FALSE(features.is_pinching);
}
