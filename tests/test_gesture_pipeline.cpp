/**
 * @file test_gesture_pipeline.cpp
 * @brief End-to-end tests for the per-tick gesture pipeline
 *
 * Validates:
 * - Palm pan scenario (sign, stability, no rotation)
 * - Pinch selection scenario (single event, suppression, re-arm)
 * - Locked interaction scenario
 * - Cross-tick resets on hand loss and gesture change
 * - Debug labels
 * - GesturePipeline wrapper (validation, impulses, statistics)
 */

#include <gtest/gtest.h>
#include <handctl/gesture/GesturePipeline.hpp>
#include <handctl/core/exception.h>
#include "HandPoseFixtures.hpp"

using namespace handctl;
using namespace handctl::gesture;
using namespace handctl::test;

class GesturePipelineTest : public ::testing::Test {
protected:
    TickOutput tick(const LandmarkFrame& landmarks, float elapsed = 1.0f / 30.0f, bool locked = false) {
        TickInput input;
        input.landmarks = landmarks;
        input.elapsed_seconds = elapsed;
        input.interaction_locked = locked;
        return process_tick(state, config, input);
    }

    GesturePipelineConfig config;
    GesturePipelineState state{config};
};

TEST_F(GesturePipelineTest, OpenPalmPansWithoutRotation) {
    std::vector<TickOutput> outputs;
    for (int i = 0; i < 3; ++i) {
        outputs.push_back(tick(make_pose(GestureLabel::OPEN_PALM, 1.0f, cv::Point2f(0.02f * i, 0.0f))));
    }

    for (const auto& out : outputs) {
        EXPECT_EQ(out.raw_gesture, GestureLabel::OPEN_PALM);
        EXPECT_FLOAT_EQ(out.rotation_speed, 0.0f);
        EXPECT_FLOAT_EQ(out.zoom_delta, 0.0f);
    }

    EXPECT_FALSE(outputs[0].stable_gesture.has_value());
    EXPECT_FLOAT_EQ(outputs[0].pan_delta.x, 0.0f);

    ASSERT_TRUE(outputs[1].stable_gesture.has_value());
    EXPECT_EQ(*outputs[1].stable_gesture, GestureLabel::OPEN_PALM);
    EXPECT_TRUE(outputs[1].gesture_onset);
    EXPECT_FALSE(outputs[2].gesture_onset);

    // Hand moves +x in the camera image, the view pans -x
    EXPECT_LT(outputs[1].pan_delta.x, 0.0f);
    EXPECT_LT(outputs[2].pan_delta.x, 0.0f);
    EXPECT_NEAR(outputs[1].pan_delta.x, -0.01f * 25.0f, 1e-3f);
    EXPECT_NEAR(outputs[2].pan_delta.x, -0.01f * 25.0f, 1e-3f);
    EXPECT_NEAR(outputs[2].pan_delta.y, 0.0f, 1e-5f);
}

TEST_F(GesturePipelineTest, PinchFiresOncePerSelection) {
    const cv::Point2f target(0.5f, 0.5f);
    const float dt = 0.2f;

    TickOutput t1 = tick(make_pinch_at(target), dt);
    EXPECT_EQ(t1.raw_gesture, GestureLabel::PINCH);
    EXPECT_FALSE(t1.pinch_event.has_value());

    TickOutput t2 = tick(make_pinch_at(target), dt);
    ASSERT_TRUE(t2.pinch_event.has_value());
    EXPECT_NEAR(t2.pinch_event->x, 0.5f, 1e-4f);
    EXPECT_NEAR(t2.pinch_event->y, 0.5f, 1e-4f);
    ASSERT_TRUE(t2.stable_gesture.has_value());
    EXPECT_EQ(*t2.stable_gesture, GestureLabel::PINCH);
    EXPECT_TRUE(t2.gesture_onset);

    TickOutput t3 = tick(make_pinch_at(target), dt);
    EXPECT_FALSE(t3.pinch_event.has_value());
    EXPECT_TRUE(t3.stable_gesture.has_value());

    TickOutput t4 = tick(LandmarkFrame(), dt);
    EXPECT_EQ(t4.raw_gesture, GestureLabel::NONE);
    EXPECT_FALSE(state.pinch.last_trigger_position().has_value());
    EXPECT_LE(state.pinch.cooldown_remaining(), 0.0f);

    // Streak restarted after the hand was lost
    TickOutput t5 = tick(make_pinch_at(target), dt);
    EXPECT_FALSE(t5.pinch_event.has_value());

    TickOutput t6 = tick(make_pinch_at(target), dt);
    EXPECT_TRUE(t6.pinch_event.has_value());
}

TEST_F(GesturePipelineTest, HeldPinchAtSamePositionNeverRefires) {
    tick(make_pinch_at(cv::Point2f(0.5f, 0.5f)), 0.1f);
    ASSERT_TRUE(tick(make_pinch_at(cv::Point2f(0.5f, 0.5f)), 0.1f).pinch_event.has_value());

    // Briefly switch to another gesture, come back at the same spot
    tick(make_pose(GestureLabel::CLOSED_FIST), 0.5f);
    tick(make_pinch_at(cv::Point2f(0.5f, 0.5f)), 0.5f);
    EXPECT_FALSE(tick(make_pinch_at(cv::Point2f(0.5f, 0.5f)), 0.5f).pinch_event.has_value());

    // A different spot fires
    tick(make_pose(GestureLabel::CLOSED_FIST), 0.1f);
    tick(make_pinch_at(cv::Point2f(0.3f, 0.5f)), 0.1f);
    TickOutput moved = tick(make_pinch_at(cv::Point2f(0.3f, 0.5f)), 0.1f);
    ASSERT_TRUE(moved.pinch_event.has_value());
    EXPECT_NEAR(moved.pinch_event->x, 0.3f, 1e-4f);
}

TEST_F(GesturePipelineTest, LockedInteractionSuppressesPalmControl) {
    state.momentum.add_impulse(3.0f);

    for (int i = 0; i < 5; ++i) {
        float scale = 1.0f + 0.1f * i;
        TickOutput out = tick(make_pose(GestureLabel::OPEN_PALM, scale, cv::Point2f(0.03f * i, 0.01f * i)),
                              1.0f / 30.0f, true);

        EXPECT_EQ(out.raw_gesture, GestureLabel::OPEN_PALM);
        EXPECT_FLOAT_EQ(out.pan_delta.x, 0.0f);
        EXPECT_FLOAT_EQ(out.pan_delta.y, 0.0f);
        EXPECT_FLOAT_EQ(out.zoom_delta, 0.0f);
        EXPECT_FLOAT_EQ(out.rotation_speed, 0.0f);
    }
    EXPECT_TRUE(state.palm.history().is_empty());
}

TEST_F(GesturePipelineTest, UnlockReseedsPan) {
    tick(make_pose(GestureLabel::OPEN_PALM), 0.03f, true);
    tick(make_pose(GestureLabel::OPEN_PALM, 1.0f, cv::Point2f(0.05f, 0.0f)), 0.03f, true);

    TickOutput first = tick(make_pose(GestureLabel::OPEN_PALM, 1.0f, cv::Point2f(0.10f, 0.0f)));
    EXPECT_FLOAT_EQ(first.pan_delta.x, 0.0f);

    TickOutput second = tick(make_pose(GestureLabel::OPEN_PALM, 1.0f, cv::Point2f(0.14f, 0.0f)));
    EXPECT_LT(second.pan_delta.x, 0.0f);
}

TEST_F(GesturePipelineTest, ZoomFollowsHandScale) {
    tick(make_pose(GestureLabel::OPEN_PALM, 1.0f));
    TickOutput seed = tick(make_pose(GestureLabel::OPEN_PALM, 1.0f));
    EXPECT_FLOAT_EQ(seed.zoom_delta, 0.0f);

    // Hand grows: zoom in
    TickOutput closer = tick(make_pose(GestureLabel::OPEN_PALM, 1.5f));
    EXPECT_GT(closer.zoom_delta, 0.0f);

    TickOutput farther = tick(make_pose(GestureLabel::OPEN_PALM, 0.6f));
    EXPECT_LT(farther.zoom_delta, 0.0f);
}

TEST_F(GesturePipelineTest, OtherGestureReleasesPalmControl) {
    tick(make_pose(GestureLabel::OPEN_PALM));
    tick(make_pose(GestureLabel::OPEN_PALM, 1.0f, cv::Point2f(0.02f, 0.0f)));

    TickOutput fist = tick(make_pose(GestureLabel::CLOSED_FIST));
    EXPECT_FLOAT_EQ(fist.pan_delta.x, 0.0f);
    EXPECT_FALSE(state.palm.last_smoothed_centroid().has_value());

    // Back to palm far away: no jump, only a re-seed
    TickOutput back = tick(make_pose(GestureLabel::OPEN_PALM, 1.0f, cv::Point2f(0.3f, 0.0f)));
    EXPECT_FLOAT_EQ(back.pan_delta.x, 0.0f);
    EXPECT_FLOAT_EQ(back.pan_delta.y, 0.0f);
}

TEST_F(GesturePipelineTest, HandLossResetsStreakAndWindow) {
    tick(make_pose(GestureLabel::OPEN_PALM));
    ASSERT_TRUE(tick(make_pose(GestureLabel::OPEN_PALM)).stable_gesture.has_value());

    TickOutput lost = tick(LandmarkFrame());
    EXPECT_EQ(lost.raw_gesture, GestureLabel::NONE);
    EXPECT_FALSE(lost.stable_gesture.has_value());
    EXPECT_TRUE(state.palm.history().is_empty());
    EXPECT_EQ(state.stabilizer.count(), 0u);

    EXPECT_FALSE(tick(make_pose(GestureLabel::OPEN_PALM)).stable_gesture.has_value());
}

TEST_F(GesturePipelineTest, NoneLabelIsNeverStable) {
    for (int i = 0; i < 10; ++i) {
        TickOutput out = tick(make_pose(GestureLabel::NONE));
        EXPECT_EQ(out.raw_gesture, GestureLabel::NONE);
        EXPECT_FALSE(out.stable_gesture.has_value());
    }
}

TEST_F(GesturePipelineTest, MomentumDampingWithAndWithoutHand) {
    state.momentum.add_impulse(1.0f);
    TickOutput with_hand = tick(make_pose(GestureLabel::CLOSED_FIST));
    EXPECT_NEAR(with_hand.rotation_speed, 0.9f * 0.08f, 1e-6f);

    TickOutput no_hand = tick(LandmarkFrame());
    EXPECT_NEAR(no_hand.rotation_speed, 0.81f * 0.05f, 1e-6f);

    TickOutput pinch = tick(make_pose(GestureLabel::PINCH));
    EXPECT_FLOAT_EQ(pinch.rotation_speed, 0.0f);
}

TEST_F(GesturePipelineTest, DebugLabels) {
    TickOutput off = tick(make_pose(GestureLabel::CLOSED_FIST));
    EXPECT_FALSE(off.debug_label.has_value());

    config.debug_labels = true;
    TickOutput fist = tick(make_pose(GestureLabel::CLOSED_FIST));
    ASSERT_TRUE(fist.debug_label.has_value());
    EXPECT_EQ(*fist.debug_label, "Closed_Fist (2/2) T:0 I:0 M:0 R:0 P:0");

    TickOutput palm = tick(make_pose(GestureLabel::OPEN_PALM));
    ASSERT_TRUE(palm.debug_label.has_value());
    EXPECT_EQ(*palm.debug_label, "Open_Palm (1/2) T:1 I:1 M:1 R:1 P:1");

    TickOutput none = tick(LandmarkFrame());
    ASSERT_TRUE(none.debug_label.has_value());
    EXPECT_EQ(*none.debug_label, "No hand");
}

TEST(FormatDebugLabelTest, Format) {
    StabilityStatus status;
    status.count = 3;
    status.threshold = 5;
    FingerState fingers;
    fingers.thumb = true;
    fingers.pinky = true;
    fingers.index = true;

    EXPECT_EQ(format_debug_label(GestureLabel::I_LOVE_YOU, status, fingers),
              "ILoveYou (3/5) T:1 I:1 M:0 R:0 P:1");
}

TEST(GesturePipelineClassTest, RejectsInvalidConfig) {
    GesturePipelineConfig config;
    config.momentum_decay = 1.5f;

    EXPECT_THROW(GesturePipeline pipeline(config), core::ConfigurationException);
}

TEST(GesturePipelineClassTest, ProcessMatchesFreeFunction) {
    GesturePipeline pipeline;
    GesturePipelineConfig config;
    GesturePipelineState state(config);

    for (int i = 0; i < 4; ++i) {
        TickInput input;
        input.landmarks = make_pose(GestureLabel::OPEN_PALM, 1.0f, cv::Point2f(0.015f * i, 0.0f));
        input.elapsed_seconds = 0.033f;

        TickOutput expected = process_tick(state, config, input);
        TickOutput actual = pipeline.process(input);

        EXPECT_EQ(actual.raw_gesture, expected.raw_gesture);
        EXPECT_EQ(actual.stable_gesture, expected.stable_gesture);
        EXPECT_FLOAT_EQ(actual.pan_delta.x, expected.pan_delta.x);
        EXPECT_FLOAT_EQ(actual.zoom_delta, expected.zoom_delta);
    }
}

TEST(GesturePipelineClassTest, RotationImpulse) {
    GesturePipeline pipeline;
    pipeline.add_rotation_impulse(2.0f);

    TickInput input;
    TickOutput out = pipeline.process(input);

    EXPECT_NEAR(out.rotation_speed, 1.8f * 0.05f, 1e-6f);

    pipeline.reset();
    EXPECT_FLOAT_EQ(pipeline.process(input).rotation_speed, 0.0f);
}

TEST(GesturePipelineClassTest, SetConfig) {
    GesturePipeline pipeline;

    GesturePipelineConfig invalid;
    invalid.palm_history_capacity = 0;
    EXPECT_FALSE(pipeline.set_config(invalid));
    EXPECT_EQ(pipeline.get_config().palm_history_capacity, 4u);

    GesturePipelineConfig tuned;
    tuned.stability_thresholds[GestureLabel::CLOSED_FIST] = 1;
    ASSERT_TRUE(pipeline.set_config(tuned));

    TickInput input;
    input.landmarks = make_pose(GestureLabel::CLOSED_FIST);
    TickOutput out = pipeline.process(input);
    ASSERT_TRUE(out.stable_gesture.has_value());
    EXPECT_EQ(*out.stable_gesture, GestureLabel::CLOSED_FIST);
}

TEST(GesturePipelineClassTest, PerformanceStats) {
    GesturePipeline pipeline;
    TickInput input;
    input.landmarks = make_pose(GestureLabel::VICTORY);

    for (int i = 0; i < 3; ++i) {
        pipeline.process(input);
    }

    std::size_t ticks = 0;
    double avg_us = -1.0;
    pipeline.get_performance_stats(ticks, avg_us);
    EXPECT_EQ(ticks, 3u);
    EXPECT_GE(avg_us, 0.0);

    pipeline.reset_performance_stats();
    pipeline.get_performance_stats(ticks, avg_us);
    EXPECT_EQ(ticks, 0u);
    EXPECT_DOUBLE_EQ(avg_us, 0.0);
}
