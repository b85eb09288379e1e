#include <gtest/gtest.h>
#include <memory>

#include "core/frame_slot.h"
#include "detect/background_model.h"
#include "detect/exposure_guard.h"
#include "detect/motion_detector.h"
#include "record/recording_session.h"
#include "test_helpers.hpp"

/*
    One tick per simulated second: publish a frame, then tick at t = n * 1000.
    Stability window of 2 ticks, recording window of 15 s.
*/
class MotionDetectorTests : public ::testing::Test {
    protected:
        void SetUp() override {
            base = testutil::textured_frame(3);
        }
        void TearDown() override {}

        void build(bool guard_enabled = true) {
            detect::BackgroundModel::Config bg;
            bg.stability_ticks = 2;
            bg.verbose = false;
            detect::ExposureGuard::Config eg;
            eg.enabled = guard_enabled;
            record::RecordingSessionManager::Config sc;
            sc.window_ms = 15000;
            sc.verbose = false;
            detect::MotionDetector::Config dc;
            dc.threshold = 10.0;

            background = std::make_unique<detect::BackgroundModel>(bg);
            guard = std::make_unique<detect::ExposureGuard>(eg);
            session = std::make_unique<record::RecordingSessionManager>(writer, sc);
            detector = std::make_unique<detect::MotionDetector>(dc, slot, *background, *guard, *session);
        }

        detect::MotionDetector::TickResult step(int n, const cv::Mat& image) {
            slot.publish(testutil::make_frame(image, n * 1000LL));
            return detector->tick(n * 1000LL);
        }

        cv::Mat base;
        core::FrameSlot slot;
        testutil::MemoryFootageWriter writer;
        std::unique_ptr<detect::BackgroundModel> background;
        std::unique_ptr<detect::ExposureGuard> guard;
        std::unique_ptr<record::RecordingSessionManager> session;
        std::unique_ptr<detect::MotionDetector> detector;
};

TEST_F(MotionDetectorTests, EmptySlotSkipsTick) {
    build();
    const detect::MotionDetector::TickResult r = detector->tick(1000);

    ASSERT_FALSE(r.sampled);
    ASSERT_EQ(detector->skipped_ticks(), 1u);
    ASSERT_FALSE(background->has_average());
    ASSERT_EQ(writer.opens(), 0);
}

TEST_F(MotionDetectorTests, FirstFrameSeedsBackground) {
    build();
    const detect::MotionDetector::TickResult r = step(1, base);

    ASSERT_TRUE(r.sampled);
    ASSERT_TRUE(background->has_average());
    ASSERT_FALSE(r.event.detected);
    ASSERT_DOUBLE_EQ(r.event.magnitude, 0.0);
    ASSERT_EQ(r.event.ts_ms, 1000);
}

TEST_F(MotionDetectorTests, QuietSceneCommitsAfterWindowWithoutRecording) {
    build();
    const cv::Mat quiet = testutil::shifted(base, 3);

    ASSERT_FALSE(step(1, base).committed);
    ASSERT_TRUE(step(2, quiet).committed);
    ASSERT_FALSE(step(3, quiet).committed);

    ASSERT_EQ(background->commits(), 1);
    ASSERT_EQ(session->state(), record::SessionState::IDLE);
    ASSERT_EQ(writer.opens(), 0);
}

TEST_F(MotionDetectorTests, SingleMotionTickRecordsForWindow) {
    build();
    step(1, base);

    const detect::MotionDetector::TickResult hit = step(2, testutil::with_motion(base));
    ASSERT_TRUE(hit.event.detected);
    ASSERT_GT(hit.event.magnitude, 10.0);
    ASSERT_EQ(session->state(), record::SessionState::RECORDING);

    for (int n = 3; n < 17; ++n) {
        step(n, base);
        ASSERT_EQ(session->state(), record::SessionState::RECORDING) << "tick " << n;
    }
    step(17, base);
    ASSERT_EQ(session->state(), record::SessionState::IDLE);

    ASSERT_EQ(writer.opens(), 1);
    ASSERT_EQ(writer.closes(), 1);
    ASSERT_EQ(writer.frames(), 16);
    // Recording held the background still.
    ASSERT_EQ(background->commits(), 0);
}

TEST_F(MotionDetectorTests, ContinuousMotionNeverLeavesRecording) {
    build();
    step(1, base);
    const cv::Mat moving = testutil::with_motion(base);

    for (int n = 2; n < 102; ++n) {
        ASSERT_TRUE(step(n, moving).event.detected);
        ASSERT_EQ(session->state(), record::SessionState::RECORDING);
    }
    ASSERT_EQ(writer.opens(), 1);
    ASSERT_EQ(background->commits(), 0);
}

TEST_F(MotionDetectorTests, ExposureJumpIgnoredWithGuard) {
    build(true);
    step(1, base);

    const detect::MotionDetector::TickResult r = step(2, testutil::shifted(base, 30));
    ASSERT_TRUE(r.event.exposure_suppressed);
    ASSERT_FALSE(r.event.detected);
    ASSERT_GT(r.event.raw_magnitude, 10.0);
    ASSERT_EQ(session->state(), record::SessionState::IDLE);
}

TEST_F(MotionDetectorTests, ExposureJumpDetectedWithoutGuard) {
    build(false);
    step(1, base);

    const detect::MotionDetector::TickResult r = step(2, testutil::shifted(base, 30));
    ASSERT_FALSE(r.event.exposure_suppressed);
    ASSERT_TRUE(r.event.detected);
    ASSERT_EQ(session->state(), record::SessionState::RECORDING);
}

TEST_F(MotionDetectorTests, FrameSizeChangeReseeds) {
    build();
    step(1, base);

    cv::Mat larger;
    cv::resize(base, larger, cv::Size(640, 480));
    const detect::MotionDetector::TickResult r = step(2, larger);

    ASSERT_TRUE(r.sampled);
    ASSERT_FALSE(r.event.detected);
    ASSERT_EQ(background->average().cols, 160);
}

TEST_F(MotionDetectorTests, FrameSizeChangeDuringRecordingEndsSessionBeforeReseed) {
    build();
    step(1, base);
    ASSERT_TRUE(step(2, testutil::with_motion(base)).event.detected);
    ASSERT_TRUE(session->recording());

    // Width of the average at the moment the session ends.
    int average_cols_at_close = -1;
    session->set_on_session_ended([this, &average_cols_at_close](const record::SessionInfo&) {
        average_cols_at_close = background->average().cols;
    });

    cv::Mat larger;
    cv::resize(testutil::with_motion(base), larger, cv::Size(640, 480));
    step(3, larger);

    ASSERT_EQ(average_cols_at_close, 80);
    ASSERT_EQ(writer.closes(), 1);
    ASSERT_EQ(writer.open_count(), 0u);
    ASSERT_EQ(session->state(), record::SessionState::IDLE);
    ASSERT_EQ(background->average().cols, 160);
    ASSERT_EQ(background->commits(), 0);
}

TEST_F(MotionDetectorTests, SameFrameTwiceGivesSameMagnitude) {
    build();
    step(1, base);
    slot.publish(testutil::make_frame(testutil::with_motion(base), 2000));

    const double a = detector->tick(2000).event.magnitude;
    const double b = detector->tick(3000).event.magnitude;
    ASSERT_DOUBLE_EQ(a, b);
    // One frame in the slot, one write.
    ASSERT_EQ(writer.frames(), 1);
}
