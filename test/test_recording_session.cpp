#include <gtest/gtest.h>
#include <vector>

#include "record/recording_session.h"
#include "test_helpers.hpp"

namespace {

    core::MotionEvent event_at(long long ts_ms, bool detected) {
        core::MotionEvent ev;
        ev.ts_ms = ts_ms;
        ev.detected = detected;
        ev.magnitude = detected ? 50.0 : 0.0;
        ev.raw_magnitude = ev.magnitude;
        return ev;
    }

}

class RecordingSessionTests : public ::testing::Test {
    protected:
        void SetUp() override {
            cfg.window_ms = 15000;
            cfg.verbose = false;
            image = cv::Mat(24, 32, CV_8UC3, cv::Scalar(10, 20, 30));
        }
        void TearDown() override {}

        /* Feeds one event per second, each with a fresh frame. */
        void feed(record::RecordingSessionManager& mgr, long long ts_ms, bool detected) {
            mgr.on_motion_event(event_at(ts_ms, detected), testutil::make_frame(image, ts_ms), ++seq);
        }

        record::RecordingSessionManager::Config cfg;
        testutil::MemoryFootageWriter writer;
        cv::Mat image;
        std::uint64_t seq = 0;
};

TEST_F(RecordingSessionTests, StaysIdleWithoutMotion) {
    record::RecordingSessionManager mgr(writer, cfg);
    for (int t = 0; t < 10; ++t) {
        feed(mgr, t * 1000, false);
    }
    ASSERT_EQ(mgr.state(), record::SessionState::IDLE);
    ASSERT_EQ(writer.opens(), 0);
    ASSERT_EQ(writer.frames(), 0);
}

TEST_F(RecordingSessionTests, MotionOpensDestinationAndWritesFrame) {
    record::RecordingSessionManager mgr(writer, cfg);
    feed(mgr, 2000, true);

    ASSERT_EQ(mgr.state(), record::SessionState::RECORDING);
    ASSERT_EQ(writer.opens(), 1);
    ASSERT_EQ(writer.frames(), 1);
    ASSERT_EQ(mgr.session().deadline_ms, 17000);
    ASSERT_EQ(mgr.sessions_started(), 1);
}

TEST_F(RecordingSessionTests, GracePeriodThenClose) {
    record::RecordingSessionManager mgr(writer, cfg);
    feed(mgr, 2000, true);

    for (long long t = 3000; t < 17000; t += 1000) {
        feed(mgr, t, false);
        ASSERT_EQ(mgr.state(), record::SessionState::RECORDING) << "t=" << t;
    }

    feed(mgr, 17000, false);
    ASSERT_EQ(mgr.state(), record::SessionState::IDLE);
    ASSERT_EQ(writer.opens(), 1);
    ASSERT_EQ(writer.closes(), 1);
    ASSERT_EQ(writer.open_count(), 0u);
    // 2000 .. 17000 inclusive
    ASSERT_EQ(writer.frames(), 16);
}

TEST_F(RecordingSessionTests, MotionExtendsDeadline) {
    record::RecordingSessionManager mgr(writer, cfg);
    feed(mgr, 0, true);
    feed(mgr, 10000, true);
    ASSERT_EQ(mgr.session().deadline_ms, 25000);

    feed(mgr, 15000, false);
    ASSERT_EQ(mgr.state(), record::SessionState::RECORDING);
    feed(mgr, 24999, false);
    ASSERT_EQ(mgr.state(), record::SessionState::RECORDING);
    feed(mgr, 25000, false);
    ASSERT_EQ(mgr.state(), record::SessionState::IDLE);
    ASSERT_EQ(writer.opens(), 1);
}

TEST_F(RecordingSessionTests, ContinuousMotionKeepsOneSession) {
    record::RecordingSessionManager mgr(writer, cfg);
    for (int t = 0; t < 100; ++t) {
        feed(mgr, t * 1000, true);
        ASSERT_EQ(mgr.state(), record::SessionState::RECORDING);
    }
    ASSERT_EQ(writer.opens(), 1);
    ASSERT_EQ(writer.closes(), 0);
    ASSERT_EQ(writer.frames(), 100);
}

TEST_F(RecordingSessionTests, SecondBurstOpensNewDestination) {
    record::RecordingSessionManager mgr(writer, cfg);
    feed(mgr, 0, true);
    feed(mgr, 15000, false);
    ASSERT_EQ(mgr.state(), record::SessionState::IDLE);

    feed(mgr, 20000, true);
    ASSERT_EQ(mgr.state(), record::SessionState::RECORDING);
    ASSERT_EQ(writer.opens(), 2);
    ASSERT_EQ(writer.closes(), 1);
}

TEST_F(RecordingSessionTests, OpenFailureStaysIdle) {
    writer.fail_open = true;
    record::RecordingSessionManager mgr(writer, cfg);
    feed(mgr, 0, true);

    ASSERT_EQ(mgr.state(), record::SessionState::IDLE);
    ASSERT_EQ(mgr.write_failures(), 1);
    ASSERT_EQ(writer.open_count(), 0u);

    // Next motion tries again.
    writer.fail_open = false;
    feed(mgr, 1000, true);
    ASSERT_EQ(mgr.state(), record::SessionState::RECORDING);
}

TEST_F(RecordingSessionTests, WriteFailureClosesDestinationAndReturnsIdle) {
    writer.fail_write_at = 2;
    record::RecordingSessionManager mgr(writer, cfg);

    std::vector<record::SessionInfo> ended;
    mgr.set_on_session_ended([&](const record::SessionInfo& s) { ended.push_back(s); });

    feed(mgr, 0, true);
    feed(mgr, 1000, true);
    feed(mgr, 2000, true);   // third write fails

    ASSERT_EQ(mgr.state(), record::SessionState::IDLE);
    ASSERT_EQ(mgr.write_failures(), 1);
    ASSERT_EQ(writer.opens(), writer.closes());
    ASSERT_EQ(writer.open_count(), 0u);
    ASSERT_EQ(ended.size(), 1u);
    ASSERT_TRUE(ended[0].aborted);
    ASSERT_EQ(ended[0].frames_written, 2);
}

TEST_F(RecordingSessionTests, ForwardedFramesWrittenOncePerSequence) {
    record::RecordingSessionManager mgr(writer, cfg);

    // Idle: dropped.
    mgr.forward_frame(testutil::make_frame(image, 500), 1);
    ASSERT_EQ(writer.frames(), 0);

    mgr.on_motion_event(event_at(1000, true), testutil::make_frame(image, 1000), 2);
    mgr.forward_frame(testutil::make_frame(image, 1000), 2);   // same frame as the tick
    mgr.forward_frame(testutil::make_frame(image, 1100), 3);
    mgr.forward_frame(testutil::make_frame(image, 1100), 3);
    mgr.forward_frame(testutil::make_frame(image, 1200), 4);

    const std::vector<long long> ts = writer.written_ts();
    ASSERT_EQ(ts.size(), 3u);
    ASSERT_EQ(ts[0], 1000);
    ASSERT_EQ(ts[1], 1100);
    ASSERT_EQ(ts[2], 1200);
}

TEST_F(RecordingSessionTests, ShutdownClosesOpenDestination) {
    record::RecordingSessionManager mgr(writer, cfg);
    feed(mgr, 0, true);
    ASSERT_EQ(writer.open_count(), 1u);

    mgr.shutdown(500);
    ASSERT_EQ(mgr.state(), record::SessionState::IDLE);
    ASSERT_EQ(writer.open_count(), 0u);
    ASSERT_EQ(writer.closes(), 1);

    // Nothing left to close.
    mgr.shutdown(600);
    ASSERT_EQ(writer.closes(), 1);
}

TEST_F(RecordingSessionTests, DestructorClosesOpenDestination) {
    {
        record::RecordingSessionManager mgr(writer, cfg);
        feed(mgr, 0, true);
    }
    ASSERT_EQ(writer.open_count(), 0u);
    ASSERT_EQ(writer.closes(), 1);
}

TEST_F(RecordingSessionTests, ListenersSeeStartAndEnd) {
    record::RecordingSessionManager mgr(writer, cfg);
    int started = 0;
    long long ended_after = -1;
    mgr.set_on_session_started([&](const record::SessionInfo&) { ++started; });
    mgr.set_on_session_ended([&](const record::SessionInfo& s) { ended_after = s.end_ms - s.start_ms; });

    feed(mgr, 1000, true);
    feed(mgr, 16000, false);

    ASSERT_EQ(started, 1);
    ASSERT_EQ(ended_after, 15000);
}
