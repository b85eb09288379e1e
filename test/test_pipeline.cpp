#include <gtest/gtest.h>
#include <chrono>
#include <thread>

#include "core/pipeline.h"
#include "test_helpers.hpp"

class PipelineTests : public ::testing::Test {
    protected:
        void SetUp() override {
            cfg.capture.max_consecutive_failures = 3;
            cfg.capture.retry_delay_ms = 1;
            cfg.capture.verbose = false;
            cfg.background.verbose = false;
            cfg.detection.tick_interval_ms = 20;
            cfg.detection.sample_fps = 10;
            cfg.detection.verbose = false;
            cfg.session.window_ms = 15000;
            cfg.session.verbose = false;

            base = testutil::textured_frame(21);
            moving = testutil::with_motion(base);
        }
        void TearDown() override {}

        core::PipelineConfig cfg;
        testutil::MemoryFootageWriter writer;
        cv::Mat base;
        cv::Mat moving;
};

TEST_F(PipelineTests, DeviceLossDuringRecordingShutsDownCleanly) {
    /*
        ~200 ms of still scene, ~300 ms of motion, then the camera stops
        delivering frames for good.
    */
    const cv::Mat& still = base;
    const cv::Mat& motion = moving;
    testutil::ScriptedCamera camera([&still, &motion](int call, core::Frame& out, std::string& err) {
        if (call >= 250) {
            err = "device removed";
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        out = testutil::make_frame(call < 100 ? still : motion, call * 2LL);
        return true;
    });

    core::MotionPipeline pipeline(cfg, camera, writer);
    const core::ShutdownReason reason = pipeline.run();

    ASSERT_EQ(reason, core::ShutdownReason::DEVICE_UNAVAILABLE);
    ASSERT_EQ(core::exit_code_for(reason), core::kExitDeviceUnavailable);
    ASSERT_EQ(pipeline.capture_loop().state(), capture::CaptureLoop::State::FAILED);

    ASSERT_GE(writer.opens(), 1);
    ASSERT_GE(writer.frames(), 1);
    ASSERT_EQ(writer.opens(), writer.closes());
    ASSERT_EQ(writer.open_count(), 0u);
    ASSERT_FALSE(pipeline.session().recording());
    ASSERT_EQ(camera.closed_count(), 1);
}

TEST_F(PipelineTests, UserStopEndsRunWithSuccess) {
    const cv::Mat& still = base;
    testutil::ScriptedCamera camera([&still](int call, core::Frame& out, std::string&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        out = testutil::make_frame(still, call * 2LL);
        return true;
    });

    core::MotionPipeline pipeline(cfg, camera, writer);
    std::thread stopper([&pipeline]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        pipeline.shutdown_signal().request(core::ShutdownReason::USER_STOP);
    });

    const core::ShutdownReason reason = pipeline.run();
    stopper.join();

    ASSERT_EQ(reason, core::ShutdownReason::USER_STOP);
    ASSERT_EQ(core::exit_code_for(reason), core::kExitOk);
    ASSERT_EQ(pipeline.capture_loop().state(), capture::CaptureLoop::State::STOPPED);
    ASSERT_GT(pipeline.capture_loop().frames_published(), 0u);
    ASSERT_GE(pipeline.detection_loop().passes(), 1u);
    ASSERT_TRUE(pipeline.background().has_average());
    ASSERT_EQ(writer.opens(), 0);
    ASSERT_EQ(camera.closed_count(), 1);
}

TEST_F(PipelineTests, UserStopWhileRecordingClosesDestination) {
    const cv::Mat& still = base;
    const cv::Mat& motion = moving;
    testutil::ScriptedCamera camera([&still, &motion](int call, core::Frame& out, std::string&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        out = testutil::make_frame(call < 100 ? still : motion, call * 2LL);
        return true;
    });

    core::MotionPipeline pipeline(cfg, camera, writer);
    std::thread stopper([&pipeline]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        pipeline.shutdown_signal().request(core::ShutdownReason::USER_STOP);
    });

    const core::ShutdownReason reason = pipeline.run();
    stopper.join();

    ASSERT_EQ(reason, core::ShutdownReason::USER_STOP);
    ASSERT_GE(writer.opens(), 1);
    ASSERT_EQ(writer.open_count(), 0u);
    ASSERT_EQ(writer.opens(), writer.closes());
}
