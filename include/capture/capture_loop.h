#pragma once
#include <atomic>
#include <cstdint>
#include <thread>

#include "capture/camera.h"
#include "core/frame_slot.h"
#include "core/shutdown_signal.h"

namespace capture {

// CaptureLoop: pulls frames from the camera and publishes each one into the
// FrameSlot. Never waits on the detection side.
// A single failed acquisition is logged and retried; `max_consecutive_failures`
// failures in a row raise DEVICE_UNAVAILABLE on the shutdown signal.
    class CaptureLoop {
    public:
        enum class State {
            STOPPED,
            RUNNING,
            FAILED
        };

        struct Config {
            int max_consecutive_failures = 10;
            int retry_delay_ms = 100;
            bool verbose = true;
        };

        CaptureLoop(Camera& camera,
                    core::FrameSlot& slot,
                    core::ShutdownSignal& shutdown,
                    const Config& cfg);
        ~CaptureLoop();

        CaptureLoop(const CaptureLoop&) = delete;
        CaptureLoop& operator=(const CaptureLoop&) = delete;

        // Runs run() on a worker thread.
        void start();
        // Asks the worker to leave its loop and joins it.
        void stop();

        // Loop body; returns when shutdown is requested, stop() is called or the
        // device is declared unavailable. Closes the camera on return.
        void run();

        State state() const { return state_.load(std::memory_order_acquire); }
        std::uint64_t frames_published() const { return frames_published_.load(std::memory_order_relaxed); }
        std::uint64_t acquire_failures() const { return acquire_failures_.load(std::memory_order_relaxed); }

    private:
        bool keepRunning() const;

        Camera& camera_;
        core::FrameSlot& slot_;
        core::ShutdownSignal& shutdown_;
        Config cfg_;

        std::thread th_;
        std::atomic<bool> stopRequested_{false};
        std::atomic<State> state_{State::STOPPED};
        std::atomic<std::uint64_t> frames_published_{0};
        std::atomic<std::uint64_t> acquire_failures_{0};
    };

} // namespace capture
