#pragma once
#include <atomic>
#include <cstdint>
#include <thread>

#include "core/frame_slot.h"
#include "core/shutdown_signal.h"
#include "detect/motion_detector.h"
#include "record/recording_session.h"

namespace detect {

// DetectionLoop: the timer-driven thread. One MotionDetector tick per
// `tick_interval_ms`; an overrunning tick is followed immediately by the next
// one (no backlog). While a session is recording, new frames are also sampled
// between ticks at `sample_fps` and forwarded to the session.
// On exit the session is shut down, closing any open destination.
    class DetectionLoop {
    public:
        struct Config {
            int tick_interval_ms = 1000;
            int sample_fps = 10;          // 0 = write only the frames seen by ticks
            bool verbose = true;
        };

        DetectionLoop(const Config& cfg,
                      core::FrameSlot& slot,
                      MotionDetector& detector,
                      record::RecordingSessionManager& session,
                      core::ShutdownSignal& shutdown);
        ~DetectionLoop();

        DetectionLoop(const DetectionLoop&) = delete;
        DetectionLoop& operator=(const DetectionLoop&) = delete;

        void start();
        void stop();

        // Loop body on the calling thread; returns once shutdown is requested
        // or stop() is called.
        void run();

        std::uint64_t passes() const { return passes_.load(std::memory_order_relaxed); }
        std::uint64_t overruns() const { return overruns_.load(std::memory_order_relaxed); }

    private:
        bool keepRunning() const;
        void sampleUntil(std::chrono::steady_clock::time_point deadline);

        Config cfg_;
        core::FrameSlot& slot_;
        MotionDetector& detector_;
        record::RecordingSessionManager& session_;
        core::ShutdownSignal& shutdown_;

        std::thread th_;
        std::atomic<bool> stopRequested_{false};
        std::atomic<std::uint64_t> passes_{0};
        std::atomic<std::uint64_t> overruns_{0};
    };

} // namespace detect
