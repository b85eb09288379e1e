#include "detect/detection_loop.h"
#include "util/tick_scheduler.h"
#include "util/time_utils.h"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>

namespace detect {

    DetectionLoop::DetectionLoop(const Config& cfg,
                                 core::FrameSlot& slot,
                                 MotionDetector& detector,
                                 record::RecordingSessionManager& session,
                                 core::ShutdownSignal& shutdown)
            : cfg_(cfg), slot_(slot), detector_(detector), session_(session), shutdown_(shutdown) {
        cfg_.tick_interval_ms = std::max(1, cfg_.tick_interval_ms);
        cfg_.sample_fps = std::max(0, cfg_.sample_fps);
        if (cfg_.verbose) {
            std::cout << "[DETECT] loop config: tick_interval_ms=" << cfg_.tick_interval_ms
                      << " sample_fps=" << cfg_.sample_fps << std::endl;
        }
    }

    DetectionLoop::~DetectionLoop() {
        stop();
    }

    void DetectionLoop::start() {
        if (th_.joinable()) return;

        stopRequested_.store(false, std::memory_order_release);
        th_ = std::thread(&DetectionLoop::run, this);
    }

    void DetectionLoop::stop() {
        stopRequested_.store(true, std::memory_order_release);
        if (th_.joinable()) th_.join();
    }

    bool DetectionLoop::keepRunning() const {
        return !stopRequested_.load(std::memory_order_acquire) && !shutdown_.requested();
    }

    void DetectionLoop::run() {
        using Clock = std::chrono::steady_clock;

        if (cfg_.verbose) {
            std::cout << "[DETECT] detection thread started" << std::endl;
        }

        util::TickScheduler scheduler(std::chrono::milliseconds(cfg_.tick_interval_ms));

        while (keepRunning()) {
            detector_.tick(util::now_steady_ms());
            passes_.fetch_add(1, std::memory_order_relaxed);

            if (scheduler.advance(Clock::now())) {
                overruns_.fetch_add(1, std::memory_order_relaxed);
                if (cfg_.verbose) {
                    std::cout << "[DETECT] tick overran " << cfg_.tick_interval_ms << " ms" << std::endl;
                }
                continue;
            }

            sampleUntil(scheduler.next());

            if (shutdown_.wait_until(scheduler.next())) {
                break;
            }
        }

        session_.shutdown(util::now_steady_ms());

        if (cfg_.verbose) {
            std::cout << "[DETECT] detection thread exit, passes: "
                      << passes_.load(std::memory_order_relaxed) << std::endl;
        }
    }

    void DetectionLoop::sampleUntil(std::chrono::steady_clock::time_point deadline) {
        using Clock = std::chrono::steady_clock;

        if (cfg_.sample_fps <= 0) return;
        const auto period = std::chrono::milliseconds(std::max(1, 1000 / cfg_.sample_fps));

        auto next = Clock::now() + period;
        while (session_.recording() && keepRunning() && next < deadline) {
            if (shutdown_.wait_until(next)) return;
            if (stopRequested_.load(std::memory_order_acquire)) return;

            std::shared_ptr<const core::Frame> frame;
            std::uint64_t seq = 0;
            if (slot_.latest(frame, seq)) {
                session_.forward_frame(*frame, seq);
            }
            next += period;
        }
    }

} // namespace detect
