#include "capture/capture_loop.h"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <string>
#include <utility>

namespace capture {

    CaptureLoop::CaptureLoop(Camera& camera,
                             core::FrameSlot& slot,
                             core::ShutdownSignal& shutdown,
                             const Config& cfg)
            : camera_(camera), slot_(slot), shutdown_(shutdown), cfg_(cfg) {
        cfg_.max_consecutive_failures = std::max(1, cfg_.max_consecutive_failures);
        cfg_.retry_delay_ms = std::max(0, cfg_.retry_delay_ms);

        if (cfg_.verbose) {
            std::cout << "[CAPTURE] config: max_consecutive_failures=" << cfg_.max_consecutive_failures
                      << " retry_delay_ms=" << cfg_.retry_delay_ms
                      << std::endl;
        }
    }

    CaptureLoop::~CaptureLoop() {
        stop();
    }

    void CaptureLoop::start() {
        if (th_.joinable()) return;

        stopRequested_.store(false, std::memory_order_release);
        th_ = std::thread(&CaptureLoop::run, this);
    }

    void CaptureLoop::stop() {
        stopRequested_.store(true, std::memory_order_release);
        if (th_.joinable()) th_.join();
    }

    bool CaptureLoop::keepRunning() const {
        return !stopRequested_.load(std::memory_order_acquire) && !shutdown_.requested();
    }

    void CaptureLoop::run() {
        state_.store(State::RUNNING, std::memory_order_release);
        if (cfg_.verbose) {
            std::cout << "[CAPTURE] capture thread started" << std::endl;
        }

        int consecutive_failures = 0;
        std::string err;

        while (keepRunning()) {
            core::Frame frame;
            err.clear();

            if (camera_.acquire_frame(frame, err)) {
                if (consecutive_failures > 0 && cfg_.verbose) {
                    std::cout << "[CAPTURE] camera recovered after " << consecutive_failures
                              << " failed acquisitions" << std::endl;
                }
                consecutive_failures = 0;
                slot_.publish(std::move(frame));
                frames_published_.fetch_add(1, std::memory_order_relaxed);
                continue;
            }

            ++consecutive_failures;
            acquire_failures_.fetch_add(1, std::memory_order_relaxed);
            std::cerr << "[CAPTURE] acquire failed (" << consecutive_failures << "/"
                      << cfg_.max_consecutive_failures << "): " << err << std::endl;

            if (consecutive_failures >= cfg_.max_consecutive_failures) {
                std::cerr << "[CAPTURE] FATAL: device unavailable after "
                          << consecutive_failures << " consecutive failures" << std::endl;
                state_.store(State::FAILED, std::memory_order_release);
                shutdown_.request(core::ShutdownReason::DEVICE_UNAVAILABLE);
                break;
            }

            if (cfg_.retry_delay_ms > 0) {
                shutdown_.wait_for(std::chrono::milliseconds(cfg_.retry_delay_ms));
            }
        }

        camera_.close();

        if (state_.load(std::memory_order_acquire) != State::FAILED) {
            state_.store(State::STOPPED, std::memory_order_release);
        }
        if (cfg_.verbose) {
            std::cout << "[CAPTURE] capture thread exit, frames published: "
                      << frames_published_.load(std::memory_order_relaxed) << std::endl;
        }
    }

} // namespace capture
