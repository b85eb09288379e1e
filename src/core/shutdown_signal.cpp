#include "core/shutdown_signal.h"

namespace core {

    int exit_code_for(ShutdownReason reason) {
        switch (reason) {
            case ShutdownReason::DEVICE_UNAVAILABLE:
                return kExitDeviceUnavailable;
            case ShutdownReason::USER_STOP:
            case ShutdownReason::NONE:
            default:
                return kExitOk;
        }
    }

    const char* to_string(ShutdownReason reason) {
        switch (reason) {
            case ShutdownReason::USER_STOP:
                return "user stop";
            case ShutdownReason::DEVICE_UNAVAILABLE:
                return "device unavailable";
            case ShutdownReason::NONE:
            default:
                return "none";
        }
    }

    void ShutdownSignal::request(ShutdownReason reason) {
        {
            std::lock_guard<std::mutex> lk(m_);
            if (reason_ == ShutdownReason::NONE) {
                reason_ = reason;
            }
            requested_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
    }

    ShutdownReason ShutdownSignal::reason() const {
        std::lock_guard<std::mutex> lk(m_);
        return reason_;
    }

    bool ShutdownSignal::wait_until(Clock::time_point deadline) {
        std::unique_lock<std::mutex> lk(m_);
        return cv_.wait_until(lk, deadline, [&] {
            return requested_.load(std::memory_order_acquire);
        });
    }

    bool ShutdownSignal::wait_for(std::chrono::milliseconds timeout) {
        return wait_until(Clock::now() + timeout);
    }

} // namespace core
