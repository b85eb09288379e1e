#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace core {

    enum class ShutdownReason {
        NONE,
        USER_STOP,           // SIGINT / SIGTERM
        DEVICE_UNAVAILABLE   // capture gave up after sustained failures
    };

    // Process exit codes.
    constexpr int kExitOk = 0;
    constexpr int kExitStartupFailure = 1;
    constexpr int kExitConfigError = 2;
    constexpr int kExitDeviceUnavailable = 3;

    int exit_code_for(ShutdownReason reason);
    const char* to_string(ShutdownReason reason);

// Cooperative cancellation shared by the capture and detection threads.
// The first request() wins; later reasons are ignored.
    class ShutdownSignal {
    public:
        using Clock = std::chrono::steady_clock;

        ShutdownSignal() = default;

        ShutdownSignal(const ShutdownSignal&) = delete;
        ShutdownSignal& operator=(const ShutdownSignal&) = delete;

        void request(ShutdownReason reason);

        bool requested() const { return requested_.load(std::memory_order_acquire); }
        ShutdownReason reason() const;

        // Sleep until `deadline` or until shutdown is requested.
        // Returns true if shutdown was requested.
        bool wait_until(Clock::time_point deadline);
        bool wait_for(std::chrono::milliseconds timeout);

    private:
        mutable std::mutex m_;
        std::condition_variable cv_;
        std::atomic<bool> requested_{false};
        ShutdownReason reason_ = ShutdownReason::NONE;
    };

} // namespace core
