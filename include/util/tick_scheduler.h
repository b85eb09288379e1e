#pragma once
#include <chrono>

namespace util {

// TickScheduler: fixed-period deadlines for a periodic loop.
// advance() is called after each pass. If the pass overran, the next deadline
// is "now" (the next pass starts immediately) and the schedule is re-anchored,
// so an overrun never turns into a backlog of catch-up passes.
class TickScheduler {
public:
    using Clock = std::chrono::steady_clock;

    explicit TickScheduler(std::chrono::milliseconds period)
            : period_(period.count() > 0 ? period : std::chrono::milliseconds(1)),
              next_(Clock::now()) {}

    // Deadline of the next pass.
    Clock::time_point next() const { return next_; }

    // Returns true if the finished pass overran its slot.
    bool advance(Clock::time_point now = Clock::now()) {
        next_ += period_;
        if (now > next_) {
            next_ = now;
            return true;
        }
        return false;
    }

    void reset(Clock::time_point now = Clock::now()) {
        next_ = now;
    }

    std::chrono::milliseconds period() const { return period_; }

private:
    std::chrono::milliseconds period_;
    Clock::time_point next_;
};

} // namespace util
