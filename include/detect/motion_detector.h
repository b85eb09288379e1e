#pragma once
#include <cstdint>

#include "core/frame_slot.h"
#include "core/motion_event.h"
#include "detect/background_model.h"
#include "detect/exposure_guard.h"
#include "record/recording_session.h"

namespace detect {

// MotionDetector: one analysis pass per tick.
// latest frame -> prepare -> difference against the background -> exposure
// filter -> threshold -> session manager -> background commit check.
    class MotionDetector {
    public:
        struct Config {
            double threshold = 10.0;  // detected = magnitude > threshold
            bool verbose = false;     // one log line per tick
        };

        struct TickResult {
            bool sampled = false;     // false: the slot was empty, tick skipped
            std::uint64_t seq = 0;
            core::MotionEvent event;
            bool committed = false;   // background average replaced on this tick
        };

        MotionDetector(const Config& cfg,
                       core::FrameSlot& slot,
                       BackgroundModel& background,
                       const ExposureGuard& guard,
                       record::RecordingSessionManager& session);

        TickResult tick(long long now_ms);

        std::uint64_t ticks() const { return ticks_; }
        std::uint64_t skipped_ticks() const { return skipped_ticks_; }
        std::uint64_t motion_ticks() const { return motion_ticks_; }

    private:
        Config cfg_;
        core::FrameSlot& slot_;
        BackgroundModel& background_;
        const ExposureGuard& guard_;
        record::RecordingSessionManager& session_;

        std::uint64_t ticks_ = 0;
        std::uint64_t skipped_ticks_ = 0;
        std::uint64_t motion_ticks_ = 0;
    };

} // namespace detect
