#include "detect/motion_detector.h"

#include <algorithm>
#include <iostream>
#include <memory>
#include <string>

namespace detect {

    MotionDetector::MotionDetector(const Config& cfg,
                                   core::FrameSlot& slot,
                                   BackgroundModel& background,
                                   const ExposureGuard& guard,
                                   record::RecordingSessionManager& session)
            : cfg_(cfg), slot_(slot), background_(background), guard_(guard), session_(session) {
        cfg_.threshold = std::max(0.0, cfg_.threshold);
        if (cfg_.verbose) {
            std::cout << "[DETECT] config: threshold=" << cfg_.threshold << std::endl;
        }
    }

    MotionDetector::TickResult MotionDetector::tick(long long now_ms) {
        TickResult result;
        ++ticks_;

        // The frame is held for this pass only.
        std::shared_ptr<const core::Frame> frame;
        std::uint64_t seq = 0;
        if (!slot_.latest(frame, seq) || frame->image.empty()) {
            ++skipped_ticks_;
            return result;
        }
        result.sampled = true;
        result.seq = seq;

        const cv::Mat prepared = background_.prepare(frame->image);

        if (!background_.has_average()) {
            background_.seed(prepared, now_ms);
        } else if (background_.average().size() != prepared.size()) {
            // The average of the old geometry is useless; it is replaced only
            // from IDLE, so an open recording ends first.
            if (session_.recording()) {
                std::cout << "[DETECT] frame size changed during recording, session closed" << std::endl;
                session_.shutdown(now_ms);
            }
            std::cout << "[DETECT] frame size changed, background re-seeded" << std::endl;
            background_.seed(prepared, now_ms);
        }

        const double raw = background_.difference(prepared);
        const ExposureGuard::Result filtered = guard_.filter(raw, prepared, background_);

        core::MotionEvent& ev = result.event;
        ev.ts_ms = now_ms;
        ev.raw_magnitude = raw;
        ev.magnitude = filtered.magnitude;
        ev.exposure_suppressed = filtered.suppressed;
        ev.detected = ev.magnitude > cfg_.threshold;
        if (ev.detected) {
            ++motion_ticks_;
        }

        if (cfg_.verbose) {
            std::cout << "[DETECT] tick " << ticks_ << " seq=" << seq
                      << " magnitude=" << ev.magnitude
                      << (ev.exposure_suppressed ? " (exposure, raw=" + std::to_string(raw) + ")" : std::string())
                      << (ev.detected ? " MOTION" : "")
                      << std::endl;
        }

        session_.on_motion_event(ev, *frame, seq);

        result.committed = background_.consider_commit(prepared, ev.magnitude, now_ms, session_.recording());
        return result;
    }

} // namespace detect
