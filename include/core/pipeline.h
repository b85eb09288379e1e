#pragma once
#include "capture/camera.h"
#include "capture/capture_loop.h"
#include "core/frame_slot.h"
#include "core/shutdown_signal.h"
#include "detect/background_model.h"
#include "detect/detection_loop.h"
#include "detect/exposure_guard.h"
#include "detect/motion_detector.h"
#include "record/footage_writer.h"
#include "record/recording_session.h"

namespace core {

    struct PipelineConfig {
        capture::CaptureLoop::Config capture;
        detect::BackgroundModel::Config background;
        detect::ExposureGuard::Config exposure;
        detect::MotionDetector::Config detector;
        detect::DetectionLoop::Config detection;
        record::RecordingSessionManager::Config session;
    };

// MotionPipeline: lifecycle object for one camera. Owns the frame slot, the
// shutdown signal and both threads; created once at startup, torn down once.
// The camera and the footage writer are external and must outlive it.
    class MotionPipeline {
    public:
        MotionPipeline(const PipelineConfig& cfg,
                       capture::Camera& camera,
                       record::FootageWriter& writer);
        ~MotionPipeline();

        MotionPipeline(const MotionPipeline&) = delete;
        MotionPipeline& operator=(const MotionPipeline&) = delete;

        // Starts capture and detection, blocks until shutdown is requested, then
        // joins both threads. On return the camera is closed and no destination
        // is open. Returns the shutdown reason.
        ShutdownReason run();

        ShutdownSignal& shutdown_signal() { return shutdown_; }
        FrameSlot& slot() { return slot_; }
        record::RecordingSessionManager& session() { return session_; }
        const detect::BackgroundModel& background() const { return background_; }
        const capture::CaptureLoop& capture_loop() const { return capture_; }
        const detect::DetectionLoop& detection_loop() const { return detection_; }

    private:
        FrameSlot slot_;
        ShutdownSignal shutdown_;

        detect::BackgroundModel background_;
        detect::ExposureGuard guard_;
        record::RecordingSessionManager session_;
        detect::MotionDetector detector_;

        capture::CaptureLoop capture_;
        detect::DetectionLoop detection_;
    };

} // namespace core
