#include "core/pipeline.h"

#include <chrono>
#include <iostream>

namespace core {

    MotionPipeline::MotionPipeline(const PipelineConfig& cfg,
                                   capture::Camera& camera,
                                   record::FootageWriter& writer)
            : background_(cfg.background),
              guard_(cfg.exposure),
              session_(writer, cfg.session),
              detector_(cfg.detector, slot_, background_, guard_, session_),
              capture_(camera, slot_, shutdown_, cfg.capture),
              detection_(cfg.detection, slot_, detector_, session_, shutdown_) {}

    MotionPipeline::~MotionPipeline() {
        detection_.stop();
        capture_.stop();
    }

    ShutdownReason MotionPipeline::run() {
        capture_.start();
        detection_.start();
        std::cout << "[PIPELINE] started" << std::endl;

        while (!shutdown_.wait_for(std::chrono::milliseconds(500))) {
        }

        const ShutdownReason reason = shutdown_.reason();
        std::cout << "[PIPELINE] shutting down: " << to_string(reason) << std::endl;

        // Detection first: it closes any open destination on exit.
        detection_.stop();
        capture_.stop();

        std::cout << "[PIPELINE] stopped" << std::endl;
        return reason;
    }

} // namespace core
