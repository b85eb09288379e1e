#include <gst/gst.h>
#include <toml++/toml.h>

#include <csignal>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <memory>
#include <pthread.h>
#include <string>
#include <thread>

#include "capture/camera_factory.h"
#include "config.h"
#include "core/pipeline.h"
#include "core/shutdown_signal.h"
#include "record/video_file_writer.h"
#include "util/time_utils.h"


int main(int argc, char *argv[]) {

    setvbuf(stdout, nullptr, _IONBF, 0);
    setvbuf(stderr, nullptr, _IONBF, 0);

    // SIGINT/SIGTERM are blocked in every thread and collected by the watcher
    // below. Must happen before any thread (including GStreamer's) is spawned.
    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);

    gst_init(&argc, &argv);

    const std::string config_path = argc > 1 ? argv[1] : "config.toml";
    std::cout << "[MAIN] config: " << config_path << std::endl;

    AppConfig cfg;
    try {
        cfg = load_app_config_file(config_path);
    } catch (const toml::parse_error &e) {
        std::cerr << "[MAIN] config parse failed: " << e.description()
                  << " at " << e.source().begin << std::endl;
        return core::kExitConfigError;
    }

    std::unique_ptr<capture::Camera> camera = capture::make_camera(
            cfg.camera_backend, cfg.camera_auto_exposure, cfg.gst_camera, cfg.opencv_camera);
    std::string err;
    if (!camera->open(err)) {
        std::cerr << "[MAIN] could not open the camera device: " << err << std::endl;
        return core::kExitStartupFailure;
    }

    apply_camera_frame_rate(cfg, camera->frame_rate());
    std::cout << "[MAIN] footage fps: " << cfg.writer.fps << std::endl;

    record::VideoFileWriter writer(cfg.writer);
    core::MotionPipeline pipeline(cfg.pipeline, *camera, writer);

    pipeline.session().set_on_session_started([](const record::SessionInfo &s) {
        std::cout << "[EVENT] motion started "
                  << util::format_local_time(s.start_wall_ms, "%Y-%m-%d %H:%M:%S") << std::endl;
    });
    pipeline.session().set_on_session_ended([](const record::SessionInfo &s) {
        std::cout << "[EVENT] motion ended after " << (s.end_ms - s.start_ms) / 1000.0 << " s, "
                  << s.frames_written << " frames" << (s.aborted ? " (write failed)" : "") << std::endl;
    });

    core::ShutdownSignal &shutdown = pipeline.shutdown_signal();
    std::thread signal_thread([&]() {
        const timespec poll{0, 200 * 1000 * 1000};
        while (!shutdown.requested()) {
            const int sig = sigtimedwait(&stop_signals, nullptr, &poll);
            if (sig == SIGINT || sig == SIGTERM) {
                std::cout << "[MAIN] received signal " << sig << ", shutting down..." << std::endl;
                shutdown.request(core::ShutdownReason::USER_STOP);
            }
        }
    });

    const core::ShutdownReason reason = pipeline.run();

    if (signal_thread.joinable()) signal_thread.join();

    const int code = core::exit_code_for(reason);
    std::cout << "[MAIN] exit: " << core::to_string(reason) << " (code " << code << ")" << std::endl;
    return code;
}
