#include <toml++/toml.h>
#include "config.h"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string_view>


// ============================================================================
// config.toml loading
//
//  - Every key is optional; the defaults live in the component Config structs.
//  - A malformed section is reported and left at its defaults, the remaining
//    sections still load.
//  - Only a file that is not valid TOML at all is fatal (toml::parse_error).
// ============================================================================

namespace {

    const toml::table *section(const toml::table &tbl, std::string_view name) {
        const auto *node = tbl.get(name);
        if (!node) {
            return nullptr;
        }
        const auto *sec = node->as_table();
        if (!sec) {
            throw std::runtime_error("invalid [" + std::string(name) + "] table");
        }
        return sec;
    }

    const char *yes_no(bool v) {
        return v ? "true" : "false";
    }

}


bool load_camera_config(const toml::table &tbl, AppConfig &cfg) {
    // ----------------------------- [camera] -----------------------------
    try {
        const auto *cam = section(tbl, "camera");
        if (!cam) {
            return true;
        }

        std::string backend = read_or<std::string>(*cam, "backend", cfg.camera_backend);
        if (backend != "gstreamer" && backend != "opencv") {
            throw std::runtime_error("unknown backend '" + backend + "'");
        }
        const bool auto_exposure = read_or<bool>(*cam, "auto_exposure", cfg.camera_auto_exposure);

        capture::GstCamera::Config gst = cfg.gst_camera;
        gst.device = read_or<std::string>(*cam, "device", gst.device);
        gst.pipeline = read_or<std::string>(*cam, "pipeline", gst.pipeline);
        gst.width = read_or<int>(*cam, "width", gst.width);
        gst.height = read_or<int>(*cam, "height", gst.height);
        gst.acquire_timeout_ms = read_or<int>(*cam, "acquire_timeout_ms", gst.acquire_timeout_ms);

        capture::OpenCvCamera::Config ocv = cfg.opencv_camera;
        ocv.device_index = read_or<int>(*cam, "device_index", ocv.device_index);
        ocv.width = gst.width;
        ocv.height = gst.height;

        cfg.camera_backend = backend;
        cfg.camera_auto_exposure = auto_exposure;
        cfg.gst_camera = gst;
        cfg.opencv_camera = ocv;

        std::cout << "[CONFIG] camera: backend=" << cfg.camera_backend
                  << " device=" << gst.device
                  << " device_index=" << ocv.device_index
                  << " size=" << gst.width << "x" << gst.height
                  << " auto_exposure=" << yes_no(cfg.camera_auto_exposure)
                  << (gst.pipeline.empty() ? "" : " pipeline=<custom>")
                  << std::endl;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "[CONFIG] camera config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_capture_config(const toml::table &tbl, AppConfig &cfg) {
    // ----------------------------- [capture] ----------------------------
    try {
        const auto *cap = section(tbl, "capture");
        if (!cap) {
            return true;
        }
        capture::CaptureLoop::Config next = cfg.pipeline.capture;
        next.max_consecutive_failures = read_or<int>(*cap, "max_consecutive_failures", next.max_consecutive_failures);
        next.retry_delay_ms = read_or<int>(*cap, "retry_delay_ms", next.retry_delay_ms);
        cfg.pipeline.capture = next;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "[CONFIG] capture config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_detector_config(const toml::table &tbl, AppConfig &cfg) {
    // ---------------------------- [detector] ----------------------------
    try {
        const auto *det = section(tbl, "detector");
        if (!det) {
            return true;
        }
        detect::MotionDetector::Config detector = cfg.pipeline.detector;
        detect::DetectionLoop::Config loop = cfg.pipeline.detection;
        detect::BackgroundModel::Config bg = cfg.pipeline.background;

        loop.tick_interval_ms = read_or<int>(*det, "tick_interval_ms", loop.tick_interval_ms);
        detector.threshold = read_or<double>(*det, "threshold", detector.threshold);
        bg.pixel_delta = read_or<int>(*det, "pixel_delta", bg.pixel_delta);
        bg.resize_factor = read_or<double>(*det, "resize_factor", bg.resize_factor);
        bg.blur_kernel = read_or<int>(*det, "blur_kernel", bg.blur_kernel);
        bg.dilate_iterations = read_or<int>(*det, "dilate_iterations", bg.dilate_iterations);
        bg.min_region_area = read_or<int>(*det, "min_region_area", bg.min_region_area);

        if (loop.tick_interval_ms <= 0) {
            throw std::runtime_error("tick_interval_ms must be positive");
        }

        cfg.pipeline.detector = detector;
        cfg.pipeline.detection = loop;
        cfg.pipeline.background = bg;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "[CONFIG] detector config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_background_config(const toml::table &tbl, AppConfig &cfg) {
    // --------------------------- [background] ---------------------------
    // Adaptive reference frame: committed after a quiet stability window.
    try {
        const auto *bg_tbl = section(tbl, "background");
        if (!bg_tbl) {
            return true;
        }
        detect::BackgroundModel::Config bg = cfg.pipeline.background;
        const std::int64_t window_ms = read_or<std::int64_t>(*bg_tbl, "stability_window_ms", cfg.stability_window_ms);
        bg.stability_epsilon = read_or<double>(*bg_tbl, "stability_epsilon", bg.stability_epsilon);
        bg.commit_blend = read_or<double>(*bg_tbl, "commit_blend", bg.commit_blend);
        bg.converge_tolerance = read_or<double>(*bg_tbl, "converge_tolerance", bg.converge_tolerance);

        if (window_ms < 0) {
            throw std::runtime_error("stability_window_ms must not be negative");
        }

        cfg.stability_window_ms = window_ms;
        cfg.pipeline.background = bg;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "[CONFIG] background config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_exposure_guard_config(const toml::table &tbl, AppConfig &cfg) {
    // ------------------------- [exposure_guard] -------------------------
    try {
        const auto *eg = section(tbl, "exposure_guard");
        if (!eg) {
            return true;
        }
        detect::ExposureGuard::Config next = cfg.pipeline.exposure;
        next.enabled = read_or<bool>(*eg, "enabled", next.enabled);
        next.grid = read_or<int>(*eg, "grid", next.grid);
        next.min_shift = read_or<double>(*eg, "min_shift", next.min_shift);
        next.coverage = read_or<double>(*eg, "coverage", next.coverage);
        next.tolerance = read_or<double>(*eg, "tolerance", next.tolerance);
        cfg.pipeline.exposure = next;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "[CONFIG] exposure_guard config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_recording_config(const toml::table &tbl, AppConfig &cfg) {
    // ---------------------------- [recording] ---------------------------
    try {
        const auto *rec = section(tbl, "recording");
        if (!rec) {
            return true;
        }
        record::RecordingSessionManager::Config session = cfg.pipeline.session;
        record::VideoFileWriter::Config writer = cfg.writer;
        detect::DetectionLoop::Config loop = cfg.pipeline.detection;

        session.window_ms = read_or<std::int64_t>(*rec, "window_ms", session.window_ms);
        writer.capture_dir = read_or<std::string>(*rec, "capture_dir", writer.capture_dir);
        writer.fps = read_or<double>(*rec, "fps", writer.fps);
        writer.fourcc = read_or<std::string>(*rec, "fourcc", writer.fourcc);
        writer.timestamp_overlay = read_or<bool>(*rec, "timestamp_overlay", writer.timestamp_overlay);
        loop.sample_fps = read_or<int>(*rec, "sample_fps", loop.sample_fps);
        const bool fps_explicit = rec->contains("fps");

        if (session.window_ms <= 0) {
            throw std::runtime_error("window_ms must be positive");
        }
        if (fps_explicit && writer.fps <= 0.0) {
            throw std::runtime_error("fps must be positive");
        }

        cfg.pipeline.session = session;
        cfg.pipeline.detection.sample_fps = loop.sample_fps;
        cfg.writer = writer;
        cfg.writer_fps_explicit = fps_explicit;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "[CONFIG] recording config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_logging_config(const toml::table &tbl, LoggingConfig &cfg) {
    // ----------------------------- [logging] ----------------------------
    try {
        const auto *logging = section(tbl, "logging");
        if (!logging) {
            return true;
        }
        LoggingConfig next = cfg;
        next.capture_level_logger = read_or<bool>(*logging, "capture_level_logger", next.capture_level_logger);
        next.detector_level_logger = read_or<bool>(*logging, "detector_level_logger", next.detector_level_logger);
        next.session_level_logger = read_or<bool>(*logging, "session_level_logger", next.session_level_logger);
        next.background_level_logger = read_or<bool>(*logging, "background_level_logger", next.background_level_logger);
        cfg = next;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "[CONFIG] logging config load failed  " << e.what() << std::endl;
        return false;
    }
}

AppConfig load_app_config(const toml::table &tbl) {
    AppConfig cfg;

    load_logging_config(tbl, cfg.logging);
    load_camera_config(tbl, cfg);
    load_capture_config(tbl, cfg);
    load_detector_config(tbl, cfg);
    load_background_config(tbl, cfg);
    load_exposure_guard_config(tbl, cfg);
    load_recording_config(tbl, cfg);

    // Stability is counted in ticks, not wall time.
    cfg.pipeline.background.stability_ticks = detect::BackgroundModel::stability_ticks_for(
            cfg.stability_window_ms, cfg.pipeline.detection.tick_interval_ms);

    // Footage plays back at the rate frames are written: sample_fps while
    // recording, or one frame per tick without sampling.
    if (!cfg.writer_fps_explicit) {
        const detect::DetectionLoop::Config &loop = cfg.pipeline.detection;
        cfg.writer.fps = loop.sample_fps > 0
                         ? static_cast<double>(loop.sample_fps)
                         : 1000.0 / static_cast<double>(loop.tick_interval_ms);
    }

    const LoggingConfig &log = cfg.logging;
    cfg.gst_camera.verbose = log.capture_level_logger;
    cfg.opencv_camera.verbose = log.capture_level_logger;
    cfg.pipeline.capture.verbose = log.capture_level_logger;
    cfg.pipeline.detector.verbose = log.detector_level_logger;
    cfg.pipeline.detection.verbose = log.session_level_logger;
    cfg.pipeline.session.verbose = log.session_level_logger;
    cfg.writer.verbose = log.session_level_logger;
    cfg.pipeline.background.verbose = log.background_level_logger;
    cfg.pipeline.exposure.verbose = log.detector_level_logger;

    std::cout << "[CONFIG] detector: tick_interval_ms=" << cfg.pipeline.detection.tick_interval_ms
              << " threshold=" << cfg.pipeline.detector.threshold
              << " stability_window_ms=" << cfg.stability_window_ms
              << " (" << cfg.pipeline.background.stability_ticks << " ticks)"
              << " recording_window_ms=" << cfg.pipeline.session.window_ms
              << " exposure_guard=" << yes_no(cfg.pipeline.exposure.enabled)
              << " footage_fps=" << cfg.writer.fps
              << std::endl;
    return cfg;
}

void apply_camera_frame_rate(AppConfig &cfg, double camera_fps) {
    if (cfg.writer_fps_explicit || camera_fps <= 0.0) {
        return;
    }
    if (camera_fps < cfg.writer.fps) {
        cfg.writer.fps = camera_fps;
    }
}

AppConfig load_app_config_file(const std::string &path) {
    if (!std::filesystem::exists(path)) {
        std::cerr << "[CONFIG] " << path << " not found, using defaults" << std::endl;
        return load_app_config(toml::table{});
    }
    const toml::table tbl = toml::parse_file(path);
    return load_app_config(tbl);
}
