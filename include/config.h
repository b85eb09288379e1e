#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <toml++/toml.h>

#include "capture/gst_camera.h"
#include "capture/opencv_camera.h"
#include "core/pipeline.h"
#include "record/video_file_writer.h"


// Missing key -> fallback. Present but of the wrong type -> throws.
template <typename T>
static T read_or(const toml::table &tbl, std::string_view key, T fallback) {
    const auto *node = tbl.get(key);
    if (!node) {
        return fallback;
    }
    const auto value = node->value<T>();
    if (!value) {
        throw std::runtime_error("invalid value for '" + std::string(key) + "'");
    }
    return *value;
}


struct LoggingConfig {
    bool capture_level_logger = true;
    bool detector_level_logger = false;   // one line per tick
    bool session_level_logger = true;
    bool background_level_logger = false;
};

struct AppConfig {
    // -------------------------- [camera] ---------------------------
    std::string camera_backend = "gstreamer";   // "gstreamer" | "opencv"
    bool camera_auto_exposure = true;
    capture::GstCamera::Config gst_camera;
    capture::OpenCvCamera::Config opencv_camera;

    // ------------------------- [recording] -------------------------
    record::VideoFileWriter::Config writer;
    // [recording] fps given explicitly; otherwise derived from sample_fps.
    bool writer_fps_explicit = false;

    // ------------------------- [background] ------------------------
    // Converted to background.stability_ticks with detector.tick_interval_ms.
    long long stability_window_ms = 15000;

    core::PipelineConfig pipeline;
    LoggingConfig logging;
};

// Section loaders. Each one leaves `cfg` untouched and returns false if the
// section is malformed; a missing section keeps the defaults.
bool load_camera_config(const toml::table &tbl, AppConfig &cfg);
bool load_capture_config(const toml::table &tbl, AppConfig &cfg);
bool load_detector_config(const toml::table &tbl, AppConfig &cfg);
bool load_background_config(const toml::table &tbl, AppConfig &cfg);
bool load_exposure_guard_config(const toml::table &tbl, AppConfig &cfg);
bool load_recording_config(const toml::table &tbl, AppConfig &cfg);
bool load_logging_config(const toml::table &tbl, LoggingConfig &cfg);

// All sections, then derived values (stability ticks, verbose flags).
AppConfig load_app_config(const toml::table &tbl);

// Caps the derived footage fps at the camera's rate (0 = unknown, no cap).
// An explicit [recording] fps is left alone.
void apply_camera_frame_rate(AppConfig &cfg, double camera_fps);

// Throws toml::parse_error on a malformed file. A missing file gives defaults.
AppConfig load_app_config_file(const std::string &path);
