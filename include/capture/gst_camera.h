#pragma once
#include <gst/gst.h>
#include <gst/app/gstappsink.h>

#include <string>

#include "capture/camera.h"

namespace capture {

// GstCamera: frames pulled from a GStreamer pipeline that ends in
// "appsink name=sink" producing BGR or GRAY8.
// Without an explicit pipeline a v4l2src one is built from `device`.
    class GstCamera : public Camera {
    public:
        struct Config {
            std::string pipeline;                 // empty = v4l2src on `device`
            std::string device = "/dev/video0";
            int width = 640;
            int height = 480;
            int acquire_timeout_ms = 2000;
            bool verbose = true;
        };

        explicit GstCamera(const Config& cfg);
        ~GstCamera() override;

        GstCamera(const GstCamera&) = delete;
        GstCamera& operator=(const GstCamera&) = delete;

        bool open(std::string& err) override;
        bool acquire_frame(core::Frame& out, std::string& err) override;
        void close() override;
        bool is_open() const override { return pipeline_ != nullptr; }
        // Taken from the caps of the last sample; 0 before the first frame.
        double frame_rate() const override { return frame_rate_; }
        void set_auto_exposure(bool enabled) override { auto_exposure_ = enabled; }

        // Pipeline description used by open().
        std::string describe() const;

    private:
        bool popBusError(std::string& err);
        void teardownPipeline();

        Config cfg_;
        bool auto_exposure_ = true;
        double frame_rate_ = 0.0;

        GstElement* pipeline_{nullptr};
        GstElement* sink_{nullptr};
        GstBus* bus_{nullptr};
    };

} // namespace capture
