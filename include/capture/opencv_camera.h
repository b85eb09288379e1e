#pragma once
#include <opencv2/videoio.hpp>

#include <string>

#include "capture/camera.h"

namespace capture {

// OpenCvCamera: cv::VideoCapture on a device index.
    class OpenCvCamera : public Camera {
    public:
        struct Config {
            int device_index = 0;
            int width = 640;
            int height = 480;
            bool verbose = true;
        };

        explicit OpenCvCamera(const Config& cfg);
        ~OpenCvCamera() override;

        bool open(std::string& err) override;
        bool acquire_frame(core::Frame& out, std::string& err) override;
        void close() override;
        bool is_open() const override { return cap_.isOpened(); }
        double frame_rate() const override;
        void set_auto_exposure(bool enabled) override { auto_exposure_ = enabled; }

    private:
        Config cfg_;
        bool auto_exposure_ = true;
        cv::VideoCapture cap_;
    };

} // namespace capture
