#include "capture/opencv_camera.h"
#include "util/time_utils.h"

#include <iostream>

namespace capture {

    OpenCvCamera::OpenCvCamera(const Config& cfg)
            : cfg_(cfg) {}

    OpenCvCamera::~OpenCvCamera() {
        close();
    }

    bool OpenCvCamera::open(std::string& err) {
        if (!cap_.open(cfg_.device_index)) {
            err = "could not open camera device " + std::to_string(cfg_.device_index);
            return false;
        }

        cap_.set(cv::CAP_PROP_FRAME_WIDTH, cfg_.width);
        cap_.set(cv::CAP_PROP_FRAME_HEIGHT, cfg_.height);

        // V4L2 backend: 3 = auto exposure, 1 = manual.
        // Auto exposure shifts the whole frame brightness, which shows up as motion.
        if (!cap_.set(cv::CAP_PROP_AUTO_EXPOSURE, auto_exposure_ ? 3 : 1) && cfg_.verbose) {
            std::cerr << "[CAMERA] device does not accept CAP_PROP_AUTO_EXPOSURE" << std::endl;
        }

        if (cfg_.verbose) {
            std::cout << "[CAMERA] opencv camera " << cfg_.device_index << " opened: "
                      << cap_.get(cv::CAP_PROP_FRAME_WIDTH) << "x"
                      << cap_.get(cv::CAP_PROP_FRAME_HEIGHT)
                      << " fps=" << cap_.get(cv::CAP_PROP_FPS)
                      << " auto_exposure=" << (auto_exposure_ ? "true" : "false")
                      << std::endl;
        }
        return true;
    }

    bool OpenCvCamera::acquire_frame(core::Frame& out, std::string& err) {
        if (!cap_.isOpened()) {
            err = "camera is not open";
            return false;
        }

        // Fresh Mat per call: the published frame must not share its buffer
        // with the next capture.
        cv::Mat image;
        if (!cap_.read(image) || image.empty()) {
            err = "could not receive a new frame from device " + std::to_string(cfg_.device_index);
            return false;
        }

        out.image = image;
        out.ts_ms = util::now_steady_ms();
        out.wall_ms = util::now_wall_ms();
        return true;
    }

    double OpenCvCamera::frame_rate() const {
        if (!cap_.isOpened()) return 0.0;
        const double fps = cap_.get(cv::CAP_PROP_FPS);
        return fps > 0.0 ? fps : 0.0;
    }

    void OpenCvCamera::close() {
        if (!cap_.isOpened()) return;
        cap_.release();
        if (cfg_.verbose) {
            std::cout << "[CAMERA] opencv camera " << cfg_.device_index << " released" << std::endl;
        }
    }

} // namespace capture
