#include "capture/camera_factory.h"

namespace capture {

    std::unique_ptr<Camera> make_camera(const std::string& backend,
                                        bool auto_exposure,
                                        const GstCamera::Config& gst_cfg,
                                        const OpenCvCamera::Config& opencv_cfg) {
        std::unique_ptr<Camera> camera;
        if (backend == "opencv") {
            camera = std::make_unique<OpenCvCamera>(opencv_cfg);
        } else {
            camera = std::make_unique<GstCamera>(gst_cfg);
        }
        camera->set_auto_exposure(auto_exposure);
        return camera;
    }

} // namespace capture
