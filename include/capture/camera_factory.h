#pragma once
#include <memory>
#include <string>

#include "capture/camera.h"
#include "capture/gst_camera.h"
#include "capture/opencv_camera.h"

namespace capture {

    // "opencv" -> OpenCvCamera, anything else -> GstCamera. Nothing is opened.
    std::unique_ptr<Camera> make_camera(const std::string& backend,
                                        bool auto_exposure,
                                        const GstCamera::Config& gst_cfg,
                                        const OpenCvCamera::Config& opencv_cfg);

} // namespace capture
