#pragma once
#include <opencv2/core.hpp>

namespace core {

    // One captured image. The image buffer belongs to this Frame only:
    // cameras hand over a freshly allocated cv::Mat per frame, so a published
    // Frame is never modified afterwards.
    struct Frame {
        cv::Mat image;          // BGR (CV_8UC3) or gray (CV_8UC1)
        long long ts_ms = 0;    // steady_clock, ms
        long long wall_ms = 0;  // system_clock, ms since epoch
    };

} // namespace core
