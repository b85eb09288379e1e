#pragma once
#include <opencv2/opencv.hpp>

#include "detect/background_model.h"

namespace detect {

// ExposureGuard: damps magnitudes caused by auto-exposure transients.
// An exposure change shifts the brightness of the whole frame by roughly the
// same amount; real motion is local. The frame is split into grid x grid
// cells and the mean signed difference against the average is taken per cell.
// If enough cells follow the global shift, the shift is subtracted and the
// magnitude recomputed on the compensated frame. Best effort only.
    class ExposureGuard {
    public:
        struct Config {
            bool enabled = true;
            int grid = 4;
            double min_shift = 8.0;   // |global shift| below this is not an exposure change
            double coverage = 0.85;   // fraction of cells that must follow the shift
            double tolerance = 10.0;  // allowed cell deviation, at least 0.5 * |shift|
            bool verbose = false;
        };

        struct Result {
            double magnitude = 0.0;
            bool suppressed = false;
            double global_shift = 0.0;
            double uniform_ratio = 0.0;
        };

        explicit ExposureGuard(const Config& cfg);

        // Identity when disabled. Never returns more than `magnitude`.
        Result filter(double magnitude, const cv::Mat& prepared, const BackgroundModel& model) const;

        bool enabled() const { return cfg_.enabled; }

    private:
        Config cfg_;
    };

} // namespace detect
