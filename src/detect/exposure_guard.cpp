#include "detect/exposure_guard.h"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace detect {

    ExposureGuard::ExposureGuard(const Config& cfg)
            : cfg_(cfg) {
        cfg_.grid = std::max(1, cfg_.grid);
        cfg_.min_shift = std::max(0.0, cfg_.min_shift);
        cfg_.coverage = std::max(0.0, std::min(cfg_.coverage, 1.0));
        cfg_.tolerance = std::max(0.0, cfg_.tolerance);

        if (cfg_.verbose) {
            std::cout << "[EXPOSURE] guard " << (cfg_.enabled ? "enabled" : "disabled")
                      << ": grid=" << cfg_.grid
                      << " min_shift=" << cfg_.min_shift
                      << " coverage=" << cfg_.coverage
                      << " tolerance=" << cfg_.tolerance
                      << std::endl;
        }
    }

    ExposureGuard::Result ExposureGuard::filter(double magnitude,
                                                const cv::Mat& prepared,
                                                const BackgroundModel& model) const {
        Result r;
        r.magnitude = magnitude;

        if (!cfg_.enabled || magnitude <= 0.0 || prepared.empty() || !model.has_average()) {
            return r;
        }
        const cv::Mat& average = model.average();
        if (prepared.size() != average.size() || prepared.type() != average.type()) {
            return r;
        }

        cv::Mat signed_diff;
        cv::subtract(prepared, average, signed_diff, cv::noArray(), CV_32F);

        const double shift = cv::mean(signed_diff)[0];
        r.global_shift = shift;
        if (std::abs(shift) < cfg_.min_shift) {
            return r;
        }

        const int grid_x = std::min(cfg_.grid, signed_diff.cols);
        const int grid_y = std::min(cfg_.grid, signed_diff.rows);
        const int cell_w = signed_diff.cols / grid_x;
        const int cell_h = signed_diff.rows / grid_y;
        const double tol = std::max(cfg_.tolerance, 0.5 * std::abs(shift));

        int uniform = 0;
        for (int gy = 0; gy < grid_y; ++gy) {
            for (int gx = 0; gx < grid_x; ++gx) {
                // Last row/column absorbs the remainder.
                const int x = gx * cell_w;
                const int y = gy * cell_h;
                const int w = (gx == grid_x - 1) ? signed_diff.cols - x : cell_w;
                const int h = (gy == grid_y - 1) ? signed_diff.rows - y : cell_h;

                const double cell = cv::mean(signed_diff(cv::Rect(x, y, w, h)))[0];
                const bool same_sign = (cell > 0.0) == (shift > 0.0) && cell != 0.0;
                if (same_sign && std::abs(cell - shift) <= tol) {
                    ++uniform;
                }
            }
        }

        r.uniform_ratio = static_cast<double>(uniform) / static_cast<double>(grid_x * grid_y);
        if (r.uniform_ratio < cfg_.coverage) {
            return r;
        }

        // Remove the global shift; whatever is left is local change.
        cv::Mat compensated;
        prepared.convertTo(compensated, CV_32F, 1.0, -shift);
        const double residual = model.difference(compensated);

        r.magnitude = std::min(magnitude, residual);
        r.suppressed = r.magnitude < magnitude;

        if (cfg_.verbose) {
            std::cout << "[EXPOSURE] shift=" << shift
                      << " uniform=" << r.uniform_ratio
                      << " magnitude " << magnitude << " -> " << r.magnitude << std::endl;
        }
        return r;
    }

} // namespace detect
