#include "detect/background_model.h"

#include <algorithm>
#include <iostream>

namespace detect {

    BackgroundModel::BackgroundModel(const Config& cfg)
            : cfg_(cfg) {
        cfg_.resize_factor = std::max(0.01, std::min(cfg_.resize_factor, 1.0));
        cfg_.blur_kernel = std::max(1, cfg_.blur_kernel);
        if (cfg_.blur_kernel % 2 == 0) {
            cfg_.blur_kernel += 1;
        }
        cfg_.pixel_delta = std::max(0, std::min(cfg_.pixel_delta, 255));
        cfg_.dilate_iterations = std::max(0, cfg_.dilate_iterations);
        cfg_.min_region_area = std::max(1, cfg_.min_region_area);
        cfg_.stability_ticks = std::max(1, cfg_.stability_ticks);
        cfg_.stability_epsilon = std::max(0.0, cfg_.stability_epsilon);
        cfg_.commit_blend = std::max(0.01, std::min(cfg_.commit_blend, 1.0));
        cfg_.converge_tolerance = std::max(0.0, cfg_.converge_tolerance);

        if (cfg_.verbose) {
            std::cout << "[BACKGROUND] config: resize_factor=" << cfg_.resize_factor
                      << " blur_kernel=" << cfg_.blur_kernel
                      << " pixel_delta=" << cfg_.pixel_delta
                      << " dilate_iterations=" << cfg_.dilate_iterations
                      << " min_region_area=" << cfg_.min_region_area
                      << " stability_ticks=" << cfg_.stability_ticks
                      << " stability_epsilon=" << cfg_.stability_epsilon
                      << " commit_blend=" << cfg_.commit_blend
                      << " converge_tolerance=" << cfg_.converge_tolerance
                      << std::endl;
        }
    }

    int BackgroundModel::stability_ticks_for(long long window_ms, long long tick_interval_ms) {
        if (tick_interval_ms <= 0) return 1;
        const long long ticks = (window_ms + tick_interval_ms - 1) / tick_interval_ms;
        return static_cast<int>(std::max(1LL, ticks));
    }

    cv::Mat BackgroundModel::prepare(const cv::Mat& image) const {
        if (image.empty()) {
            return {};
        }

        cv::Mat small;
        if (cfg_.resize_factor < 1.0) {
            cv::resize(image, small, cv::Size(), cfg_.resize_factor, cfg_.resize_factor, cv::INTER_AREA);
        } else {
            small = image;
        }

        cv::Mat gray;
        if (small.channels() == 3) {
            cv::cvtColor(small, gray, cv::COLOR_BGR2GRAY);
        } else if (small.channels() == 4) {
            cv::cvtColor(small, gray, cv::COLOR_BGRA2GRAY);
        } else {
            gray = small;
        }

        cv::Mat blurred;
        if (cfg_.blur_kernel > 1) {
            cv::GaussianBlur(gray, blurred, cv::Size(cfg_.blur_kernel, cfg_.blur_kernel), 0);
        } else {
            blurred = gray;
        }

        cv::Mat out;
        blurred.convertTo(out, CV_32F);
        return out;
    }

    // Changed area, as the original contour check:
    // |frame - average| > pixel_delta -> dilate -> regions >= min_region_area.
    double BackgroundModel::difference(const cv::Mat& prepared) const {
        if (!has_average() || prepared.empty()) {
            return 0.0;
        }
        if (prepared.size() != average_.size() || prepared.type() != average_.type()) {
            return 0.0;
        }

        cv::Mat diff;
        cv::absdiff(prepared, average_, diff);

        cv::Mat mask;
        cv::threshold(diff, mask, cfg_.pixel_delta, 255, cv::THRESH_BINARY);
        mask.convertTo(mask, CV_8U);

        if (cfg_.dilate_iterations > 0) {
            cv::dilate(mask, mask, cv::Mat(), cv::Point(-1, -1), cfg_.dilate_iterations);
        }

        cv::Mat labels, stats, centroids;
        const int n = cv::connectedComponentsWithStats(mask, labels, stats, centroids, 8, CV_32S);

        long long changed = 0;
        for (int i = 1; i < n; ++i) { // 0 = background label
            const int area = stats.at<int>(i, cv::CC_STAT_AREA);
            if (area >= cfg_.min_region_area) {
                changed += area;
            }
        }

        return 100.0 * static_cast<double>(changed) / static_cast<double>(mask.total());
    }

    void BackgroundModel::seed(const cv::Mat& prepared, long long now_ms) {
        average_ = prepared.clone();
        stable_ticks_ = 0;
        last_commit_ms_ = now_ms;
        if (cfg_.verbose) {
            std::cout << "[BACKGROUND] seeded " << average_.cols << "x" << average_.rows << std::endl;
        }
    }

    bool BackgroundModel::consider_commit(const cv::Mat& prepared,
                                          double magnitude,
                                          long long now_ms,
                                          bool recording) {
        if (!has_average() || prepared.empty()) {
            return false;
        }

        if (recording || magnitude > cfg_.stability_epsilon) {
            stable_ticks_ = 0;
            return false;
        }

        ++stable_ticks_;
        if (stable_ticks_ < cfg_.stability_ticks) {
            return false;
        }
        stable_ticks_ = 0;

        if (prepared.size() != average_.size() || prepared.type() != average_.type()) {
            return false;
        }

        // Already converged to this frame: nothing to replace.
        const double gap = cv::norm(prepared, average_, cv::NORM_INF);
        if (gap == 0.0 || gap < cfg_.converge_tolerance) {
            return false;
        }

        cv::Mat next;
        if (cfg_.commit_blend >= 1.0) {
            next = prepared.clone();
        } else {
            cv::addWeighted(average_, 1.0 - cfg_.commit_blend, prepared, cfg_.commit_blend, 0.0, next);
            // Blending only approaches the frame; land on it once close enough.
            if (cv::norm(prepared, next, cv::NORM_INF) < cfg_.converge_tolerance) {
                next = prepared.clone();
            }
        }
        average_ = next;

        last_commit_ms_ = now_ms;
        ++commits_;
        if (cfg_.verbose) {
            std::cout << "[BACKGROUND] average committed (#" << commits_ << ") at " << now_ms << " ms" << std::endl;
        }
        return true;
    }

} // namespace detect
