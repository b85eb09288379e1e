#pragma once
#include <opencv2/opencv.hpp>

namespace detect {

// BackgroundModel: reference ("average") image of the steady scene.
//
// Frames are compared in a reduced form (see prepare()): downscaled, gray,
// Gaussian-blurred, CV_32F. The average is only ever replaced wholesale, by
// consider_commit(), after `stability_ticks` consecutive quiet ticks outside
// of a recording session. Slow lighting drift thus becomes the new normal,
// while an ongoing motion episode never leaks into the reference.
    class BackgroundModel {
    public:
        struct Config {
            double resize_factor = 0.25;   // prepare(): downscale factor, 1.0 = none
            int blur_kernel = 21;          // prepare(): Gaussian kernel (odd)
            int pixel_delta = 25;          // difference(): per-pixel change threshold (0..255)
            int dilate_iterations = 2;     // difference(): 3x3 dilations of the change mask
            int min_region_area = 100;     // difference(): smallest changed region counted (prepared px)
            int stability_ticks = 15;      // quiet ticks before a commit
            double stability_epsilon = 0.5;// magnitude at or below this counts as quiet
            double commit_blend = 1.0;     // 1.0 = replace, <1.0 = running blend
            double converge_tolerance = 0.5;// average within this of the frame (grey levels) = converged
            bool verbose = false;
        };

        explicit BackgroundModel(const Config& cfg);

        cv::Mat prepare(const cv::Mat& image) const;

        // Changed area in % (0..100) of `prepared` against the average.
        // 0 while there is no average or the sizes differ.
        double difference(const cv::Mat& prepared) const;

        // Installs the first average.
        void seed(const cv::Mat& prepared, long long now_ms);

        // Called once per tick. Returns true if the average was replaced.
        bool consider_commit(const cv::Mat& prepared, double magnitude, long long now_ms, bool recording);

        bool has_average() const { return !average_.empty(); }
        const cv::Mat& average() const { return average_; }
        int commits() const { return commits_; }
        int stable_ticks() const { return stable_ticks_; }
        long long last_commit_ms() const { return last_commit_ms_; }
        const Config& config() const { return cfg_; }

        // Ticks covering `window_ms` at `tick_interval_ms`, at least 1.
        static int stability_ticks_for(long long window_ms, long long tick_interval_ms);

    private:
        Config cfg_;
        cv::Mat average_;
        int stable_ticks_ = 0;
        int commits_ = 0;
        long long last_commit_ms_ = 0;
    };

} // namespace detect
