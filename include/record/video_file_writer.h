#pragma once
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

#include <string>
#include <unordered_map>

#include "record/footage_writer.h"

namespace record {

// VideoFileWriter: one video file per destination,
// <capture_dir>/<YYYY>/<MM>/<DD>/<HHMMSS>_<ms>.avi.
// The cv::VideoWriter is opened on the first frame, when the frame size is known.
    class VideoFileWriter : public FootageWriter {
    public:
        struct Config {
            std::string capture_dir = "captures";
            double fps = 10.0;
            std::string fourcc = "MJPG";
            bool timestamp_overlay = true;
            bool verbose = true;
        };

        explicit VideoFileWriter(const Config& cfg);
        ~VideoFileWriter() override;

        VideoFileWriter(const VideoFileWriter&) = delete;
        VideoFileWriter& operator=(const VideoFileWriter&) = delete;

        bool open_destination(long long wall_ms, DestinationHandle& out, std::string& err) override;
        bool write_frame(DestinationHandle handle, const core::Frame& frame, std::string& err) override;
        void close(DestinationHandle handle) override;

        // Path of an open destination, empty if unknown.
        std::string path_of(DestinationHandle handle) const;

    private:
        struct Destination {
            std::string path;
            cv::VideoWriter writer;
            cv::Size size;
            int frames = 0;
        };

        std::string directory_for(long long wall_ms) const;
        static void draw_timestamp(cv::Mat& image, long long wall_ms);

        Config cfg_;
        DestinationHandle next_handle_ = 1;
        std::unordered_map<DestinationHandle, Destination> open_;
    };

} // namespace record
