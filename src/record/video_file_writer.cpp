#include "record/video_file_writer.h"
#include "util/time_utils.h"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace record {

    VideoFileWriter::VideoFileWriter(const Config& cfg)
            : cfg_(cfg) {
        cfg_.fps = std::max(0.1, cfg_.fps);
        if (cfg_.fourcc.size() != 4) {
            std::cerr << "[WRITER] invalid fourcc '" << cfg_.fourcc << "', using MJPG" << std::endl;
            cfg_.fourcc = "MJPG";
        }
        if (cfg_.verbose) {
            std::cout << "[WRITER] config: capture_dir=" << cfg_.capture_dir
                      << " fps=" << cfg_.fps
                      << " fourcc=" << cfg_.fourcc
                      << " timestamp_overlay=" << (cfg_.timestamp_overlay ? "true" : "false")
                      << std::endl;
        }
    }

    VideoFileWriter::~VideoFileWriter() {
        for (auto& kv : open_) {
            kv.second.writer.release();
        }
        open_.clear();
    }

    std::string VideoFileWriter::directory_for(long long wall_ms) const {
        const fs::path dir = fs::path(cfg_.capture_dir)
                             / util::format_local_time(wall_ms, "%Y")
                             / util::format_local_time(wall_ms, "%m")
                             / util::format_local_time(wall_ms, "%d");
        return dir.string();
    }

    bool VideoFileWriter::open_destination(long long wall_ms, DestinationHandle& out, std::string& err) {
        const std::string dir = directory_for(wall_ms);

        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            err = "cannot create " + dir + ": " + ec.message();
            return false;
        }

        char ms[8];
        std::snprintf(ms, sizeof(ms), "%03lld", wall_ms % 1000);

        Destination dst;
        dst.path = (fs::path(dir) / (util::format_local_time(wall_ms, "%H%M%S") + "_" + ms + ".avi")).string();

        out = next_handle_++;
        if (cfg_.verbose) {
            std::cout << "[WRITER] destination " << out << " -> " << dst.path << std::endl;
        }
        open_.emplace(out, std::move(dst));
        return true;
    }

    bool VideoFileWriter::write_frame(DestinationHandle handle, const core::Frame& frame, std::string& err) {
        auto it = open_.find(handle);
        if (it == open_.end()) {
            err = "unknown destination " + std::to_string(handle);
            return false;
        }
        if (frame.image.empty()) {
            err = "empty frame";
            return false;
        }

        Destination& dst = it->second;

        // The published frame is shared and immutable: draw on a copy.
        cv::Mat image;
        if (frame.image.channels() == 1) {
            cv::cvtColor(frame.image, image, cv::COLOR_GRAY2BGR);
        } else {
            image = frame.image.clone();
        }

        if (!dst.writer.isOpened()) {
            dst.size = image.size();
            const int fourcc = cv::VideoWriter::fourcc(cfg_.fourcc[0], cfg_.fourcc[1],
                                                       cfg_.fourcc[2], cfg_.fourcc[3]);
            if (!dst.writer.open(dst.path, fourcc, cfg_.fps, dst.size, true)) {
                err = "cv::VideoWriter could not open " + dst.path;
                return false;
            }
        }

        if (image.size() != dst.size) {
            cv::resize(image, image, dst.size);
        }

        if (cfg_.timestamp_overlay) {
            draw_timestamp(image, frame.wall_ms);
        }

        dst.writer.write(image);
        // write() has no result; a backend that hit an I/O error releases itself.
        if (!dst.writer.isOpened()) {
            err = "cv::VideoWriter failed writing " + dst.path;
            return false;
        }
        ++dst.frames;
        return true;
    }

    void VideoFileWriter::close(DestinationHandle handle) {
        auto it = open_.find(handle);
        if (it == open_.end()) return;

        it->second.writer.release();
        if (cfg_.verbose) {
            std::cout << "[WRITER] closed " << it->second.path
                      << " (" << it->second.frames << " frames)" << std::endl;
        }
        open_.erase(it);
    }

    std::string VideoFileWriter::path_of(DestinationHandle handle) const {
        auto it = open_.find(handle);
        return it == open_.end() ? std::string() : it->second.path;
    }

    void VideoFileWriter::draw_timestamp(cv::Mat& image, long long wall_ms) {
        const std::string text = util::format_local_time(wall_ms, "%d %B %Y at %H:%M:%S");
        const cv::Point org(10, 20);
        // Dark outline first so the text stays readable on bright scenes.
        cv::putText(image, text, org, cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(0, 0, 0), 3, cv::LINE_AA);
        cv::putText(image, text, org, cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(255, 255, 255), 1, cv::LINE_AA);
    }

} // namespace record
