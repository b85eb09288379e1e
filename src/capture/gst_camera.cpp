#include "capture/gst_camera.h"
#include "util/time_utils.h"

#include <opencv2/core.hpp>

#include <cstring>
#include <iostream>
#include <sstream>

namespace capture {

    GstCamera::GstCamera(const Config& cfg)
            : cfg_(cfg) {}

    GstCamera::~GstCamera() {
        close();
    }

    std::string GstCamera::describe() const {
        if (!cfg_.pipeline.empty()) {
            return cfg_.pipeline;
        }

        // V4L2 exposure control: 1 = manual, 3 = aperture priority (auto).
        std::ostringstream ss;
        ss << "v4l2src device=" << cfg_.device
           << " extra-controls=\"c,auto_exposure=" << (auto_exposure_ ? 3 : 1) << "\""
           << " ! videoconvert ! videoscale"
           << " ! video/x-raw,format=BGR,width=" << cfg_.width << ",height=" << cfg_.height
           << " ! appsink name=sink";
        return ss.str();
    }

    bool GstCamera::open(std::string& err) {
        teardownPipeline();
        frame_rate_ = 0.0;

        const std::string desc = describe();
        if (cfg_.verbose) {
            std::cout << "[CAMERA] gst pipeline: " << desc << std::endl;
        }

        GError* gerr = nullptr;
        pipeline_ = gst_parse_launch(desc.c_str(), &gerr);
        if (!pipeline_) {
            err = gerr ? gerr->message : "gst_parse_launch failed";
            if (gerr) g_error_free(gerr);
            return false;
        }
        if (gerr) {
            // Recoverable parse problem (e.g. unknown property); the pipeline exists.
            std::cerr << "[CAMERA] gst_parse_launch warning: " << gerr->message << std::endl;
            g_error_free(gerr);
        }

        sink_ = gst_bin_get_by_name(GST_BIN(pipeline_), "sink");
        if (!sink_ || !GST_IS_APP_SINK(sink_)) {
            err = "pipeline has no appsink named 'sink'";
            teardownPipeline();
            return false;
        }

        // Only the newest buffer is of interest.
        g_object_set(G_OBJECT(sink_), "sync", FALSE, nullptr);
        g_object_set(G_OBJECT(sink_), "max-buffers", 1, nullptr);
        g_object_set(G_OBJECT(sink_), "drop", TRUE, nullptr);

        bus_ = gst_element_get_bus(pipeline_);

        if (gst_element_set_state(pipeline_, GST_STATE_PLAYING) == GST_STATE_CHANGE_FAILURE) {
            if (!popBusError(err)) {
                err = "state change to PLAYING failed";
            }
            teardownPipeline();
            return false;
        }

        if (cfg_.verbose) {
            std::cout << "[CAMERA] gst camera opened" << std::endl;
        }
        return true;
    }

    bool GstCamera::acquire_frame(core::Frame& out, std::string& err) {
        if (!pipeline_) {
            err = "camera is not open";
            return false;
        }
        if (popBusError(err)) {
            return false;
        }

        GstSample* sample = gst_app_sink_try_pull_sample(
                GST_APP_SINK(sink_),
                static_cast<GstClockTime>(cfg_.acquire_timeout_ms) * GST_MSECOND);
        if (!sample) {
            if (gst_app_sink_is_eos(GST_APP_SINK(sink_))) {
                err = "end of stream";
            } else {
                err = "no frame within " + std::to_string(cfg_.acquire_timeout_ms) + " ms";
            }
            return false;
        }

        GstBuffer* buffer = gst_sample_get_buffer(sample);
        GstCaps* caps = gst_sample_get_caps(sample);
        if (!buffer || !caps) {
            gst_sample_unref(sample);
            err = "sample without buffer or caps";
            return false;
        }

        GstStructure* s = gst_caps_get_structure(caps, 0);
        int width = 0, height = 0;
        gst_structure_get_int(s, "width", &width);
        gst_structure_get_int(s, "height", &height);
        const char* format = gst_structure_get_string(s, "format");
        int fps_n = 0, fps_d = 0;
        if (gst_structure_get_fraction(s, "framerate", &fps_n, &fps_d) && fps_n > 0 && fps_d > 0) {
            frame_rate_ = static_cast<double>(fps_n) / fps_d;
        }

        int type = -1;
        if (format && std::strcmp(format, "BGR") == 0) {
            type = CV_8UC3;
        } else if (format && std::strcmp(format, "GRAY8") == 0) {
            type = CV_8UC1;
        }
        if (type < 0 || width <= 0 || height <= 0) {
            gst_sample_unref(sample);
            err = std::string("unsupported caps, format=") + (format ? format : "(null)");
            return false;
        }

        GstMapInfo map{};
        if (!gst_buffer_map(buffer, &map, GST_MAP_READ)) {
            gst_sample_unref(sample);
            err = "gst_buffer_map failed";
            return false;
        }

        // Rows may be padded; derive the stride from the mapped size.
        const size_t stride = map.size / static_cast<size_t>(height);
        cv::Mat view(height, width, type, static_cast<void*>(map.data), stride);
        out.image = view.clone();

        gst_buffer_unmap(buffer, &map);
        gst_sample_unref(sample);

        out.ts_ms = util::now_steady_ms();
        out.wall_ms = util::now_wall_ms();
        return true;
    }

    void GstCamera::close() {
        if (!pipeline_) return;
        teardownPipeline();
        if (cfg_.verbose) {
            std::cout << "[CAMERA] gst camera closed" << std::endl;
        }
    }

    bool GstCamera::popBusError(std::string& err) {
        if (!bus_) return false;

        GstMessage* msg = gst_bus_pop_filtered(
                bus_, static_cast<GstMessageType>(GST_MESSAGE_ERROR | GST_MESSAGE_EOS));
        if (!msg) return false;

        if (GST_MESSAGE_TYPE(msg) == GST_MESSAGE_EOS) {
            err = "end of stream";
        } else {
            GError* gerr = nullptr;
            gchar* dbg = nullptr;
            gst_message_parse_error(msg, &gerr, &dbg);
            err = gerr ? gerr->message : "(null)";
            if (dbg && cfg_.verbose) {
                std::cerr << "[CAMERA] debug: " << dbg << std::endl;
            }
            if (gerr) g_error_free(gerr);
            if (dbg) g_free(dbg);
        }

        gst_message_unref(msg);
        return true;
    }

    void GstCamera::teardownPipeline() {
        if (pipeline_) {
            gst_element_set_state(pipeline_, GST_STATE_NULL);
        }
        if (bus_) {
            gst_object_unref(bus_);
            bus_ = nullptr;
        }
        if (sink_) {
            // gst_bin_get_by_name() returned a new reference.
            gst_object_unref(sink_);
            sink_ = nullptr;
        }
        if (pipeline_) {
            gst_object_unref(pipeline_);
            pipeline_ = nullptr;
        }
    }

} // namespace capture
