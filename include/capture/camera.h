#pragma once
#include <string>

#include "core/frame.h"

namespace capture {

// Camera device as seen by the capture loop.
// acquire_frame() may block (device read) and may fail; failures are reported
// through the return value and `err`, never by throwing.
    class Camera {
    public:
        virtual ~Camera() = default;

        virtual bool open(std::string& err) = 0;
        virtual bool acquire_frame(core::Frame& out, std::string& err) = 0;
        virtual void close() = 0;
        virtual bool is_open() const = 0;

        // Nominal frames per second reported by the device, 0 if unknown.
        virtual double frame_rate() const = 0;

        // Camera auto-exposure; takes effect on the next open().
        virtual void set_auto_exposure(bool enabled) = 0;
    };

} // namespace capture
