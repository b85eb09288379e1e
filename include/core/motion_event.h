#pragma once

namespace core {

    // Result of one detection tick.
    struct MotionEvent {
        long long ts_ms = 0;
        bool detected = false;
        double magnitude = 0.0;      // after exposure filtering, % of changed area
        double raw_magnitude = 0.0;  // before exposure filtering
        bool exposure_suppressed = false;
    };

} // namespace core
