#pragma once
#include <string>

namespace util {

// Monotonic time in ms (steady_clock, no jumps).
long long now_steady_ms();

// Wall-clock time in ms since epoch.
long long now_wall_ms();

// strftime() over local time; fmt as in strftime.
std::string format_local_time(long long wall_ms, const char* fmt);

} // namespace util
