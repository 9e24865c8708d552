#pragma once
#include <chrono>
#include <string>

namespace yieldguard {

using Clock     = std::chrono::system_clock;
using Timestamp = Clock::time_point;

// UTC, second resolution: 2026-10-19T08:30:00Z
std::string format_utc(Timestamp ts);

// Inverse of format_utc. Throws ValidationError on malformed input.
Timestamp parse_utc(const std::string& text);

inline double hours_between(Timestamp from, Timestamp to) {
    return std::chrono::duration<double, std::ratio<3600>>(to - from).count();
}

} // namespace yieldguard
