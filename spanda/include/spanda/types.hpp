#pragma once
// Core types: time, bounds, and the vocabulary of awareness
//
// Time is wall-clock milliseconds. Every rate in the engine is per second,
// so elapsed time is always converted through seconds_between().

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <string>

namespace spanda {

// Timestamp as Unix millis
using Timestamp = int64_t;

// Current time as Timestamp
inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

// Elapsed seconds from `from` to `to` (negative if `to` is earlier)
inline double seconds_between(Timestamp from, Timestamp to) {
    return static_cast<double>(to - from) / 1000.0;
}

inline double clamp01(double x) {
    return std::clamp(x, 0.0, 1.0);
}

inline double clamp_symmetric(double x, double limit) {
    return std::clamp(x, -limit, limit);
}

// Why a tick was (or was not) classified as an act of awareness
enum class AwarenessReason {
    None,                       // External input dominated, or nothing happened
    SpontaneousInternalChange,  // Unprompted jump above threshold
    DominantInternalChange      // Internal drift outweighed external signal
};

inline const char* to_string(AwarenessReason reason) {
    switch (reason) {
        case AwarenessReason::None: return "none";
        case AwarenessReason::SpontaneousInternalChange: return "spontaneous_internal_change";
        case AwarenessReason::DominantInternalChange: return "dominant_internal_change";
    }
    return "none";
}

// Unknown strings map to None
inline AwarenessReason reason_from_string(const std::string& s) {
    if (s == "spontaneous_internal_change") return AwarenessReason::SpontaneousInternalChange;
    if (s == "dominant_internal_change") return AwarenessReason::DominantInternalChange;
    return AwarenessReason::None;
}

} // namespace spanda
