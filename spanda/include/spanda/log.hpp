#pragma once
// Log: component-tagged lines on stderr
//
//   [14:02:11.042][life_loop] Started (period=1000ms)
//
// Debug lines only appear in verbose mode.

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace spanda {
namespace log {

inline std::atomic<bool>& verbose_flag() {
    static std::atomic<bool> verbose{false};
    return verbose;
}

inline void set_verbose(bool on) { verbose_flag() = on; }
inline bool verbose() { return verbose_flag(); }

inline void vwrite(const char* level, const char* component, const char* fmt, va_list args) {
    // Serialize whole lines; the life loop and the input thread both log
    static std::mutex write_mutex;

    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&now_time_t, &local);
    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &local);

    std::lock_guard<std::mutex> lock(write_mutex);
    std::fprintf(stderr, "[%s.%03d][%s]%s ", time_buf,
                 static_cast<int>(now_ms.count()), component, level);
    std::vfprintf(stderr, fmt, args);
    std::fputc('\n', stderr);
}

inline void info(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite("", component, fmt, args);
    va_end(args);
}

inline void warn(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite(" WARNING:", component, fmt, args);
    va_end(args);
}

inline void debug(const char* component, const char* fmt, ...) {
    if (!verbose()) return;
    va_list args;
    va_start(args, fmt);
    vwrite("", component, fmt, args);
    va_end(args);
}

} // namespace log
} // namespace spanda
