#pragma once
// Operator log: component-tagged lines on stderr
//
// Format: [HH:MM:SS.mmm][component] message
//
// Debug lines only appear when verbose mode is on (CLI --verbose).
// Nothing the run decides lives here; the durable record is the
// event streams in event_log.hpp.

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <ctime>

namespace episteme {
namespace log {

enum class Level : uint8_t { Debug, Info, Warn, Error };

inline std::atomic<bool>& verbose_flag() {
    static std::atomic<bool> verbose{false};
    return verbose;
}

inline std::atomic<bool>& quiet_flag() {
    static std::atomic<bool> quiet{false};
    return quiet;
}

inline void set_verbose(bool on) { verbose_flag() = on; }
inline void set_quiet(bool on) { quiet_flag() = on; }
inline bool verbose() { return verbose_flag(); }

inline const char* level_tag(Level level) {
    switch (level) {
        case Level::Debug: return "";
        case Level::Info:  return "";
        case Level::Warn:  return "warn: ";
        case Level::Error: return "error: ";
    }
    return "";
}

inline void vwrite(Level level, const char* component, const char* fmt, va_list args) {
    if (level == Level::Debug && !verbose_flag()) return;
    if (quiet_flag() && level != Level::Error) return;

    // Timestamp with milliseconds
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    char time_buf[32];
    std::tm tm_buf{};
    localtime_r(&now_time_t, &tm_buf);
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

    std::fprintf(stderr, "[%s.%03d][%s] %s", time_buf,
                 static_cast<int>(now_ms.count()), component, level_tag(level));
    std::vfprintf(stderr, fmt, args);
    std::fputc('\n', stderr);
}

} // namespace log

#if defined(__GNUC__)
#define EPISTEME_PRINTF_LIKE __attribute__((format(printf, 2, 3)))
#else
#define EPISTEME_PRINTF_LIKE
#endif

inline void log_debug(const char* component, const char* fmt, ...) EPISTEME_PRINTF_LIKE;
inline void log_info(const char* component, const char* fmt, ...) EPISTEME_PRINTF_LIKE;
inline void log_warn(const char* component, const char* fmt, ...) EPISTEME_PRINTF_LIKE;
inline void log_error(const char* component, const char* fmt, ...) EPISTEME_PRINTF_LIKE;

inline void log_debug(const char* component, const char* fmt, ...) {
    if (!log::verbose_flag()) return;
    va_list args;
    va_start(args, fmt);
    log::vwrite(log::Level::Debug, component, fmt, args);
    va_end(args);
}

inline void log_info(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log::vwrite(log::Level::Info, component, fmt, args);
    va_end(args);
}

inline void log_warn(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log::vwrite(log::Level::Warn, component, fmt, args);
    va_end(args);
}

inline void log_error(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log::vwrite(log::Level::Error, component, fmt, args);
    va_end(args);
}

} // namespace episteme
