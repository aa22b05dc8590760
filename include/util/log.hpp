#pragma once
#include <atomic>
#include <chrono>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

// printf-style logging to stderr, one timestamped line per call:
//   12:00:01.234 [WARN] handle_frame: ...
// The daemon and the CLI share it; CLIPSYNC_LOG_LEVEL picks the threshold.
namespace clipsync
{

enum class Level
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3,
    System  = 4  // operator-facing events, never filtered
};

// read by every logging thread, set from main and tests
inline std::atomic<Level> &global_level()
{
    static std::atomic<Level> lv{Level::Info};
    return lv;
}

inline std::mutex &log_mutex()
{
    static std::mutex mu;
    return mu;
}

inline void set_log_level(Level lv)
{
    global_level().store(lv, std::memory_order_relaxed);
}

// Case-insensitive; System is not selectable
inline std::optional<Level> parse_log_level(std::string_view name)
{
    std::string level(name);
    for (auto &c : level)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (level == "debug")
        return Level::Debug;
    if (level == "info")
        return Level::Info;
    if (level == "warn" || level == "warning")
        return Level::Warning;
    if (level == "error" || level == "err")
        return Level::Error;
    return std::nullopt;
}

// Unknown names fall back to Info and return false
inline bool set_log_level_by_name(std::string_view name)
{
    const auto lv = parse_log_level(name);
    set_log_level(lv.value_or(Level::Info));
    return lv.has_value();
}

inline const char *level_name(Level lv)
{
    switch (lv)
    {
        case Level::Debug:
            return "[DEBUG]";
        case Level::Info:
            return "[INFO]";
        case Level::Warning:
            return "[WARN]";
        case Level::Error:
            return "[ERROR]";
        case Level::System:
            return "[SYSTEM]";
    }
    return "?";
}

inline void timestamp(char *buf, size_t n)
{
    using namespace std::chrono;
    const auto  now = system_clock::now();
    const auto  ms  = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t tt  = system_clock::to_time_t(now);
    std::tm     tm{};
    localtime_r(&tt, &tm);
    std::snprintf(buf, n, "%02d:%02d:%02d.%03d", tm.tm_hour, tm.tm_min, tm.tm_sec,
                  (int)ms.count());
}

inline void logf(Level lv, const char *func, const char *fmt, ...)
{
    if ((int)lv < (int)global_level().load(std::memory_order_relaxed))
        return;

    char ts[16];
    timestamp(ts, sizeof(ts));

    // one line per call even when the rx and tx paths log concurrently
    std::lock_guard<std::mutex> lk(log_mutex());
    std::fprintf(stderr, "%s %s %s: ", ts, level_name(lv), func ? func : "?");

    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);

    size_t m = std::strlen(fmt);
    if (m == 0 || fmt[m - 1] != '\n')
        std::fputc('\n', stderr);
}

#define LOG_DEBUG(...) ::clipsync::logf(::clipsync::Level::Debug, __func__, __VA_ARGS__)
#define LOG_INFO(...) ::clipsync::logf(::clipsync::Level::Info, __func__, __VA_ARGS__)
#define LOG_WARN(...) ::clipsync::logf(::clipsync::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(...) ::clipsync::logf(::clipsync::Level::Error, __func__, __VA_ARGS__)
#define LOG_SYSTEM(...) ::clipsync::logf(::clipsync::Level::System, __func__, __VA_ARGS__)

}  // namespace clipsync
