#pragma once
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <mutex>
#include <string>
#include <string_view>

namespace webble
{

enum class Level
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3,
    System  = 4  // event channel, always printed (tailed by the UI host)
};

// Read by every scan, listener and notification thread
inline std::atomic<Level> &global_level()
{
    static std::atomic<Level> lv{Level::Info};
    return lv;
}

inline void set_log_level(Level lv)
{
    global_level().store(lv);
}

inline bool log_enabled(Level lv)
{
    return lv == Level::System || (int)lv >= (int)global_level().load();
}

// Case-insensitive; accepts the short and long spellings. System is not
// selectable.
inline bool parse_level(std::string_view name, Level &out)
{
    std::string v;
    for (char c : name)
        v.push_back((char)std::tolower((unsigned char)c));

    if (v == "debug")
        out = Level::Debug;
    else if (v == "info")
        out = Level::Info;
    else if (v == "warn" || v == "warning")
        out = Level::Warning;
    else if (v == "error" || v == "err")
        out = Level::Error;
    else
        return false;
    return true;
}

// Unknown names fall back to Info
inline void set_log_level_by_name(const char *name)
{
    Level lv = Level::Info;
    if (name)
        (void)parse_level(name, lv);
    set_log_level(lv);
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

inline std::mutex &log_mutex()
{
    static std::mutex mu;
    return mu;
}

// ======================================================================
// Function: vlogf
// - In: level, calling function, optional tag, printf format + args
// - Out: one line on stderr, "HH:MM:SS.mmm [LEVEL] func: [tag ]msg"
// - Note: the whole line is written under log_mutex so lines from
//         concurrent threads never interleave
// ======================================================================
inline void vlogf(Level lv, const char *func, const char *tag, const char *fmt, va_list ap)
{
    char ts[16];
    timestamp(ts, sizeof(ts));

    std::lock_guard<std::mutex> lk(log_mutex());
    std::fprintf(stderr, "%s %s %s: ", ts, level_name(lv), func ? func : "?");
    if (tag && *tag)
        std::fprintf(stderr, "%s ", tag);
    std::vfprintf(stderr, fmt, ap);

    size_t m = std::strlen(fmt);
    if (m == 0 || fmt[m - 1] != '\n')
        std::fputc('\n', stderr);
    std::fflush(stderr);
}

inline void logf(Level lv, const char *func, const char *fmt, ...)
{
    if (!log_enabled(lv))
        return;
    va_list ap;
    va_start(ap, fmt);
    vlogf(lv, func, nullptr, fmt, ap);
    va_end(ap);
}

// Host-facing event line: "[EVENT] <name> <fields>" on the System channel
inline void log_event(const char *func, std::string_view name, const char *fmt, ...)
{
    const std::string tag = "[EVENT] " + std::string(name);
    va_list           ap;
    va_start(ap, fmt);
    vlogf(Level::System, func, tag.c_str(), fmt, ap);
    va_end(ap);
}

// Warns when the variable holds an unknown level name
inline void set_log_level_from_env(const char *env_var)
{
    const char *v = std::getenv(env_var);
    if (!v)
        return;
    Level lv = Level::Info;
    if (!parse_level(v, lv))
        logf(Level::Warning, __func__, "Ignoring invalid %s='%s' (expect debug|info|warn|error)",
             env_var, v);
    set_log_level(lv);
}

#define LOG_DEBUG(...) ::webble::logf(::webble::Level::Debug, __func__, __VA_ARGS__)
#define LOG_INFO(...) ::webble::logf(::webble::Level::Info, __func__, __VA_ARGS__)
#define LOG_WARN(...) ::webble::logf(::webble::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(...) ::webble::logf(::webble::Level::Error, __func__, __VA_ARGS__)
#define LOG_SYSTEM(...) ::webble::logf(::webble::Level::System, __func__, __VA_ARGS__)
#define LOG_EVENT(name, ...) ::webble::log_event(__func__, name, __VA_ARGS__)

}  // namespace webble
