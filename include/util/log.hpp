#pragma once
#include <chrono>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <string>

namespace brickhub
{

enum class Level
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3
};

inline Level &global_level()
{
    static Level lv = Level::Info;
    return lv;
}

inline void set_log_level(Level lv)
{
    global_level() = lv;
}

// Unknown names fall back to info.
inline void set_log_level_by_name(const char *name)
{
    std::string level = name ? std::string(name) : std::string();
    for (auto &c : level)
        c = (char)std::tolower((unsigned char)c);

    if (level == "debug")
        set_log_level(Level::Debug);
    else if (level == "info")
        set_log_level(Level::Info);
    else if (level == "warn" || level == "warning")
        set_log_level(Level::Warning);
    else if (level == "error" || level == "err")
        set_log_level(Level::Error);
    else
        set_log_level(Level::Info);
}

inline void init_log_level_from_env(const char *env_var = "BRICKHUB_LOG_LEVEL")
{
    if (const char *v = std::getenv(env_var); v && *v)
        set_log_level_by_name(v);
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
    if ((int)lv < (int)global_level())
        return;

    char ts[16];
    timestamp(ts, sizeof(ts));

    // one buffered line per call so concurrent threads do not interleave
    char    line[1024];
    int     head = std::snprintf(line, sizeof(line), "%s %s %s: ", ts, level_name(lv),
                                 func ? func : "?");
    va_list ap;
    va_start(ap, fmt);
    if (head > 0 && (size_t)head < sizeof(line))
        std::vsnprintf(line + head, sizeof(line) - head, fmt, ap);
    va_end(ap);

    size_t m = std::strlen(line);
    if (m == 0 || line[m - 1] != '\n')
        std::fprintf(stderr, "%s\n", line);
    else
        std::fputs(line, stderr);
}

#define LOG_DEBUG(...) ::brickhub::logf(::brickhub::Level::Debug, __func__, __VA_ARGS__)
#define LOG_INFO(...) ::brickhub::logf(::brickhub::Level::Info, __func__, __VA_ARGS__)
#define LOG_WARN(...) ::brickhub::logf(::brickhub::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(...) ::brickhub::logf(::brickhub::Level::Error, __func__, __VA_ARGS__)

}  // namespace brickhub
