#pragma once
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace meshwire::logx
{

enum class Level : int
{
    Quiet = 0,
    Error = 1,
    Warn = 2,
    Info = 3,
    Debug = 4
};

struct Config
{
    Level level = Level::Warn; // default verbosity (overridden by MESHWIRE_LOG if level==Warn)
};

inline std::atomic<Level> g_level{Level::Warn};

inline Level level_from_string(std::string s, Level fallback)
{
    for (auto& c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (s == "quiet")
        return Level::Quiet;
    if (s == "error")
        return Level::Error;
    if (s == "warn" || s == "warning")
        return Level::Warn;
    if (s == "info")
        return Level::Info;
    if (s == "debug")
        return Level::Debug;
    return fallback;
}

inline Level level_from_env()
{
    const char* v = std::getenv("MESHWIRE_LOG");
    if (!v)
        return Level::Warn;
    return level_from_string(v, Level::Warn);
}

inline void init(const Config& cfg = {})
{
    // A caller that keeps the default lets MESHWIRE_LOG decide
    g_level.store(cfg.level == Level::Warn ? level_from_env() : cfg.level);
}

inline const char* level_tag(Level L)
{
    switch (L)
    {
    case Level::Error:
        return "[error] ";
    case Level::Warn:
        return "[warn ] ";
    case Level::Info:
        return "[info ] ";
    case Level::Debug:
        return "[debug] ";
    default:
        return "";
    }
}

inline bool gate(Level L)
{
    return L == Level::Quiet || L > g_level.load();
}

inline void vprint(Level L, const char* fmt, va_list ap)
{
    if (gate(L))
        return;
    std::fputs(level_tag(L), stderr);
    std::vfprintf(stderr, fmt, ap);
    std::fflush(stderr);
}

inline void print(Level L, const char* fmt, ...)
{
    va_list ap;
    va_start(ap, fmt);
    vprint(L, fmt, ap);
    va_end(ap);
}

// Convenience
#define LOGD(...) ::meshwire::logx::print(::meshwire::logx::Level::Debug, __VA_ARGS__)
#define LOGI(...) ::meshwire::logx::print(::meshwire::logx::Level::Info, __VA_ARGS__)
#define LOGW(...) ::meshwire::logx::print(::meshwire::logx::Level::Warn, __VA_ARGS__)
#define LOGE(...) ::meshwire::logx::print(::meshwire::logx::Level::Error, __VA_ARGS__)

} // namespace meshwire::logx
