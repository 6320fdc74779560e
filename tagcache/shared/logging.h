#pragma once
#include <cstdio>
#include <cstdint>
#include <ctime>
#include <chrono>
#include <mutex>
#include <string_view>

namespace tagcache {

enum log_level : uint8_t
{
    log_debug = 0,
    log_info  = 1,
    log_warn  = 2,
    log_error = 3
};

struct logger
{
    static inline log_level g_level = log_info;

    static void log(log_level level, std::string_view msg)
    {
        if (level < g_level)
            return;

        auto now = std::chrono::system_clock::now();
        auto t = std::chrono::system_clock::to_time_t(now);
        std::tm tm{};
        localtime_r(&t, &tm);

        const char* tag;
        switch (level)
        {
            case log_debug: tag = "DEBUG"; break;
            case log_info:  tag = "INFO";  break;
            case log_warn:  tag = "WARN";  break;
            case log_error: tag = "ERROR"; break;
            default:        tag = "?";     break;
        }

        static std::mutex mtx;
        std::lock_guard<std::mutex> lock(mtx);
        std::fprintf(stderr, "[%02d:%02d:%02d] [%s] tagcache: %.*s\n",
            tm.tm_hour, tm.tm_min, tm.tm_sec, tag,
            static_cast<int>(msg.size()), msg.data());
    }

    // Returns false for unknown names and leaves the level unchanged
    static bool parse_level(std::string_view name, log_level& out)
    {
        if (name == "debug") { out = log_debug; return true; }
        if (name == "info")  { out = log_info;  return true; }
        if (name == "warn")  { out = log_warn;  return true; }
        if (name == "error") { out = log_error; return true; }
        return false;
    }
};

} // namespace tagcache

// msg may be any expression convertible to std::string_view; it is not
// evaluated when the level is filtered out.
#define TAGCACHE_LOG_DEBUG(msg) do { if (::tagcache::logger::g_level <= ::tagcache::log_debug) ::tagcache::logger::log(::tagcache::log_debug, msg); } while(0)
#define TAGCACHE_LOG_INFO(msg)  do { if (::tagcache::logger::g_level <= ::tagcache::log_info)  ::tagcache::logger::log(::tagcache::log_info,  msg); } while(0)
#define TAGCACHE_LOG_WARN(msg)  do { if (::tagcache::logger::g_level <= ::tagcache::log_warn)  ::tagcache::logger::log(::tagcache::log_warn,  msg); } while(0)
#define TAGCACHE_LOG_ERROR(msg) do { if (::tagcache::logger::g_level <= ::tagcache::log_error) ::tagcache::logger::log(::tagcache::log_error, msg); } while(0)
