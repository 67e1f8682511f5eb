#pragma once

#include "config/Config.h"

#include <cstdarg>
#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace logging {

enum class LogCategory { NET, DATA, CURSOR, STORAGE, INTEGRITY, APP };

struct LogOptions {
    config::LogLevel level = config::LogLevel::Info;
    // Debug and Trace lines go here while the level is Debug or lower; empty path keeps them on stdout.
    std::filesystem::path debugFile{"./logs/ledger-ingest-debug.log"};
    std::size_t debugFileMaxBytes = 8U * 1024U * 1024U;
    std::size_t queueCapacity = 4096;
};

struct LogStats {
    std::uint64_t written{0};
    std::uint64_t dropped{0};     // low-severity lines lost to a saturated queue
    std::uint64_t suppressed{0};  // lines swallowed by log_every throttling
    std::uint64_t rotations{0};
};

class Log {
public:
    // Applies sink settings. Lines already queued are written under the previous settings.
    static void configure(const LogOptions& options);

    static void set_log_level(config::LogLevel level);
    static config::LogLevel get_log_level();
    static bool enabled(config::LogLevel level);

    static const char* category_to_string(LogCategory category);

    static void log(config::LogLevel level, LogCategory category, const char* fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;

    // At most one line per key every intervalMs. The next emitted line reports how many were skipped.
    static void log_every(const char* key, long long intervalMs, config::LogLevel level, LogCategory category,
                          const char* fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
        __attribute__((format(printf, 5, 6)))
#endif
        ;

    // Blocks until every queued line has been written.
    static void flush();
    static LogStats stats();

private:
    static void vlog(config::LogLevel level, LogCategory category, const char* fmt, std::va_list args);
};

}  // namespace logging

#define LOG_ERROR(cat, ...) ::logging::Log::log(::config::LogLevel::Error, (cat), __VA_ARGS__)
#define LOG_WARN(cat, ...)  ::logging::Log::log(::config::LogLevel::Warn,  (cat), __VA_ARGS__)
#define LOG_INFO(cat, ...)  ::logging::Log::log(::config::LogLevel::Info,  (cat), __VA_ARGS__)
#define LOG_DEBUG(cat, ...) ::logging::Log::log(::config::LogLevel::Debug, (cat), __VA_ARGS__)
#define LOG_TRACE(cat, ...) ::logging::Log::log(::config::LogLevel::Trace, (cat), __VA_ARGS__)

#define LOG_INFO_EVERY(key, intervalMs, cat, ...) \
    ::logging::Log::log_every((key), (intervalMs), ::config::LogLevel::Info, (cat), __VA_ARGS__)
#define LOG_WARN_EVERY(key, intervalMs, cat, ...) \
    ::logging::Log::log_every((key), (intervalMs), ::config::LogLevel::Warn, (cat), __VA_ARGS__)
