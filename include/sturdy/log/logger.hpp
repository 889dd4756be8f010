#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sturdy {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,  // Per-attempt detail (headers, backoff delays)
    Debug = 1,  // Retry decisions, policy defaults, cache hits
    Info  = 2,  // Lifecycle (client built, shutdown, breaker transitions)
    Warn  = 3,  // Misconfiguration that degrades to a safe default
    Error = 4,  // Failures in caller-supplied callbacks
    Fatal = 5,
    Off   = 6
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

// ─────────────────────────────────────────────────────────────────────────────
// Log Fields - structured key/value pairs attached to a record
// ─────────────────────────────────────────────────────────────────────────────
// Usage:
//   get_logger().warn("cache enabled without backend",
//                     {{"method", "GET"}, {"path", "/users"}});

using LogField = std::pair<std::string, std::string>;
using LogFields = std::vector<LogField>;

/// Render fields as "key=value key=value" (empty string for no fields).
[[nodiscard]] std::string format_fields(const LogFields& fields);

// ─────────────────────────────────────────────────────────────────────────────
// Log Record - Immutable snapshot of a log event
// ─────────────────────────────────────────────────────────────────────────────

struct LogRecord {
    LogLevel level;
    std::string message;
    LogFields fields;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string msg,
        LogFields kv = {},
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , message(std::move(msg))
        , fields(std::move(kv))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger Interface - Swappable logging backend
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    // Check if a level would be logged (for avoiding expensive formatting)
    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void trace(std::string_view msg, LogFields fields = {},
               std::source_location loc = std::source_location::current()) {
        emit(LogLevel::Trace, msg, std::move(fields), loc);
    }

    void debug(std::string_view msg, LogFields fields = {},
               std::source_location loc = std::source_location::current()) {
        emit(LogLevel::Debug, msg, std::move(fields), loc);
    }

    void info(std::string_view msg, LogFields fields = {},
              std::source_location loc = std::source_location::current()) {
        emit(LogLevel::Info, msg, std::move(fields), loc);
    }

    void warn(std::string_view msg, LogFields fields = {},
              std::source_location loc = std::source_location::current()) {
        emit(LogLevel::Warn, msg, std::move(fields), loc);
    }

    void error(std::string_view msg, LogFields fields = {},
               std::source_location loc = std::source_location::current()) {
        emit(LogLevel::Error, msg, std::move(fields), loc);
    }

    void fatal(std::string_view msg, LogFields fields = {},
               std::source_location loc = std::source_location::current()) {
        emit(LogLevel::Fatal, msg, std::move(fields), loc);
    }

    // Templated formatting helpers (C++20 std::format)
    template<typename... Args>
    void trace_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::Trace)) {
            log(LogRecord(LogLevel::Trace, std::format(fmt, std::forward<Args>(args)...)));
        }
    }

    template<typename... Args>
    void debug_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::Debug)) {
            log(LogRecord(LogLevel::Debug, std::format(fmt, std::forward<Args>(args)...)));
        }
    }

    template<typename... Args>
    void info_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::Info)) {
            log(LogRecord(LogLevel::Info, std::format(fmt, std::forward<Args>(args)...)));
        }
    }

    template<typename... Args>
    void warn_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::Warn)) {
            log(LogRecord(LogLevel::Warn, std::format(fmt, std::forward<Args>(args)...)));
        }
    }

    template<typename... Args>
    void error_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::Error)) {
            log(LogRecord(LogLevel::Error, std::format(fmt, std::forward<Args>(args)...)));
        }
    }

private:
    void emit(LogLevel level, std::string_view msg, LogFields fields, std::source_location loc) {
        if (should_log(level)) {
            log(LogRecord(level, std::string(msg), std::move(fields), loc));
        }
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger - Discards all logs (zero overhead when disabled)
// ─────────────────────────────────────────────────────────────────────────────

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger Access
// ─────────────────────────────────────────────────────────────────────────────

// Get the global logger instance (defaults to NullLogger)
[[nodiscard]] ILogger& get_logger() noexcept;

// Set a new global logger (takes ownership). nullptr restores NullLogger.
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

// These check should_log() before evaluating arguments

#define STURDY_LOG_TRACE(msg) \
    do { if (::sturdy::get_logger().should_log(::sturdy::LogLevel::Trace)) \
         ::sturdy::get_logger().trace(msg); } while(false)

#define STURDY_LOG_DEBUG(msg) \
    do { if (::sturdy::get_logger().should_log(::sturdy::LogLevel::Debug)) \
         ::sturdy::get_logger().debug(msg); } while(false)

#define STURDY_LOG_INFO(msg) \
    do { if (::sturdy::get_logger().should_log(::sturdy::LogLevel::Info)) \
         ::sturdy::get_logger().info(msg); } while(false)

#define STURDY_LOG_WARN(msg) \
    do { if (::sturdy::get_logger().should_log(::sturdy::LogLevel::Warn)) \
         ::sturdy::get_logger().warn(msg); } while(false)

#define STURDY_LOG_ERROR(msg) \
    do { if (::sturdy::get_logger().should_log(::sturdy::LogLevel::Error)) \
         ::sturdy::get_logger().error(msg); } while(false)

#define STURDY_LOG_FATAL(msg) \
    do { if (::sturdy::get_logger().should_log(::sturdy::LogLevel::Fatal)) \
         ::sturdy::get_logger().fatal(msg); } while(false)

}  // namespace sturdy
