#include "sturdy/log/spdlog_logger.hpp"

#include <spdlog/async_logger.h>
#include <spdlog/details/thread_pool.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <stdexcept>

namespace sturdy {

namespace {

// Instances are never registered in spdlog's global registry, but names
// still have to be distinct for sinks that print them.
std::string unique_name(const std::string& prefix) {
    static std::atomic<std::uint64_t> counter{0};
    return prefix + "_" + std::to_string(counter.fetch_add(1, std::memory_order_relaxed));
}

// Sized by the first async logger created in the process.
std::shared_ptr<spdlog::details::thread_pool> shared_thread_pool(
    std::size_t queue_size,
    std::size_t thread_count
) {
    static std::once_flag once;
    static std::shared_ptr<spdlog::details::thread_pool> pool;
    std::call_once(once, [queue_size, thread_count]() {
        pool = std::make_shared<spdlog::details::thread_pool>(queue_size, thread_count);
    });
    return pool;
}

std::shared_ptr<spdlog::logger> build_logger(
    std::vector<spdlog::sink_ptr> sinks,
    const SpdlogOptions& options
) {
    std::shared_ptr<spdlog::logger> logger;
    if (options.async) {
        logger = std::make_shared<spdlog::async_logger>(
            unique_name(options.name + "_async"),
            sinks.begin(),
            sinks.end(),
            shared_thread_pool(options.async_queue_size, options.async_threads),
            spdlog::async_overflow_policy::block
        );
    } else {
        logger = std::make_shared<spdlog::logger>(unique_name(options.name), sinks.begin(), sinks.end());
    }
    logger->set_level(SpdlogLogger::to_spdlog_level(options.min_level));
    logger->set_pattern(options.pattern);
    return logger;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Level Conversion
// ─────────────────────────────────────────────────────────────────────────────

spdlog::level::level_enum SpdlogLogger::to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info:  return spdlog::level::info;
        case LogLevel::Warn:  return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Fatal: return spdlog::level::critical;
        case LogLevel::Off:   return spdlog::level::off;
    }
    return spdlog::level::info;
}

LogLevel SpdlogLogger::from_spdlog_level(spdlog::level::level_enum level) noexcept {
    switch (level) {
        case spdlog::level::trace:    return LogLevel::Trace;
        case spdlog::level::debug:    return LogLevel::Debug;
        case spdlog::level::info:     return LogLevel::Info;
        case spdlog::level::warn:     return LogLevel::Warn;
        case spdlog::level::err:      return LogLevel::Error;
        case spdlog::level::critical: return LogLevel::Fatal;
        case spdlog::level::off:      return LogLevel::Off;
        default:                      return LogLevel::Info;
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger
// ─────────────────────────────────────────────────────────────────────────────

SpdlogLogger::SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, const SpdlogOptions& options)
    : logger_(build_logger(std::move(sinks), options))
    , min_level_(options.min_level)
{}

SpdlogLogger::SpdlogLogger(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger))
    , min_level_(LogLevel::Info)
{
    if (logger_ == nullptr) {
        throw std::invalid_argument("SpdlogLogger: logger cannot be null");
    }
    min_level_ = from_spdlog_level(logger_->level());
}

void SpdlogLogger::log(const LogRecord& record) {
    if (should_log(record.level) == false) {
        return;
    }

    const spdlog::source_loc where{
        record.location.file_name(),
        static_cast<int>(record.location.line()),
        record.location.function_name()
    };

    if (record.fields.empty()) {
        logger_->log(where, to_spdlog_level(record.level), "{}", record.message);
        return;
    }
    logger_->log(where, to_spdlog_level(record.level), "{} {}", record.message, format_fields(record.fields));
}

bool SpdlogLogger::should_log(LogLevel level) const noexcept {
    return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(min_level_);
}

void SpdlogLogger::set_level(LogLevel level) noexcept {
    min_level_ = level;
    logger_->set_level(to_spdlog_level(level));
}

void SpdlogLogger::set_pattern(const std::string& pattern) {
    logger_->set_pattern(pattern);
}

void SpdlogLogger::flush() {
    logger_->flush();
}

// ─────────────────────────────────────────────────────────────────────────────
// Factory Functions
// ─────────────────────────────────────────────────────────────────────────────

std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(LogLevel min_level) {
    return std::make_unique<SpdlogLogger>(
        std::vector<spdlog::sink_ptr>{std::make_shared<spdlog::sinks::stdout_color_sink_mt>()},
        SpdlogOptions{.min_level = min_level});
}

std::unique_ptr<SpdlogLogger> make_spdlog_file_logger(const std::string& filename, LogLevel min_level) {
    return std::make_unique<SpdlogLogger>(
        std::vector<spdlog::sink_ptr>{std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename)},
        SpdlogOptions{.min_level = min_level, .name = "sturdy_file"});
}

std::unique_ptr<SpdlogLogger> make_spdlog_console_file_logger(const std::string& filename, LogLevel min_level) {
    std::vector<spdlog::sink_ptr> sinks{
        std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename)
    };
    return std::make_unique<SpdlogLogger>(std::move(sinks), SpdlogOptions{.min_level = min_level});
}

std::unique_ptr<SpdlogLogger> make_spdlog_async_console_logger(
    LogLevel min_level,
    std::size_t queue_size,
    std::size_t thread_count
) {
    return std::make_unique<SpdlogLogger>(
        std::vector<spdlog::sink_ptr>{std::make_shared<spdlog::sinks::stdout_color_sink_mt>()},
        SpdlogOptions{
            .min_level = min_level,
            .async = true,
            .async_queue_size = queue_size,
            .async_threads = thread_count
        });
}

}  // namespace sturdy
