#pragma once

#include "sturdy/log/logger.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace sturdy {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogOptions
// ─────────────────────────────────────────────────────────────────────────────

struct SpdlogOptions {
    LogLevel min_level = LogLevel::Info;

    /// spdlog pattern syntax; the default shows time, level and call site.
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v";

    /// Prefix of the spdlog logger name; a unique suffix is always appended.
    std::string name = "sturdy";

    /// Set to route records through spdlog's shared background thread pool.
    bool async = false;
    std::size_t async_queue_size = 8192;
    std::size_t async_threads = 1;
};

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger - ILogger backed by spdlog
// ─────────────────────────────────────────────────────────────────────────────
// Structured fields are appended to the message as key=value pairs, e.g.
//   retrying request url=https://api/x attempt=1 delay_ms=200

class SpdlogLogger final : public ILogger {
public:
    /// Build a logger writing to `sinks`.
    SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, const SpdlogOptions& options);

    /// Wrap an existing spdlog logger; its current level becomes the minimum.
    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

    SpdlogLogger(const SpdlogLogger&) = delete;
    SpdlogLogger& operator=(const SpdlogLogger&) = delete;

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override;

    [[nodiscard]] std::shared_ptr<spdlog::logger> get_spdlog_logger() const noexcept {
        return logger_;
    }

    void set_level(LogLevel level) noexcept;
    void set_pattern(const std::string& pattern);
    void flush();

    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept;

private:
    std::shared_ptr<spdlog::logger> logger_;
    LogLevel min_level_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Factory Functions
// ─────────────────────────────────────────────────────────────────────────────

/// Colored stdout.
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(
    LogLevel min_level = LogLevel::Info
);

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_file_logger(
    const std::string& filename,
    LogLevel min_level = LogLevel::Info
);

/// Colored stdout plus a file, same level and pattern for both.
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_console_file_logger(
    const std::string& filename,
    LogLevel min_level = LogLevel::Info
);

/// Colored stdout written by a background thread; log() never blocks on I/O
/// unless the queue is full.
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_async_console_logger(
    LogLevel min_level = LogLevel::Info,
    std::size_t queue_size = 8192,
    std::size_t thread_count = 1
);

}  // namespace sturdy
