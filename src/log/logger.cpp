#include "sturdy/log/logger.hpp"

#include <mutex>

namespace sturdy {

std::string format_fields(const LogFields& fields) {
    std::string out;
    for (const auto& [key, value] : fields) {
        if (out.empty() == false) {
            out += ' ';
        }
        out += key;
        out += '=';
        // Quote values that would otherwise be ambiguous when grepping
        const bool needs_quotes = (value.find(' ') != std::string::npos) || value.empty();
        if (needs_quotes) {
            out += '"';
            out += value;
            out += '"';
        } else {
            out += value;
        }
    }
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger Singleton
// ─────────────────────────────────────────────────────────────────────────────

namespace {

std::unique_ptr<ILogger>& logger_instance() {
    static std::unique_ptr<ILogger> instance = std::make_unique<NullLogger>();
    return instance;
}

std::mutex& logger_mutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace

ILogger& get_logger() noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    return *logger_instance();
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    const bool is_valid = (logger != nullptr);
    if (is_valid) {
        logger_instance() = std::move(logger);
    } else {
        logger_instance() = std::make_unique<NullLogger>();
    }
}

}  // namespace sturdy
