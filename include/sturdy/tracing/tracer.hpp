#pragma once

#include "sturdy/log/logger.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sturdy {

// ─────────────────────────────────────────────────────────────────────────────
// Trace Context (W3C traceparent)
// ─────────────────────────────────────────────────────────────────────────────
// "00-<32 hex trace id>-<16 hex span id>-<2 hex flags>"

struct TraceContext {
    std::string trace_id;  // 32 lowercase hex chars
    std::string span_id;   // 16 lowercase hex chars
    bool sampled{true};

    [[nodiscard]] std::string to_traceparent() const;
    [[nodiscard]] static std::optional<TraceContext> parse(std::string_view traceparent);
};

/// Random trace id (16 bytes) as lowercase hex.
[[nodiscard]] std::string generate_trace_id();

/// Random span id (8 bytes) as lowercase hex.
[[nodiscard]] std::string generate_span_id();

// ─────────────────────────────────────────────────────────────────────────────
// Span / Tracer Interfaces
// ─────────────────────────────────────────────────────────────────────────────
// Exporters plug in by implementing ITracer. A span is ended exactly once;
// attributes set after end() are ignored.

enum class SpanStatus {
    Unset,
    Ok,
    Error
};

class ISpan {
public:
    virtual ~ISpan() = default;

    virtual void set_attribute(std::string_view key, std::string value) = 0;
    virtual void set_attribute(std::string_view key, std::int64_t value) = 0;
    virtual void set_status(SpanStatus status, std::string_view description = {}) = 0;
    virtual void end() = 0;

    [[nodiscard]] virtual const TraceContext& context() const noexcept = 0;
};

class ITracer {
public:
    virtual ~ITracer() = default;

    /// Start a span; `parent` continues an existing trace when present.
    [[nodiscard]] virtual std::unique_ptr<ISpan> start_span(
        std::string_view name,
        const std::optional<TraceContext>& parent
    ) = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// NullTracer - context propagation only, nothing recorded
// ─────────────────────────────────────────────────────────────────────────────

class NullTracer final : public ITracer {
public:
    [[nodiscard]] std::unique_ptr<ISpan> start_span(
        std::string_view name,
        const std::optional<TraceContext>& parent
    ) override;
};

// ─────────────────────────────────────────────────────────────────────────────
// LogTracer - finished spans are written to the global logger
// ─────────────────────────────────────────────────────────────────────────────
// Usage:
//   auto tracer = std::make_shared<LogTracer>(LogLevel::Info);
//   options.with_interceptor(tracing_interceptor(TracingConfig{.tracer = tracer}));

class LogTracer final : public ITracer {
public:
    explicit LogTracer(LogLevel level = LogLevel::Debug)
        : level_(level)
    {}

    [[nodiscard]] std::unique_ptr<ISpan> start_span(
        std::string_view name,
        const std::optional<TraceContext>& parent
    ) override;

private:
    LogLevel level_;
};

}  // namespace sturdy
