#include "sturdy/tracing/tracer.hpp"

#include <algorithm>
#include <mutex>
#include <random>

namespace sturdy {

namespace {

constexpr std::size_t kTraceIdHex = 32;
constexpr std::size_t kSpanIdHex = 16;

std::string random_hex(std::size_t length) {
    static std::mutex mutex;
    static std::mt19937_64 rng(std::random_device{}());
    constexpr char kDigits[] = "0123456789abcdef";

    std::string out(length, '0');
    std::lock_guard<std::mutex> lock(mutex);
    do {
        for (auto& c : out) {
            c = kDigits[rng() & 0xF];
        }
    } while (std::ranges::all_of(out, [](char c) { return c == '0'; }));  // all-zero ids are invalid
    return out;
}

bool is_lower_hex(std::string_view text) {
    return std::ranges::all_of(text, [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

// Propagates context without recording anything
class NullSpan final : public ISpan {
public:
    explicit NullSpan(TraceContext context)
        : context_(std::move(context))
    {}

    void set_attribute(std::string_view, std::string) override {}
    void set_attribute(std::string_view, std::int64_t) override {}
    void set_status(SpanStatus, std::string_view) override {}
    void end() override {}

    [[nodiscard]] const TraceContext& context() const noexcept override { return context_; }

private:
    TraceContext context_;
};

class LogSpan final : public ISpan {
public:
    LogSpan(std::string name, TraceContext context, std::string parent_span_id, LogLevel level)
        : name_(std::move(name))
        , context_(std::move(context))
        , parent_span_id_(std::move(parent_span_id))
        , level_(level)
        , started_(std::chrono::steady_clock::now())
    {}

    ~LogSpan() override {
        end();
    }

    void set_attribute(std::string_view key, std::string value) override {
        if (ended_ == false) {
            attributes_.emplace_back(std::string(key), std::move(value));
        }
    }

    void set_attribute(std::string_view key, std::int64_t value) override {
        set_attribute(key, std::to_string(value));
    }

    void set_status(SpanStatus status, std::string_view description) override {
        if (ended_ == false) {
            status_ = status;
            description_ = std::string(description);
        }
    }

    void end() override {
        if (ended_) {
            return;
        }
        ended_ = true;

        const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - started_);

        LogFields fields{
            {"span", name_},
            {"trace_id", context_.trace_id},
            {"span_id", context_.span_id},
            {"duration_us", std::to_string(elapsed.count())}
        };
        if (parent_span_id_.empty() == false) {
            fields.emplace_back("parent_span_id", parent_span_id_);
        }
        if (status_ == SpanStatus::Error) {
            fields.emplace_back("status", "error");
            if (description_.empty() == false) {
                fields.emplace_back("status_description", description_);
            }
        } else if (status_ == SpanStatus::Ok) {
            fields.emplace_back("status", "ok");
        }
        for (auto& attribute : attributes_) {
            fields.push_back(std::move(attribute));
        }

        auto& logger = get_logger();
        if (logger.should_log(level_)) {
            logger.log(LogRecord(level_, "span finished", std::move(fields)));
        }
    }

    [[nodiscard]] const TraceContext& context() const noexcept override { return context_; }

private:
    std::string name_;
    TraceContext context_;
    std::string parent_span_id_;
    LogLevel level_;
    std::chrono::steady_clock::time_point started_;
    LogFields attributes_;
    SpanStatus status_{SpanStatus::Unset};
    std::string description_;
    bool ended_{false};
};

TraceContext child_of(const std::optional<TraceContext>& parent) {
    TraceContext context;
    context.trace_id = parent.has_value() ? parent->trace_id : generate_trace_id();
    context.span_id = generate_span_id();
    context.sampled = parent.has_value() ? parent->sampled : true;
    return context;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Trace Context
// ─────────────────────────────────────────────────────────────────────────────

std::string TraceContext::to_traceparent() const {
    return "00-" + trace_id + "-" + span_id + (sampled ? "-01" : "-00");
}

std::optional<TraceContext> TraceContext::parse(std::string_view traceparent) {
    // 2 + 1 + 32 + 1 + 16 + 1 + 2
    constexpr std::size_t kLength = 55;
    if (traceparent.size() != kLength) {
        return std::nullopt;
    }
    if (traceparent[2] != '-' || traceparent[35] != '-' || traceparent[52] != '-') {
        return std::nullopt;
    }

    const auto version = traceparent.substr(0, 2);
    const auto trace_id = traceparent.substr(3, kTraceIdHex);
    const auto span_id = traceparent.substr(36, kSpanIdHex);
    const auto flags = traceparent.substr(53, 2);

    const bool well_formed = is_lower_hex(version) && version != "ff" &&
                             is_lower_hex(trace_id) && is_lower_hex(span_id) && is_lower_hex(flags);
    if (well_formed == false) {
        return std::nullopt;
    }

    const bool zero_trace = std::ranges::all_of(trace_id, [](char c) { return c == '0'; });
    const bool zero_span = std::ranges::all_of(span_id, [](char c) { return c == '0'; });
    if (zero_trace || zero_span) {
        return std::nullopt;
    }

    TraceContext context;
    context.trace_id = std::string(trace_id);
    context.span_id = std::string(span_id);
    const char low = flags[1];
    const int nibble = (low <= '9') ? (low - '0') : (low - 'a' + 10);
    context.sampled = (nibble & 0x1) != 0;
    return context;
}

std::string generate_trace_id() {
    return random_hex(kTraceIdHex);
}

std::string generate_span_id() {
    return random_hex(kSpanIdHex);
}

// ─────────────────────────────────────────────────────────────────────────────
// Tracers
// ─────────────────────────────────────────────────────────────────────────────

std::unique_ptr<ISpan> NullTracer::start_span(
    std::string_view /*name*/,
    const std::optional<TraceContext>& parent
) {
    return std::make_unique<NullSpan>(child_of(parent));
}

std::unique_ptr<ISpan> LogTracer::start_span(
    std::string_view name,
    const std::optional<TraceContext>& parent
) {
    std::string parent_span_id = parent.has_value() ? parent->span_id : std::string{};
    return std::make_unique<LogSpan>(std::string(name), child_of(parent), std::move(parent_span_id), level_);
}

}  // namespace sturdy
