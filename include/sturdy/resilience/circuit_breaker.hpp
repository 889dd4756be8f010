#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Circuit Breaker
// ═══════════════════════════════════════════════════════════════════════════
// Gates calls to a dependency based on its recent failure history. One
// breaker is shared by every call routed to it, so all operations are
// thread-safe.
//
//   CLOSED ── failure_threshold consecutive failures ──▶ OPEN
//   OPEN   ── recovery_timeout elapsed ─────────────────▶ HALF_OPEN
//   HALF_OPEN ── success_threshold successes ───────────▶ CLOSED
//   HALF_OPEN ── any failure ───────────────────────────▶ OPEN
//
// In HALF_OPEN exactly one trial call is admitted at a time.
//
// Usage:
//   auto breaker = std::make_shared<CircuitBreaker>(CircuitBreakerConfig{
//       .failure_threshold = 3,
//       .recovery_timeout = std::chrono::seconds(10),
//       .name = "billing"
//   });
//
//   auto outcome = breaker->execute(
//       [&] { return inner.send(request, ctx); },
//       [](const TransportResult& r) { return !r || r->status_code >= 500; });
//   if (!outcome) { /* rejected: outcome.error().breaker_name */ }

#include <tl/expected.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace sturdy {

// ─────────────────────────────────────────────────────────────────────────────
// Circuit Breaker State
// ─────────────────────────────────────────────────────────────────────────────

enum class CircuitState {
    Closed,    ///< Normal operation, requests pass through
    Open,      ///< Circuit tripped, requests rejected immediately
    HalfOpen   ///< Admitting a trial call to test recovery
};

[[nodiscard]] constexpr std::string_view to_string(CircuitState state) noexcept {
    switch (state) {
        case CircuitState::Closed:   return "Closed";
        case CircuitState::Open:     return "Open";
        case CircuitState::HalfOpen: return "HalfOpen";
        default:                     return "Unknown";
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Circuit Breaker Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct CircuitBreakerConfig {
    /// Number of consecutive failures before opening the circuit
    std::size_t failure_threshold{5};

    /// Time to wait before an open circuit admits a trial call
    std::chrono::milliseconds recovery_timeout{30000};

    /// Number of successful trial calls in HalfOpen before closing
    std::size_t success_threshold{1};

    /// Name used in logs, rejection errors and metrics
    std::string name{"default"};
};

struct CircuitBreakerStats {
    std::size_t total_requests{0};
    std::size_t successful_requests{0};
    std::size_t failed_requests{0};
    std::size_t rejected_requests{0};
    std::size_t state_transitions{0};
    CircuitState current_state{CircuitState::Closed};
};

/// Returned by execute() when the breaker refuses to run the operation.
struct CircuitOpenError {
    std::string breaker_name;
    CircuitState state{CircuitState::Open};

    [[nodiscard]] std::string message() const {
        return "circuit breaker '" + breaker_name + "' is " + std::string(to_string(state));
    }
};

class CircuitBreaker;

// ─────────────────────────────────────────────────────────────────────────────
// RAII Guard
// ─────────────────────────────────────────────────────────────────────────────
// Records a failure on scope exit unless mark_success() was called, so an
// operation that throws still counts against the breaker.

class CircuitBreakerGuard {
public:
    explicit CircuitBreakerGuard(CircuitBreaker& breaker)
        : breaker_(breaker)
    {}

    ~CircuitBreakerGuard();

    CircuitBreakerGuard(const CircuitBreakerGuard&) = delete;
    CircuitBreakerGuard& operator=(const CircuitBreakerGuard&) = delete;
    CircuitBreakerGuard(CircuitBreakerGuard&&) = delete;
    CircuitBreakerGuard& operator=(CircuitBreakerGuard&&) = delete;

    void mark_success() noexcept { success_ = true; }

private:
    CircuitBreaker& breaker_;
    bool success_{false};
};

// ─────────────────────────────────────────────────────────────────────────────
// Circuit Breaker
// ─────────────────────────────────────────────────────────────────────────────

class CircuitBreaker {
public:
    using StateChangeCallback = std::function<void(CircuitState old_state, CircuitState new_state)>;

    CircuitBreaker() = default;
    explicit CircuitBreaker(CircuitBreakerConfig config);

    // Non-copyable, non-movable (due to mutex)
    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;
    CircuitBreaker(CircuitBreaker&&) = delete;
    CircuitBreaker& operator=(CircuitBreaker&&) = delete;

    ~CircuitBreaker() = default;

    // ─────────────────────────────────────────────────────────────────────────
    // Core Operations
    // ─────────────────────────────────────────────────────────────────────────

    /// Admission check. Every `true` must be followed by exactly one
    /// record_success() or record_failure().
    [[nodiscard]] bool allow_request();

    void record_success();
    void record_failure();

    /// Run `operation` through the gate. `is_failure` classifies the
    /// operation's result; a throwing operation is recorded as a failure and
    /// the exception propagates.
    template <typename Operation, typename FailurePredicate>
    [[nodiscard]] auto execute(Operation&& operation, FailurePredicate&& is_failure)
        -> tl::expected<std::invoke_result_t<Operation>, CircuitOpenError>
    {
        using Result = std::invoke_result_t<Operation>;
        if (allow_request() == false) {
            return tl::unexpected(CircuitOpenError{config_.name, state()});
        }

        CircuitBreakerGuard guard(*this);
        Result result = std::forward<Operation>(operation)();
        const Result& view = result;
        if (is_failure(view) == false) {
            guard.mark_success();
        }
        return tl::expected<Result, CircuitOpenError>(tl::in_place, std::move(result));
    }

    // ─────────────────────────────────────────────────────────────────────────
    // State Queries
    // ─────────────────────────────────────────────────────────────────────────

    /// Effective state: an Open breaker whose recovery timeout has elapsed
    /// reports HalfOpen, because the next request will be admitted as a trial call.
    [[nodiscard]] CircuitState state() const;

    [[nodiscard]] bool is_open() const;
    [[nodiscard]] bool is_closed() const;

    [[nodiscard]] CircuitBreakerStats stats() const;

    [[nodiscard]] const CircuitBreakerConfig& config() const noexcept { return config_; }
    [[nodiscard]] const std::string& name() const noexcept { return config_.name; }

    // ─────────────────────────────────────────────────────────────────────────
    // Manual Control
    // ─────────────────────────────────────────────────────────────────────────

    void force_open();
    void force_close();

    /// Reset all statistics and state
    void reset();

    void on_state_change(StateChangeCallback callback);

private:
    [[nodiscard]] bool recovery_elapsed() const;
    void transition(CircuitState to, std::vector<StateChangeCallback>& fire, CircuitState& from);
    void notify(const std::vector<StateChangeCallback>& callbacks, CircuitState from, CircuitState to) const;

    CircuitBreakerConfig config_;

    mutable std::mutex mutex_;
    CircuitState state_{CircuitState::Closed};
    std::size_t consecutive_failures_{0};
    std::size_t consecutive_successes_{0};
    std::chrono::steady_clock::time_point opened_at_{std::chrono::steady_clock::now()};
    bool half_open_trial_in_flight_{false};

    std::atomic<std::size_t> total_requests_{0};
    std::atomic<std::size_t> successful_requests_{0};
    std::atomic<std::size_t> failed_requests_{0};
    std::atomic<std::size_t> rejected_requests_{0};
    std::atomic<std::size_t> state_transitions_{0};

    std::vector<StateChangeCallback> state_change_callbacks_;
};

inline CircuitBreakerGuard::~CircuitBreakerGuard() {
    if (success_) {
        breaker_.record_success();
    } else {
        breaker_.record_failure();
    }
}

}  // namespace sturdy
