#include "sturdy/resilience/circuit_breaker.hpp"

#include "sturdy/log/logger.hpp"

#include <exception>

namespace sturdy {

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config)
    : config_(std::move(config))
{}

// ─────────────────────────────────────────────────────────────────────────────
// Core Operations
// ─────────────────────────────────────────────────────────────────────────────
// State changes are decided under the lock; callbacks and logging run after
// it is released so a callback may query the breaker.

bool CircuitBreaker::allow_request() {
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    std::vector<StateChangeCallback> to_fire;
    CircuitState from = CircuitState::Closed;
    bool admitted = false;
    bool changed = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        switch (state_) {
            case CircuitState::Closed:
                admitted = true;
                break;

            case CircuitState::Open:
                if (recovery_elapsed()) {
                    transition(CircuitState::HalfOpen, to_fire, from);
                    consecutive_successes_ = 0;
                    half_open_trial_in_flight_ = true;
                    changed = true;
                    admitted = true;
                } else {
                    rejected_requests_.fetch_add(1, std::memory_order_relaxed);
                }
                break;

            case CircuitState::HalfOpen:
                if (half_open_trial_in_flight_) {
                    rejected_requests_.fetch_add(1, std::memory_order_relaxed);
                } else {
                    half_open_trial_in_flight_ = true;
                    admitted = true;
                }
                break;
        }
    }

    if (changed) {
        notify(to_fire, from, CircuitState::HalfOpen);
    }
    return admitted;
}

void CircuitBreaker::record_success() {
    successful_requests_.fetch_add(1, std::memory_order_relaxed);

    std::vector<StateChangeCallback> to_fire;
    CircuitState from = CircuitState::Closed;
    bool changed = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        consecutive_failures_ = 0;
        half_open_trial_in_flight_ = false;

        if (state_ == CircuitState::HalfOpen) {
            consecutive_successes_++;
            if (consecutive_successes_ >= config_.success_threshold) {
                transition(CircuitState::Closed, to_fire, from);
                changed = true;
            }
        }
    }

    if (changed) {
        notify(to_fire, from, CircuitState::Closed);
    }
}

void CircuitBreaker::record_failure() {
    failed_requests_.fetch_add(1, std::memory_order_relaxed);

    std::vector<StateChangeCallback> to_fire;
    CircuitState from = CircuitState::Closed;
    bool changed = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        consecutive_successes_ = 0;
        consecutive_failures_++;
        half_open_trial_in_flight_ = false;

        switch (state_) {
            case CircuitState::Closed:
                if (consecutive_failures_ >= config_.failure_threshold) {
                    transition(CircuitState::Open, to_fire, from);
                    opened_at_ = std::chrono::steady_clock::now();
                    changed = true;
                }
                break;

            case CircuitState::HalfOpen:
                // Trial call failed: back to open with a fresh recovery window
                transition(CircuitState::Open, to_fire, from);
                opened_at_ = std::chrono::steady_clock::now();
                changed = true;
                break;

            case CircuitState::Open:
                break;
        }
    }

    if (changed) {
        notify(to_fire, from, CircuitState::Open);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// State Queries
// ─────────────────────────────────────────────────────────────────────────────

CircuitState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const bool pending_trial = (state_ == CircuitState::Open) && recovery_elapsed();
    if (pending_trial) {
        return CircuitState::HalfOpen;
    }
    return state_;
}

bool CircuitBreaker::is_open() const {
    return state() == CircuitState::Open;
}

bool CircuitBreaker::is_closed() const {
    return state() == CircuitState::Closed;
}

CircuitBreakerStats CircuitBreaker::stats() const {
    const CircuitState current = state();
    return CircuitBreakerStats{
        .total_requests = total_requests_.load(std::memory_order_relaxed),
        .successful_requests = successful_requests_.load(std::memory_order_relaxed),
        .failed_requests = failed_requests_.load(std::memory_order_relaxed),
        .rejected_requests = rejected_requests_.load(std::memory_order_relaxed),
        .state_transitions = state_transitions_.load(std::memory_order_relaxed),
        .current_state = current
    };
}

// ─────────────────────────────────────────────────────────────────────────────
// Manual Control
// ─────────────────────────────────────────────────────────────────────────────

void CircuitBreaker::force_open() {
    std::vector<StateChangeCallback> to_fire;
    CircuitState from = CircuitState::Closed;
    bool changed = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != CircuitState::Open) {
            transition(CircuitState::Open, to_fire, from);
            opened_at_ = std::chrono::steady_clock::now();
            half_open_trial_in_flight_ = false;
            changed = true;
        }
    }

    if (changed) {
        notify(to_fire, from, CircuitState::Open);
    }
}

void CircuitBreaker::force_close() {
    std::vector<StateChangeCallback> to_fire;
    CircuitState from = CircuitState::Closed;
    bool changed = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != CircuitState::Closed) {
            transition(CircuitState::Closed, to_fire, from);
            consecutive_failures_ = 0;
            consecutive_successes_ = 0;
            half_open_trial_in_flight_ = false;
            changed = true;
        }
    }

    if (changed) {
        notify(to_fire, from, CircuitState::Closed);
    }
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);

    state_ = CircuitState::Closed;
    consecutive_failures_ = 0;
    consecutive_successes_ = 0;
    half_open_trial_in_flight_ = false;

    total_requests_.store(0, std::memory_order_relaxed);
    successful_requests_.store(0, std::memory_order_relaxed);
    failed_requests_.store(0, std::memory_order_relaxed);
    rejected_requests_.store(0, std::memory_order_relaxed);
    state_transitions_.store(0, std::memory_order_relaxed);
}

void CircuitBreaker::on_state_change(StateChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_change_callbacks_.push_back(std::move(callback));
}

// ─────────────────────────────────────────────────────────────────────────────
// Internal Helpers
// ─────────────────────────────────────────────────────────────────────────────

bool CircuitBreaker::recovery_elapsed() const {
    // Caller must hold mutex
    const auto elapsed = std::chrono::steady_clock::now() - opened_at_;
    return elapsed >= config_.recovery_timeout;
}

void CircuitBreaker::transition(
    CircuitState to,
    std::vector<StateChangeCallback>& fire,
    CircuitState& from
) {
    // Caller must hold mutex
    from = state_;
    state_ = to;
    state_transitions_.fetch_add(1, std::memory_order_relaxed);
    fire = state_change_callbacks_;
}

void CircuitBreaker::notify(
    const std::vector<StateChangeCallback>& callbacks,
    CircuitState from,
    CircuitState to
) const {
    get_logger().info("circuit breaker state change", {
        {"breaker", config_.name},
        {"from", std::string(to_string(from))},
        {"to", std::string(to_string(to))}
    });
    // Callbacks run from record_*(), which the RAII guard calls while
    // unwinding; nothing may escape from here
    for (const auto& callback : callbacks) {
        try {
            callback(from, to);
        } catch (const std::exception& e) {
            get_logger().error("circuit breaker callback threw", {
                {"breaker", config_.name},
                {"error", e.what()}
            });
        } catch (...) {
            get_logger().error("circuit breaker callback threw", {
                {"breaker", config_.name},
                {"error", "unknown exception"}
            });
        }
    }
}

}  // namespace sturdy
