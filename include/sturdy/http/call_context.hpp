#pragma once

#include <chrono>
#include <optional>
#include <stop_token>
#include <string>

namespace sturdy {

// ─────────────────────────────────────────────────────────────────────────────
// CallContext - per-call deadline, cancellation and caller identity
// ─────────────────────────────────────────────────────────────────────────────
// A value type threaded through every layer of one logical call. Builders
// return narrowed copies; the original is never mutated.
//
// Usage:
//   std::stop_source stop;
//   auto ctx = CallContext{}
//       .with_timeout(std::chrono::seconds(5))
//       .with_cancellation(stop.get_token())
//       .with_incoming_authorization("Bearer abc");

class CallContext {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    CallContext() = default;

    // ─────────────────────────────────────────────────────────────────────────
    // Builders
    // ─────────────────────────────────────────────────────────────────────────

    /// Deadline = now + timeout, or the existing deadline if that is sooner.
    [[nodiscard]] CallContext with_timeout(std::chrono::milliseconds timeout) const;

    /// Deadline = `deadline`, or the existing deadline if that is sooner.
    [[nodiscard]] CallContext with_deadline(TimePoint deadline) const;

    [[nodiscard]] CallContext with_cancellation(std::stop_token token) const;

    /// Inbound credential to forward on endpoints that require auth.
    [[nodiscard]] CallContext with_incoming_authorization(std::string token) const;

    /// Network address of the caller's own client, for X-Forwarded-For.
    [[nodiscard]] CallContext with_remote_address(std::string address) const;

    // ─────────────────────────────────────────────────────────────────────────
    // Queries
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] const std::optional<TimePoint>& deadline() const noexcept { return deadline_; }
    [[nodiscard]] const std::stop_token& stop_token() const noexcept { return stop_token_; }
    [[nodiscard]] const std::string& incoming_authorization() const noexcept { return incoming_authorization_; }
    [[nodiscard]] const std::string& remote_address() const noexcept { return remote_address_; }

    [[nodiscard]] bool is_cancelled() const noexcept;
    [[nodiscard]] bool is_expired() const noexcept;
    [[nodiscard]] bool is_done() const noexcept { return is_cancelled() || is_expired(); }

    /// Time left before the deadline (zero once expired); nullopt if unbounded.
    [[nodiscard]] std::optional<std::chrono::milliseconds> remaining() const;

    /// Sleep for `duration` unless the call is cancelled or its deadline
    /// arrives first. Returns true only if the full duration elapsed.
    [[nodiscard]] bool sleep_for(std::chrono::milliseconds duration) const;

private:
    std::optional<TimePoint> deadline_;
    std::stop_token stop_token_;
    std::string incoming_authorization_;
    std::string remote_address_;
};

}  // namespace sturdy
