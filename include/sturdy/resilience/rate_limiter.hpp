#pragma once

#include "sturdy/http/call_context.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <mutex>
#include <string>

namespace sturdy {

// ─────────────────────────────────────────────────────────────────────────────
// Rate Limiter Interface
// ─────────────────────────────────────────────────────────────────────────────
// A limiter is shared by every call routed to it. wait() blocks the calling
// thread until a permit is granted or the call's deadline/cancellation fires.

struct RateLimitError {
    enum class Code {
        DeadlineExceeded,  // Permit would not arrive before the deadline
        Cancelled          // Caller cancelled while waiting
    };

    Code code;
    std::string message;
};

class IRateLimiter {
public:
    virtual ~IRateLimiter() = default;

    [[nodiscard]] virtual tl::expected<void, RateLimitError> wait(const CallContext& ctx) = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// Token Bucket
// ─────────────────────────────────────────────────────────────────────────────
// `burst` tokens are available immediately; tokens refill continuously at
// `rate_per_second`. A waiter that cannot be served before its deadline
// fails at once without consuming a token.
//
// Usage:
//   auto limiter = std::make_shared<TokenBucketRateLimiter>(
//       TokenBucketConfig{.rate_per_second = 1.0, .burst = 2, .name = "search"});

struct TokenBucketConfig {
    double rate_per_second{10.0};
    std::size_t burst{1};
    std::string name{"default"};
};

struct TokenBucketStats {
    std::size_t granted{0};
    std::size_t rejected{0};
    double available_tokens{0.0};
};

class TokenBucketRateLimiter final : public IRateLimiter {
public:
    explicit TokenBucketRateLimiter(TokenBucketConfig config);

    TokenBucketRateLimiter(const TokenBucketRateLimiter&) = delete;
    TokenBucketRateLimiter& operator=(const TokenBucketRateLimiter&) = delete;

    [[nodiscard]] tl::expected<void, RateLimitError> wait(const CallContext& ctx) override;

    /// Take a token only if one is available right now.
    [[nodiscard]] bool try_acquire();

    [[nodiscard]] TokenBucketStats stats() const;
    [[nodiscard]] const TokenBucketConfig& config() const noexcept { return config_; }

private:
    using Clock = std::chrono::steady_clock;

    void refill_locked(Clock::time_point now);

    TokenBucketConfig config_;

    mutable std::mutex mutex_;
    double tokens_;
    Clock::time_point last_refill_;
    std::size_t granted_{0};
    std::size_t rejected_{0};
};

}  // namespace sturdy
