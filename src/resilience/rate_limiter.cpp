#include "sturdy/resilience/rate_limiter.hpp"

#include "sturdy/log/logger.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace sturdy {

TokenBucketRateLimiter::TokenBucketRateLimiter(TokenBucketConfig config)
    : config_(std::move(config))
    , tokens_(static_cast<double>(config_.burst))
    , last_refill_(Clock::now())
{}

void TokenBucketRateLimiter::refill_locked(Clock::time_point now) {
    const std::chrono::duration<double> elapsed = now - last_refill_;
    last_refill_ = now;
    const double capacity = static_cast<double>(config_.burst);
    tokens_ = std::min(capacity, tokens_ + elapsed.count() * config_.rate_per_second);
}

tl::expected<void, RateLimitError> TokenBucketRateLimiter::wait(const CallContext& ctx) {
    if (ctx.is_cancelled()) {
        return tl::unexpected(RateLimitError{RateLimitError::Code::Cancelled, "cancelled before rate limit wait"});
    }

    std::chrono::milliseconds delay{0};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        refill_locked(Clock::now());

        // Reserve a token now; a negative balance is the queue of waiters
        tokens_ -= 1.0;
        if (tokens_ < 0.0) {
            if (config_.rate_per_second <= 0.0) {
                tokens_ += 1.0;
                rejected_++;
                return tl::unexpected(RateLimitError{
                    RateLimitError::Code::DeadlineExceeded,
                    "rate limiter '" + config_.name + "' has no refill rate"
                });
            }
            const double wait_ms = std::ceil((-tokens_ / config_.rate_per_second) * 1000.0);
            delay = std::chrono::milliseconds{static_cast<std::int64_t>(wait_ms)};
        }

        const auto remaining = ctx.remaining();
        const bool misses_deadline = remaining.has_value() && (delay > *remaining);
        if (misses_deadline) {
            tokens_ += 1.0;
            rejected_++;
            return tl::unexpected(RateLimitError{
                RateLimitError::Code::DeadlineExceeded,
                "rate limiter '" + config_.name + "' wait of " + std::to_string(delay.count()) +
                    "ms exceeds call deadline"
            });
        }
    }

    if (delay.count() > 0) {
        get_logger().trace("rate limiter wait", {
            {"limiter", config_.name},
            {"delay_ms", std::to_string(delay.count())}
        });
        const bool slept = ctx.sleep_for(delay);
        if (slept == false) {
            std::lock_guard<std::mutex> lock(mutex_);
            tokens_ += 1.0;
            rejected_++;
            if (ctx.is_cancelled()) {
                return tl::unexpected(RateLimitError{RateLimitError::Code::Cancelled, "cancelled during rate limit wait"});
            }
            return tl::unexpected(RateLimitError{RateLimitError::Code::DeadlineExceeded, "deadline exceeded during rate limit wait"});
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    granted_++;
    return {};
}

bool TokenBucketRateLimiter::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    refill_locked(Clock::now());
    if (tokens_ < 1.0) {
        return false;
    }
    tokens_ -= 1.0;
    granted_++;
    return true;
}

TokenBucketStats TokenBucketRateLimiter::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::chrono::duration<double> elapsed = Clock::now() - last_refill_;
    const double capacity = static_cast<double>(config_.burst);
    return TokenBucketStats{
        .granted = granted_,
        .rejected = rejected_,
        .available_tokens = std::min(capacity, tokens_ + elapsed.count() * config_.rate_per_second)
    };
}

}  // namespace sturdy
