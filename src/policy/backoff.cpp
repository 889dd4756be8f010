#include "sturdy/policy/backoff.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <stdexcept>

namespace sturdy {

ExponentialBackoff::ExponentialBackoff(ExponentialBackoffConfig config)
    : config_(config)
    , rng_(std::random_device{}())
{
    if (config_.initial.count() < 0 || config_.max < config_.initial) {
        throw std::invalid_argument("ExponentialBackoff requires 0 <= initial <= max");
    }
    if (config_.multiplier < 1.0) {
        throw std::invalid_argument("ExponentialBackoff multiplier must be >= 1.0");
    }
    if (config_.jitter < 0.0 || config_.jitter > 1.0) {
        throw std::invalid_argument("ExponentialBackoff jitter must be in [0, 1]");
    }
}

std::chrono::milliseconds ExponentialBackoff::delay_for(std::size_t attempt) {
    const double grown = static_cast<double>(config_.initial.count()) *
                         std::pow(config_.multiplier, static_cast<double>(attempt));
    const double capped = std::min(grown, static_cast<double>(config_.max.count()));

    const auto delay_ms = static_cast<std::int64_t>(std::max(0.0, jittered(capped)));
    return std::chrono::milliseconds{delay_ms};
}

double ExponentialBackoff::jittered(double delay_ms) {
    if (config_.jitter == 0.0) {
        return delay_ms;
    }

    std::uniform_real_distribution<double> scale(1.0 - config_.jitter, 1.0 + config_.jitter);
    // mt19937 is shared by every call using this policy
    std::lock_guard<std::mutex> lock(rng_mutex_);
    return delay_ms * scale(rng_);
}

// ─────────────────────────────────────────────────────────────────────────────
// Factories
// ─────────────────────────────────────────────────────────────────────────────

BackoffFunction as_backoff_function(std::shared_ptr<IBackoffPolicy> policy) {
    if (policy == nullptr) {
        throw std::invalid_argument("as_backoff_function requires a policy");
    }
    return [policy = std::move(policy)](std::size_t attempt) {
        return policy->delay_for(attempt);
    };
}

BackoffFunction constant_backoff(std::chrono::milliseconds delay) {
    return [delay](std::size_t /*attempt*/) { return delay; };
}

BackoffFunction exponential_backoff(ExponentialBackoffConfig config) {
    return as_backoff_function(std::make_shared<ExponentialBackoff>(config));
}

BackoffFunction no_backoff() {
    return constant_backoff(std::chrono::milliseconds{0});
}

}  // namespace sturdy
