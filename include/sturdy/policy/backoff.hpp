#ifndef STURDY_POLICY_BACKOFF_HPP
#define STURDY_POLICY_BACKOFF_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <random>

namespace sturdy {

/// Delay before the retry that follows attempt `attempt` (0 = first attempt).
using BackoffFunction = std::function<std::chrono::milliseconds(std::size_t attempt)>;

// ─────────────────────────────────────────────────────────────────────────────
// IBackoffPolicy
// ─────────────────────────────────────────────────────────────────────────────
// Strategies that keep state (a random engine, a history) implement this and
// plug into EndpointSettings through as_backoff_function(). A single instance
// may be shared by concurrent calls.

class IBackoffPolicy {
public:
    virtual ~IBackoffPolicy() = default;

    [[nodiscard]] virtual std::chrono::milliseconds delay_for(std::size_t attempt) = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// Exponential
// ─────────────────────────────────────────────────────────────────────────────

struct ExponentialBackoffConfig {
    std::chrono::milliseconds initial{100};
    double multiplier = 2.0;
    std::chrono::milliseconds max{30'000};
    double jitter = 0.0;  // 0.25 = each delay scaled by U(0.75, 1.25)
};

// delay = min(initial * multiplier^attempt, max), then jittered.
//
//   {100ms, 2.0, 5s}: 100ms, 200ms, 400ms, 800ms, ... 5s, 5s
class ExponentialBackoff final : public IBackoffPolicy {
public:
    explicit ExponentialBackoff(ExponentialBackoffConfig config = {});

    [[nodiscard]] std::chrono::milliseconds delay_for(std::size_t attempt) override;

    [[nodiscard]] const ExponentialBackoffConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] double jittered(double delay_ms);

    ExponentialBackoffConfig config_;
    std::mutex rng_mutex_;
    std::mt19937 rng_;
};

// Always zero; keeps retry tests fast.
class NoBackoff final : public IBackoffPolicy {
public:
    [[nodiscard]] std::chrono::milliseconds delay_for(std::size_t /*attempt*/) override {
        return std::chrono::milliseconds{0};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// BackoffFunction factories
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] BackoffFunction as_backoff_function(std::shared_ptr<IBackoffPolicy> policy);

/// Same delay before every retry. The engine default is constant 200ms.
[[nodiscard]] BackoffFunction constant_backoff(std::chrono::milliseconds delay);

[[nodiscard]] BackoffFunction exponential_backoff(ExponentialBackoffConfig config);

[[nodiscard]] BackoffFunction no_backoff();

}  // namespace sturdy

#endif  // STURDY_POLICY_BACKOFF_HPP
