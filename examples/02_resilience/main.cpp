// Example 02: Resilience
//
// Circuit breaker, rate limiter, retries with exponential backoff and a
// fallback, all configured per endpoint.
//
// Usage: resilience [base-url]

#include <sturdy/client/client.hpp>
#include <sturdy/interceptors/header_interceptors.hpp>
#include <sturdy/interceptors/observability_interceptors.hpp>
#include <sturdy/interceptors/resilience_interceptors.hpp>
#include <sturdy/log/spdlog_logger.hpp>

#include <prometheus/registry.h>

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

using namespace sturdy;
using namespace std::chrono_literals;

std::string state_to_string(CircuitState state) {
    switch (state) {
        case CircuitState::Closed: return "CLOSED";
        case CircuitState::Open: return "OPEN";
        case CircuitState::HalfOpen: return "HALF-OPEN";
        default: return "UNKNOWN";
    }
}

int main(int argc, char* argv[]) {
    std::cout << "=== Resilience Example ===\n\n";

    set_logger(make_spdlog_console_logger(LogLevel::Info));

    const std::string base_url = (argc > 1) ? argv[1] : "https://httpbin.org";

    // 1. Shared collaborators, owned here and injected into the policy
    auto breaker = std::make_shared<CircuitBreaker>(CircuitBreakerConfig{
        .failure_threshold = 3,
        .recovery_timeout = 5s,
        .success_threshold = 1,
        .name = "status-breaker"
    });
    breaker->on_state_change([](CircuitState old_state, CircuitState new_state) {
        std::cout << "\n*** Circuit state changed: "
                  << state_to_string(old_state) << " -> "
                  << state_to_string(new_state) << " ***\n\n";
    });

    auto limiter = std::make_shared<TokenBucketRateLimiter>(
        TokenBucketConfig{.rate_per_second = 2.0, .burst = 2, .name = "delay"});

    auto registry = std::make_shared<prometheus::Registry>();

    // 2. Per-endpoint policy
    auto overrides = [breaker, limiter](HttpMethod /*method*/, std::string_view path)
        -> std::optional<EndpointSettings> {
        if (path.starts_with("/status/")) {
            return EndpointSettings{}
                .with_max_retries(1)
                .with_circuit_breaker(breaker)
                .with_fallback([](const HttpRequest& request, const CallError& error) -> TransportResult {
                    std::cout << "  fallback for " << request.url << " after " << error.attempts << " attempts\n";
                    return make_buffered_response(200, R"({"source":"fallback"})");
                });
        }
        if (path.starts_with("/delay/")) {
            return EndpointSettings{}
                .with_timeout(3s)
                .with_rate_limiter(limiter);
        }
        return std::nullopt;
    };

    auto options = ClientOptions{}
        .with_base_url(base_url)
        .with_default_settings(EndpointSettings{}
            .with_backoff(exponential_backoff({.initial = 100ms, .max = 2s, .jitter = 0.25})))
        .with_endpoint_settings(overrides)
        .with_interceptors({
            request_id_interceptor(),
            metrics_interceptor(MetricsConfig{.ns = "example", .subsystem = "resilience", .registry = registry}),
            tracing_interceptor(TracingConfig{.tracer = std::make_shared<LogTracer>(LogLevel::Info)}),
            rate_limit_interceptor(),
            circuit_breaker_interceptor(),
            max_response_size_interceptor(1 << 20)
        });

    Client client(std::move(options));

    // 3. Failing endpoint: retries, then the breaker opens; the fallback answers
    std::cout << "=== Failing Endpoint ===\n";
    for (int i = 0; i < 4; ++i) {
        auto result = client.get("/status/503");
        if (result) {
            std::cout << "  call " << i + 1 << ": " << result->status_code << " " << result->text() << "\n";
        } else {
            std::cout << "  call " << i + 1 << ": " << result.error().message() << "\n";
        }
        std::cout << "  breaker: " << state_to_string(breaker->state()) << "\n";
    }

    // 4. Rate-limited endpoint under a tight caller deadline
    std::cout << "\n=== Rate-Limited Endpoint ===\n";
    for (int i = 0; i < 4; ++i) {
        auto result = client.get("/delay/0", {}, CallContext{}.with_timeout(200ms));
        if (result) {
            std::cout << "  call " << i + 1 << ": " << result->status_code << "\n";
        } else {
            std::cout << "  call " << i + 1 << ": refused ("
                      << to_string(result.error().cause->code) << ")\n";
        }
    }

    // 5. Recovery
    std::cout << "\nWaiting for recovery timeout...\n";
    std::this_thread::sleep_for(6s);
    std::cout << "Breaker: " << state_to_string(breaker->state()) << "\n";

    // 6. Metrics
    std::cout << "\n=== Metrics ===\n" << serialize_metrics(*registry) << "\n";

    client.shutdown();
    std::cout << "=== Done ===\n";
    return 0;
}
