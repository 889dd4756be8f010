// ─────────────────────────────────────────────────────────────────────────────
// Circuit Breaker Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "sturdy/resilience/circuit_breaker.hpp"
#include "mocks/mock_transport.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace sturdy;
using namespace sturdy::testing;
using namespace std::chrono_literals;

namespace {

CircuitBreakerConfig quick_config(std::size_t threshold, std::chrono::milliseconds recovery = 10ms) {
    CircuitBreakerConfig config;
    config.failure_threshold = threshold;
    config.recovery_timeout = recovery;
    config.name = "test";
    return config;
}

void trip(CircuitBreaker& breaker, std::size_t failures) {
    for (std::size_t i = 0; i < failures; ++i) {
        (void)breaker.allow_request();
        breaker.record_failure();
    }
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Basic State Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("CircuitBreaker starts in closed state", "[resilience][circuit_breaker]") {
    CircuitBreaker breaker;

    REQUIRE(breaker.state() == CircuitState::Closed);
    REQUIRE(breaker.is_closed());
    REQUIRE_FALSE(breaker.is_open());
    REQUIRE(breaker.allow_request());
}

TEST_CASE("CircuitBreaker opens after failure threshold", "[resilience][circuit_breaker]") {
    CircuitBreaker breaker(quick_config(3, 1h));

    trip(breaker, 2);
    REQUIRE(breaker.is_closed());

    trip(breaker, 1);
    REQUIRE(breaker.is_open());
    REQUIRE_FALSE(breaker.allow_request());
    REQUIRE(breaker.stats().rejected_requests == 1);
}

TEST_CASE("CircuitBreaker success resets failure count", "[resilience][circuit_breaker]") {
    CircuitBreaker breaker(quick_config(3, 1h));

    trip(breaker, 2);
    (void)breaker.allow_request();
    breaker.record_success();
    trip(breaker, 2);

    REQUIRE(breaker.is_closed());
    trip(breaker, 1);
    REQUIRE(breaker.is_open());
}

// ═══════════════════════════════════════════════════════════════════════════
// Recovery Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("CircuitBreaker reports half-open once recovery elapses", "[resilience][circuit_breaker]") {
    CircuitBreaker breaker(quick_config(1));
    trip(breaker, 1);
    REQUIRE(breaker.is_open());

    std::this_thread::sleep_for(20ms);

    REQUIRE(breaker.state() == CircuitState::HalfOpen);
    REQUIRE(breaker.allow_request());
    REQUIRE(breaker.state() == CircuitState::HalfOpen);
}

TEST_CASE("CircuitBreaker closes on success in half-open", "[resilience][circuit_breaker]") {
    CircuitBreaker breaker(quick_config(1));
    trip(breaker, 1);
    std::this_thread::sleep_for(20ms);

    REQUIRE(breaker.allow_request());
    breaker.record_success();
    REQUIRE(breaker.is_closed());
}

TEST_CASE("CircuitBreaker reopens on failure in half-open", "[resilience][circuit_breaker]") {
    CircuitBreaker breaker(quick_config(1, 50ms));
    trip(breaker, 1);
    std::this_thread::sleep_for(60ms);

    REQUIRE(breaker.allow_request());
    breaker.record_failure();
    REQUIRE(breaker.is_open());
}

TEST_CASE("CircuitBreaker half-open admits one trial call at a time", "[resilience][circuit_breaker]") {
    CircuitBreaker breaker(quick_config(1));
    trip(breaker, 1);
    std::this_thread::sleep_for(20ms);

    REQUIRE(breaker.allow_request());
    REQUIRE_FALSE(breaker.allow_request());
    REQUIRE_FALSE(breaker.allow_request());
    REQUIRE(breaker.stats().rejected_requests == 2);
}

TEST_CASE("CircuitBreaker requires multiple successes to close", "[resilience][circuit_breaker]") {
    auto config = quick_config(1);
    config.success_threshold = 2;
    CircuitBreaker breaker(config);
    trip(breaker, 1);
    std::this_thread::sleep_for(20ms);

    REQUIRE(breaker.allow_request());
    breaker.record_success();
    REQUIRE(breaker.state() == CircuitState::HalfOpen);

    REQUIRE(breaker.allow_request());
    breaker.record_success();
    REQUIRE(breaker.is_closed());
}

// ═══════════════════════════════════════════════════════════════════════════
// execute()
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("execute runs the operation and classifies its result", "[resilience][circuit_breaker][execute]") {
    CircuitBreaker breaker(quick_config(2, 1h));
    const auto is_failure = [](int status) { return status >= 500; };

    auto ok = breaker.execute([] { return 200; }, is_failure);
    REQUIRE(ok.has_value());
    REQUIRE(*ok == 200);

    auto failed = breaker.execute([] { return 503; }, is_failure);
    REQUIRE(failed.has_value());
    REQUIRE(*failed == 503);
    (void)breaker.execute([] { return 503; }, is_failure);

    REQUIRE(breaker.is_open());
    REQUIRE(breaker.stats().successful_requests == 1);
    REQUIRE(breaker.stats().failed_requests == 2);
}

TEST_CASE("execute rejects without running when open", "[resilience][circuit_breaker][execute]") {
    CircuitBreaker breaker(quick_config(1, 1h));
    breaker.force_open();

    bool ran = false;
    auto result = breaker.execute([&ran] { ran = true; return 0; }, [](int) { return false; });

    REQUIRE(ran == false);
    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().breaker_name == "test");
    REQUIRE(result.error().state == CircuitState::Open);
    REQUIRE(result.error().message() == "circuit breaker 'test' is Open");
}

TEST_CASE("execute records a failure when the operation throws", "[resilience][circuit_breaker][execute]") {
    CircuitBreaker breaker(quick_config(1, 1h));

    REQUIRE_THROWS_AS(
        breaker.execute([]() -> int { throw std::runtime_error("boom"); }, [](int) { return false; }),
        std::runtime_error);
    REQUIRE(breaker.is_open());
}

// ═══════════════════════════════════════════════════════════════════════════
// Statistics, Manual Control, Callbacks
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("CircuitBreaker tracks state transitions", "[resilience][circuit_breaker]") {
    CircuitBreaker breaker(quick_config(1));
    trip(breaker, 1);
    std::this_thread::sleep_for(20ms);
    (void)breaker.allow_request();
    breaker.record_success();

    REQUIRE(breaker.stats().state_transitions == 3);
}

TEST_CASE("CircuitBreaker can be forced and reset", "[resilience][circuit_breaker]") {
    CircuitBreaker breaker(quick_config(1, 1h));

    breaker.force_open();
    REQUIRE(breaker.is_open());

    breaker.force_close();
    REQUIRE(breaker.is_closed());
    REQUIRE(breaker.allow_request());

    trip(breaker, 1);
    breaker.reset();
    REQUIRE(breaker.is_closed());
    REQUIRE(breaker.stats().total_requests == 0);
    REQUIRE(breaker.stats().state_transitions == 0);
}

TEST_CASE("CircuitBreaker fires state change callbacks", "[resilience][circuit_breaker]") {
    CircuitBreaker breaker(quick_config(1));

    std::vector<std::pair<CircuitState, CircuitState>> transitions;
    breaker.on_state_change([&](CircuitState old_state, CircuitState new_state) {
        transitions.emplace_back(old_state, new_state);
    });

    trip(breaker, 1);
    std::this_thread::sleep_for(20ms);
    (void)breaker.allow_request();

    REQUIRE(transitions.size() == 2);
    REQUIRE(transitions[0] == std::pair{CircuitState::Closed, CircuitState::Open});
    REQUIRE(transitions[1] == std::pair{CircuitState::Open, CircuitState::HalfOpen});
}

TEST_CASE("Throwing callbacks are logged and the state still changes", "[resilience][circuit_breaker]") {
    LoggerCapture capture;
    CircuitBreaker breaker(quick_config(1, 1h));

    int later_calls = 0;
    breaker.on_state_change([](CircuitState, CircuitState) {
        throw std::runtime_error("callback");
    });
    breaker.on_state_change([](CircuitState, CircuitState) {
        throw 42;
    });
    breaker.on_state_change([&](CircuitState, CircuitState) {
        ++later_calls;
    });

    tl::expected<int, CircuitOpenError> outcome = 0;
    REQUIRE_NOTHROW(outcome = breaker.execute([] { return 503; }, [](int status) { return status >= 500; }));

    REQUIRE(outcome.has_value());
    REQUIRE(*outcome == 503);
    REQUIRE(breaker.is_open());
    REQUIRE(later_calls == 1);
    REQUIRE(capture.logger().contains(LogLevel::Error, "circuit breaker callback threw"));
}

TEST_CASE("Callbacks may query the breaker", "[resilience][circuit_breaker]") {
    CircuitBreaker breaker(quick_config(1, 1h));
    CircuitState seen = CircuitState::Closed;
    breaker.on_state_change([&](CircuitState, CircuitState) {
        seen = breaker.state();
    });

    trip(breaker, 1);
    REQUIRE(seen == CircuitState::Open);
}

TEST_CASE("CircuitBreakerGuard records failure unless marked", "[resilience][circuit_breaker]") {
    CircuitBreaker breaker(quick_config(1, 1h));

    {
        CircuitBreakerGuard guard(breaker);
        guard.mark_success();
    }
    REQUIRE(breaker.is_closed());

    {
        CircuitBreakerGuard guard(breaker);
    }
    REQUIRE(breaker.is_open());
}

TEST_CASE("CircuitState to_string returns correct values", "[resilience][circuit_breaker]") {
    REQUIRE(to_string(CircuitState::Closed) == "Closed");
    REQUIRE(to_string(CircuitState::Open) == "Open");
    REQUIRE(to_string(CircuitState::HalfOpen) == "HalfOpen");
}
