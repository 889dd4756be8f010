#include <catch2/catch_test_macros.hpp>

#include "sturdy/client/retry_executor.hpp"
#include "sturdy/policy/backoff.hpp"
#include "sturdy/policy/endpoint_policy.hpp"
#include "sturdy/policy/retry_policy.hpp"
#include "mocks/mock_transport.hpp"

#include <chrono>
#include <stdexcept>
#include <stop_token>
#include <thread>

using namespace sturdy;
using namespace sturdy::testing;
using namespace std::chrono_literals;

namespace {

const std::string kUrl = "https://api.example.com/orders";

RequestContext context_for(EndpointSettings settings, CallContext call = {}) {
    RequestContext ctx;
    ctx.call = std::move(call);
    ctx.policy = std::make_shared<const EndpointPolicy>(finalize_policy(std::move(settings), "/orders"));
    ctx.target = *parse_url(kUrl);
    return ctx;
}

EndpointSettings fast_settings(std::size_t max_retries) {
    return EndpointSettings{}
        .with_max_retries(max_retries)
        .with_backoff(constant_backoff(0ms));
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// RetryPolicy
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("RetryPolicy default configuration", "[retry][policy]") {
    RetryPolicy policy;

    SECTION("Connection failures are retryable by default") {
        REQUIRE(policy.should_retry(TransportError::Code::ConnectionFailed) == true);
    }

    SECTION("Timeouts are retryable by default") {
        REQUIRE(policy.should_retry(TransportError::Code::Timeout) == true);
    }

    SECTION("SSL errors are NOT retryable by default") {
        REQUIRE(policy.should_retry(TransportError::Code::SslError) == false);
    }

    SECTION("Refused calls are NOT retryable") {
        REQUIRE(policy.should_retry(TransportError::Code::CircuitOpen) == false);
        REQUIRE(policy.should_retry(TransportError::Code::RateLimited) == false);
        REQUIRE(policy.should_retry(TransportError::Code::ResponseTooLarge) == false);
        REQUIRE(policy.should_retry(TransportError::Code::Cancelled) == false);
    }
}

TEST_CASE("RetryPolicy HTTP status code handling", "[retry][policy]") {
    RetryPolicy policy;

    SECTION("Gateway and overload statuses are retryable") {
        REQUIRE(policy.should_retry_http_status(429));
        REQUIRE(policy.should_retry_http_status(500));
        REQUIRE(policy.should_retry_http_status(502));
        REQUIRE(policy.should_retry_http_status(503));
        REQUIRE(policy.should_retry_http_status(504));
    }

    SECTION("Other client errors are NOT retryable") {
        REQUIRE(policy.should_retry_http_status(400) == false);
        REQUIRE(policy.should_retry_http_status(404) == false);
        REQUIRE(policy.should_retry_http_status(501) == false);
    }
}

TEST_CASE("RetryPolicy builder pattern", "[retry][policy]") {
    const auto predicate = RetryPolicy{}
        .with_retry_on_timeout(false)
        .with_retryable_status(409)
        .without_retryable_status(429)
        .as_predicate();

    REQUIRE(predicate(tl::unexpected(TransportError::timeout("slow"))) == false);
    REQUIRE(predicate(tl::unexpected(TransportError::connection_failed("refused"))));
    REQUIRE(predicate(make_buffered_response(409, "")));
    REQUIRE(predicate(make_buffered_response(429, "")) == false);
}

// ═══════════════════════════════════════════════════════════════════════════
// Backoff
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ExponentialBackoff grows and caps without jitter", "[retry][backoff]") {
    ExponentialBackoff backoff({.initial = 100ms, .multiplier = 2.0, .max = 500ms});

    REQUIRE(backoff.delay_for(0) == 100ms);
    REQUIRE(backoff.delay_for(1) == 200ms);
    REQUIRE(backoff.delay_for(2) == 400ms);
    REQUIRE(backoff.delay_for(3) == 500ms);
    REQUIRE(backoff.delay_for(10) == 500ms);
}

TEST_CASE("ExponentialBackoff jitter stays within bounds", "[retry][backoff]") {
    ExponentialBackoff backoff({.initial = 100ms, .multiplier = 2.0, .max = 10s, .jitter = 0.25});

    for (int i = 0; i < 50; ++i) {
        const auto delay = backoff.delay_for(1);
        REQUIRE(delay >= 150ms);
        REQUIRE(delay <= 250ms);
    }
}

TEST_CASE("ExponentialBackoff rejects inverted bounds", "[retry][backoff]") {
    REQUIRE_THROWS_AS(ExponentialBackoff({.initial = 1s, .max = 100ms}), std::invalid_argument);
    REQUIRE_THROWS_AS(ExponentialBackoff({.multiplier = 0.5}), std::invalid_argument);
    REQUIRE_THROWS_AS(ExponentialBackoff({.jitter = 1.5}), std::invalid_argument);
}

TEST_CASE("Backoff function factories", "[retry][backoff]") {
    REQUIRE(constant_backoff(75ms)(3) == 75ms);
    REQUIRE(exponential_backoff({.initial = 10ms, .multiplier = 3.0, .max = 1s})(2) == 90ms);
    REQUIRE(no_backoff()(4) == 0ms);
    REQUIRE(as_backoff_function(std::make_shared<NoBackoff>())(5) == 0ms);
    REQUIRE_THROWS_AS(as_backoff_function(nullptr), std::invalid_argument);
}

// ═══════════════════════════════════════════════════════════════════════════
// execute_with_retry
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("A successful first attempt is not retried", "[retry][executor]") {
    MockTransport transport;
    transport.queue_response(200, "ok");
    HttpRequest request(HttpMethod::Get, kUrl);

    auto outcome = execute_with_retry(transport, request, context_for(fast_settings(2)));

    REQUIRE(outcome.attempts == 1);
    REQUIRE(outcome.result.has_value());
    REQUIRE(outcome.result->status_code == 200);
    REQUIRE(transport.request_count() == 1);
}

TEST_CASE("An always-503 endpoint is attempted max_retries + 1 times", "[retry][executor]") {
    MockTransport transport;
    transport.set_default_response(503, "unavailable");
    HttpRequest request(HttpMethod::Get, kUrl);

    auto outcome = execute_with_retry(transport, request, context_for(fast_settings(2)));

    REQUIRE(outcome.attempts == 3);
    REQUIRE(transport.request_count() == 3);
    REQUIRE(outcome.result.has_value());
    REQUIRE(outcome.result->status_code == 503);

    const auto attempts = transport.attempts();
    for (std::size_t i = 0; i < attempts.size(); ++i) {
        REQUIRE(attempts[i].attempt == i);
    }
}

TEST_CASE("Discarded responses are closed before retrying", "[retry][executor]") {
    MockTransport transport;
    transport.queue_response(500, "first");
    transport.queue_response(502, "second");
    transport.queue_response(200, "third");
    HttpRequest request(HttpMethod::Get, kUrl);

    auto outcome = execute_with_retry(transport, request, context_for(fast_settings(2)));

    REQUIRE(outcome.result->status_code == 200);
    const auto bodies = transport.bodies();
    REQUIRE(bodies.size() == 3);
    REQUIRE(bodies[0]->closes.load() == 1);
    REQUIRE(bodies[1]->closes.load() == 1);
    REQUIRE(bodies[2]->closes.load() == 0);
}

TEST_CASE("Zero retries means exactly one attempt", "[retry][executor]") {
    MockTransport transport;
    transport.queue_connection_error();
    HttpRequest request(HttpMethod::Post, kUrl);

    auto outcome = execute_with_retry(transport, request, context_for(fast_settings(0)));

    REQUIRE(outcome.attempts == 1);
    REQUIRE(outcome.result.has_value() == false);
    REQUIRE(outcome.result.error().code == TransportError::Code::ConnectionFailed);
}

TEST_CASE("Non-retryable results end the loop immediately", "[retry][executor]") {
    MockTransport transport;
    transport.queue_response(404, "missing");
    HttpRequest request(HttpMethod::Get, kUrl);

    auto outcome = execute_with_retry(transport, request, context_for(fast_settings(5)));

    REQUIRE(outcome.attempts == 1);
    REQUIRE(outcome.result->status_code == 404);
}

TEST_CASE("A custom predicate decides retries", "[retry][executor]") {
    MockTransport transport;
    transport.queue_response(409);
    transport.queue_response(409);
    transport.queue_response(201);
    HttpRequest request(HttpMethod::Put, kUrl);

    auto settings = fast_settings(3)
        .with_retry_predicate([](const TransportResult& outcome) {
            return outcome.has_value() && outcome->status_code == 409;
        });
    auto outcome = execute_with_retry(transport, request, context_for(std::move(settings)));

    REQUIRE(outcome.attempts == 3);
    REQUIRE(outcome.result->status_code == 201);
}

TEST_CASE("The backoff function receives the failed attempt index", "[retry][executor][backoff]") {
    MockTransport transport;
    transport.set_default_response(500);
    HttpRequest request(HttpMethod::Get, kUrl);

    std::vector<std::size_t> seen;
    auto settings = EndpointSettings{}
        .with_max_retries(3)
        .with_backoff([&seen](std::size_t attempt) {
            seen.push_back(attempt);
            return 0ms;
        });
    (void)execute_with_retry(transport, request, context_for(std::move(settings)));

    REQUIRE(seen == std::vector<std::size_t>{0, 1, 2});
}

TEST_CASE("A deadline that expires during backoff ends the call", "[retry][executor][deadline]") {
    MockTransport transport;
    transport.set_default_response(503);
    HttpRequest request(HttpMethod::Get, kUrl);

    auto settings = EndpointSettings{}
        .with_max_retries(5)
        .with_backoff(constant_backoff(10s));

    const auto start = std::chrono::steady_clock::now();
    auto outcome = execute_with_retry(
        transport, request, context_for(std::move(settings), CallContext{}.with_timeout(50ms)));

    REQUIRE(std::chrono::steady_clock::now() - start < 5s);
    REQUIRE(outcome.attempts == 1);
    REQUIRE(outcome.result.has_value() == false);
    REQUIRE(outcome.result.error().code == TransportError::Code::DeadlineExceeded);
    REQUIRE(transport.bodies().front()->closes.load() == 1);
}

TEST_CASE("Cancellation during backoff ends the call", "[retry][executor][cancel]") {
    MockTransport transport;
    transport.set_default_response(503);
    HttpRequest request(HttpMethod::Get, kUrl);

    std::stop_source stop;
    auto settings = EndpointSettings{}
        .with_max_retries(5)
        .with_backoff(constant_backoff(10s));

    std::thread canceller([&stop]() {
        std::this_thread::sleep_for(30ms);
        stop.request_stop();
    });
    auto outcome = execute_with_retry(
        transport, request,
        context_for(std::move(settings), CallContext{}.with_cancellation(stop.get_token())));
    canceller.join();

    REQUIRE(outcome.result.has_value() == false);
    REQUIRE(outcome.result.error().code == TransportError::Code::Cancelled);
    REQUIRE(transport.request_count() == 1);
}

TEST_CASE("execute_with_retry requires a policy", "[retry][executor]") {
    MockTransport transport;
    HttpRequest request(HttpMethod::Get, kUrl);

    REQUIRE_THROWS_AS(execute_with_retry(transport, request, RequestContext{}), std::invalid_argument);
    REQUIRE(transport.request_count() == 0);
}
