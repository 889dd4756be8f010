// ─────────────────────────────────────────────────────────────────────────────
// Client Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "sturdy/client/client.hpp"
#include "sturdy/interceptors/cache_interceptor.hpp"
#include "sturdy/interceptors/header_interceptors.hpp"
#include "sturdy/interceptors/observability_interceptors.hpp"
#include "sturdy/interceptors/resilience_interceptors.hpp"
#include "mocks/mock_transport.hpp"

#include <prometheus/registry.h>

#include <chrono>
#include <stdexcept>
#include <thread>

using namespace sturdy;
using namespace sturdy::testing;
using namespace std::chrono_literals;

namespace {

constexpr const char* kBase = "https://api.example.com";

// Zero backoff keeps retry tests fast
EndpointSettings fast_defaults() {
    return EndpointSettings{}.with_backoff(constant_backoff(0ms));
}

ClientOptions options_with(EndpointSettings defaults = fast_defaults()) {
    return ClientOptions{}
        .with_base_url(kBase)
        .with_default_settings(std::move(defaults));
}

struct HookLog {
    std::vector<std::string> events;
    std::optional<CallError> last_error;

    Hooks hooks() {
        return Hooks{
            .pre_request = [this](const CallContext&, const RequestInfo& info) {
                events.push_back("pre " + to_string(info.method) + " " + info.path);
            },
            .post_request = [this](const CallContext&, const RequestInfo&, int status) {
                events.push_back("post " + std::to_string(status));
            },
            .on_error = [this](const CallContext&, const RequestInfo&, const CallError& error) {
                events.push_back("error");
                last_error = error;
            }
        };
    }
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Basic Calls
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Verbs build absolute URLs from the base", "[client][verbs]") {
    auto transport = std::make_shared<MockTransport>();
    Client client(ClientOptions{}.with_base_url("https://api.example.com/v1//"), transport);

    REQUIRE(client.base_url() == "https://api.example.com/v1");

    (void)client.get("/users");
    REQUIRE(transport->last_attempt()->url == "https://api.example.com/v1/users");
    REQUIRE(transport->last_attempt()->method == HttpMethod::Get);

    (void)client.post("/users", R"({"name":"ada"})", {{"Content-Type", "application/json"}});
    REQUIRE(transport->last_attempt()->method == HttpMethod::Post);
    REQUIRE(transport->last_attempt()->body == R"({"name":"ada"})");
    REQUIRE(get_header(transport->last_attempt()->headers, "content-type") == "application/json");

    (void)client.put("/users/1", "x");
    REQUIRE(transport->last_attempt()->method == HttpMethod::Put);
    (void)client.patch("/users/1", "y");
    REQUIRE(transport->last_attempt()->method == HttpMethod::Patch);
    (void)client.del("/users/1");
    REQUIRE(transport->last_attempt()->method == HttpMethod::Delete);
    (void)client.head("/users/1");
    REQUIRE(transport->last_attempt()->method == HttpMethod::Head);
}

TEST_CASE("Successful calls return a materialized body", "[client][verbs]") {
    auto transport = std::make_shared<MockTransport>();
    transport->queue_response(200, R"({"id":42})", {{"Content-Type", "application/json"}});
    Client client(options_with(), transport);

    auto result = client.get("/users/42");

    REQUIRE(result.has_value());
    REQUIRE(result->status_code == 200);
    REQUIRE(result->text() == R"({"id":42})");
    REQUIRE(get_header(result->headers, "content-type") == "application/json");
    REQUIRE(transport->bodies().front()->closes.load() == 1);
}

TEST_CASE("Client construction validates its inputs", "[client][config]") {
    REQUIRE_THROWS_AS(Client(ClientOptions{}.with_base_url("not a url"), std::make_shared<MockTransport>()),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(Client(ClientOptions{}, nullptr), std::invalid_argument);
    REQUIRE_NOTHROW(Client(ClientOptions{}, std::make_shared<MockTransport>()));
}

TEST_CASE("Without a base URL, paths must be absolute URLs", "[client][config]") {
    auto transport = std::make_shared<MockTransport>();
    Client client(ClientOptions{}, transport);

    REQUIRE(client.get("https://other.example.com/ping").has_value());
    REQUIRE(transport->last_attempt()->url == "https://other.example.com/ping");

    auto relative = client.get("/ping");
    REQUIRE(relative.has_value() == false);
    REQUIRE(relative.error().is(TransportError::Code::InvalidRequest));
    REQUIRE(relative.error().attempts == 0);
    REQUIRE(transport->request_count() == 1);
}

TEST_CASE("shutdown releases idle connections", "[client][lifecycle]") {
    auto transport = std::make_shared<MockTransport>();
    Client client(options_with(), transport);

    client.shutdown();
    REQUIRE(transport->close_idle_count() == 1);
    REQUIRE(client.get("/after").has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// Error Classification
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("An always-503 endpoint is attempted max_retries + 1 times", "[client][retry]") {
    auto transport = std::make_shared<MockTransport>();
    transport->set_default_response(503, "overloaded");
    Client client(options_with(fast_defaults().with_max_retries(3)), transport);

    auto result = client.get("/flaky");

    REQUIRE(result.has_value() == false);
    REQUIRE(transport->request_count() == 4);
    REQUIRE(result.error().attempts == 4);
    REQUIRE(result.error().status_code == 503);
    REQUIRE(result.error().body == "overloaded");
    REQUIRE(result.error().is_transport_error() == false);
}

TEST_CASE("Discarded bodies are released before the next attempt", "[client][retry]") {
    auto transport = std::make_shared<MockTransport>();
    std::vector<int> closes_seen;
    transport->set_handler([&](HttpRequest&, const RequestContext&) -> TransportResult {
        int closed = 0;
        for (const auto& body : transport->bodies()) {
            closed += body->closes.load();
        }
        closes_seen.push_back(closed);
        return transport->make_response(500, "error");
    });
    Client client(options_with(fast_defaults().with_max_retries(4)), transport);

    (void)client.get("/leaky");

    REQUIRE(closes_seen == std::vector<int>{0, 1, 2, 3, 4});
    for (const auto& body : transport->bodies()) {
        REQUIRE(body->closes.load() == 1);
    }
}

TEST_CASE("Client errors are not retried", "[client][retry]") {
    auto transport = std::make_shared<MockTransport>();
    transport->queue_response(404, R"({"error":"not found"})");
    Client client(options_with(), transport);

    auto result = client.get("/missing");

    REQUIRE(transport->request_count() == 1);
    REQUIRE(result.error().status_code == 404);
    REQUIRE(result.error().body == R"({"error":"not found"})");
    REQUIRE(result.error().message() ==
            R"([HTTP] GET https://api.example.com/missing: status=404, attempts=1, body={"error":"not found"})");
}

TEST_CASE("Transport failures carry no status", "[client][errors]") {
    auto transport = std::make_shared<MockTransport>();
    transport->set_handler([](HttpRequest&, const RequestContext&) -> TransportResult {
        return tl::unexpected(TransportError::connection_failed("Connection refused"));
    });
    Client client(options_with(), transport);

    auto result = client.get("/down");

    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().has_response() == false);
    REQUIRE(result.error().is(TransportError::Code::ConnectionFailed));
    REQUIRE(result.error().attempts == 3);
    REQUIRE(result.error().message() ==
            "[HTTP] GET https://api.example.com/down: status=none, attempts=3, "
            "err=connection_failed: Connection refused");
}

TEST_CASE("Oversized responses fail instead of truncating", "[client][errors][limit]") {
    auto transport = std::make_shared<MockTransport>();
    transport->queue_response(200, std::string(100, 'x'));
    Client client(
        options_with(fast_defaults().with_max_response_size(10))
            .with_interceptor(max_response_size_interceptor()),
        transport);

    auto result = client.get("/large");

    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().is(TransportError::Code::ResponseTooLarge));
    REQUIRE(result.error().status_code == 200);
    REQUIRE(result.error().body.size() <= 10);
}

TEST_CASE("The policy size limit holds without the size interceptor", "[client][errors][limit]") {
    auto transport = std::make_shared<MockTransport>();
    transport->queue_response(200, std::string(100, 'x'));
    transport->queue_response(200, std::string(10, 'y'));
    Client client(options_with(fast_defaults().with_max_response_size(10)), transport);

    auto oversized = client.get("/large");
    REQUIRE(oversized.has_value() == false);
    REQUIRE(oversized.error().is(TransportError::Code::ResponseTooLarge));
    REQUIRE(oversized.error().status_code == 200);
    REQUIRE(oversized.error().body.size() <= 10);

    auto exact = client.get("/small");
    REQUIRE(exact.has_value());
    REQUIRE(exact->text() == std::string(10, 'y'));
}

// ═══════════════════════════════════════════════════════════════════════════
// Resilience Through the Client
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Breaker opens, rejects, half-opens and closes", "[client][circuit_breaker]") {
    auto transport = std::make_shared<MockTransport>();
    transport->set_default_response(503);

    auto breaker = std::make_shared<CircuitBreaker>(CircuitBreakerConfig{
        .failure_threshold = 3,
        .recovery_timeout = 50ms,
        .success_threshold = 1,
        .name = "orders"
    });
    Client client(
        options_with(fast_defaults().with_max_retries(0).with_circuit_breaker(breaker))
            .with_interceptor(circuit_breaker_interceptor()),
        transport);

    for (int i = 0; i < 3; ++i) {
        REQUIRE(client.get("/orders").error().status_code == 503);
    }
    REQUIRE(breaker->is_open());

    auto rejected = client.get("/orders");
    REQUIRE(rejected.error().is(TransportError::Code::CircuitOpen));
    REQUIRE(rejected.error().has_response() == false);
    REQUIRE(transport->request_count() == 3);

    std::this_thread::sleep_for(70ms);
    REQUIRE(breaker->state() == CircuitState::HalfOpen);

    transport->set_default_response(200, "ok");
    REQUIRE(client.get("/orders").has_value());
    REQUIRE(breaker->is_closed());
}

TEST_CASE("Rate limiter burst then deadline exhaustion", "[client][rate_limit]") {
    auto transport = std::make_shared<MockTransport>();
    auto limiter = std::make_shared<TokenBucketRateLimiter>(
        TokenBucketConfig{.rate_per_second = 1.0, .burst = 2, .name = "search"});
    Client client(
        options_with(fast_defaults().with_max_retries(0).with_rate_limiter(limiter))
            .with_interceptor(rate_limit_interceptor()),
        transport);

    const auto start = std::chrono::steady_clock::now();
    REQUIRE(client.get("/search").has_value());
    REQUIRE(client.get("/search").has_value());
    REQUIRE(std::chrono::steady_clock::now() - start < 100ms);

    auto third = client.get("/search", {}, CallContext{}.with_timeout(100ms));
    REQUIRE(third.has_value() == false);
    REQUIRE(third.error().is(TransportError::Code::RateLimited));
    REQUIRE(third.error().has_response() == false);
    REQUIRE(transport->request_count() == 2);
}

TEST_CASE("Cached GETs are served without the transport", "[client][cache]") {
    auto backend = std::make_shared<MemoryCacheBackend>();
    auto transport = std::make_shared<MockTransport>();
    transport->queue_response(200, "catalog-v1");
    transport->queue_response(200, "catalog-v2");

    Client client(
        options_with(fast_defaults().with_cache(3s))
            .with_interceptor(cache_interceptor(CacheConfig{.cache = backend})),
        transport);

    auto first = client.get("/catalog");
    auto second = client.get("/catalog");

    REQUIRE(first->status_code == second->status_code);
    REQUIRE(first->text() == second->text());
    REQUIRE(second->text() == "catalog-v1");
    REQUIRE(transport->request_count() == 1);
}

TEST_CASE("Two clients may share a metrics namespace", "[client][metrics]") {
    auto registry = std::make_shared<prometheus::Registry>();
    const MetricsConfig config{.ns = "orders", .subsystem = "client", .registry = registry};

    auto transport = std::make_shared<MockTransport>();
    Client first(options_with().with_interceptor(metrics_interceptor(config)), transport);
    REQUIRE_NOTHROW(Client(options_with().with_interceptor(metrics_interceptor(config)), transport));

    REQUIRE(first.get("/ping").has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// Policy Application
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("The policy timeout bounds the transport deadline", "[client][deadline]") {
    auto transport = std::make_shared<MockTransport>();
    Client client(options_with(fast_defaults().with_timeout(2s)), transport);

    const auto start = CallContext::Clock::now();
    (void)client.get("/slow");

    const auto deadline = transport->last_attempt()->deadline;
    REQUIRE(deadline.has_value());
    REQUIRE(*deadline <= start + 2s + 50ms);
    REQUIRE(*deadline > start);
}

TEST_CASE("A tighter caller deadline wins over the policy timeout", "[client][deadline]") {
    auto transport = std::make_shared<MockTransport>();
    Client client(options_with(fast_defaults().with_timeout(10s)), transport);

    const auto caller = CallContext{}.with_timeout(500ms);
    (void)client.get("/slow", {}, caller);

    REQUIRE(transport->last_attempt()->deadline == caller.deadline());
}

TEST_CASE("Endpoint overrides apply per route", "[client][policy]") {
    auto transport = std::make_shared<MockTransport>();
    transport->set_default_response(503);

    EndpointTable table;
    table.add(HttpMethod::Post, "/payments", EndpointSettings{}.with_max_retries(0));

    Client client(options_with(fast_defaults().with_max_retries(2)).with_endpoint_table(table), transport);

    REQUIRE(client.post("/payments", "{}").error().attempts == 1);
    REQUIRE(client.get("/payments").error().attempts == 3);
    REQUIRE(transport->attempts().front().policy->max_retries == 0);
}

TEST_CASE("Default headers fill gaps, endpoint headers override the caller", "[client][policy]") {
    auto transport = std::make_shared<MockTransport>();
    Client client(
        options_with(fast_defaults()
            .with_header("Accept", "application/json")
            .with_header("X-Client", "sturdy"))
            .with_endpoint_settings([](HttpMethod, std::string_view path) -> std::optional<EndpointSettings> {
                if (path == "/reports") {
                    return EndpointSettings{}.with_header("Accept", "application/pdf");
                }
                return std::nullopt;
            }),
        transport);

    SECTION("defaults only") {
        (void)client.get("/users", {{"accept", "text/csv"}});

        const auto headers = transport->last_attempt()->headers;
        REQUIRE(get_header(headers, "Accept") == "text/csv");
        REQUIRE(get_header(headers, "X-Client") == "sturdy");
    }

    SECTION("endpoint override") {
        (void)client.get("/reports", {{"accept", "text/csv"}, {"X-Client", "caller"}});

        const auto headers = transport->last_attempt()->headers;
        REQUIRE(get_header(headers, "Accept") == "application/pdf");
        REQUIRE(get_header(headers, "X-Client") == "caller");
        REQUIRE(headers.size() == 2);
    }
}

TEST_CASE("Auth token provider sets a bearer token", "[client][auth]") {
    auto transport = std::make_shared<MockTransport>();

    SECTION("token supplied") {
        Client client(options_with(fast_defaults().with_auth_token_provider(
            [](const CallContext&, const RequestInfo& info) -> tl::expected<std::string, std::string> {
                return "token-for" + info.path;
            })), transport);

        (void)client.get("/me");
        REQUIRE(get_header(transport->last_attempt()->headers, "Authorization") == "Bearer token-for/me");
    }

    SECTION("provider failure lets the call proceed") {
        Client client(options_with(fast_defaults().with_auth_token_provider(
            [](const CallContext&, const RequestInfo&) -> tl::expected<std::string, std::string> {
                throw std::runtime_error("vault unavailable");
            })), transport);

        REQUIRE(client.get("/me").has_value());
        REQUIRE(has_header(transport->last_attempt()->headers, "Authorization") == false);
    }

    SECTION("empty token sends no header") {
        Client client(options_with(fast_defaults().with_auth_token_provider(
            [](const CallContext&, const RequestInfo&) -> tl::expected<std::string, std::string> {
                return std::string();
            })), transport);

        (void)client.get("/me");
        REQUIRE(has_header(transport->last_attempt()->headers, "Authorization") == false);
    }
}

TEST_CASE("Interceptors see the resolved policy and caller context", "[client][interceptors]") {
    auto transport = std::make_shared<MockTransport>();
    Client client(
        options_with(fast_defaults().with_require_auth())
            .with_interceptors({request_id_interceptor(), auth_interceptor()}),
        transport);

    (void)client.get("/profile", {}, CallContext{}.with_incoming_authorization("Bearer caller"));

    const auto attempt = *transport->last_attempt();
    REQUIRE(attempt.policy->require_auth);
    REQUIRE(attempt.incoming_authorization == "Bearer caller");
    REQUIRE(get_header(attempt.headers, "Authorization") == "Bearer caller");
    REQUIRE(has_header(attempt.headers, "X-Request-ID"));
}

// ═══════════════════════════════════════════════════════════════════════════
// Fallback
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("A fallback replaces a transport failure", "[client][fallback]") {
    auto transport = std::make_shared<MockTransport>();
    transport->set_handler([](HttpRequest&, const RequestContext&) -> TransportResult {
        return tl::unexpected(TransportError::connection_failed("no route to host"));
    });

    HookLog log;
    Client client(
        options_with(fast_defaults().with_fallback([](const HttpRequest&, const CallError& error) -> TransportResult {
            REQUIRE(error.is(TransportError::Code::ConnectionFailed));
            return make_buffered_response(200, R"({"cached":true})");
        })).with_hooks(log.hooks()),
        transport);

    auto result = client.get("/unreachable");

    REQUIRE(result.has_value());
    REQUIRE(result->status_code == 200);
    REQUIRE(result->text() == R"({"cached":true})");
    REQUIRE(log.events == std::vector<std::string>{"pre GET /unreachable", "post 200"});
}

TEST_CASE("A failing fallback is reported as a CallError", "[client][fallback]") {
    auto transport = std::make_shared<MockTransport>();
    transport->set_default_response(500);

    SECTION("fallback returns an error") {
        HookLog log;
        Client client(
            options_with(fast_defaults().with_max_retries(1).with_fallback(
                [](const HttpRequest&, const CallError&) -> TransportResult {
                    return tl::unexpected(TransportError::unknown("no cached copy"));
                })).with_hooks(log.hooks()),
            transport);

        auto result = client.get("/broken");

        REQUIRE(result.has_value() == false);
        REQUIRE(result.error().cause->message == "no cached copy");
        REQUIRE(result.error().attempts == 2);
        REQUIRE(log.events.back() == "error");
        REQUIRE(log.last_error->cause->message == "no cached copy");
    }

    SECTION("fallback throws") {
        Client client(
            options_with(fast_defaults().with_max_retries(0).with_fallback(
                [](const HttpRequest&, const CallError&) -> TransportResult {
                    throw std::runtime_error("boom");
                })),
            transport);

        auto result = client.get("/broken");

        REQUIRE(result.has_value() == false);
        REQUIRE(result.error().is(TransportError::Code::Unknown));
        REQUIRE(result.error().cause->message == "fallback failed: boom");
    }
}

TEST_CASE("A fallback against an unreachable host", "[client][fallback][network]") {
    Client client(
        ClientOptions{}
            .with_base_url("http://127.0.0.1:9")
            .with_default_settings(EndpointSettings{}
                .with_max_retries(0)
                .with_timeout(2s)
                .with_fallback([](const HttpRequest&, const CallError&) -> TransportResult {
                    return make_buffered_response(200, "fallback");
                })));

    auto result = client.get("/anything");

    REQUIRE(result.has_value());
    REQUIRE(result->status_code == 200);
    REQUIRE(result->text() == "fallback");
}

// ═══════════════════════════════════════════════════════════════════════════
// Hooks
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Hooks run once per logical call", "[client][hooks]") {
    auto transport = std::make_shared<MockTransport>();
    transport->queue_response(502);
    transport->queue_response(200);

    HookLog log;
    Client client(options_with().with_hooks(log.hooks()), transport);

    REQUIRE(client.get("/users?page=2").has_value());
    REQUIRE(log.events == std::vector<std::string>{"pre GET /users", "post 200"});
}

TEST_CASE("Error responses fire both post and error hooks", "[client][hooks]") {
    auto transport = std::make_shared<MockTransport>();
    transport->queue_response(404);

    HookLog log;
    Client client(options_with().with_hooks(log.hooks()), transport);

    (void)client.del("/users/9");
    REQUIRE(log.events == std::vector<std::string>{"pre DELETE /users/9", "post 404", "error"});
    REQUIRE(log.last_error->status_code == 404);
}

TEST_CASE("Throwing hooks never break the call", "[client][hooks]") {
    LoggerCapture capture;
    auto transport = std::make_shared<MockTransport>();
    Client client(
        options_with().with_hooks(Hooks{
            .pre_request = [](const CallContext&, const RequestInfo&) {
                throw std::runtime_error("pre");
            },
            .post_request = [](const CallContext&, const RequestInfo&, int) {
                throw std::runtime_error("post");
            }
        }),
        transport);

    REQUIRE(client.get("/ok").has_value());
    REQUIRE(capture.logger().contains(LogLevel::Error, "call hook threw"));
}

TEST_CASE("Hooks throwing non-exception values are contained", "[client][hooks]") {
    LoggerCapture capture;
    auto transport = std::make_shared<MockTransport>();
    transport->queue_response(200);
    transport->queue_response(404);
    Client client(
        options_with().with_hooks(Hooks{
            .post_request = [](const CallContext&, const RequestInfo&, int) {
                throw 42;
            },
            .on_error = [](const CallContext&, const RequestInfo&, const CallError&) {
                throw 42;
            }
        }),
        transport);

    CallResult ok = tl::unexpected(CallError{});
    REQUIRE_NOTHROW(ok = client.get("/x"));
    REQUIRE(ok.has_value());

    CallResult missing = tl::unexpected(CallError{});
    REQUIRE_NOTHROW(missing = client.get("/missing"));
    REQUIRE(missing.error().status_code == 404);

    bool logged_unknown = false;
    for (const auto& record : capture.logger().records()) {
        for (const auto& [key, value] : record.fields) {
            if (record.message == "call hook threw" && key == "error" && value == "unknown exception") {
                logged_unknown = true;
            }
        }
    }
    REQUIRE(logged_unknown);
}

TEST_CASE("A fallback throwing a non-exception value becomes a CallError", "[client][fallback]") {
    auto transport = std::make_shared<MockTransport>();
    transport->set_default_response(500);
    Client client(
        options_with(fast_defaults().with_max_retries(0).with_fallback(
            [](const HttpRequest&, const CallError&) -> TransportResult {
                throw 42;
            })),
        transport);

    CallResult result = tl::unexpected(CallError{});
    REQUIRE_NOTHROW(result = client.get("/broken"));
    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().cause->message == "fallback failed: unknown exception");
}
