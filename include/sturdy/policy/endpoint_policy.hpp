#pragma once

#include "sturdy/client/call_error.hpp"
#include "sturdy/http/call_context.hpp"
#include "sturdy/http/http_message.hpp"
#include "sturdy/http/transport_error.hpp"
#include "sturdy/policy/backoff.hpp"
#include "sturdy/policy/retry_policy.hpp"
#include "sturdy/resilience/circuit_breaker.hpp"
#include "sturdy/resilience/rate_limiter.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace sturdy {

// ─────────────────────────────────────────────────────────────────────────────
// Callback Types
// ─────────────────────────────────────────────────────────────────────────────

/// Produces a bearer token for an outbound call. An error string, or an empty
/// token, means "send no Authorization header"; the call still proceeds.
using AuthTokenProvider =
    std::function<tl::expected<std::string, std::string>(const CallContext&, const RequestInfo&)>;

/// Invoked once a call has failed. A returned response becomes the call's
/// result; a returned TransportError is reported as a CallError.
using FallbackFunction =
    std::function<TransportResult(const HttpRequest& request, const CallError& error)>;

using TagMap = std::map<std::string, std::string>;

// ─────────────────────────────────────────────────────────────────────────────
// Structural Defaults
// ─────────────────────────────────────────────────────────────────────────────

inline constexpr std::chrono::milliseconds kDefaultTimeout{10'000};
inline constexpr std::size_t kDefaultMaxRetries = 2;
inline constexpr std::chrono::milliseconds kDefaultBackoffDelay{200};

// ─────────────────────────────────────────────────────────────────────────────
// EndpointSettings - partial, mergeable configuration
// ─────────────────────────────────────────────────────────────────────────────
// Every field is optional. Used both for the client-wide defaults and for
// per-endpoint overrides; an override field that is set wins over the
// default, headers and tags merge key by key.
//
// Usage:
//   auto settings = EndpointSettings{}
//       .with_timeout(std::chrono::seconds(2))
//       .with_max_retries(0)
//       .with_cache(std::chrono::seconds(30));

struct EndpointSettings {
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<std::size_t> max_retries;
    RetryPredicate retry_predicate;
    BackoffFunction backoff;
    HeaderMap headers;
    std::optional<bool> require_auth;
    std::shared_ptr<IRateLimiter> rate_limiter;
    std::shared_ptr<CircuitBreaker> circuit_breaker;
    AuthTokenProvider auth_token_provider;
    std::optional<bool> enable_cache;
    std::optional<std::chrono::milliseconds> cache_ttl;
    FallbackFunction fallback;
    std::optional<std::size_t> max_response_size;
    TagMap custom_tags;

    EndpointSettings& with_timeout(std::chrono::milliseconds value) {
        timeout = value;
        return *this;
    }

    EndpointSettings& with_max_retries(std::size_t value) {
        max_retries = value;
        return *this;
    }

    EndpointSettings& with_retry_predicate(RetryPredicate value) {
        retry_predicate = std::move(value);
        return *this;
    }

    EndpointSettings& with_backoff(BackoffFunction value) {
        backoff = std::move(value);
        return *this;
    }

    EndpointSettings& with_header(std::string_view name, std::string value) {
        set_header(headers, name, std::move(value));
        return *this;
    }

    EndpointSettings& with_require_auth(bool value = true) {
        require_auth = value;
        return *this;
    }

    EndpointSettings& with_rate_limiter(std::shared_ptr<IRateLimiter> value) {
        rate_limiter = std::move(value);
        return *this;
    }

    EndpointSettings& with_circuit_breaker(std::shared_ptr<CircuitBreaker> value) {
        circuit_breaker = std::move(value);
        return *this;
    }

    EndpointSettings& with_auth_token_provider(AuthTokenProvider value) {
        auth_token_provider = std::move(value);
        return *this;
    }

    EndpointSettings& with_cache(std::optional<std::chrono::milliseconds> ttl = std::nullopt) {
        enable_cache = true;
        if (ttl.has_value()) {
            cache_ttl = ttl;
        }
        return *this;
    }

    EndpointSettings& without_cache() {
        enable_cache = false;
        return *this;
    }

    EndpointSettings& with_fallback(FallbackFunction value) {
        fallback = std::move(value);
        return *this;
    }

    EndpointSettings& with_max_response_size(std::size_t bytes) {
        max_response_size = bytes;
        return *this;
    }

    EndpointSettings& with_tag(std::string key, std::string value) {
        custom_tags[std::move(key)] = std::move(value);
        return *this;
    }

    /// True when no field is set.
    [[nodiscard]] bool empty() const;
};

/// Overlay `over` on `base`: set fields of `over` win, maps merge key-wise.
[[nodiscard]] EndpointSettings merge_settings(const EndpointSettings& base, const EndpointSettings& over);

// ─────────────────────────────────────────────────────────────────────────────
// EndpointPolicy - resolved, immutable per call
// ─────────────────────────────────────────────────────────────────────────────
// Produced once per logical call and shared (const) by every attempt and
// every interceptor. `circuit_breaker`, `retry_predicate` and `backoff` are
// never empty after resolution.

struct EndpointPolicy {
    std::chrono::milliseconds timeout{kDefaultTimeout};
    std::size_t max_retries{kDefaultMaxRetries};
    RetryPredicate retry_predicate;
    BackoffFunction backoff;
    HeaderMap headers;           // defaults merged with the override; fill gaps only
    HeaderMap override_headers;  // from the endpoint override; replace caller values
    bool require_auth{false};
    std::shared_ptr<IRateLimiter> rate_limiter;
    std::shared_ptr<CircuitBreaker> circuit_breaker;
    AuthTokenProvider auth_token_provider;
    bool enable_cache{false};
    std::optional<std::chrono::milliseconds> cache_ttl;
    FallbackFunction fallback;
    std::size_t max_response_size{0};  // 0 = unlimited
    TagMap custom_tags;
};

/// Apply structural defaults to whatever `settings` left unset.
/// `path` names the lazily created breaker when APP_NAME is not set.
[[nodiscard]] EndpointPolicy finalize_policy(EndpointSettings settings, std::string_view path);

}  // namespace sturdy
