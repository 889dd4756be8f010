#pragma once

#include "sturdy/http/transport.hpp"
#include "sturdy/resilience/circuit_breaker.hpp"
#include "sturdy/resilience/rate_limiter.hpp"

#include <functional>
#include <memory>
#include <string_view>

namespace sturdy {

// ─────────────────────────────────────────────────────────────────────────────
// Rate Limiting
// ─────────────────────────────────────────────────────────────────────────────
// Blocks until the limiter grants a permit or the call's deadline or
// cancellation fires. A refused wait fails the attempt with
// TransportError::RateLimited (or Cancelled) without reaching the wire.
//
// The limiter is chosen per request: `limiter_for` first, then the resolved
// policy's limiter. No limiter means pass-through.

struct RateLimitConfig {
    std::function<std::shared_ptr<IRateLimiter>(HttpMethod, std::string_view path)> limiter_for;
};

[[nodiscard]] Interceptor rate_limit_interceptor(RateLimitConfig config = {});

// ─────────────────────────────────────────────────────────────────────────────
// Circuit Breaking
// ─────────────────────────────────────────────────────────────────────────────
// Runs the inner attempt through the breaker. A transport failure or a
// response with status >= 500 is recorded as a failure. While the breaker is
// open the attempt fails with TransportError::CircuitOpen without reaching
// the wire.
//
// The breaker is chosen per request: `breaker_for` first, then the resolved
// policy's breaker.

struct CircuitBreakerInterceptorConfig {
    std::function<std::shared_ptr<CircuitBreaker>(HttpMethod, std::string_view path)> breaker_for;
};

[[nodiscard]] Interceptor circuit_breaker_interceptor(CircuitBreakerInterceptorConfig config = {});

// ─────────────────────────────────────────────────────────────────────────────
// Max Response Size
// ─────────────────────────────────────────────────────────────────────────────
// Wraps each response body in a BoundedBody. With max_bytes == 0 the
// resolved policy's max_response_size applies; if that is also 0 the body
// is left alone.

[[nodiscard]] Interceptor max_response_size_interceptor(std::size_t max_bytes = 0);

}  // namespace sturdy
