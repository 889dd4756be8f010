#include "sturdy/interceptors/resilience_interceptors.hpp"

#include "sturdy/log/logger.hpp"
#include "sturdy/policy/endpoint_policy.hpp"

namespace sturdy {

namespace {

bool is_breaker_failure(const TransportResult& outcome) {
    if (outcome.has_value() == false) {
        return true;
    }
    return outcome->status_code >= 500;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Rate Limiting
// ─────────────────────────────────────────────────────────────────────────────

Interceptor rate_limit_interceptor(RateLimitConfig config) {
    return [config = std::move(config)](TransportPtr next) {
        return make_transport([next, config](HttpRequest& request, const RequestContext& ctx) -> TransportResult {
            std::shared_ptr<IRateLimiter> limiter;
            if (config.limiter_for != nullptr) {
                limiter = config.limiter_for(request.method, ctx.target.path);
            }
            if (limiter == nullptr && ctx.policy != nullptr) {
                limiter = ctx.policy->rate_limiter;
            }
            if (limiter == nullptr) {
                return next->send(request, ctx);
            }

            auto permit = limiter->wait(ctx.call);
            if (permit.has_value() == false) {
                get_logger().debug("rate limiter refused call", {
                    {"method", to_string(request.method)},
                    {"path", ctx.target.path},
                    {"reason", permit.error().message}
                });
                if (permit.error().code == RateLimitError::Code::Cancelled) {
                    return tl::unexpected(TransportError::cancelled());
                }
                return tl::unexpected(TransportError::rate_limited(permit.error().message));
            }
            return next->send(request, ctx);
        });
    };
}

// ─────────────────────────────────────────────────────────────────────────────
// Circuit Breaking
// ─────────────────────────────────────────────────────────────────────────────

Interceptor circuit_breaker_interceptor(CircuitBreakerInterceptorConfig config) {
    return [config = std::move(config)](TransportPtr next) {
        return make_transport([next, config](HttpRequest& request, const RequestContext& ctx) -> TransportResult {
            std::shared_ptr<CircuitBreaker> breaker;
            if (config.breaker_for != nullptr) {
                breaker = config.breaker_for(request.method, ctx.target.path);
            }
            if (breaker == nullptr && ctx.policy != nullptr) {
                breaker = ctx.policy->circuit_breaker;
            }
            if (breaker == nullptr) {
                return next->send(request, ctx);
            }

            auto outcome = breaker->execute(
                [&]() { return next->send(request, ctx); },
                is_breaker_failure
            );
            if (outcome.has_value() == false) {
                get_logger().debug("circuit breaker rejected call", {
                    {"breaker", outcome.error().breaker_name},
                    {"method", to_string(request.method)},
                    {"path", ctx.target.path}
                });
                return tl::unexpected(TransportError::circuit_open(outcome.error().message()));
            }
            return std::move(*outcome);
        });
    };
}

// ─────────────────────────────────────────────────────────────────────────────
// Max Response Size
// ─────────────────────────────────────────────────────────────────────────────

Interceptor max_response_size_interceptor(std::size_t max_bytes) {
    return [max_bytes](TransportPtr next) {
        return make_transport([next, max_bytes](HttpRequest& request, const RequestContext& ctx) {
            auto outcome = next->send(request, ctx);
            if (outcome.has_value() == false) {
                return outcome;
            }

            std::size_t limit = max_bytes;
            if (limit == 0 && ctx.policy != nullptr) {
                limit = ctx.policy->max_response_size;
            }
            if (limit > 0 && outcome->body != nullptr) {
                outcome->body = std::make_unique<BoundedBody>(std::move(outcome->body), limit);
            }
            return outcome;
        });
    };
}

}  // namespace sturdy
