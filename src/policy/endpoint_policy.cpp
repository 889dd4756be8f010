#include "sturdy/policy/endpoint_policy.hpp"

#include "sturdy/log/logger.hpp"

#include <cstdlib>
#include <limits>

namespace sturdy {

namespace {

// Name the breaker after the application, falling back to the route
std::string default_breaker_name(std::string_view path) {
    const char* app_name = std::getenv("APP_NAME");
    const bool has_app_name = (app_name != nullptr) && (*app_name != '\0');
    std::string base = has_app_name ? std::string(app_name) : std::string(path);
    return base + "-breaker";
}

}  // namespace

bool EndpointSettings::empty() const {
    return timeout.has_value() == false &&
           max_retries.has_value() == false &&
           retry_predicate == nullptr &&
           backoff == nullptr &&
           headers.empty() &&
           require_auth.has_value() == false &&
           rate_limiter == nullptr &&
           circuit_breaker == nullptr &&
           auth_token_provider == nullptr &&
           enable_cache.has_value() == false &&
           cache_ttl.has_value() == false &&
           fallback == nullptr &&
           max_response_size.has_value() == false &&
           custom_tags.empty();
}

EndpointSettings merge_settings(const EndpointSettings& base, const EndpointSettings& over) {
    EndpointSettings merged = base;

    if (over.timeout.has_value()) {
        merged.timeout = over.timeout;
    }
    if (over.max_retries.has_value()) {
        merged.max_retries = over.max_retries;
    }
    if (over.retry_predicate != nullptr) {
        merged.retry_predicate = over.retry_predicate;
    }
    if (over.backoff != nullptr) {
        merged.backoff = over.backoff;
    }
    for (const auto& [name, value] : over.headers) {
        set_header(merged.headers, name, value);
    }
    if (over.require_auth.has_value()) {
        merged.require_auth = over.require_auth;
    }
    if (over.rate_limiter != nullptr) {
        merged.rate_limiter = over.rate_limiter;
    }
    if (over.circuit_breaker != nullptr) {
        merged.circuit_breaker = over.circuit_breaker;
    }
    if (over.auth_token_provider != nullptr) {
        merged.auth_token_provider = over.auth_token_provider;
    }
    if (over.enable_cache.has_value()) {
        merged.enable_cache = over.enable_cache;
    }
    if (over.cache_ttl.has_value()) {
        merged.cache_ttl = over.cache_ttl;
    }
    if (over.fallback != nullptr) {
        merged.fallback = over.fallback;
    }
    if (over.max_response_size.has_value()) {
        merged.max_response_size = over.max_response_size;
    }
    for (const auto& [key, value] : over.custom_tags) {
        merged.custom_tags[key] = value;
    }

    return merged;
}

EndpointPolicy finalize_policy(EndpointSettings settings, std::string_view path) {
    EndpointPolicy policy;

    // A zero or negative timeout counts as unset
    policy.timeout = settings.timeout.has_value() && settings.timeout->count() > 0
        ? *settings.timeout
        : kDefaultTimeout;
    policy.max_retries = settings.max_retries.value_or(kDefaultMaxRetries);

    policy.retry_predicate = settings.retry_predicate != nullptr
        ? std::move(settings.retry_predicate)
        : default_retry_predicate();

    policy.backoff = settings.backoff != nullptr
        ? std::move(settings.backoff)
        : constant_backoff(kDefaultBackoffDelay);

    policy.headers = std::move(settings.headers);
    policy.require_auth = settings.require_auth.value_or(false);
    policy.rate_limiter = std::move(settings.rate_limiter);
    policy.auth_token_provider = std::move(settings.auth_token_provider);
    policy.enable_cache = settings.enable_cache.value_or(false);
    policy.cache_ttl = settings.cache_ttl;
    policy.fallback = std::move(settings.fallback);
    policy.max_response_size = settings.max_response_size.value_or(0);
    policy.custom_tags = std::move(settings.custom_tags);

    if (settings.circuit_breaker != nullptr) {
        policy.circuit_breaker = std::move(settings.circuit_breaker);
    } else {
        // Per-call breaker that never trips
        CircuitBreakerConfig config;
        config.failure_threshold = std::numeric_limits<std::size_t>::max();
        config.name = default_breaker_name(path);
        policy.circuit_breaker = std::make_shared<CircuitBreaker>(std::move(config));
        get_logger().trace("created default circuit breaker", {
            {"breaker", policy.circuit_breaker->name()}
        });
    }

    return policy;
}

}  // namespace sturdy
