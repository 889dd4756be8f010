#include "sturdy/interceptors/cache_interceptor.hpp"

#include "sturdy/log/logger.hpp"
#include "sturdy/policy/endpoint_policy.hpp"

namespace sturdy {

namespace {

using json = nlohmann::json;

// Per-attempt identifiers must not be replayed from the cache
constexpr std::string_view kUncachedHeader = "X-Request-Id";

TransportError from_body_error(const BodyError& error) {
    if (error.code == BodyError::Code::TooLarge) {
        return TransportError::response_too_large(error.message);
    }
    return TransportError::unknown("error reading response body: " + error.message);
}

std::optional<HttpResponse> lookup(ICacheBackend& cache, const std::string& key) {
    const auto cached = cache.get(key);
    if (cached.has_value() == false) {
        return std::nullopt;
    }
    try {
        const auto entry = json::parse(*cached).get<CacheEntry>();
        return entry.to_response();
    } catch (const json::exception& e) {
        get_logger().debug("discarding unreadable cache entry", {{"key", key}, {"error", e.what()}});
        return std::nullopt;
    }
}

void store(
    ICacheBackend& cache,
    const std::string& key,
    const HttpResponse& response,
    std::string body,
    std::chrono::milliseconds ttl
) {
    CacheEntry entry;
    entry.status = response.status_message;
    entry.status_code = response.status_code;
    entry.header = response.headers;
    erase_header(entry.header, kUncachedHeader);
    entry.body = std::move(body);

    try {
        cache.set(key, json(entry).dump(), ttl);
    } catch (const json::exception& e) {
        // Non-UTF-8 bodies cannot be represented in the JSON entry
        get_logger().debug("response not cacheable", {{"key", key}, {"error", e.what()}});
    }
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// CacheEntry
// ─────────────────────────────────────────────────────────────────────────────

HttpResponse CacheEntry::to_response() const {
    HttpResponse response = make_buffered_response(status_code, body, header);
    response.status_message = status;
    return response;
}

void to_json(json& j, const CacheEntry& entry) {
    j = json{
        {"status", entry.status},
        {"status_code", entry.status_code},
        {"header", entry.header},
        {"body", entry.body}
    };
}

void from_json(const json& j, CacheEntry& entry) {
    j.at("status").get_to(entry.status);
    j.at("status_code").get_to(entry.status_code);
    j.at("header").get_to(entry.header);
    j.at("body").get_to(entry.body);
}

// ─────────────────────────────────────────────────────────────────────────────
// Interceptor
// ─────────────────────────────────────────────────────────────────────────────

std::string default_cache_key(const HttpRequest& request) {
    return to_string(request.method) + ":" + request.url;
}

Interceptor cache_interceptor(CacheConfig config) {
    if (config.key_fn == nullptr) {
        config.key_fn = default_cache_key;
    }
    auto shared = std::make_shared<const CacheConfig>(std::move(config));

    return [shared](TransportPtr next) {
        return make_transport([next, shared](HttpRequest& request, const RequestContext& ctx) -> TransportResult {
            const CacheConfig& cfg = *shared;
            const bool enabled = (ctx.policy != nullptr) && ctx.policy->enable_cache;
            if (enabled == false) {
                return next->send(request, ctx);
            }

            if (cfg.cache == nullptr) {
                get_logger().warn("cache enabled but no cache backend is configured", {
                    {"method", to_string(request.method)},
                    {"path", ctx.target.path}
                });
                return next->send(request, ctx);
            }

            const auto skip = get_header(request.headers, cfg.skip_cache_header);
            if (skip.has_value() && *skip == "true") {
                erase_header(request.headers, cfg.skip_cache_header);
                return next->send(request, ctx);
            }

            if (cfg.methods.contains(request.method) == false) {
                return next->send(request, ctx);
            }

            const std::string key = cfg.key_fn(request);
            auto hit = lookup(*cfg.cache, key);
            if (hit.has_value()) {
                get_logger().debug("cache hit", {{"key", key}});
                return std::move(*hit);
            }

            auto outcome = next->send(request, ctx);
            if (outcome.has_value() == false) {
                return outcome;
            }

            auto body = read_and_restore(outcome->body);
            if (body.has_value() == false) {
                return tl::unexpected(from_body_error(body.error()));
            }

            if (cfg.status_codes.contains(outcome->status_code)) {
                const auto& policy_ttl = ctx.policy->cache_ttl;
                const auto ttl = policy_ttl.has_value() && policy_ttl->count() > 0
                    ? *policy_ttl
                    : cfg.default_ttl;
                store(*cfg.cache, key, *outcome, std::move(*body), ttl);
            }
            return outcome;
        });
    };
}

}  // namespace sturdy
