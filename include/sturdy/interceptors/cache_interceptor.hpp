#pragma once

#include "sturdy/cache/cache_backend.hpp"
#include "sturdy/http/transport.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>

namespace sturdy {

// ─────────────────────────────────────────────────────────────────────────────
// CacheEntry - serialized snapshot of a cacheable response
// ─────────────────────────────────────────────────────────────────────────────
// Stored as JSON: {"status": "...", "status_code": 200, "header": {...}, "body": "..."}

struct CacheEntry {
    std::string status;
    int status_code{0};
    HeaderMap header;
    std::string body;

    [[nodiscard]] HttpResponse to_response() const;
};

void to_json(nlohmann::json& j, const CacheEntry& entry);
void from_json(const nlohmann::json& j, CacheEntry& entry);

// ─────────────────────────────────────────────────────────────────────────────
// Response Caching
// ─────────────────────────────────────────────────────────────────────────────
// Engages only when the resolved policy has enable_cache and the method is in
// `methods`. A hit is served from the backend without calling inward. On a
// miss, responses whose status is in `status_codes` are stored for the
// policy's cache_ttl when positive (else `default_ttl`). A request carrying
// `skip_cache_header: true` bypasses the cache; the header is removed before
// forwarding.
//
// Usage:
//   auto backend = std::make_shared<MemoryCacheBackend>();
//   options.with_interceptor(cache_interceptor(CacheConfig{.cache = backend}));

struct CacheConfig {
    std::shared_ptr<ICacheBackend> cache;
    std::chrono::milliseconds default_ttl{std::chrono::minutes(5)};
    std::set<HttpMethod> methods{HttpMethod::Get};
    std::set<int> status_codes{200};
    std::function<std::string(const HttpRequest&)> key_fn;
    std::string skip_cache_header{"X-Skip-Cache"};
};

/// "METHOD:URL" (full URL including query string).
[[nodiscard]] std::string default_cache_key(const HttpRequest& request);

[[nodiscard]] Interceptor cache_interceptor(CacheConfig config);

}  // namespace sturdy
