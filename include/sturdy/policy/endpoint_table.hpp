#pragma once

#include "sturdy/policy/policy_resolver.hpp"

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sturdy {

struct ConfigError {
    std::string message;
};

// ─────────────────────────────────────────────────────────────────────────────
// EndpointTable - routing table feeding the endpoint override function
// ─────────────────────────────────────────────────────────────────────────────
// A pattern is either an exact path ("/users/me") or a prefix ending in '*'
// ("/users/*"). Lookup picks the most specific route: exact beats prefix,
// longer prefix beats shorter, a method-specific route beats an any-method
// route of the same pattern.
//
// JSON form:
//   {
//     "defaults": { "timeout_ms": 5000, "max_retries": 2 },
//     "rate_limiters": { "search": { "rate": 5.0, "burst": 10 } },
//     "circuit_breakers": { "billing": { "failure_threshold": 3,
//                                        "recovery_timeout_ms": 10000 } },
//     "endpoints": [
//       { "path": "/search*", "rate_limiter": "search" },
//       { "method": "POST", "path": "/billing/*", "circuit_breaker": "billing",
//         "max_retries": 0, "require_auth": true },
//       { "method": "GET", "path": "/catalog/*", "enable_cache": true,
//         "cache_ttl_ms": 30000, "headers": { "Accept": "application/json" } }
//     ]
//   }
//
// Settings keys: timeout_ms, max_retries, headers, require_auth,
// enable_cache, cache_ttl_ms, max_response_size, tags, rate_limiter,
// circuit_breaker. Named limiters and breakers are shared by every route
// that references them.

struct EndpointRoute {
    std::optional<HttpMethod> method;
    std::string pattern;
    EndpointSettings settings;

    [[nodiscard]] bool matches(HttpMethod m, std::string_view path) const;
    [[nodiscard]] bool is_prefix() const noexcept {
        return pattern.empty() == false && pattern.back() == '*';
    }
};

class EndpointTable {
public:
    EndpointTable() = default;

    EndpointTable& add(std::string pattern, EndpointSettings settings);
    EndpointTable& add(HttpMethod method, std::string pattern, EndpointSettings settings);

    [[nodiscard]] std::optional<EndpointSettings> lookup(HttpMethod method, std::string_view path) const;

    /// Snapshot of the table as an override function for ClientOptions.
    [[nodiscard]] EndpointOverrideFn as_override() const;

    /// Client-wide defaults from the "defaults" section (empty if absent).
    [[nodiscard]] const EndpointSettings& defaults() const noexcept { return defaults_; }

    [[nodiscard]] std::size_t size() const noexcept { return routes_.size(); }
    [[nodiscard]] const std::vector<EndpointRoute>& routes() const noexcept { return routes_; }

    [[nodiscard]] static tl::expected<EndpointTable, ConfigError> from_json(const nlohmann::json& config);
    [[nodiscard]] static tl::expected<EndpointTable, ConfigError> parse(std::string_view text);

private:
    EndpointSettings defaults_;
    std::vector<EndpointRoute> routes_;
};

}  // namespace sturdy
