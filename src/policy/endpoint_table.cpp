#include "sturdy/policy/endpoint_table.hpp"

#include "sturdy/log/logger.hpp"

#include <cstdint>
#include <map>

namespace sturdy {

namespace {

using json = nlohmann::json;

using LimiterMap = std::map<std::string, std::shared_ptr<IRateLimiter>>;
using BreakerMap = std::map<std::string, std::shared_ptr<CircuitBreaker>>;

// Route specificity, compared lexicographically
struct Specificity {
    bool exact{false};
    std::size_t length{0};
    bool method_specific{false};

    bool operator>(const Specificity& other) const {
        if (exact != other.exact) {
            return exact;
        }
        if (length != other.length) {
            return length > other.length;
        }
        return method_specific && (other.method_specific == false);
    }
};

LimiterMap parse_rate_limiters(const json& section) {
    LimiterMap limiters;
    for (const auto& [name, def] : section.items()) {
        TokenBucketConfig config;
        config.rate_per_second = def.at("rate").get<double>();
        config.burst = def.value("burst", std::size_t{1});
        config.name = name;
        limiters.emplace(name, std::make_shared<TokenBucketRateLimiter>(std::move(config)));
    }
    return limiters;
}

BreakerMap parse_circuit_breakers(const json& section) {
    BreakerMap breakers;
    for (const auto& [name, def] : section.items()) {
        CircuitBreakerConfig config;
        config.failure_threshold = def.value("failure_threshold", config.failure_threshold);
        config.recovery_timeout = std::chrono::milliseconds{
            def.value("recovery_timeout_ms", static_cast<std::int64_t>(config.recovery_timeout.count()))
        };
        config.success_threshold = def.value("success_threshold", config.success_threshold);
        config.name = name;
        breakers.emplace(name, std::make_shared<CircuitBreaker>(std::move(config)));
    }
    return breakers;
}

tl::expected<EndpointSettings, ConfigError> parse_settings(
    const json& node,
    const LimiterMap& limiters,
    const BreakerMap& breakers
) {
    EndpointSettings settings;

    if (node.contains("timeout_ms")) {
        settings.timeout = std::chrono::milliseconds{node.at("timeout_ms").get<std::int64_t>()};
    }
    if (node.contains("max_retries")) {
        settings.max_retries = node.at("max_retries").get<std::size_t>();
    }
    if (node.contains("headers")) {
        for (const auto& [name, value] : node.at("headers").items()) {
            set_header(settings.headers, name, value.get<std::string>());
        }
    }
    if (node.contains("require_auth")) {
        settings.require_auth = node.at("require_auth").get<bool>();
    }
    if (node.contains("enable_cache")) {
        settings.enable_cache = node.at("enable_cache").get<bool>();
    }
    if (node.contains("cache_ttl_ms")) {
        settings.cache_ttl = std::chrono::milliseconds{node.at("cache_ttl_ms").get<std::int64_t>()};
    }
    if (node.contains("max_response_size")) {
        settings.max_response_size = node.at("max_response_size").get<std::size_t>();
    }
    if (node.contains("tags")) {
        for (const auto& [key, value] : node.at("tags").items()) {
            settings.custom_tags[key] = value.get<std::string>();
        }
    }
    if (node.contains("rate_limiter")) {
        const auto name = node.at("rate_limiter").get<std::string>();
        const auto it = limiters.find(name);
        if (it == limiters.end()) {
            return tl::unexpected(ConfigError{"unknown rate_limiter '" + name + "'"});
        }
        settings.rate_limiter = it->second;
    }
    if (node.contains("circuit_breaker")) {
        const auto name = node.at("circuit_breaker").get<std::string>();
        const auto it = breakers.find(name);
        if (it == breakers.end()) {
            return tl::unexpected(ConfigError{"unknown circuit_breaker '" + name + "'"});
        }
        settings.circuit_breaker = it->second;
    }

    return settings;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Matching
// ─────────────────────────────────────────────────────────────────────────────

bool EndpointRoute::matches(HttpMethod m, std::string_view path) const {
    if (method.has_value() && *method != m) {
        return false;
    }
    if (is_prefix()) {
        const std::string_view prefix(pattern.data(), pattern.size() - 1);
        return path.starts_with(prefix);
    }
    return path == pattern;
}

EndpointTable& EndpointTable::add(std::string pattern, EndpointSettings settings) {
    routes_.push_back(EndpointRoute{std::nullopt, std::move(pattern), std::move(settings)});
    return *this;
}

EndpointTable& EndpointTable::add(HttpMethod method, std::string pattern, EndpointSettings settings) {
    routes_.push_back(EndpointRoute{method, std::move(pattern), std::move(settings)});
    return *this;
}

std::optional<EndpointSettings> EndpointTable::lookup(HttpMethod method, std::string_view path) const {
    const EndpointRoute* best = nullptr;
    Specificity best_score;

    for (const auto& route : routes_) {
        if (route.matches(method, path) == false) {
            continue;
        }
        const Specificity score{
            route.is_prefix() == false,
            route.pattern.size(),
            route.method.has_value()
        };
        if (best == nullptr || score > best_score) {
            best = &route;
            best_score = score;
        }
    }

    if (best == nullptr) {
        return std::nullopt;
    }
    return best->settings;
}

EndpointOverrideFn EndpointTable::as_override() const {
    auto snapshot = std::make_shared<const EndpointTable>(*this);
    return [snapshot](HttpMethod method, std::string_view path) {
        return snapshot->lookup(method, path);
    };
}

// ─────────────────────────────────────────────────────────────────────────────
// JSON Loading
// ─────────────────────────────────────────────────────────────────────────────

tl::expected<EndpointTable, ConfigError> EndpointTable::from_json(const json& config) {
    if (config.is_object() == false) {
        return tl::unexpected(ConfigError{"endpoint config must be a JSON object"});
    }

    try {
        LimiterMap limiters;
        BreakerMap breakers;
        if (config.contains("rate_limiters")) {
            limiters = parse_rate_limiters(config.at("rate_limiters"));
        }
        if (config.contains("circuit_breakers")) {
            breakers = parse_circuit_breakers(config.at("circuit_breakers"));
        }

        EndpointTable table;

        if (config.contains("defaults")) {
            auto defaults = parse_settings(config.at("defaults"), limiters, breakers);
            if (defaults.has_value() == false) {
                return tl::unexpected(defaults.error());
            }
            table.defaults_ = std::move(*defaults);
        }

        if (config.contains("endpoints")) {
            for (const auto& node : config.at("endpoints")) {
                const auto path = node.at("path").get<std::string>();
                if (path.empty()) {
                    return tl::unexpected(ConfigError{"endpoint path must not be empty"});
                }

                auto settings = parse_settings(node, limiters, breakers);
                if (settings.has_value() == false) {
                    return tl::unexpected(ConfigError{path + ": " + settings.error().message});
                }

                if (node.contains("method")) {
                    const auto name = node.at("method").get<std::string>();
                    const auto method = parse_method(name);
                    if (method.has_value() == false) {
                        return tl::unexpected(ConfigError{path + ": unsupported method '" + name + "'"});
                    }
                    table.add(*method, path, std::move(*settings));
                } else {
                    table.add(path, std::move(*settings));
                }
            }
        }

        get_logger().debug("endpoint table loaded", {
            {"routes", std::to_string(table.size())},
            {"rate_limiters", std::to_string(limiters.size())},
            {"circuit_breakers", std::to_string(breakers.size())}
        });
        return table;

    } catch (const json::exception& e) {
        return tl::unexpected(ConfigError{std::string("invalid endpoint config: ") + e.what()});
    }
}

tl::expected<EndpointTable, ConfigError> EndpointTable::parse(std::string_view text) {
    const json config = json::parse(text, nullptr, false);
    if (config.is_discarded()) {
        return tl::unexpected(ConfigError{"endpoint config is not valid JSON"});
    }
    return from_json(config);
}

}  // namespace sturdy
