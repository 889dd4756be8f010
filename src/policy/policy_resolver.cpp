#include "sturdy/policy/policy_resolver.hpp"

#include "sturdy/log/logger.hpp"

#include <exception>

namespace sturdy {

PolicyResolver::PolicyResolver(EndpointSettings defaults, EndpointOverrideFn overrides)
    : defaults_(std::move(defaults))
    , overrides_(std::move(overrides))
{}

std::shared_ptr<const EndpointPolicy> PolicyResolver::resolve(HttpMethod method, std::string_view path) const {
    std::optional<EndpointSettings> endpoint;
    if (overrides_ != nullptr) {
        try {
            endpoint = overrides_(method, path);
        } catch (const std::exception& e) {
            get_logger().warn("endpoint override failed, using defaults", {
                {"method", to_string(method)},
                {"path", std::string(path)},
                {"error", e.what()}
            });
        } catch (...) {
            get_logger().warn("endpoint override failed, using defaults", {
                {"method", to_string(method)},
                {"path", std::string(path)},
                {"error", "unknown exception"}
            });
        }
    }

    const bool has_override = endpoint.has_value() && (endpoint->empty() == false);
    if (has_override) {
        get_logger().debug("endpoint override applied", {
            {"method", to_string(method)},
            {"path", std::string(path)}
        });
        auto policy = finalize_policy(merge_settings(defaults_, *endpoint), path);
        policy.override_headers = std::move(endpoint->headers);
        return std::make_shared<const EndpointPolicy>(std::move(policy));
    }

    return std::make_shared<const EndpointPolicy>(finalize_policy(defaults_, path));
}

}  // namespace sturdy
