#pragma once

#include "sturdy/policy/endpoint_policy.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string_view>

namespace sturdy {

/// Per-endpoint override lookup. nullopt (or empty settings) declines.
using EndpointOverrideFn =
    std::function<std::optional<EndpointSettings>(HttpMethod method, std::string_view path)>;

// ─────────────────────────────────────────────────────────────────────────────
// PolicyResolver
// ─────────────────────────────────────────────────────────────────────────────
// resolve(method, path) = finalize(defaults ⊕ override(method, path)).
// Absent configuration degrades to structural defaults; resolution itself
// never fails. Safe to call concurrently.

class PolicyResolver {
public:
    PolicyResolver() = default;
    explicit PolicyResolver(EndpointSettings defaults, EndpointOverrideFn overrides = nullptr);

    /// `path` must not carry a query string.
    [[nodiscard]] std::shared_ptr<const EndpointPolicy> resolve(HttpMethod method, std::string_view path) const;

    [[nodiscard]] const EndpointSettings& defaults() const noexcept { return defaults_; }

private:
    EndpointSettings defaults_;
    EndpointOverrideFn overrides_;
};

}  // namespace sturdy
