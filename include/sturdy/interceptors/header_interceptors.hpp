#pragma once

#include "sturdy/http/transport.hpp"

#include <optional>
#include <string>

namespace sturdy {

// ─────────────────────────────────────────────────────────────────────────────
// Header Interceptors
// ─────────────────────────────────────────────────────────────────────────────
// Each only mutates outbound headers and then forwards the request.

inline constexpr std::string_view kRequestIdHeader = "X-Request-ID";
inline constexpr std::string_view kForwardedForHeader = "X-Forwarded-For";
inline constexpr std::string_view kAppTokenHeader = "X-Auth-App-Token";
inline constexpr std::string_view kAuthorizationHeader = "Authorization";

/// Random RFC 4122 version 4 UUID, lowercase.
[[nodiscard]] std::string generate_request_id();

/// Sets X-Request-ID to a fresh UUID unless the request already carries one.
[[nodiscard]] Interceptor request_id_interceptor();

/// Appends the caller's address (CallContext::remote_address, port stripped)
/// to X-Forwarded-For unless it is already listed.
[[nodiscard]] Interceptor ip_propagation_interceptor();

/// Sets X-Auth-App-Token. With no explicit token, X_AUTH_APP_TOKEN is read
/// once when the interceptor is built; an empty token disables it.
[[nodiscard]] Interceptor app_token_interceptor(std::optional<std::string> token = std::nullopt);

/// On endpoints whose policy requires auth, forwards the caller's inbound
/// credential (CallContext::incoming_authorization) as Authorization. A
/// missing credential lets the call through unchanged.
[[nodiscard]] Interceptor auth_interceptor();

}  // namespace sturdy
