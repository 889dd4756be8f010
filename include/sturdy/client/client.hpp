#pragma once

#include "sturdy/client/call_error.hpp"
#include "sturdy/http/call_context.hpp"
#include "sturdy/http/http_message.hpp"
#include "sturdy/http/transport.hpp"
#include "sturdy/policy/endpoint_policy.hpp"
#include "sturdy/policy/endpoint_table.hpp"
#include "sturdy/policy/policy_resolver.hpp"

#include <tl/expected.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sturdy {

// ═══════════════════════════════════════════════════════════════════════════
// Call Hooks
// ═══════════════════════════════════════════════════════════════════════════
// Invoked once per logical call, around the whole retry loop. A hook that
// throws is logged and ignored.
//
//   pre_request   before policy resolution
//   post_request  whenever the call ends with a status (error responses and
//                 fallback responses included)
//   on_error      whenever the call fails, including a failed fallback

struct Hooks {
    std::function<void(const CallContext&, const RequestInfo&)> pre_request;
    std::function<void(const CallContext&, const RequestInfo&, int status_code)> post_request;
    std::function<void(const CallContext&, const RequestInfo&, const CallError&)> on_error;
};

// ═══════════════════════════════════════════════════════════════════════════
// Client Configuration
// ═══════════════════════════════════════════════════════════════════════════

struct ClientOptions {
    /// Prefix for verb paths. Trailing slashes are trimmed.
    std::string base_url;

    /// Applied to every call; endpoint overrides are merged on top.
    EndpointSettings default_settings;

    /// Per-endpoint override lookup (see EndpointTable::as_override).
    EndpointOverrideFn endpoint_settings;

    /// Registration order is execution order: the first is outermost.
    std::vector<Interceptor> interceptors;

    Hooks hooks;

    ClientOptions& with_base_url(std::string url) {
        base_url = std::move(url);
        return *this;
    }

    ClientOptions& with_default_settings(EndpointSettings settings) {
        default_settings = std::move(settings);
        return *this;
    }

    ClientOptions& with_endpoint_settings(EndpointOverrideFn fn) {
        endpoint_settings = std::move(fn);
        return *this;
    }

    /// Use a routing table for both the defaults and the overrides.
    ClientOptions& with_endpoint_table(const EndpointTable& table) {
        default_settings = merge_settings(default_settings, table.defaults());
        endpoint_settings = table.as_override();
        return *this;
    }

    ClientOptions& with_interceptor(Interceptor interceptor) {
        interceptors.push_back(std::move(interceptor));
        return *this;
    }

    ClientOptions& with_interceptors(std::vector<Interceptor> list) {
        for (auto& interceptor : list) {
            interceptors.push_back(std::move(interceptor));
        }
        return *this;
    }

    ClientOptions& with_hooks(Hooks value) {
        hooks = std::move(value);
        return *this;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Client
// ═══════════════════════════════════════════════════════════════════════════
// Resilient HTTP client. Every call resolves its endpoint policy, runs the
// interceptor chain under the retry executor, buffers the final body and
// classifies the outcome. Thread-safe: calls share no per-call state.
//
// Usage:
//   auto options = ClientOptions{}
//       .with_base_url("https://api.example.com")
//       .with_default_settings(EndpointSettings{}.with_max_retries(3))
//       .with_interceptor(request_id_interceptor());
//
//   Client client(std::move(options));
//   auto result = client.get("/users/42");
//   if (result) {
//       std::cout << result->text() << "\n";
//   } else {
//       std::cerr << result.error().message() << "\n";
//   }

class Client {
public:
    // ─────────────────────────────────────────────────────────────────────────
    // Construction
    // ─────────────────────────────────────────────────────────────────────────

    /// Uses a default cpr transport. Throws std::invalid_argument when
    /// base_url is set but is not an absolute http(s) URL.
    explicit Client(ClientOptions options);

    /// Uses `base` as the innermost transport.
    Client(ClientOptions options, TransportPtr base);

    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;
    Client(Client&&) = delete;
    Client& operator=(Client&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Calls
    // ─────────────────────────────────────────────────────────────────────────

    /// `request.url` must be absolute.
    [[nodiscard]] CallResult execute(HttpRequest request, const CallContext& ctx = {}) const;

    [[nodiscard]] CallResult get(std::string_view path, HeaderMap headers = {}, const CallContext& ctx = {}) const;
    [[nodiscard]] CallResult head(std::string_view path, HeaderMap headers = {}, const CallContext& ctx = {}) const;
    [[nodiscard]] CallResult del(std::string_view path, HeaderMap headers = {}, const CallContext& ctx = {}) const;

    [[nodiscard]] CallResult post(
        std::string_view path,
        std::string body,
        HeaderMap headers = {},
        const CallContext& ctx = {}
    ) const;

    [[nodiscard]] CallResult put(
        std::string_view path,
        std::string body,
        HeaderMap headers = {},
        const CallContext& ctx = {}
    ) const;

    [[nodiscard]] CallResult patch(
        std::string_view path,
        std::string body,
        HeaderMap headers = {},
        const CallContext& ctx = {}
    ) const;

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Release idle pooled connections. Calls remain possible afterwards.
    void shutdown();

    [[nodiscard]] const std::string& base_url() const noexcept { return base_url_; }
    [[nodiscard]] const PolicyResolver& resolver() const noexcept { return resolver_; }

private:
    [[nodiscard]] std::string url_for(std::string_view path) const;
    [[nodiscard]] CallResult call(
        HttpMethod method,
        std::string_view path,
        std::optional<std::string> body,
        HeaderMap headers,
        const CallContext& ctx
    ) const;

    [[nodiscard]] CallResult run_fallback(
        const EndpointPolicy& policy,
        const HttpRequest& request,
        CallError error
    ) const;

    void notify_post(const CallContext& ctx, const RequestInfo& info, int status_code) const;
    void notify_error(const CallContext& ctx, const RequestInfo& info, const CallError& error) const;

    std::string base_url_;
    PolicyResolver resolver_;
    Hooks hooks_;
    TransportPtr base_;
    TransportPtr chain_;
};

}  // namespace sturdy
