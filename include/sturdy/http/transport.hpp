#pragma once

#include "sturdy/http/call_context.hpp"
#include "sturdy/http/http_message.hpp"
#include "sturdy/http/http_types.hpp"
#include "sturdy/http/transport_error.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

namespace sturdy {

struct EndpointPolicy;

// ─────────────────────────────────────────────────────────────────────────────
// RequestContext - per-attempt view of one logical call
// ─────────────────────────────────────────────────────────────────────────────
// Threaded alongside the request through every interceptor. The policy is
// resolved once per call and shared by all attempts.

struct RequestContext {
    CallContext call;
    std::shared_ptr<const EndpointPolicy> policy;
    UrlComponents target;
    std::size_t attempt{0};  // 0 = first attempt
};

// ─────────────────────────────────────────────────────────────────────────────
// ITransport Interface
// ─────────────────────────────────────────────────────────────────────────────
// send() performs exactly one attempt. A response with any status is a
// value; only failures that produced no response are errors. Implementations
// are shared by concurrent calls and must be thread-safe.
//
// The request is passed by mutable reference so interceptors can add
// headers before forwarding; those changes are visible to later attempts.

class ITransport {
public:
    virtual ~ITransport() = default;

    [[nodiscard]] virtual TransportResult send(HttpRequest& request, const RequestContext& ctx) = 0;

    /// Release pooled idle connections. Only base transports pool anything.
    virtual void close_idle_connections() {}
};

using TransportPtr = std::shared_ptr<ITransport>;

// ─────────────────────────────────────────────────────────────────────────────
// Interceptors
// ─────────────────────────────────────────────────────────────────────────────
// An interceptor wraps the next transport inward and returns the outer one.
// compose(base, {A, B, C}) executes A → B → C → base: the first registered
// interceptor is outermost.

using Interceptor = std::function<TransportPtr(TransportPtr next)>;

[[nodiscard]] TransportPtr compose(TransportPtr base, const std::vector<Interceptor>& interceptors);

// ─────────────────────────────────────────────────────────────────────────────
// TransportFunction - adapt a callable into a transport
// ─────────────────────────────────────────────────────────────────────────────
// Usage:
//   Interceptor tag = [](TransportPtr next) {
//       return make_transport([next](HttpRequest& req, const RequestContext& ctx) {
//           req.with_header("X-Tag", "1");
//           return next->send(req, ctx);
//       });
//   };

using SendFunction = std::function<TransportResult(HttpRequest&, const RequestContext&)>;

class TransportFunction final : public ITransport {
public:
    explicit TransportFunction(SendFunction fn)
        : fn_(std::move(fn))
    {}

    [[nodiscard]] TransportResult send(HttpRequest& request, const RequestContext& ctx) override {
        return fn_(request, ctx);
    }

private:
    SendFunction fn_;
};

[[nodiscard]] inline TransportPtr make_transport(SendFunction fn) {
    return std::make_shared<TransportFunction>(std::move(fn));
}

// ─────────────────────────────────────────────────────────────────────────────
// cpr Transport
// ─────────────────────────────────────────────────────────────────────────────

struct CprTransportConfig {
    std::chrono::milliseconds connect_timeout{5000};
    bool verify_ssl{true};
    bool follow_redirects{true};

    /// Idle sessions kept per (method, has-body) pool key
    std::size_t max_idle_sessions{16};

    /// Headers applied when the request does not set them
    HeaderMap default_headers;

    CprTransportConfig& with_connect_timeout(std::chrono::milliseconds timeout) {
        connect_timeout = timeout;
        return *this;
    }

    CprTransportConfig& with_verify_ssl(bool verify) {
        verify_ssl = verify;
        return *this;
    }

    CprTransportConfig& with_follow_redirects(bool follow) {
        follow_redirects = follow;
        return *this;
    }

    CprTransportConfig& with_max_idle_sessions(std::size_t count) {
        max_idle_sessions = count;
        return *this;
    }

    CprTransportConfig& with_default_header(std::string_view name, std::string value) {
        set_header(default_headers, name, std::move(value));
        return *this;
    }
};

/// Base transport over cpr/libcurl. Each attempt's timeout is the call's
/// remaining deadline; cancellation aborts in-flight transfers.
[[nodiscard]] TransportPtr make_cpr_transport(CprTransportConfig config = {});

}  // namespace sturdy
