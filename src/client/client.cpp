#include "sturdy/client/client.hpp"

#include "sturdy/client/retry_executor.hpp"
#include "sturdy/http/response_body.hpp"
#include "sturdy/log/logger.hpp"

#include <exception>
#include <memory>
#include <stdexcept>

namespace sturdy {

namespace {

constexpr std::string_view kBearerPrefix = "Bearer ";

std::string normalize_base_url(std::string url) {
    while (url.empty() == false && url.back() == '/') {
        url.pop_back();
    }
    if (url.empty() == false && parse_url(url).has_value() == false) {
        throw std::invalid_argument("Invalid base URL: " + url);
    }
    return url;
}

TransportError from_body_error(const BodyError& error) {
    if (error.code == BodyError::Code::TooLarge) {
        return TransportError::response_too_large(error.message);
    }
    return TransportError::unknown("error reading response body: " + error.message);
}

// Default headers fill gaps; endpoint override headers win over the caller
void apply_policy_headers(HttpRequest& request, const EndpointPolicy& policy) {
    for (const auto& [name, value] : policy.headers) {
        if (find_header(request.headers, name) == request.headers.end()) {
            request.headers.emplace(name, value);
        }
    }
    for (const auto& [name, value] : policy.override_headers) {
        set_header(request.headers, name, value);
    }
}

// Provider failures never block the call
void apply_auth_token(HttpRequest& request, const EndpointPolicy& policy,
                      const CallContext& ctx, const RequestInfo& info) {
    if (policy.auth_token_provider == nullptr) {
        return;
    }

    tl::expected<std::string, std::string> token = tl::unexpected(std::string());
    try {
        token = policy.auth_token_provider(ctx, info);
    } catch (const std::exception& e) {
        token = tl::unexpected(std::string(e.what()));
    } catch (...) {
        token = tl::unexpected(std::string("unknown exception"));
    }

    if (token.has_value() == false) {
        get_logger().debug("auth token provider failed", {
            {"path", info.path},
            {"error", token.error()}
        });
        return;
    }
    if (token->empty()) {
        return;
    }
    set_header(request.headers, "Authorization", std::string(kBearerPrefix) + *token);
}

template <typename Fn, typename... Args>
void invoke_hook(std::string_view hook, const Fn& fn, Args&&... args) {
    if (fn == nullptr) {
        return;
    }
    try {
        fn(std::forward<Args>(args)...);
    } catch (const std::exception& e) {
        get_logger().error("call hook threw", {{"hook", std::string(hook)}, {"error", e.what()}});
    } catch (...) {
        get_logger().error("call hook threw", {{"hook", std::string(hook)}, {"error", "unknown exception"}});
    }
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

Client::Client(ClientOptions options)
    : Client(std::move(options), make_cpr_transport())
{}

Client::Client(ClientOptions options, TransportPtr base)
    : base_url_(normalize_base_url(std::move(options.base_url)))
    , resolver_(std::move(options.default_settings), std::move(options.endpoint_settings))
    , hooks_(std::move(options.hooks))
    , base_(std::move(base))
{
    if (base_ == nullptr) {
        throw std::invalid_argument("Client requires a base transport");
    }
    chain_ = compose(base_, options.interceptors);
}

Client::~Client() = default;

void Client::shutdown() {
    base_->close_idle_connections();
    get_logger().info("http client shut down", {{"base_url", base_url_}});
}

// ─────────────────────────────────────────────────────────────────────────────
// Verbs
// ─────────────────────────────────────────────────────────────────────────────

std::string Client::url_for(std::string_view path) const {
    if (base_url_.empty()) {
        return std::string(path);
    }
    return join_url(base_url_, path);
}

CallResult Client::call(
    HttpMethod method,
    std::string_view path,
    std::optional<std::string> body,
    HeaderMap headers,
    const CallContext& ctx
) const {
    HttpRequest request(method, url_for(path));
    request.headers = std::move(headers);
    request.body = std::move(body);
    return execute(std::move(request), ctx);
}

CallResult Client::get(std::string_view path, HeaderMap headers, const CallContext& ctx) const {
    return call(HttpMethod::Get, path, std::nullopt, std::move(headers), ctx);
}

CallResult Client::head(std::string_view path, HeaderMap headers, const CallContext& ctx) const {
    return call(HttpMethod::Head, path, std::nullopt, std::move(headers), ctx);
}

CallResult Client::del(std::string_view path, HeaderMap headers, const CallContext& ctx) const {
    return call(HttpMethod::Delete, path, std::nullopt, std::move(headers), ctx);
}

CallResult Client::post(std::string_view path, std::string body, HeaderMap headers, const CallContext& ctx) const {
    return call(HttpMethod::Post, path, std::move(body), std::move(headers), ctx);
}

CallResult Client::put(std::string_view path, std::string body, HeaderMap headers, const CallContext& ctx) const {
    return call(HttpMethod::Put, path, std::move(body), std::move(headers), ctx);
}

CallResult Client::patch(std::string_view path, std::string body, HeaderMap headers, const CallContext& ctx) const {
    return call(HttpMethod::Patch, path, std::move(body), std::move(headers), ctx);
}

// ─────────────────────────────────────────────────────────────────────────────
// Execution
// ─────────────────────────────────────────────────────────────────────────────

CallResult Client::execute(HttpRequest request, const CallContext& ctx) const {
    const auto target = parse_url(request.url);
    const RequestInfo info{request.method, target.has_value() ? target->path : request.url};

    invoke_hook("pre_request", hooks_.pre_request, ctx, info);

    if (target.has_value() == false) {
        const auto error = CallError::from_transport(
            TransportError::invalid_request("Invalid URL: " + request.url),
            request.method, request.url, 0);
        notify_error(ctx, info, error);
        return tl::unexpected(error);
    }

    const auto policy = resolver_.resolve(request.method, target->path);

    RequestContext attempt_ctx;
    attempt_ctx.call = ctx.with_timeout(policy->timeout);
    attempt_ctx.policy = policy;
    attempt_ctx.target = *target;

    apply_policy_headers(request, *policy);
    apply_auth_token(request, *policy, attempt_ctx.call, info);

    auto [outcome, attempts] = execute_with_retry(*chain_, request, attempt_ctx);

    // Classify
    std::optional<CallError> failure;
    if (outcome.has_value() == false) {
        failure = CallError::from_transport(std::move(outcome.error()), request.method, request.url, attempts);
    } else {
        // The policy limit holds whether or not max_response_size_interceptor is registered
        if (policy->max_response_size > 0 && outcome->body != nullptr) {
            outcome->body = std::make_unique<BoundedBody>(std::move(outcome->body), policy->max_response_size);
        }
        auto body = read_and_restore(outcome->body);
        if (body.has_value() == false) {
            // read_and_restore left the partial bytes in the buffer
            failure = CallError::from_response(*outcome, outcome->text(), request.method, request.url, attempts);
            failure->cause = from_body_error(body.error());
        } else if (outcome->status_code >= 400) {
            failure = CallError::from_response(*outcome, std::move(*body), request.method, request.url, attempts);
        }
    }

    if (failure.has_value() == false) {
        notify_post(ctx, info, outcome->status_code);
        return std::move(*outcome);
    }

    CallResult result = (policy->fallback != nullptr)
        ? run_fallback(*policy, request, std::move(*failure))
        : CallResult(tl::unexpected(std::move(*failure)));

    if (result.has_value()) {
        notify_post(ctx, info, result->status_code);
        return result;
    }
    if (result.error().has_response()) {
        notify_post(ctx, info, result.error().status_code);
    }
    notify_error(ctx, info, result.error());
    return result;
}

CallResult Client::run_fallback(const EndpointPolicy& policy, const HttpRequest& request, CallError error) const {
    TransportResult replacement = tl::unexpected(TransportError::unknown("fallback produced no result"));
    try {
        replacement = policy.fallback(request, error);
    } catch (const std::exception& e) {
        get_logger().warn("fallback threw", {{"url", request.url}, {"error", e.what()}});
        replacement = tl::unexpected(TransportError::unknown(std::string("fallback failed: ") + e.what()));
    } catch (...) {
        get_logger().warn("fallback threw", {{"url", request.url}, {"error", "unknown exception"}});
        replacement = tl::unexpected(TransportError::unknown("fallback failed: unknown exception"));
    }

    if (replacement.has_value() == false) {
        return tl::unexpected(CallError::from_transport(
            std::move(replacement.error()), request.method, request.url, error.attempts));
    }

    auto body = read_and_restore(replacement->body);
    if (body.has_value() == false) {
        return tl::unexpected(CallError::from_transport(
            from_body_error(body.error()), request.method, request.url, error.attempts));
    }

    get_logger().debug("fallback response used", {
        {"url", request.url},
        {"status", std::to_string(replacement->status_code)}
    });
    return std::move(*replacement);
}

// ─────────────────────────────────────────────────────────────────────────────
// Hooks
// ─────────────────────────────────────────────────────────────────────────────

void Client::notify_post(const CallContext& ctx, const RequestInfo& info, int status_code) const {
    invoke_hook("post_request", hooks_.post_request, ctx, info, status_code);
}

void Client::notify_error(const CallContext& ctx, const RequestInfo& info, const CallError& error) const {
    invoke_hook("on_error", hooks_.on_error, ctx, info, error);
}

}  // namespace sturdy
