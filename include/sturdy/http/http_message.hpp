#pragma once

#include "sturdy/http/http_types.hpp"
#include "sturdy/http/response_body.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace sturdy {

/// Routing identity of a call: method plus URL path (no query string).
struct RequestInfo {
    HttpMethod method{HttpMethod::Get};
    std::string path;
};

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Request
// ─────────────────────────────────────────────────────────────────────────────
// `url` is always absolute by the time a request reaches a transport. The
// body is held in memory so every retry attempt can resend it.

struct HttpRequest {
    HttpMethod method{HttpMethod::Get};
    std::string url;
    HeaderMap headers;
    std::optional<std::string> body;

    HttpRequest() = default;
    HttpRequest(HttpMethod m, std::string u)
        : method(m)
        , url(std::move(u))
    {}

    HttpRequest& with_header(std::string_view name, std::string value) {
        set_header(headers, name, std::move(value));
        return *this;
    }

    HttpRequest& with_body(std::string data) {
        body = std::move(data);
        return *this;
    }

    [[nodiscard]] bool has_body() const noexcept {
        return body.has_value();
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Response
// ─────────────────────────────────────────────────────────────────────────────
// Move-only: the body may own a network resource. Responses returned from
// Client calls are always materialized (body is a BufferedBody).

struct HttpResponse {
    int status_code{0};
    std::string status_message;
    HeaderMap headers;
    std::unique_ptr<ResponseBody> body;
    std::optional<std::int64_t> content_length;

    HttpResponse() = default;
    HttpResponse(HttpResponse&&) noexcept = default;
    HttpResponse& operator=(HttpResponse&&) noexcept = default;
    HttpResponse(const HttpResponse&) = delete;
    HttpResponse& operator=(const HttpResponse&) = delete;
    ~HttpResponse() = default;

    [[nodiscard]] bool is_success() const noexcept {
        return status_code >= 200 && status_code < 300;
    }

    [[nodiscard]] bool is_client_error() const noexcept {
        return status_code >= 400 && status_code < 500;
    }

    [[nodiscard]] bool is_server_error() const noexcept {
        return status_code >= 500;
    }

    /// Contents of a materialized body, empty otherwise.
    [[nodiscard]] std::string text() const {
        const auto* buffered = dynamic_cast<const BufferedBody*>(body.get());
        if (buffered == nullptr) {
            return {};
        }
        return buffered->data();
    }

    /// Release the body resource without reading it.
    void close_body() noexcept {
        if (body != nullptr) {
            body->close();
        }
    }
};

/// Build a response whose body is already in memory.
[[nodiscard]] inline HttpResponse make_buffered_response(
    int status_code,
    std::string body,
    HeaderMap headers = {}
) {
    HttpResponse response;
    response.status_code = status_code;
    response.headers = std::move(headers);
    response.content_length = static_cast<std::int64_t>(body.size());
    response.body = std::make_unique<BufferedBody>(std::move(body));
    return response;
}

}  // namespace sturdy
