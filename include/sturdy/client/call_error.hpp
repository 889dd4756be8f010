#ifndef STURDY_CLIENT_CALL_ERROR_HPP
#define STURDY_CLIENT_CALL_ERROR_HPP

#include "sturdy/http/http_message.hpp"
#include "sturdy/http/http_types.hpp"
#include "sturdy/http/transport_error.hpp"

#include <cstddef>
#include <optional>
#include <string>

#include <tl/expected.hpp>

namespace sturdy {

// ─────────────────────────────────────────────────────────────────────────────
// CallError - the single failure shape returned by Client calls
// ─────────────────────────────────────────────────────────────────────────────
// status_code is 0 when no response was ever received (transport failure,
// open breaker, limiter wait cut short). `body` holds the last response body
// captured, so callers can log server error payloads.

struct CallError {
    int status_code{0};
    std::optional<TransportError> cause;
    std::size_t attempts{0};
    HttpMethod method{HttpMethod::Get};
    std::string url;
    std::string body;
    HeaderMap headers;

    [[nodiscard]] bool has_response() const noexcept {
        return status_code != 0;
    }

    [[nodiscard]] bool is_transport_error() const noexcept {
        return cause.has_value();
    }

    [[nodiscard]] bool is(TransportError::Code code) const noexcept {
        return cause.has_value() && cause->code == code;
    }

    /// "[HTTP] GET https://host/path: status=503, attempts=3, err=..., body=..."
    [[nodiscard]] std::string message() const;

    /// Failure with no response.
    [[nodiscard]] static CallError from_transport(
        TransportError cause,
        HttpMethod method,
        std::string url,
        std::size_t attempts
    );

    /// Failure with an error-status response whose body has been read.
    [[nodiscard]] static CallError from_response(
        const HttpResponse& response,
        std::string body,
        HttpMethod method,
        std::string url,
        std::size_t attempts
    );
};

using CallResult = tl::expected<HttpResponse, CallError>;

}  // namespace sturdy

#endif  // STURDY_CLIENT_CALL_ERROR_HPP
