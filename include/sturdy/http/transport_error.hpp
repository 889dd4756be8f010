#ifndef STURDY_HTTP_TRANSPORT_ERROR_HPP
#define STURDY_HTTP_TRANSPORT_ERROR_HPP

#include "sturdy/http/http_message.hpp"

#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace sturdy {

// ─────────────────────────────────────────────────────────────────────────────
// Transport Error Types
// ─────────────────────────────────────────────────────────────────────────────
// A failure that produced no HTTP response. Decorators that refuse a call
// (open breaker, limiter wait cut short) report through the same type so the
// retry predicate and classifier see one shape.

struct TransportError {
    enum class Code {
        ConnectionFailed,    // DNS, refused, reset
        Timeout,             // Transport-level timeout
        SslError,            // TLS/SSL handshake or verification failed
        Cancelled,           // Caller requested stop
        DeadlineExceeded,    // Call deadline passed before or during an attempt
        CircuitOpen,         // Breaker rejected the call
        RateLimited,         // Limiter wait failed
        ResponseTooLarge,    // Body exceeded the configured limit
        InvalidRequest,      // URL could not be parsed
        Closed,              // Transport was shut down
        Unknown
    };

    Code code{Code::Unknown};
    std::string message;

    static TransportError connection_failed(std::string msg) {
        return {Code::ConnectionFailed, std::move(msg)};
    }

    static TransportError timeout(std::string msg) {
        return {Code::Timeout, std::move(msg)};
    }

    static TransportError ssl_error(std::string msg) {
        return {Code::SslError, std::move(msg)};
    }

    static TransportError cancelled() {
        return {Code::Cancelled, "call cancelled"};
    }

    static TransportError deadline_exceeded() {
        return {Code::DeadlineExceeded, "call deadline exceeded"};
    }

    static TransportError circuit_open(std::string msg) {
        return {Code::CircuitOpen, std::move(msg)};
    }

    static TransportError rate_limited(std::string msg) {
        return {Code::RateLimited, std::move(msg)};
    }

    static TransportError response_too_large(std::string msg) {
        return {Code::ResponseTooLarge, std::move(msg)};
    }

    static TransportError invalid_request(std::string msg) {
        return {Code::InvalidRequest, std::move(msg)};
    }

    static TransportError closed() {
        return {Code::Closed, "transport is closed"};
    }

    static TransportError unknown(std::string msg) {
        return {Code::Unknown, std::move(msg)};
    }
};

[[nodiscard]] constexpr std::string_view to_string(TransportError::Code code) noexcept {
    switch (code) {
        case TransportError::Code::ConnectionFailed: return "connection_failed";
        case TransportError::Code::Timeout:          return "timeout";
        case TransportError::Code::SslError:         return "ssl_error";
        case TransportError::Code::Cancelled:        return "cancelled";
        case TransportError::Code::DeadlineExceeded: return "deadline_exceeded";
        case TransportError::Code::CircuitOpen:      return "circuit_open";
        case TransportError::Code::RateLimited:      return "rate_limited";
        case TransportError::Code::ResponseTooLarge: return "response_too_large";
        case TransportError::Code::InvalidRequest:   return "invalid_request";
        case TransportError::Code::Closed:           return "closed";
        case TransportError::Code::Unknown:          return "unknown";
    }
    return "unknown";
}

/// Outcome of one attempt through a transport: a response (any status) or a
/// transport failure.
using TransportResult = tl::expected<HttpResponse, TransportError>;

}  // namespace sturdy

#endif  // STURDY_HTTP_TRANSPORT_ERROR_HPP
