#ifndef STURDY_POLICY_RETRY_POLICY_HPP
#define STURDY_POLICY_RETRY_POLICY_HPP

#include "sturdy/http/transport_error.hpp"

#include <functional>
#include <set>

namespace sturdy {

/// Decides, after an attempt, whether another attempt should be made.
using RetryPredicate = std::function<bool(const TransportResult& outcome)>;

/// Retry on any transport failure, or on a response with status >= 500.
[[nodiscard]] inline RetryPredicate default_retry_predicate() {
    return [](const TransportResult& outcome) {
        if (outcome.has_value() == false) {
            return true;
        }
        return outcome->status_code >= 500;
    };
}

// ─────────────────────────────────────────────────────────────────────────────
// RetryPolicy
// ─────────────────────────────────────────────────────────────────────────────
// A configurable alternative to the default predicate. The attempt budget is
// not part of it: max_retries lives on the endpoint policy.
//
// Default behavior:
// - Retry on: connection failures, timeouts, 429, 500, 502, 503, 504
// - Don't retry on: SSL errors, refused calls (open breaker, limiter),
//   oversized responses, cancellation, other 4xx/5xx
//
// Usage:
//   auto settings = EndpointSettings{}
//       .with_retry_predicate(RetryPolicy{}
//           .with_retry_on_timeout(false)
//           .with_retryable_status(409)
//           .as_predicate());

class RetryPolicy {
public:
    RetryPolicy()
        : retry_on_connection_error_(true)
        , retry_on_timeout_(true)
        , retry_on_ssl_error_(false)
        , retryable_http_statuses_{429, 500, 502, 503, 504}
    {}

    // ─────────────────────────────────────────────────────────────────────────
    // Configuration (Builder Pattern)
    // ─────────────────────────────────────────────────────────────────────────

    RetryPolicy& with_retry_on_connection_error(bool enable) {
        retry_on_connection_error_ = enable;
        return *this;
    }

    RetryPolicy& with_retry_on_timeout(bool enable) {
        retry_on_timeout_ = enable;
        return *this;
    }

    RetryPolicy& with_retry_on_ssl_error(bool enable) {
        retry_on_ssl_error_ = enable;
        return *this;
    }

    RetryPolicy& with_retryable_status(int status_code) {
        retryable_http_statuses_.insert(status_code);
        return *this;
    }

    RetryPolicy& without_retryable_status(int status_code) {
        retryable_http_statuses_.erase(status_code);
        return *this;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Query Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] bool should_retry(TransportError::Code code) const {
        switch (code) {
            case TransportError::Code::ConnectionFailed:
                return retry_on_connection_error_;

            case TransportError::Code::Timeout:
                return retry_on_timeout_;

            case TransportError::Code::SslError:
                return retry_on_ssl_error_;

            case TransportError::Code::Cancelled:
            case TransportError::Code::DeadlineExceeded:
            case TransportError::Code::CircuitOpen:
            case TransportError::Code::RateLimited:
            case TransportError::Code::ResponseTooLarge:
            case TransportError::Code::InvalidRequest:
            case TransportError::Code::Closed:
            case TransportError::Code::Unknown:
                return false;
        }

        return false;
    }

    [[nodiscard]] bool should_retry_http_status(int status_code) const {
        return retryable_http_statuses_.contains(status_code);
    }

    [[nodiscard]] bool should_retry(const TransportResult& outcome) const {
        if (outcome.has_value() == false) {
            return should_retry(outcome.error().code);
        }
        return should_retry_http_status(outcome->status_code);
    }

    [[nodiscard]] RetryPredicate as_predicate() const {
        return [policy = *this](const TransportResult& outcome) {
            return policy.should_retry(outcome);
        };
    }

private:
    bool retry_on_connection_error_;
    bool retry_on_timeout_;
    bool retry_on_ssl_error_;
    std::set<int> retryable_http_statuses_;
};

}  // namespace sturdy

#endif  // STURDY_POLICY_RETRY_POLICY_HPP
