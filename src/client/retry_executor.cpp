#include "sturdy/client/retry_executor.hpp"

#include "sturdy/log/logger.hpp"
#include "sturdy/policy/endpoint_policy.hpp"

#include <stdexcept>

namespace sturdy {

namespace {

TransportError interrupted(const CallContext& call) {
    if (call.is_cancelled()) {
        return TransportError::cancelled();
    }
    return TransportError::deadline_exceeded();
}

std::string describe(const TransportResult& outcome) {
    if (outcome.has_value()) {
        return "status=" + std::to_string(outcome->status_code);
    }
    return "err=" + std::string(to_string(outcome.error().code));
}

}  // namespace

RetryOutcome execute_with_retry(ITransport& transport, HttpRequest& request, RequestContext ctx) {
    if (ctx.policy == nullptr) {
        throw std::invalid_argument("execute_with_retry requires a resolved policy");
    }
    const EndpointPolicy& policy = *ctx.policy;

    for (std::size_t attempt = 0; ; ++attempt) {
        ctx.attempt = attempt;
        TransportResult outcome = transport.send(request, ctx);

        const bool retryable = policy.retry_predicate(outcome);
        if (retryable == false || attempt >= policy.max_retries) {
            if (retryable) {
                get_logger().debug_fmt("Retries exhausted: attempts={}, {}", attempt + 1, describe(outcome));
            }
            return RetryOutcome{std::move(outcome), attempt + 1};
        }

        if (outcome.has_value()) {
            outcome->close_body();
        }

        const auto delay = policy.backoff(attempt);
        get_logger().debug_fmt("Retrying {} {} in {}ms (attempt {}/{}, {})",
            to_string(request.method), ctx.target.path, delay.count(),
            attempt + 2, policy.max_retries + 1, describe(outcome));

        if (ctx.call.sleep_for(delay) == false) {
            auto error = interrupted(ctx.call);
            get_logger().debug("backoff interrupted", {
                {"path", ctx.target.path},
                {"attempts", std::to_string(attempt + 1)},
                {"reason", std::string(to_string(error.code))}
            });
            return RetryOutcome{tl::unexpected(std::move(error)), attempt + 1};
        }
    }
}

}  // namespace sturdy
