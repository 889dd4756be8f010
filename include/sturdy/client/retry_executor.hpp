#pragma once

#include "sturdy/http/transport.hpp"

#include <cstddef>

namespace sturdy {

// ═══════════════════════════════════════════════════════════════════════════
// Retry Executor
// ═══════════════════════════════════════════════════════════════════════════
// Drives attempts through a composed transport:
//
//   attempt = 0
//   loop:
//       outcome = transport.send(request, ctx{attempt})
//       stop if predicate(outcome) == false or attempt == max_retries
//       close the discarded body, sleep backoff(attempt), ++attempt
//
// The first attempt is unconditional. When retries run out the last
// outcome is returned as-is. A backoff sleep cut short by the call deadline
// or cancellation turns the outcome into DeadlineExceeded / Cancelled.

struct RetryOutcome {
    TransportResult result;
    std::size_t attempts{0};  // attempts actually sent
};

/// `ctx.policy` must be resolved; `ctx.attempt` is overwritten per attempt.
[[nodiscard]] RetryOutcome execute_with_retry(ITransport& transport, HttpRequest& request, RequestContext ctx);

}  // namespace sturdy
