#pragma once

#include "sturdy/http/transport.hpp"
#include "sturdy/tracing/tracer.hpp"

#include <functional>
#include <memory>
#include <string>

namespace prometheus {
class Registry;
}  // namespace prometheus

namespace sturdy {

// ─────────────────────────────────────────────────────────────────────────────
// Tracing
// ─────────────────────────────────────────────────────────────────────────────
// One client span per attempt. The span continues an inbound `traceparent`
// header when the request carries one, and the header is replaced with the
// new span's context before forwarding. Transport failures and statuses
// >= 400 mark the span as errored.

inline constexpr std::string_view kTraceparentHeader = "traceparent";

struct TracingConfig {
    std::shared_ptr<ITracer> tracer;  // NullTracer when empty
    std::function<std::string(const HttpRequest&)> span_name_fn;  // "HTTP <METHOD>" when empty
};

[[nodiscard]] Interceptor tracing_interceptor(TracingConfig config = {});

// ─────────────────────────────────────────────────────────────────────────────
// Metrics (prometheus-cpp)
// ─────────────────────────────────────────────────────────────────────────────
// Families, prefixed "<namespace>_<subsystem>_":
//   request_duration_seconds  histogram  {method, host, path, status}
//   requests_total            counter    {method, host, path, status}
//   request_errors_total      counter    {method, host, path, error}
//
// Registration is idempotent per (registry, namespace, subsystem): building
// a second interceptor with the same configuration reuses the families.

struct MetricsConfig {
    std::string ns{"http_client"};
    std::string subsystem;
    std::shared_ptr<prometheus::Registry> registry;  // default_metrics_registry() when empty
};

/// Process-wide registry used when MetricsConfig::registry is empty.
[[nodiscard]] std::shared_ptr<prometheus::Registry> default_metrics_registry();

[[nodiscard]] Interceptor metrics_interceptor(MetricsConfig config = {});

/// Text exposition of a registry (Prometheus format).
[[nodiscard]] std::string serialize_metrics(const prometheus::Registry& registry);

// ─────────────────────────────────────────────────────────────────────────────
// Attempt Hooks
// ─────────────────────────────────────────────────────────────────────────────
// Callbacks around every attempt that passes this point of the chain. A
// callback that throws is logged and ignored.

struct AttemptHooks {
    std::function<void(const HttpRequest&, const RequestContext&)> pre_request;
    std::function<void(const HttpRequest&, const RequestContext&, const HttpResponse&)> post_request;
    std::function<void(const HttpRequest&, const RequestContext&, const TransportError&)> on_error;
};

[[nodiscard]] Interceptor attempt_hooks_interceptor(AttemptHooks hooks);

}  // namespace sturdy
