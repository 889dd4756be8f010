#include "sturdy/interceptors/observability_interceptors.hpp"

#include <cstdint>

namespace sturdy {

Interceptor tracing_interceptor(TracingConfig config) {
    if (config.tracer == nullptr) {
        config.tracer = std::make_shared<NullTracer>();
    }
    if (config.span_name_fn == nullptr) {
        config.span_name_fn = [](const HttpRequest& request) {
            return "HTTP " + to_string(request.method);
        };
    }

    return [config](TransportPtr next) {
        return make_transport([next, config](HttpRequest& request, const RequestContext& ctx) {
            std::optional<TraceContext> parent;
            if (const auto inbound = get_header(request.headers, kTraceparentHeader); inbound.has_value()) {
                parent = TraceContext::parse(*inbound);
            }

            auto span = config.tracer->start_span(config.span_name_fn(request), parent);
            set_header(request.headers, kTraceparentHeader, span->context().to_traceparent());

            span->set_attribute("http.method", to_string(request.method));
            span->set_attribute("http.url", request.url);
            span->set_attribute("http.target", ctx.target.path);
            span->set_attribute("http.scheme", ctx.target.scheme);
            span->set_attribute("http.host", ctx.target.authority());
            span->set_attribute("http.attempt", static_cast<std::int64_t>(ctx.attempt));
            if (request.has_body() && request.body->empty() == false) {
                span->set_attribute("http.request_content_length",
                                    static_cast<std::int64_t>(request.body->size()));
            }

            auto outcome = next->send(request, ctx);
            if (outcome.has_value() == false) {
                span->set_attribute("error.type", std::string(to_string(outcome.error().code)));
                span->set_status(SpanStatus::Error, outcome.error().message);
                span->end();
                return outcome;
            }

            span->set_attribute("http.status_code", static_cast<std::int64_t>(outcome->status_code));
            if (outcome->content_length.has_value() && *outcome->content_length > 0) {
                span->set_attribute("http.response_content_length", *outcome->content_length);
            }
            if (outcome->status_code >= 400) {
                span->set_status(SpanStatus::Error, outcome->status_message);
            }
            span->end();
            return outcome;
        });
    };
}

}  // namespace sturdy
