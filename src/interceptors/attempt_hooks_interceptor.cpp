#include "sturdy/interceptors/observability_interceptors.hpp"

#include "sturdy/log/logger.hpp"

#include <exception>

namespace sturdy {

namespace {

template <typename Fn, typename... Args>
void invoke_guarded(std::string_view hook, const Fn& fn, Args&&... args) {
    if (fn == nullptr) {
        return;
    }
    try {
        fn(std::forward<Args>(args)...);
    } catch (const std::exception& e) {
        get_logger().error("attempt hook threw", {{"hook", std::string(hook)}, {"error", e.what()}});
    } catch (...) {
        get_logger().error("attempt hook threw", {{"hook", std::string(hook)}, {"error", "unknown exception"}});
    }
}

}  // namespace

Interceptor attempt_hooks_interceptor(AttemptHooks hooks) {
    auto shared = std::make_shared<const AttemptHooks>(std::move(hooks));

    return [shared](TransportPtr next) {
        return make_transport([next, shared](HttpRequest& request, const RequestContext& ctx) {
            invoke_guarded("pre_request", shared->pre_request, request, ctx);

            auto outcome = next->send(request, ctx);
            if (outcome.has_value()) {
                invoke_guarded("post_request", shared->post_request, request, ctx, *outcome);
            } else {
                invoke_guarded("on_error", shared->on_error, request, ctx, outcome.error());
            }
            return outcome;
        });
    };
}

}  // namespace sturdy
