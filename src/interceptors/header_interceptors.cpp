#include "sturdy/interceptors/header_interceptors.hpp"

#include "sturdy/log/logger.hpp"
#include "sturdy/policy/endpoint_policy.hpp"

#include <cstdint>
#include <cstdlib>
#include <mutex>
#include <random>

namespace sturdy {

namespace {

// "10.0.0.1:5432" -> "10.0.0.1", "[::1]:80" -> "::1"
std::string strip_port(std::string_view address) {
    if (address.empty() == false && address.front() == '[') {
        const auto close = address.find(']');
        if (close != std::string_view::npos) {
            return std::string(address.substr(1, close - 1));
        }
    }
    const auto colon = address.rfind(':');
    const bool single_colon = (colon != std::string_view::npos) && (address.find(':') == colon);
    if (single_colon) {
        return std::string(address.substr(0, colon));
    }
    return std::string(address);
}

std::string_view trim(std::string_view text) {
    while (text.empty() == false && text.front() == ' ') {
        text.remove_prefix(1);
    }
    while (text.empty() == false && text.back() == ' ') {
        text.remove_suffix(1);
    }
    return text;
}

bool list_contains(std::string_view list, std::string_view address) {
    while (list.empty() == false) {
        const auto comma = list.find(',');
        const auto item = trim(list.substr(0, comma));
        if (item == address) {
            return true;
        }
        if (comma == std::string_view::npos) {
            break;
        }
        list.remove_prefix(comma + 1);
    }
    return false;
}

}  // namespace

std::string generate_request_id() {
    static std::mutex mutex;
    static std::mt19937_64 rng(std::random_device{}());
    constexpr char kDigits[] = "0123456789abcdef";

    std::uint64_t high = 0;
    std::uint64_t low = 0;
    {
        std::lock_guard<std::mutex> lock(mutex);
        high = rng();
        low = rng();
    }

    // Version 4, variant 10xx
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::string out;
    out.reserve(36);
    for (int i = 60; i >= 0; i -= 4) {
        out += kDigits[(high >> i) & 0xF];
        if (out.size() == 8 || out.size() == 13) {
            out += '-';
        }
    }
    out += '-';
    for (int i = 60; i >= 0; i -= 4) {
        out += kDigits[(low >> i) & 0xF];
        if (out.size() == 23) {
            out += '-';
        }
    }
    return out;
}

Interceptor request_id_interceptor() {
    return [](TransportPtr next) {
        return make_transport([next](HttpRequest& request, const RequestContext& ctx) {
            if (has_header(request.headers, kRequestIdHeader) == false) {
                set_header(request.headers, kRequestIdHeader, generate_request_id());
            }
            return next->send(request, ctx);
        });
    };
}

Interceptor ip_propagation_interceptor() {
    return [](TransportPtr next) {
        return make_transport([next](HttpRequest& request, const RequestContext& ctx) {
            const std::string address = strip_port(ctx.call.remote_address());
            if (address.empty() == false) {
                const auto existing = get_header(request.headers, kForwardedForHeader);
                const bool has_list = existing.has_value() && (existing->empty() == false);
                if (has_list == false) {
                    set_header(request.headers, kForwardedForHeader, address);
                } else if (list_contains(*existing, address) == false) {
                    set_header(request.headers, kForwardedForHeader, *existing + ", " + address);
                }
            }
            return next->send(request, ctx);
        });
    };
}

Interceptor app_token_interceptor(std::optional<std::string> token) {
    std::string app_token;
    if (token.has_value()) {
        app_token = std::move(*token);
    } else if (const char* env = std::getenv("X_AUTH_APP_TOKEN"); env != nullptr) {
        app_token = env;
    }

    return [app_token](TransportPtr next) {
        return make_transport([next, app_token](HttpRequest& request, const RequestContext& ctx) {
            if (app_token.empty() == false) {
                set_header(request.headers, kAppTokenHeader, app_token);
            }
            return next->send(request, ctx);
        });
    };
}

Interceptor auth_interceptor() {
    return [](TransportPtr next) {
        return make_transport([next](HttpRequest& request, const RequestContext& ctx) {
            const bool requires_auth = (ctx.policy != nullptr) && ctx.policy->require_auth;
            if (requires_auth) {
                const auto& credential = ctx.call.incoming_authorization();
                if (credential.empty() == false) {
                    set_header(request.headers, kAuthorizationHeader, credential);
                } else {
                    get_logger().debug("auth required but no inbound credential", {
                        {"method", to_string(request.method)},
                        {"path", ctx.target.path}
                    });
                }
            }
            return next->send(request, ctx);
        });
    };
}

}  // namespace sturdy
