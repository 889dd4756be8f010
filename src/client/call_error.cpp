#include "sturdy/client/call_error.hpp"

namespace sturdy {

namespace {

constexpr std::size_t kMaxBodyInMessage = 512;

}  // namespace

std::string CallError::message() const {
    std::string out = "[HTTP] " + to_string(method) + " " + url + ": ";

    if (has_response()) {
        out += "status=" + std::to_string(status_code);
    } else {
        out += "status=none";
    }
    out += ", attempts=" + std::to_string(attempts);

    if (cause.has_value()) {
        out += ", err=";
        out += to_string(cause->code);
        if (cause->message.empty() == false) {
            out += ": " + cause->message;
        }
    }

    if (body.empty() == false) {
        out += ", body=";
        if (body.size() > kMaxBodyInMessage) {
            out.append(body, 0, kMaxBodyInMessage);
            out += "...";
        } else {
            out += body;
        }
    }
    return out;
}

CallError CallError::from_transport(
    TransportError cause,
    HttpMethod method,
    std::string url,
    std::size_t attempts
) {
    CallError error;
    error.cause = std::move(cause);
    error.attempts = attempts;
    error.method = method;
    error.url = std::move(url);
    return error;
}

CallError CallError::from_response(
    const HttpResponse& response,
    std::string body,
    HttpMethod method,
    std::string url,
    std::size_t attempts
) {
    CallError error;
    error.status_code = response.status_code;
    error.attempts = attempts;
    error.method = method;
    error.url = std::move(url);
    error.body = std::move(body);
    error.headers = response.headers;
    return error;
}

}  // namespace sturdy
