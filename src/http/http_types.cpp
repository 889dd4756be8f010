#include "sturdy/http/http_types.hpp"

#include <ada.h>

#include <charconv>

namespace sturdy {

std::optional<HttpMethod> parse_method(std::string_view name) {
    static constexpr HttpMethod kMethods[] = {
        HttpMethod::Get, HttpMethod::Post, HttpMethod::Put,
        HttpMethod::Patch, HttpMethod::Delete, HttpMethod::Head
    };
    for (const auto method : kMethods) {
        if (iequals(name, to_string(method))) {
            return method;
        }
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// URL Parser Implementation (using ada-url)
// ─────────────────────────────────────────────────────────────────────────────
// ada handles IDN, percent encoding, IPv6 literals, default ports and path
// normalization, so paths arriving here are already canonical.

std::optional<UrlComponents> parse_url(const std::string& url) {
    auto parsed = ada::parse<ada::url>(url);
    const bool parse_failed = (parsed.has_value() == false);
    if (parse_failed) {
        return std::nullopt;
    }

    const auto& ada_url = parsed.value();

    // ada returns "https:" - remove the colon
    std::string scheme = std::string(ada_url.get_protocol());
    const bool has_colon = (scheme.empty() == false) && (scheme.back() == ':');
    if (has_colon) {
        scheme.pop_back();
    }

    const bool is_http = (scheme == "http");
    const bool is_https = (scheme == "https");
    if ((is_http || is_https) == false) {
        return std::nullopt;
    }

    std::string host = std::string(ada_url.get_hostname());
    if (host.empty()) {
        return std::nullopt;
    }

    std::uint16_t port = is_https ? 443 : 80;
    const auto port_str = ada_url.get_port();
    if (port_str.empty() == false) {
        std::uint16_t explicit_port = 0;
        const auto* first = port_str.data();
        const auto* last = port_str.data() + port_str.size();
        const auto [ptr, ec] = std::from_chars(first, last, explicit_port);
        if (ec != std::errc{} || ptr != last) {
            return std::nullopt;
        }
        port = explicit_port;
    }

    std::string path = std::string(ada_url.get_pathname());
    if (path.empty()) {
        path = "/";
    }

    UrlComponents result;
    result.scheme = std::move(scheme);
    result.host = std::move(host);
    result.port = port;
    result.path = std::move(path);
    result.query = std::string(ada_url.get_search());
    return result;
}

std::string join_url(std::string_view base_url, std::string_view path) {
    while (base_url.empty() == false && base_url.back() == '/') {
        base_url.remove_suffix(1);
    }
    std::string result(base_url);
    const bool needs_slash = (path.empty() == false) && (path.front() != '/');
    if (needs_slash) {
        result += '/';
    }
    result += path;
    return result;
}

}  // namespace sturdy
