#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <unordered_map>

namespace sturdy {

// ─────────────────────────────────────────────────────────────────────────────
// Case-Insensitive Header Lookup
// ─────────────────────────────────────────────────────────────────────────────
// HTTP header names are case-insensitive per RFC 7230. Keys are stored as
// given; lookups, replacement and removal ignore case.

using HeaderMap = std::unordered_map<std::string, std::string>;

[[nodiscard]] inline bool iequals(std::string_view lhs, std::string_view rhs) {
    return lhs.size() == rhs.size() &&
           std::ranges::equal(lhs, rhs, [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) ==
                      std::tolower(static_cast<unsigned char>(b));
           });
}

/// Find a header by name (case-insensitive).
inline HeaderMap::const_iterator find_header(const HeaderMap& headers, std::string_view name) {
    return std::ranges::find_if(headers, [&name](const auto& pair) {
        return iequals(pair.first, name);
    });
}

inline HeaderMap::iterator find_header(HeaderMap& headers, std::string_view name) {
    return std::ranges::find_if(headers, [&name](const auto& pair) {
        return iequals(pair.first, name);
    });
}

/// Get header value by name (case-insensitive).
[[nodiscard]] inline std::optional<std::string> get_header(const HeaderMap& headers, std::string_view name) {
    const auto it = find_header(headers, name);
    const bool found = (it != headers.end());
    if (found) {
        return it->second;
    }
    return std::nullopt;
}

/// True when the header exists and has a non-empty value.
[[nodiscard]] inline bool has_header(const HeaderMap& headers, std::string_view name) {
    const auto it = find_header(headers, name);
    return (it != headers.end()) && (it->second.empty() == false);
}

/// Set a header, replacing any existing entry regardless of its casing.
inline void set_header(HeaderMap& headers, std::string_view name, std::string value) {
    const auto it = find_header(headers, name);
    if (it != headers.end()) {
        it->second = std::move(value);
        return;
    }
    headers.emplace(std::string(name), std::move(value));
}

/// Remove a header (case-insensitive). Returns true if something was removed.
inline bool erase_header(HeaderMap& headers, std::string_view name) {
    const auto it = find_header(headers, name);
    if (it == headers.end()) {
        return false;
    }
    headers.erase(it);
    return true;
}

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Method
// ─────────────────────────────────────────────────────────────────────────────

enum class HttpMethod {
    Get,
    Post,
    Put,
    Patch,
    Delete,
    Head
};

[[nodiscard]] inline std::string to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:    return "GET";
        case HttpMethod::Post:   return "POST";
        case HttpMethod::Put:    return "PUT";
        case HttpMethod::Patch:  return "PATCH";
        case HttpMethod::Delete: return "DELETE";
        case HttpMethod::Head:   return "HEAD";
    }
    return "UNKNOWN";
}

/// Parse a method name (case-insensitive). nullopt for unsupported verbs.
[[nodiscard]] std::optional<HttpMethod> parse_method(std::string_view name);

// ─────────────────────────────────────────────────────────────────────────────
// URL Components
// ─────────────────────────────────────────────────────────────────────────────
// Parsed target URL. Routing decisions (policy resolution, metrics labels)
// use `path` only; the query string never participates.

struct UrlComponents {
    std::string scheme;   // "http" or "https"
    std::string host;     // "api.example.com"
    std::uint16_t port{0};
    std::string path;     // always starts with '/'
    std::string query;    // "?foo=bar" or empty

    [[nodiscard]] bool is_secure() const {
        return scheme == "https";
    }

    /// Host header form: port omitted when it is the scheme default.
    [[nodiscard]] std::string authority() const {
        const bool default_port = (is_secure() && port == 443) || (!is_secure() && port == 80);
        if (default_port) {
            return host;
        }
        return host + ":" + std::to_string(port);
    }

    [[nodiscard]] std::string path_with_query() const {
        return path + query;
    }
};

// Parse an absolute http(s) URL using ada-url. Returns nullopt on invalid URL
// or on a non-http scheme.
[[nodiscard]] std::optional<UrlComponents> parse_url(const std::string& url);

/// Join a base URL (trailing slashes trimmed) and a path.
[[nodiscard]] std::string join_url(std::string_view base_url, std::string_view path);

}  // namespace sturdy
