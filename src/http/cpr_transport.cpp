#include "sturdy/http/transport.hpp"

#include "sturdy/log/logger.hpp"
#include "sturdy/policy/endpoint_policy.hpp"

#include <cpr/cpr.h>

#include <map>
#include <mutex>
#include <utility>
#include <vector>

namespace sturdy {

// ─────────────────────────────────────────────────────────────────────────────
// CprTransport Implementation
// ─────────────────────────────────────────────────────────────────────────────
// One cpr::Session per in-flight attempt, taken from an idle pool so libcurl
// can reuse keep-alive connections. Sessions are pooled per (method,
// has-body) so a body set on a previous request is never sent again.

class CprTransport final : public ITransport {
public:
    explicit CprTransport(CprTransportConfig config)
        : config_(std::move(config))
    {}

    ~CprTransport() override = default;

    [[nodiscard]] TransportResult send(HttpRequest& request, const RequestContext& ctx) override {
        if (ctx.call.is_cancelled()) {
            return tl::unexpected(TransportError::cancelled());
        }
        if (ctx.call.is_expired()) {
            return tl::unexpected(TransportError::deadline_exceeded());
        }

        const PoolKey key{request.method, request.has_body()};
        auto session = acquire(key);

        session->SetUrl(cpr::Url{request.url});
        session->SetHeader(build_headers(request.headers));
        if (request.has_body()) {
            session->SetBody(cpr::Body{*request.body});
        }
        session->SetConnectTimeout(cpr::ConnectTimeout{config_.connect_timeout});
        session->SetVerifySsl(cpr::VerifySsl{config_.verify_ssl});
        session->SetRedirect(cpr::Redirect{config_.follow_redirects});

        // Zero means "no timeout" to libcurl
        const auto remaining = ctx.call.remaining();
        session->SetTimeout(cpr::Timeout{remaining.value_or(std::chrono::milliseconds{0})});

        // Returning false from the progress callback aborts the transfer
        const CallContext call = ctx.call;
        session->SetProgressCallback(cpr::ProgressCallback{
            [call](auto, auto, auto, auto, auto) -> bool {
                return call.is_done() == false;
            }
        });

        // Stop pulling bytes one past the limit; the extra byte lets the
        // caller's BoundedBody report TooLarge with the status intact
        const std::size_t limit = (ctx.policy != nullptr) ? ctx.policy->max_response_size : 0;
        std::string received;
        bool overflowed = false;
        session->SetWriteCallback(cpr::WriteCallback{
            [&received, &overflowed, limit](auto data, auto) -> bool {
                received.append(data.data(), data.size());
                if (limit > 0 && received.size() > limit) {
                    overflowed = true;
                    return false;
                }
                return true;
            }
        });

        cpr::Response response = perform(*session, request.method);

        // Failed sessions are dropped, not pooled. Cancellation and deadline
        // take precedence over libcurl's own error code.
        if (ctx.call.is_cancelled()) {
            return tl::unexpected(TransportError::cancelled());
        }

        const bool has_error = (response.error.code != cpr::ErrorCode::OK);
        if (has_error && overflowed == false) {
            if (ctx.call.is_expired()) {
                return tl::unexpected(TransportError::deadline_exceeded());
            }
            return tl::unexpected(map_error(response.error));
        }

        // An aborted transfer leaves the connection mid-body
        if (overflowed == false) {
            release(key, std::move(session));
        }
        return convert_response(response, std::move(received));
    }

    void close_idle_connections() override {
        std::size_t released = 0;
        {
            std::lock_guard<std::mutex> lock(pool_mutex_);
            for (const auto& [key, sessions] : idle_) {
                released += sessions.size();
            }
            idle_.clear();
        }
        get_logger().info("released idle connections", {{"sessions", std::to_string(released)}});
    }

private:
    using PoolKey = std::pair<HttpMethod, bool>;
    using SessionPtr = std::shared_ptr<cpr::Session>;

    // ─────────────────────────────────────────────────────────────────────────
    // Session Pool
    // ─────────────────────────────────────────────────────────────────────────

    SessionPtr acquire(const PoolKey& key) {
        {
            std::lock_guard<std::mutex> lock(pool_mutex_);
            auto it = idle_.find(key);
            if (it != idle_.end() && it->second.empty() == false) {
                SessionPtr session = std::move(it->second.back());
                it->second.pop_back();
                return session;
            }
        }
        return std::make_shared<cpr::Session>();
    }

    void release(const PoolKey& key, SessionPtr session) {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        auto& sessions = idle_[key];
        if (sessions.size() < config_.max_idle_sessions) {
            sessions.push_back(std::move(session));
        }
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Request / Response Conversion
    // ─────────────────────────────────────────────────────────────────────────

    static cpr::Response perform(cpr::Session& session, HttpMethod method) {
        switch (method) {
            case HttpMethod::Get:    return session.Get();
            case HttpMethod::Post:   return session.Post();
            case HttpMethod::Put:    return session.Put();
            case HttpMethod::Patch:  return session.Patch();
            case HttpMethod::Delete: return session.Delete();
            case HttpMethod::Head:   return session.Head();
        }
        return session.Get();
    }

    cpr::Header build_headers(const HeaderMap& request_headers) const {
        cpr::Header cpr_headers;
        for (const auto& [name, value] : config_.default_headers) {
            if (find_header(request_headers, name) == request_headers.end()) {
                cpr_headers[name] = value;
            }
        }
        for (const auto& [name, value] : request_headers) {
            cpr_headers[name] = value;
        }
        return cpr_headers;
    }

    static HttpResponse convert_response(const cpr::Response& response, std::string body) {
        HttpResponse result;
        result.status_code = static_cast<int>(response.status_code);
        result.status_message = response.reason;

        for (const auto& [name, value] : response.header) {
            result.headers[name] = value;
        }

        const auto length = get_header(result.headers, "Content-Length");
        if (length.has_value()) {
            try {
                result.content_length = std::stoll(*length);
            } catch (const std::exception&) {
                result.content_length = std::nullopt;
            }
        }

        result.body = std::make_unique<BufferedBody>(std::move(body));
        return result;
    }

    static TransportError map_error(const cpr::Error& error) {
        const std::string& msg = error.message;
        const bool is_ssl_error =
            (msg.find("SSL") != std::string::npos) ||
            (msg.find("ssl") != std::string::npos) ||
            (msg.find("certificate") != std::string::npos) ||
            (msg.find("TLS") != std::string::npos);

        if (is_ssl_error) {
            return TransportError::ssl_error(msg);
        }

        switch (error.code) {
            case cpr::ErrorCode::OK:
                return TransportError::unknown("no error");

            case cpr::ErrorCode::OPERATION_TIMEDOUT:
                return TransportError::timeout(msg);

            case cpr::ErrorCode::SSL_CONNECT_ERROR:
                return TransportError::ssl_error(msg);

            default:
                return TransportError::connection_failed(msg);
        }
    }

    CprTransportConfig config_;

    std::mutex pool_mutex_;
    std::map<PoolKey, std::vector<SessionPtr>> idle_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Factory Function
// ─────────────────────────────────────────────────────────────────────────────

TransportPtr make_cpr_transport(CprTransportConfig config) {
    return std::make_shared<CprTransport>(std::move(config));
}

}  // namespace sturdy
