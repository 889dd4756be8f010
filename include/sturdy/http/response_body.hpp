#ifndef STURDY_HTTP_RESPONSE_BODY_HPP
#define STURDY_HTTP_RESPONSE_BODY_HPP

#include <tl/expected.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace sturdy {

// ─────────────────────────────────────────────────────────────────────────────
// Body Errors
// ─────────────────────────────────────────────────────────────────────────────

struct BodyError {
    enum class Code {
        ReadFailed,   // Underlying stream reported an I/O error
        TooLarge,     // Bounded reader limit exceeded
        Closed        // Read after close on a one-shot stream
    };

    Code code;
    std::string message;

    static BodyError read_failed(std::string msg) {
        return {Code::ReadFailed, std::move(msg)};
    }
    static BodyError too_large(std::size_t limit) {
        return {Code::TooLarge, "response body exceeds " + std::to_string(limit) + " bytes"};
    }
    static BodyError closed() {
        return {Code::Closed, "read on closed body"};
    }
};

template <typename T>
using BodyResult = tl::expected<T, BodyError>;

// ─────────────────────────────────────────────────────────────────────────────
// ResponseBody - pull-based body stream
// ─────────────────────────────────────────────────────────────────────────────
// A transport hands out a body that may be backed by a network resource.
// Whoever decides not to pass a response on (retry executor, cache,
// fallback) must close() it. After materialization the body is always a
// BufferedBody, which can be rewound and read again.

class ResponseBody {
public:
    virtual ~ResponseBody() = default;

    /// Read up to `size` bytes into `buffer`. Returns 0 at end of stream.
    [[nodiscard]] virtual BodyResult<std::size_t> read(char* buffer, std::size_t size) = 0;

    /// Release the underlying resource. Idempotent.
    virtual void close() noexcept = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// BufferedBody - in-memory, re-readable
// ─────────────────────────────────────────────────────────────────────────────

class BufferedBody final : public ResponseBody {
public:
    BufferedBody() = default;
    explicit BufferedBody(std::string data)
        : data_(std::move(data))
    {}

    [[nodiscard]] BodyResult<std::size_t> read(char* buffer, std::size_t size) override;

    /// Closing a buffer only rewinds it; the bytes stay readable.
    void close() noexcept override { offset_ = 0; }

    void rewind() noexcept { offset_ = 0; }

    [[nodiscard]] const std::string& data() const noexcept { return data_; }
    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }

private:
    std::string data_;
    std::size_t offset_{0};
};

// ─────────────────────────────────────────────────────────────────────────────
// BoundedBody - caps how many bytes can be pulled from an inner stream
// ─────────────────────────────────────────────────────────────────────────────
// Reads up to `limit` bytes; the first read that would go past the limit
// fails with BodyError::TooLarge instead of buffering more.

class BoundedBody final : public ResponseBody {
public:
    BoundedBody(std::unique_ptr<ResponseBody> inner, std::size_t limit);

    [[nodiscard]] BodyResult<std::size_t> read(char* buffer, std::size_t size) override;
    void close() noexcept override;

    [[nodiscard]] std::size_t limit() const noexcept { return limit_; }

private:
    std::unique_ptr<ResponseBody> inner_;
    std::size_t limit_;
    std::size_t remaining_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────────────────────────────────────

/// Drain a stream to the end. On failure the bytes read so far are lost.
[[nodiscard]] BodyResult<std::string> read_all(ResponseBody& body);

/// Drain `body`, close it, and replace it with a BufferedBody holding the
/// bytes read (including the partial prefix when reading failed). A null
/// body becomes an empty BufferedBody.
[[nodiscard]] BodyResult<std::string> read_and_restore(std::unique_ptr<ResponseBody>& body);

}  // namespace sturdy

#endif  // STURDY_HTTP_RESPONSE_BODY_HPP
