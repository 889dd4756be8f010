#include "sturdy/http/response_body.hpp"

#include <algorithm>
#include <array>
#include <cstring>

namespace sturdy {

namespace {

constexpr std::size_t kReadChunk = 16 * 1024;

}  // namespace

BodyResult<std::size_t> BufferedBody::read(char* buffer, std::size_t size) {
    const std::size_t available = data_.size() - offset_;
    const std::size_t count = std::min(size, available);
    if (count > 0) {
        std::memcpy(buffer, data_.data() + offset_, count);
        offset_ += count;
    }
    return count;
}

BoundedBody::BoundedBody(std::unique_ptr<ResponseBody> inner, std::size_t limit)
    : inner_(std::move(inner))
    , limit_(limit)
    , remaining_(limit)
{}

BodyResult<std::size_t> BoundedBody::read(char* buffer, std::size_t size) {
    if (inner_ == nullptr || size == 0) {
        return std::size_t{0};
    }

    if (remaining_ == 0) {
        // Limit reached: one extra byte decides between clean EOF and overflow
        char extra = 0;
        auto peeked = inner_->read(&extra, 1);
        if (peeked.has_value() == false) {
            return tl::unexpected(peeked.error());
        }
        if (*peeked > 0) {
            return tl::unexpected(BodyError::too_large(limit_));
        }
        return std::size_t{0};
    }

    const std::size_t wanted = std::min(size, remaining_);
    auto result = inner_->read(buffer, wanted);
    if (result.has_value()) {
        remaining_ -= *result;
    }
    return result;
}

void BoundedBody::close() noexcept {
    if (inner_ != nullptr) {
        inner_->close();
    }
}

BodyResult<std::string> read_all(ResponseBody& body) {
    std::string out;
    std::array<char, kReadChunk> chunk{};
    for (;;) {
        auto count = body.read(chunk.data(), chunk.size());
        if (count.has_value() == false) {
            return tl::unexpected(count.error());
        }
        if (*count == 0) {
            break;
        }
        out.append(chunk.data(), *count);
    }
    return out;
}

BodyResult<std::string> read_and_restore(std::unique_ptr<ResponseBody>& body) {
    if (body == nullptr) {
        body = std::make_unique<BufferedBody>();
        return std::string{};
    }

    std::string bytes;
    std::array<char, kReadChunk> chunk{};
    tl::expected<void, BodyError> status;
    for (;;) {
        auto count = body->read(chunk.data(), chunk.size());
        if (count.has_value() == false) {
            status = tl::unexpected(count.error());
            break;
        }
        if (*count == 0) {
            break;
        }
        bytes.append(chunk.data(), *count);
    }

    body->close();
    body = std::make_unique<BufferedBody>(bytes);

    if (status.has_value() == false) {
        return tl::unexpected(status.error());
    }
    return bytes;
}

}  // namespace sturdy
