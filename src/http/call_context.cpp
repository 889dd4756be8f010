#include "sturdy/http/call_context.hpp"

#include <condition_variable>
#include <mutex>

namespace sturdy {

CallContext CallContext::with_timeout(std::chrono::milliseconds timeout) const {
    return with_deadline(Clock::now() + timeout);
}

CallContext CallContext::with_deadline(TimePoint deadline) const {
    CallContext copy = *this;
    const bool narrows = (deadline_.has_value() == false) || (deadline < *deadline_);
    if (narrows) {
        copy.deadline_ = deadline;
    }
    return copy;
}

CallContext CallContext::with_cancellation(std::stop_token token) const {
    CallContext copy = *this;
    copy.stop_token_ = std::move(token);
    return copy;
}

CallContext CallContext::with_incoming_authorization(std::string token) const {
    CallContext copy = *this;
    copy.incoming_authorization_ = std::move(token);
    return copy;
}

CallContext CallContext::with_remote_address(std::string address) const {
    CallContext copy = *this;
    copy.remote_address_ = std::move(address);
    return copy;
}

bool CallContext::is_cancelled() const noexcept {
    return stop_token_.stop_requested();
}

bool CallContext::is_expired() const noexcept {
    return deadline_.has_value() && Clock::now() >= *deadline_;
}

std::optional<std::chrono::milliseconds> CallContext::remaining() const {
    if (deadline_.has_value() == false) {
        return std::nullopt;
    }
    const auto now = Clock::now();
    if (now >= *deadline_) {
        return std::chrono::milliseconds{0};
    }
    return std::chrono::ceil<std::chrono::milliseconds>(*deadline_ - now);
}

bool CallContext::sleep_for(std::chrono::milliseconds duration) const {
    if (is_done()) {
        return false;
    }
    if (duration <= std::chrono::milliseconds::zero()) {
        return true;
    }

    const auto wake_at = Clock::now() + duration;
    const bool deadline_first = deadline_.has_value() && (*deadline_ < wake_at);
    const auto until = deadline_first ? *deadline_ : wake_at;

    // Nothing ever notifies this variable; it only wakes on timeout or stop
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    const bool stopped = cv.wait_until(lock, stop_token_, until, [this]() {
        return stop_token_.stop_requested();
    });

    if (stopped) {
        return false;
    }
    return deadline_first == false;
}

}  // namespace sturdy
