#include "sturdy/cache/cache_backend.hpp"

#include <stdexcept>

namespace sturdy {

MemoryCacheBackend::MemoryCacheBackend()
    : now_([] { return Clock::now(); })
{}

MemoryCacheBackend::MemoryCacheBackend(NowFn now)
    : now_(std::move(now))
{
    if (now_ == nullptr) {
        throw std::invalid_argument("MemoryCacheBackend: clock cannot be null");
    }
}

std::optional<std::string> MemoryCacheBackend::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    const bool expired = (now_() >= it->second.expires_at);
    if (expired) {
        entries_.erase(it);
        return std::nullopt;
    }
    return it->second.value;
}

void MemoryCacheBackend::set(const std::string& key, std::string value, std::chrono::milliseconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ttl <= std::chrono::milliseconds::zero()) {
        entries_.erase(key);
        return;
    }
    entries_[key] = Entry{std::move(value), now_() + ttl};
}

bool MemoryCacheBackend::erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.erase(key) > 0;
}

void MemoryCacheBackend::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

std::size_t MemoryCacheBackend::purge_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = now_();
    return std::erase_if(entries_, [now](const auto& pair) {
        return now >= pair.second.expires_at;
    });
}

std::size_t MemoryCacheBackend::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace sturdy
