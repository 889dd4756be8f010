#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace sturdy {

// ─────────────────────────────────────────────────────────────────────────────
// Cache Backend Interface
// ─────────────────────────────────────────────────────────────────────────────
// Key/value store with per-entry TTL. Implementations must tolerate
// concurrent get/set from many calls.

class ICacheBackend {
public:
    virtual ~ICacheBackend() = default;

    [[nodiscard]] virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual void set(const std::string& key, std::string value, std::chrono::milliseconds ttl) = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// MemoryCacheBackend - in-process map with lazy expiry
// ─────────────────────────────────────────────────────────────────────────────
// Expired entries are dropped when read or on purge_expired(). The clock is
// injectable so TTL behavior can be tested without sleeping.

class MemoryCacheBackend final : public ICacheBackend {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    MemoryCacheBackend();
    explicit MemoryCacheBackend(NowFn now);

    [[nodiscard]] std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, std::string value, std::chrono::milliseconds ttl) override;

    bool erase(const std::string& key);
    void clear();

    /// Remove expired entries. Returns the number removed.
    std::size_t purge_expired();

    [[nodiscard]] std::size_t size() const;

private:
    struct Entry {
        std::string value;
        Clock::time_point expires_at;
    };

    NowFn now_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

}  // namespace sturdy
