#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace cache {

struct CacheEntry {
    std::string body;
    std::string etag;
    std::string content_type;
    int64_t stored_at = 0;   // unix seconds, for Last-Modified
};

// In-process TTL store. Entries past their deadline are never returned.
class ResponseCache {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit ResponseCache(Clock clock = nullptr);

    std::optional<CacheEntry> get(const std::string& key);
    void set(const std::string& key, CacheEntry entry, std::chrono::seconds ttl);
    // Removes every key starting with prefix; returns how many were removed.
    std::size_t invalidate(const std::string& prefix);
    void clear();
    std::size_t size() const;

private:
    struct Slot {
        CacheEntry entry;
        std::chrono::steady_clock::time_point expires_at;
    };
    void purge_expired_locked(std::chrono::steady_clock::time_point now);

    Clock clock_;
    mutable std::mutex mu_;
    std::map<std::string, Slot> entries_;
    uint64_t writes_since_purge_ = 0;
    static constexpr uint64_t PURGE_EVERY = 256;
};

}
