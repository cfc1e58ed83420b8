#include "ResponseCache.h"

namespace cache {

ResponseCache::ResponseCache(Clock clock) : clock_(std::move(clock)) {
    if (!clock_) clock_ = [] { return std::chrono::steady_clock::now(); };
}

std::optional<CacheEntry> ResponseCache::get(const std::string& key) {
    auto now = clock_();
    std::lock_guard lock(mu_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    if (it->second.expires_at <= now) {
        entries_.erase(it);
        return std::nullopt;
    }
    return it->second.entry;
}

void ResponseCache::set(const std::string& key, CacheEntry entry, std::chrono::seconds ttl) {
    if (ttl.count() <= 0) return;
    auto now = clock_();
    std::lock_guard lock(mu_);
    if (++writes_since_purge_ >= PURGE_EVERY) {
        writes_since_purge_ = 0;
        purge_expired_locked(now);
    }
    entries_[key] = Slot{std::move(entry), now + ttl};
}

std::size_t ResponseCache::invalidate(const std::string& prefix) {
    std::lock_guard lock(mu_);
    std::size_t removed = 0;
    auto it = entries_.lower_bound(prefix);
    while (it != entries_.end() && it->first.compare(0, prefix.size(), prefix) == 0) {
        it = entries_.erase(it);
        ++removed;
    }
    return removed;
}

void ResponseCache::clear() {
    std::lock_guard lock(mu_);
    entries_.clear();
}

std::size_t ResponseCache::size() const {
    std::lock_guard lock(mu_);
    return entries_.size();
}

void ResponseCache::purge_expired_locked(std::chrono::steady_clock::time_point now) {
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.expires_at <= now) it = entries_.erase(it);
        else ++it;
    }
}

}
