#include "MemoryRateLimitBackend.h"

namespace ratelimit {

int64_t window_index(int64_t now_ms, const Policy& policy) {
    int64_t w = int64_t(policy.window_seconds) * 1000;
    if (w <= 0) return 0;
    return now_ms / w;
}

Decision make_decision(int64_t count, int64_t now_ms, const Policy& policy) {
    Decision d;
    d.count = count;
    d.limit = policy.limit;
    d.window_seconds = policy.window_seconds;
    d.allowed = count <= policy.limit;
    if (!d.allowed) {
        int64_t w = int64_t(policy.window_seconds) * 1000;
        int64_t window_end = (window_index(now_ms, policy) + 1) * w;
        int64_t remaining_ms = window_end - now_ms;
        int64_t secs = (remaining_ms + 999) / 1000;
        if (secs < 1) secs = 1;
        if (secs > policy.window_seconds) secs = policy.window_seconds;
        d.retry_after = static_cast<int>(secs);
    }
    return d;
}

Decision MemoryRateLimitBackend::hit(const std::string& client_key, int64_t now_ms, const Policy& policy) {
    int64_t idx = window_index(now_ms, policy);
    std::lock_guard lock(mu_);
    if (++hits_since_sweep_ >= SWEEP_EVERY) {
        hits_since_sweep_ = 0;
        sweep_locked(idx);
    }
    auto& b = buckets_[client_key];
    if (b.window != idx) {
        b.window = idx;
        b.count = 0;
    }
    if (b.count >= policy.limit) return make_decision(b.count + 1, now_ms, policy);
    b.count += 1;
    return make_decision(b.count, now_ms, policy);
}

void MemoryRateLimitBackend::async_hit(const std::string& client_key, int64_t now_ms, const Policy& policy, DecisionCb cb) {
    auto d = hit(client_key, now_ms, policy);
    if (cb) cb({}, d);
}

std::size_t MemoryRateLimitBackend::tracked_clients() const {
    std::lock_guard lock(mu_);
    return buckets_.size();
}

void MemoryRateLimitBackend::sweep_locked(int64_t current_window) {
    for (auto it = buckets_.begin(); it != buckets_.end();) {
        if (it->second.window < current_window) it = buckets_.erase(it);
        else ++it;
    }
}

}
