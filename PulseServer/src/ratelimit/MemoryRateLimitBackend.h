#pragma once

#include "RateLimitBackend.h"
#include <mutex>
#include <unordered_map>

namespace ratelimit {

// Per-process table. Completes synchronously, before async_hit returns.
class MemoryRateLimitBackend : public RateLimitBackend {
public:
    const char* name() const override { return "memory"; }
    void async_hit(const std::string& client_key, int64_t now_ms, const Policy& policy, DecisionCb cb) override;
    Decision hit(const std::string& client_key, int64_t now_ms, const Policy& policy);
    std::size_t tracked_clients() const;

private:
    struct Bucket {
        int64_t window = 0;
        int64_t count = 0;
    };
    void sweep_locked(int64_t current_window);

    mutable std::mutex mu_;
    std::unordered_map<std::string, Bucket> buckets_;
    uint64_t hits_since_sweep_ = 0;
    static constexpr uint64_t SWEEP_EVERY = 1024;
};

}
