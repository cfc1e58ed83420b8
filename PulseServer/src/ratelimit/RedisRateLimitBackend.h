#pragma once

#include "RateLimitBackend.h"
#include <memory>

class RedisClient;

namespace ratelimit {

// INCR rl:<client>:<window> with a window-long TTL. Over-limit increments are
// undone so that the stored count matches the memory backend.
class RedisRateLimitBackend : public RateLimitBackend {
public:
    explicit RedisRateLimitBackend(std::shared_ptr<RedisClient> redis);
    const char* name() const override { return "redis"; }
    void async_hit(const std::string& client_key, int64_t now_ms, const Policy& policy, DecisionCb cb) override;

    static std::string key_for(const std::string& client_key, int64_t window);

private:
    std::shared_ptr<RedisClient> redis_;
};

}
