#include "RedisRateLimitBackend.h"
#include "../cache/RedisClient.h"
#include "../observability/Logging.h"

namespace ratelimit {

RedisRateLimitBackend::RedisRateLimitBackend(std::shared_ptr<RedisClient> redis) : redis_(std::move(redis)) {}

std::string RedisRateLimitBackend::key_for(const std::string& client_key, int64_t window) {
    return "rl:" + client_key + ":" + std::to_string(window);
}

void RedisRateLimitBackend::async_hit(const std::string& client_key, int64_t now_ms, const Policy& policy, DecisionCb cb) {
    auto key = key_for(client_key, window_index(now_ms, policy));
    auto redis = redis_;
    redis_->async_incr(key, [redis, key, now_ms, policy, cb = std::move(cb)](boost::system::error_code ec, int64_t count) {
        if (ec) { cb(ec, Decision{}); return; }
        auto d = make_decision(count, now_ms, policy);
        if (count > policy.limit) {
            redis->async_decr(key, [key](boost::system::error_code dec_ec, int64_t) {
                if (dec_ec) observability::log_debug("ratelimit.decr_failed", {{"key", key}});
            });
        }
        if (count != 1) { cb({}, d); return; }
        redis->async_expire(key, policy.window_seconds, [key, cb, d](boost::system::error_code exp_ec, bool) {
            if (exp_ec) observability::log_warn("ratelimit.expire_failed", {{"key", key}, {"err", exp_ec.message()}});
            cb({}, d);
        });
    });
}

}
