#pragma once

#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include "RateLimitBackend.h"
#include "MemoryRateLimitBackend.h"

class RedisClient;

namespace ratelimit {

struct Options {
    bool enabled = true;
    Policy policy;
    std::vector<std::string> exempt_prefixes{"/health", "/live", "/ready", "/metrics"};
    std::chrono::seconds reprobe_interval{30};
};

struct Stats {
    uint64_t total_requests = 0;
    uint64_t rate_limited = 0;
    uint64_t redis_hits = 0;
    uint64_t memory_hits = 0;
    std::string backend;
};

// Front door for every non-exempt request. Prefers the shared Redis store and
// falls back to the per-process table whenever Redis misbehaves; check()
// always produces a decision.
class RateLimiter : public std::enable_shared_from_this<RateLimiter> {
public:
    using Clock = std::function<int64_t()>;

    RateLimiter(boost::asio::io_context& ioc, Options opts, std::shared_ptr<RedisClient> redis = nullptr, Clock clock = nullptr);

    // Probes Redis and schedules re-probes while degraded.
    void start();
    void stop();

    void check(const std::string& client_key, std::function<void(Decision)> cb);

    bool enabled() const { return opts_.enabled; }
    bool is_exempt(std::string_view path) const;
    const Policy& policy() const { return opts_.policy; }
    const char* active_backend() const;
    Stats stats() const;
    std::string stats_json() const;

private:
    void check_memory(const std::string& client_key, int64_t now_ms, std::function<void(Decision)> cb);
    void count(const Decision& d);
    void degrade(const boost::system::error_code& ec);
    void probe();
    void schedule_reprobe();

    boost::asio::io_context& ioc_;
    Options opts_;
    std::shared_ptr<RedisClient> redis_;
    Clock clock_;
    std::shared_ptr<MemoryRateLimitBackend> memory_;
    std::shared_ptr<RateLimitBackend> redis_backend_;
    std::atomic<bool> use_redis_{false};
    std::atomic<bool> probing_{false};
    std::atomic<bool> stopped_{false};
    boost::asio::steady_timer reprobe_timer_;

    std::atomic<uint64_t> total_{0};
    std::atomic<uint64_t> limited_{0};
    std::atomic<uint64_t> redis_hits_{0};
    std::atomic<uint64_t> memory_hits_{0};
};

// First X-Forwarded-For entry, then X-Real-IP, then the peer address.
std::string client_key_from(std::string_view forwarded_for, std::string_view real_ip, std::string_view peer);

std::string rejection_body(const Decision& d);

}
