#include "RateLimiter.h"
#include "RedisRateLimitBackend.h"
#include "../cache/RedisClient.h"
#include "../observability/Logging.h"
#include "../observability/Metrics.h"
#include <sstream>

namespace ratelimit {

namespace {

int64_t system_now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

}

RateLimiter::RateLimiter(boost::asio::io_context& ioc, Options opts, std::shared_ptr<RedisClient> redis, Clock clock)
    : ioc_(ioc), opts_(std::move(opts)), redis_(std::move(redis)), clock_(std::move(clock)),
      memory_(std::make_shared<MemoryRateLimitBackend>()), reprobe_timer_(ioc) {
    if (!clock_) clock_ = system_now_ms;
    if (redis_) redis_backend_ = std::make_shared<RedisRateLimitBackend>(redis_);
}

void RateLimiter::start() {
    if (!opts_.enabled) return;
    if (!redis_) {
        observability::log_info("ratelimit.backend", {{"backend", std::string("memory")}, {"reason", std::string("redis not configured")}});
        return;
    }
    probe();
}

void RateLimiter::stop() {
    stopped_ = true;
    boost::asio::post(ioc_, [self = shared_from_this()]() { self->reprobe_timer_.cancel(); });
}

const char* RateLimiter::active_backend() const {
    return use_redis_.load() ? "redis" : "memory";
}

bool RateLimiter::is_exempt(std::string_view path) const {
    for (const auto& p : opts_.exempt_prefixes) {
        if (!p.empty() && path.compare(0, p.size(), p) == 0) return true;
    }
    return false;
}

void RateLimiter::count(const Decision& d) {
    total_ += 1;
    observability::Metrics::instance().add("ratelimit_requests_total");
    if (!d.allowed) {
        limited_ += 1;
        observability::Metrics::instance().add("ratelimit_rejected_total");
    }
}

void RateLimiter::check_memory(const std::string& client_key, int64_t now_ms, std::function<void(Decision)> cb) {
    auto d = memory_->hit(client_key, now_ms, opts_.policy);
    memory_hits_ += 1;
    count(d);
    cb(d);
}

void RateLimiter::check(const std::string& client_key, std::function<void(Decision)> cb) {
    int64_t now_ms = clock_();
    if (!use_redis_.load() || !redis_backend_) {
        check_memory(client_key, now_ms, std::move(cb));
        return;
    }
    auto self = shared_from_this();
    redis_backend_->async_hit(client_key, now_ms, opts_.policy, [self, client_key, now_ms, cb = std::move(cb)](boost::system::error_code ec, Decision d) mutable {
        if (ec) {
            self->degrade(ec);
            self->check_memory(client_key, now_ms, std::move(cb));
            return;
        }
        self->redis_hits_ += 1;
        self->count(d);
        cb(d);
    });
}

void RateLimiter::degrade(const boost::system::error_code& ec) {
    if (!use_redis_.exchange(false)) return;
    observability::log_warn("ratelimit.degraded", {{"backend", std::string("memory")}, {"err", ec.message()},
                                                   {"reprobe_sec", int64_t(opts_.reprobe_interval.count())}});
    schedule_reprobe();
}

void RateLimiter::probe() {
    if (stopped_.load() || probing_.exchange(true)) return;
    auto self = shared_from_this();
    redis_->async_ping([self](boost::system::error_code ec) {
        self->probing_ = false;
        if (ec) {
            observability::log_warn("ratelimit.redis_unavailable", {{"host", self->redis_->host()}, {"err", ec.message()}});
            self->schedule_reprobe();
            return;
        }
        if (!self->use_redis_.exchange(true)) {
            observability::log_info("ratelimit.backend", {{"backend", std::string("redis")}, {"host", self->redis_->host()}});
        }
    });
}

void RateLimiter::schedule_reprobe() {
    if (stopped_.load()) return;
    auto self = shared_from_this();
    boost::asio::post(ioc_, [self]() {
        self->reprobe_timer_.expires_after(self->opts_.reprobe_interval);
        self->reprobe_timer_.async_wait([self](const boost::system::error_code& ec) {
            if (ec || self->use_redis_.load()) return;
            self->probe();
        });
    });
}

Stats RateLimiter::stats() const {
    Stats s;
    s.total_requests = total_.load();
    s.rate_limited = limited_.load();
    s.redis_hits = redis_hits_.load();
    s.memory_hits = memory_hits_.load();
    s.backend = active_backend();
    return s;
}

std::string RateLimiter::stats_json() const {
    auto s = stats();
    std::ostringstream ss;
    ss << "{\"enabled\":" << (opts_.enabled ? "true" : "false")
       << ",\"total_requests\":" << s.total_requests
       << ",\"rate_limited\":" << s.rate_limited
       << ",\"redis_hits\":" << s.redis_hits
       << ",\"memory_hits\":" << s.memory_hits
       << ",\"backend\":\"" << s.backend << "\""
       << ",\"limit\":\"" << opts_.policy.limit << " requests per " << opts_.policy.window_seconds << "s\"}";
    return ss.str();
}

std::string client_key_from(std::string_view forwarded_for, std::string_view real_ip, std::string_view peer) {
    if (!forwarded_for.empty()) {
        auto first = trim(forwarded_for.substr(0, forwarded_for.find(',')));
        if (!first.empty()) return std::string(first);
    }
    auto rip = trim(real_ip);
    if (!rip.empty()) return std::string(rip);
    if (!peer.empty()) return std::string(peer);
    return "unknown";
}

std::string rejection_body(const Decision& d) {
    std::ostringstream ss;
    ss << "{\"detail\":\"Too many requests. Please try again later.\",\"limit\":" << d.limit
       << ",\"window\":" << d.window_seconds << "}";
    return ss.str();
}

}
