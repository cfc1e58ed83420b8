#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <boost/asio.hpp>
#include "ratelimit/RateLimiter.h"
#include "ratelimit/MemoryRateLimitBackend.h"

using namespace ratelimit;

static Decision hit(RateLimiter& rl, const std::string& key) {
    Decision out;
    bool called = false;
    rl.check(key, [&](Decision d) { out = d; called = true; });
    if (!called) { std::cerr << "memory check did not complete synchronously\n"; std::exit(1); }
    return out;
}

int main() {
    boost::asio::io_context io;
    // 15s into window 1000 of a 60s policy
    int64_t now = 60000LL * 1000 + 15000;
    Options opts;
    opts.policy.limit = 5;
    opts.policy.window_seconds = 60;
    auto rl = std::make_shared<RateLimiter>(io, opts, nullptr, [&now] { return now; });
    rl->start();

    for (int i = 1; i <= 5; ++i) {
        auto d = hit(*rl, "10.0.0.1");
        if (!d.allowed || d.count != i) { std::cerr << "request " << i << " should pass\n"; return 1; }
    }
    auto rejected = hit(*rl, "10.0.0.1");
    if (rejected.allowed) { std::cerr << "sixth request should be rejected\n"; return 1; }
    if (rejected.retry_after != 45) { std::cerr << "retry_after=" << rejected.retry_after << " expected 45\n"; return 1; }
    if (rejected.limit != 5 || rejected.window_seconds != 60 || rejected.count != 6) { std::cerr << "rejection fields wrong\n"; return 1; }

    // rejected attempts do not inflate the stored count
    for (int i = 0; i < 10; ++i) hit(*rl, "10.0.0.1");
    if (hit(*rl, "10.0.0.1").count != 6) { std::cerr << "rejections were counted\n"; return 1; }

    if (!hit(*rl, "10.0.0.2").allowed) { std::cerr << "other client should be unaffected\n"; return 1; }

    now += 45000;
    auto fresh = hit(*rl, "10.0.0.1");
    if (!fresh.allowed || fresh.count != 1) { std::cerr << "new window should reset the counter\n"; return 1; }

    auto st = rl->stats();
    if (st.total_requests != 19 || st.rate_limited != 12 || st.memory_hits != 19 || st.redis_hits != 0) {
        std::cerr << "stats mismatch total=" << st.total_requests << " limited=" << st.rate_limited << "\n"; return 1;
    }
    if (st.backend != "memory" || std::string(rl->active_backend()) != "memory") { std::cerr << "backend should be memory\n"; return 1; }
    auto js = rl->stats_json();
    if (js.find("\"limit\":\"5 requests per 60s\"") == std::string::npos || js.find("\"rate_limited\":12") == std::string::npos) {
        std::cerr << "stats_json mismatch: " << js << "\n"; return 1;
    }

    if (!rl->is_exempt("/health") || !rl->is_exempt("/health/db") || !rl->is_exempt("/metrics")) { std::cerr << "exempt paths not exempt\n"; return 1; }
    if (!rl->is_exempt("/healthz") || !rl->is_exempt("/metrics/raw")) { std::cerr << "exempt entries are plain prefixes\n"; return 1; }
    if (rl->is_exempt("/api/feed") || rl->is_exempt("/") || rl->is_exempt("/heal")) { std::cerr << "non-exempt path exempted\n"; return 1; }

    if (client_key_from("203.0.113.7, 10.0.0.1", "198.51.100.2", "127.0.0.1") != "203.0.113.7") { std::cerr << "XFF first entry expected\n"; return 1; }
    if (client_key_from(" , 10.0.0.1", "198.51.100.2", "127.0.0.1") != "198.51.100.2") { std::cerr << "blank XFF should fall through\n"; return 1; }
    if (client_key_from("", "", "127.0.0.1") != "127.0.0.1") { std::cerr << "peer fallback expected\n"; return 1; }
    if (client_key_from("", "", "") != "unknown") { std::cerr << "unknown fallback expected\n"; return 1; }

    if (rejection_body(rejected) != "{\"detail\":\"Too many requests. Please try again later.\",\"limit\":5,\"window\":60}") {
        std::cerr << "rejection body mismatch: " << rejection_body(rejected) << "\n"; return 1;
    }

    // window arithmetic shared by every backend
    Policy p{3, 10};
    if (make_decision(4, 20000, p).retry_after != 10) { std::cerr << "window start should wait a full window\n"; return 1; }
    if (make_decision(4, 29999, p).retry_after != 1) { std::cerr << "last millisecond should wait 1s\n"; return 1; }
    if (make_decision(3, 29999, p).retry_after != 0) { std::cerr << "allowed decisions carry no retry_after\n"; return 1; }
    if (window_index(29999, p) != 2 || window_index(30000, p) != 3) { std::cerr << "window_index mismatch\n"; return 1; }

    MemoryRateLimitBackend mem;
    mem.hit("a", 0, p);
    mem.hit("b", 0, p);
    if (mem.tracked_clients() != 2) { std::cerr << "tracked_clients mismatch\n"; return 1; }

    Options off = opts;
    off.enabled = false;
    auto disabled = std::make_shared<RateLimiter>(io, off);
    if (disabled->enabled()) { std::cerr << "limiter should be disabled\n"; return 1; }
    if (disabled->stats_json().find("\"enabled\":false") == std::string::npos) { std::cerr << "disabled stats mismatch\n"; return 1; }

    rl->stop();
    io.run();
    std::cout << "rate_limiter_unit ok\n";
    return 0;
}
