#pragma once

#include <boost/system/error_code.hpp>
#include <cstdint>
#include <functional>
#include <string>

namespace ratelimit {

struct Policy {
    int limit = 100;
    int window_seconds = 60;
};

struct Decision {
    bool allowed = true;
    int64_t count = 0;       // attempts seen in the current window, rejected one included
    int limit = 0;
    int window_seconds = 0;
    int retry_after = 0;     // seconds until the window resets, only set when rejected
};

using DecisionCb = std::function<void(boost::system::error_code, Decision)>;

// Fixed-window counter keyed by client. All backends share the window
// arithmetic below so that they reach identical decisions.
class RateLimitBackend {
public:
    virtual ~RateLimitBackend() = default;
    virtual const char* name() const = 0;
    virtual void async_hit(const std::string& client_key, int64_t now_ms, const Policy& policy, DecisionCb cb) = 0;
};

int64_t window_index(int64_t now_ms, const Policy& policy);
Decision make_decision(int64_t count, int64_t now_ms, const Policy& policy);

}
