#pragma once

#include <memory>
#include <optional>
#include <string>
#include "../net/Router.h"
#include "../pagination/Paginator.h"

namespace cache { class ApiResponseCache; }
namespace db { class ReadWriteRouter; }
namespace ratelimit { class RateLimiter; }
namespace realtime { class NotificationHub; }

namespace api {

// Services the HTTP endpoints talk to. Owned by main; db may be null when no
// DATABASE_URL is configured.
struct Services {
    std::string jwt_secret;
    bool metrics_enabled = true;
    std::shared_ptr<ratelimit::RateLimiter> limiter;
    cache::ApiResponseCache* api_cache = nullptr;
    db::ReadWriteRouter* db = nullptr;
    realtime::NotificationHub* hub = nullptr;
    pagination::Paginator jobs_paginator;
    pagination::Paginator feed_paginator;
};

// Caller's user id from a valid bearer token.
std::optional<std::string> caller_id(const Request& req, const std::string& jwt_secret);

void register_routes(Router& router, Services& svc);

}
