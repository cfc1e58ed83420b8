#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include "CacheHeaders.h"
#include "ResponseCache.h"
#include "../net/Router.h"

namespace cache {

struct CacheOptions {
    CacheStrategy strategy = CacheStrategy::PublicList;
    std::chrono::seconds ttl{120};

    static CacheOptions public_list() { return {CacheStrategy::PublicList, std::chrono::seconds(120)}; }
    static CacheOptions posts() { return {CacheStrategy::Posts, std::chrono::seconds(60)}; }
    static CacheOptions jobs() { return {CacheStrategy::Jobs, std::chrono::seconds(180)}; }
    static CacheOptions profile() { return {CacheStrategy::PublicProfile, std::chrono::seconds(600)}; }
    static CacheOptions user_feed() { return {CacheStrategy::PrivateDynamic, std::chrono::seconds(30)}; }
};

// Caches successful JSON responses of wrapped handlers and answers
// conditional requests. Writers must call invalidate() for every path
// prefix their change affects.
class ApiResponseCache {
public:
    // Caller identity for user-scoped strategies; nullopt means anonymous.
    using IdentityFn = std::function<std::optional<std::string>(const Request&)>;

    ApiResponseCache(ResponseCache& store, bool enabled, IdentityFn identity);

    Router::AsyncHandler wrap(CacheOptions opts, Router::AsyncHandler inner);
    std::size_t invalidate(const std::string& path_prefix);

    std::string key_for(const Request& req, CacheStrategy strategy) const;
    static void apply_strategy_headers(Response& res, CacheStrategy strategy);
    bool enabled() const { return enabled_; }

private:
    ResponseCache& store_;
    bool enabled_;
    IdentityFn identity_;
};

}
