#include <boost/asio.hpp>
#include <iostream>
#include <memory>
#include <string>
#include "api/Routes.h"
#include "cache/ApiCache.h"
#include "cache/RedisClient.h"
#include "cache/RedisSubscriber.h"
#include "cache/ResponseCache.h"
#include "config/Config.h"
#include "db/ReadWriteRouter.h"
#include "net/HttpServer.h"
#include "net/Router.h"
#include "observability/Logging.h"
#include "ratelimit/RateLimiter.h"
#include "realtime/EventBus.h"
#include "realtime/Events.h"
#include "realtime/NotificationHub.h"

using config::Config;
using observability::log_info;
using observability::log_warn;
using observability::set_log_level;

int main(int argc, char** argv) {
    auto cfg = Config::from_env(argc, argv);
    int lvl = 2;
    switch (cfg.log_level) {
        case Config::LogLevel::DEBUG: lvl = 1; break;
        case Config::LogLevel::INFO: lvl = 2; break;
        case Config::LogLevel::WARN: lvl = 3; break;
        case Config::LogLevel::ERROR: lvl = 4; break;
    }
    set_log_level(lvl);

    if (cfg.jwt_secret.empty()) {
        std::cerr << "fatal: JWT_SECRET environment variable is not set\n";
        return 2;
    }

    try {
        boost::asio::io_context io;
        auto timeout = std::chrono::milliseconds(cfg.backend_timeout_ms);

        std::shared_ptr<RedisClient> redis;
        if (!cfg.redis_host.empty()) {
            redis = std::make_shared<RedisClient>(io, cfg.redis_host, cfg.redis_port, cfg.redis_pass, timeout);
            redis->start();
        } else {
            log_warn("redis.not_configured", {});
        }

        ratelimit::Options rl;
        rl.enabled = cfg.rate_limit_enabled;
        rl.policy.limit = cfg.rate_limit_requests;
        rl.policy.window_seconds = cfg.rate_limit_window_sec;
        rl.exempt_prefixes = cfg.rate_limit_exclude_paths;
        rl.reprobe_interval = std::chrono::seconds(cfg.rate_limit_reprobe_sec);
        auto limiter = std::make_shared<ratelimit::RateLimiter>(io, rl, redis);
        limiter->start();

        cache::ResponseCache response_cache;
        api::Services svc;
        svc.jwt_secret = cfg.jwt_secret;
        cache::ApiResponseCache api_cache(response_cache, cfg.cache_enabled, [secret = cfg.jwt_secret](const Request& req) {
            return api::caller_id(req, secret);
        });

        std::unique_ptr<db::ReadWriteRouter> rw;
        if (!cfg.database_url.empty()) {
            db::RouterOptions ro;
            ro.primary_url = cfg.database_url;
            ro.replica_url = cfg.database_url_read;
            ro.primary_workers = cfg.db_workers;
            ro.replica_workers = cfg.db_read_workers;
            rw = std::make_unique<db::ReadWriteRouter>(io, ro);
        } else {
            log_warn("db.not_configured", {});
        }

        std::shared_ptr<realtime::EventBus> bus;
        if (cfg.pubsub_enabled && redis) {
            auto sub = std::make_shared<RedisSubscriber>(io, cfg.redis_host, cfg.redis_port, cfg.redis_pass, cfg.pubsub_channel, timeout);
            bus = std::make_shared<realtime::RedisEventBus>(redis, sub, cfg.pubsub_channel, realtime::random_id(8));
        } else {
            bus = std::make_shared<realtime::LocalEventBus>();
            log_info("bus.local", {{"reason", std::string(redis ? "pubsub disabled" : "redis not configured")}});
        }
        realtime::NotificationHub hub(cfg.jwt_secret, bus);
        hub.start();

        svc.metrics_enabled = cfg.metrics_enabled;
        svc.limiter = limiter;
        svc.api_cache = &api_cache;
        svc.db = rw.get();
        svc.hub = &hub;
        pagination::PaginatorConfig jobs_cfg;
        jobs_cfg.allowed_order_fields = {"created_at", "title"};
        svc.jobs_paginator = pagination::Paginator(jobs_cfg);
        pagination::PaginatorConfig feed_cfg;
        feed_cfg.allowed_order_fields = {"created_at", "like_count"};
        svc.feed_paginator = pagination::Paginator(feed_cfg);

        Router router;
        api::register_routes(router, svc);

        HttpServer server(io, cfg.port, router, cfg.metrics_enabled, cfg.access_log, limiter, &hub,
                          std::chrono::seconds(cfg.ws_auth_timeout_sec));

        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int sig) {
            if (ec) return;
            log_info("server.shutdown", {{"signal", int64_t(sig)}});
            server.stop();
            limiter->stop();
            hub.stop();
            if (redis) redis->stop();
            io.stop();
        });

        log_info("server.start", {{"port", int64_t(cfg.port)}, {"bus", std::string(hub.bus_name())},
                                  {"cache", int64_t(cfg.cache_enabled)}, {"rate_limit", int64_t(cfg.rate_limit_enabled)}});
        server.run();
        io.run();
    } catch (const std::exception& e) {
        std::cerr << "server error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
