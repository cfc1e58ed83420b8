#include "Routes.h"
#include "../auth/Jwt.h"
#include "../cache/ApiCache.h"
#include "../db/ReadWriteRouter.h"
#include "../net/HttpUtil.h"
#include "../net/MiniJson.h"
#include "../observability/Logging.h"
#include "../observability/Metrics.h"
#include "../ratelimit/RateLimiter.h"
#include "../realtime/NotificationHub.h"
#include <memory>
#include <sstream>
#include <stdexcept>

namespace api {

namespace http = boost::beast::http;

namespace {

const char* JOBS_SQL =
    "SELECT id, title, company, location, category, created_at FROM jobs "
    "WHERE is_active AND ($1::text IS NULL OR category = $1)";

const char* FEED_SQL =
    "SELECT p.id, p.author_id, p.content, p.like_count, p.comment_count, p.created_at FROM posts p "
    "WHERE p.author_id = $1::bigint OR p.author_id IN (SELECT followed_id FROM follows WHERE follower_id = $1::bigint)";

const char* LIKE_SQL =
    "UPDATE posts SET like_count = like_count + 1 WHERE id = $1::bigint RETURNING like_count, author_id";

Response db_unavailable(const Request& req) {
    return json_response(req, http::status::service_unavailable, "{\"error\":\"database not configured\"}");
}

Response page_error(const Request& req, const boost::system::error_code& ec) {
    observability::log_error("api.query_failed", {{"path", target_path(std::string(req.target()))}, {"err", ec.message()}});
    return json_response(req, http::status::internal_server_error, "{\"error\":\"query failed\"}");
}

// Runs a paginated list query on the read pool and replies with the page.
void serve_page(const Request& req, Router::Reply reply, const db::ReadWriteRouter& rw,
                const pagination::Paginator& paginator, const char* sql, db::DbParams params) {
    auto p = paginator.parse(parse_query(std::string(req.target())));
    auto shared_req = std::make_shared<Request>(req);
    paginator.async_paginate(rw.get_db_read(), sql, std::move(params), p,
        [shared_req, reply](const boost::system::error_code& ec, pagination::Page page) {
            if (ec) { reply(page_error(*shared_req, ec)); return; }
            reply(json_response(*shared_req, http::status::ok, pagination::page_to_json(page)));
        });
}

}

std::optional<std::string> caller_id(const Request& req, const std::string& jwt_secret) {
    auto h = header_value(req, http::field::authorization);
    if (!h.has_value()) return std::nullopt;
    auto token = auth::bearer_token(*h);
    if (!token.has_value()) return std::nullopt;
    auto claims = auth::verify_jwt(*token, jwt_secret);
    if (!claims.has_value()) return std::nullopt;
    return claims->sub;
}

void register_routes(Router& router, Services& svc) {
    Services* s = &svc;

    router.add_route("GET", "/health", [](const Request& req) {
        return json_response(req, http::status::ok, "{\"status\":\"ok\"}");
    });

    if (svc.metrics_enabled) {
        router.add_route("GET", "/metrics", [](const Request& req) {
            Response res{http::status::ok, req.version()};
            res.set(http::field::content_type, "text/plain; version=0.0.4");
            res.keep_alive(req.keep_alive());
            res.body() = observability::Metrics::instance().scrape();
            res.prepare_payload();
            return res;
        });
    }

    router.add_async_route("GET", "/db/health", [s](const Request& req, Router::Reply reply) {
        if (!s->db) { reply(json_response(req, http::status::service_unavailable, "{\"db\":\"not_configured\"}")); return; }
        auto shared_req = std::make_shared<Request>(req);
        auto rw = s->db;
        rw->get_db_write().async_query("SELECT 1", {}, [shared_req, reply, rw](const boost::system::error_code& ec, db::DbResult r) {
            bool primary_ok = !ec && r.ok;
            rw->async_replica_health([shared_req, reply, rw, primary_ok](std::string replica) {
                std::string body = std::string("{\"db\":\"") + (primary_ok ? "ok" : "down") + "\",\"replica\":" + replica +
                                   ",\"pools\":" + rw->pool_status_json() + "}";
                reply(json_response(*shared_req, primary_ok ? http::status::ok : http::status::service_unavailable, body));
            });
        });
    });

    router.add_route("GET", "/api/rate-limit/stats", [s](const Request& req) {
        std::string body = s->limiter ? s->limiter->stats_json() : std::string("{\"enabled\":false}");
        return json_response(req, http::status::ok, body);
    });

    router.add_route("GET", "/api/realtime/online", [s](const Request& req) {
        std::ostringstream ss;
        ss << "{\"online_users\":[";
        auto users = s->hub ? s->hub->get_online_users() : std::vector<std::string>();
        for (size_t i = 0; i < users.size(); ++i) {
            if (i) ss << ',';
            ss << json_quote(users[i]);
        }
        ss << "],\"count\":" << users.size() << ",\"connections\":" << (s->hub ? s->hub->connection_count() : 0) << "}";
        return json_response(req, http::status::ok, ss.str());
    });

    router.add_async_route("GET", "/api/jobs/list", svc.api_cache->wrap(cache::CacheOptions::jobs(),
        [s](const Request& req, Router::Reply reply) {
            if (!s->db) { reply(db_unavailable(req)); return; }
            auto q = parse_query(std::string(req.target()));
            auto cat = q.find("category");
            db::DbParams params{cat == q.end() || cat->second.empty() ? std::nullopt : std::optional<std::string>(cat->second)};
            serve_page(req, std::move(reply), *s->db, s->jobs_paginator, JOBS_SQL, std::move(params));
        }));

    // Anonymous callers are rejected before the cache so no shared entry is built.
    auto feed = svc.api_cache->wrap(cache::CacheOptions::user_feed(), [s](const Request& req, Router::Reply reply) {
        if (!s->db) { reply(db_unavailable(req)); return; }
        auto user = caller_id(req, s->jwt_secret);
        serve_page(req, std::move(reply), *s->db, s->feed_paginator, FEED_SQL, db::DbParams{user});
    });
    router.add_async_route("GET", "/api/feed", [s, feed](const Request& req, Router::Reply reply) {
        if (!caller_id(req, s->jwt_secret).has_value()) {
            reply(json_response(req, http::status::unauthorized, "{\"error\":\"unauthorized\"}"));
            return;
        }
        feed(req, std::move(reply));
    });

    router.add_async_route("POST", "/api/posts/like", [s](const Request& req, Router::Reply reply) {
        auto user = caller_id(req, s->jwt_secret);
        if (!user.has_value()) { reply(json_response(req, http::status::unauthorized, "{\"error\":\"unauthorized\"}")); return; }
        std::optional<std::string> post_id;
        try {
            post_id = json_extract_id_opt(req.body(), "post_id");
        } catch (const std::runtime_error&) {
            post_id.reset();
        }
        if (!post_id.has_value() || !parse_int64_strict_sv(*post_id).has_value()) {
            reply(json_response(req, http::status::bad_request, "{\"error\":\"post_id required\"}"));
            return;
        }
        if (!s->db) { reply(db_unavailable(req)); return; }
        auto shared_req = std::make_shared<Request>(req);
        std::string pid = *post_id;
        std::string uid = *user;
        s->db->session_for(LIKE_SQL).async_query(LIKE_SQL, {pid},
            [s, shared_req, reply, pid, uid](const boost::system::error_code& ec, db::DbResult r) {
                if (ec || !r.ok) {
                    observability::log_error("api.like_failed", {{"post", pid}, {"err", ec ? ec.message() : r.message}});
                    reply(json_response(*shared_req, http::status::internal_server_error, "{\"error\":\"query failed\"}"));
                    return;
                }
                if (r.rows.empty()) {
                    reply(json_response(*shared_req, http::status::not_found, "{\"error\":\"post not found\"}"));
                    return;
                }
                int64_t likes = json_parse_int_strict(r.rows[0][0]).value_or(0);
                std::string author = r.rows[0].size() > 1 ? r.rows[0][1].value_or("") : std::string();

                s->api_cache->invalidate("/api/feed");
                s->api_cache->invalidate("/api/posts");
                if (s->hub) {
                    s->hub->broadcast_like_update(pid, likes, uid);
                    if (!author.empty() && author != uid) {
                        s->hub->send_notification(author, "{\"type\":\"like\",\"post_id\":" + pid +
                                                          ",\"from_user_id\":" + json_quote(uid) + "}");
                    }
                }
                reply(json_response(*shared_req, http::status::ok,
                    "{\"success\":true,\"post_id\":" + pid + ",\"like_count\":" + std::to_string(likes) + "}"));
            });
    });
}

}
