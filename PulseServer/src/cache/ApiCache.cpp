#include "ApiCache.h"
#include "CacheKeys.h"
#include "../net/HttpUtil.h"
#include "../observability/Logging.h"
#include "../observability/Metrics.h"
#include <ctime>
#include <memory>

namespace cache {

namespace http = boost::beast::http;

ApiResponseCache::ApiResponseCache(ResponseCache& store, bool enabled, IdentityFn identity)
    : store_(store), enabled_(enabled), identity_(std::move(identity)) {}

std::string ApiResponseCache::key_for(const Request& req, CacheStrategy strategy) const {
    std::string target(req.target());
    std::optional<std::string> user;
    if (headers_for(strategy).user_scoped) {
        if (identity_) user = identity_(req);
        if (!user.has_value()) user = std::string("anonymous");
    }
    return api_cache_key(target_path(target), parse_query(target), user);
}

void ApiResponseCache::apply_strategy_headers(Response& res, CacheStrategy strategy) {
    const auto& h = headers_for(strategy);
    res.set(http::field::cache_control, h.cache_control);
    res.set("CDN-Cache-Control", h.cdn_cache_control);
    res.set(http::field::vary, h.vary);
}

std::size_t ApiResponseCache::invalidate(const std::string& path_prefix) {
    auto removed = store_.invalidate(api_cache_prefix(path_prefix));
    observability::log_debug("cache.invalidate", {{"prefix", path_prefix}, {"removed", int64_t(removed)}});
    return removed;
}

Router::AsyncHandler ApiResponseCache::wrap(CacheOptions opts, Router::AsyncHandler inner) {
    return [this, opts, inner = std::move(inner)](const Request& req, Router::Reply reply) {
        if (!enabled_) { inner(req, std::move(reply)); return; }

        auto key = key_for(req, opts.strategy);
        auto if_none_match = header_value(req, http::field::if_none_match);
        auto& metrics = observability::Metrics::instance();

        if (auto hit = store_.get(key)) {
            if (if_none_match.has_value() && check_etag_match(*if_none_match, hit->etag)) {
                metrics.add("cache_not_modified_total");
                Response res{http::status::not_modified, req.version()};
                res.keep_alive(req.keep_alive());
                res.set(http::field::etag, hit->etag);
                apply_strategy_headers(res, opts.strategy);
                res.set("X-Cache", "HIT");
                res.prepare_payload();
                reply(std::move(res));
                return;
            }
            metrics.add("cache_hits_total");
            Response res{http::status::ok, req.version()};
            res.keep_alive(req.keep_alive());
            res.set(http::field::content_type, hit->content_type);
            res.set(http::field::etag, hit->etag);
            res.set(http::field::last_modified, http_date(hit->stored_at));
            apply_strategy_headers(res, opts.strategy);
            res.set("X-Cache", "HIT");
            res.body() = std::move(hit->body);
            res.prepare_payload();
            reply(std::move(res));
            return;
        }

        metrics.add("cache_misses_total");
        auto shared_reply = std::make_shared<Router::Reply>(std::move(reply));
        auto inm = if_none_match;
        inner(req, [this, opts, key, inm, shared_reply](Response res) {
            if (res.result() != http::status::ok) {
                (*shared_reply)(std::move(res));
                return;
            }
            apply_strategy_headers(res, opts.strategy);
            res.set("X-Cache", "MISS");
            auto etag = generate_etag(res.body());
            if (!etag.has_value()) {
                observability::log_warn("cache.serialization_failed", {{"key", key}});
                (*shared_reply)(std::move(res));
                return;
            }
            int64_t now = static_cast<int64_t>(std::time(nullptr));
            CacheEntry entry;
            entry.body = res.body();
            entry.etag = *etag;
            entry.stored_at = now;
            auto ct = res.find(http::field::content_type);
            entry.content_type = ct != res.end() ? std::string(ct->value()) : std::string("application/json; charset=utf-8");
            store_.set(key, std::move(entry), opts.ttl);

            res.set(http::field::etag, *etag);
            res.set(http::field::last_modified, http_date(now));
            if (inm.has_value() && check_etag_match(*inm, *etag)) {
                Response nm{http::status::not_modified, res.version()};
                nm.keep_alive(res.keep_alive());
                nm.set(http::field::etag, *etag);
                apply_strategy_headers(nm, opts.strategy);
                nm.set("X-Cache", "MISS");
                nm.prepare_payload();
                (*shared_reply)(std::move(nm));
                return;
            }
            res.prepare_payload();
            (*shared_reply)(std::move(res));
        });
    };
}

}
