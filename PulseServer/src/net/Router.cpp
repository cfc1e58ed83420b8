#include "Router.h"
#include "HttpUtil.h"
#include <boost/beast/http.hpp>

void Router::add_route(std::string method, std::string path, Handler h) {
    add_async_route(std::move(method), std::move(path), [h = std::move(h)](const Request& req, Reply reply) {
        reply(h(req));
    });
}

void Router::add_async_route(std::string method, std::string path, AsyncHandler h) {
    Key k{std::move(method), std::move(path)};
    routes_[std::move(k)] = std::move(h);
}

bool Router::has_path(const std::string& path) const {
    for (const auto& p : routes_) {
        if (p.first.path == path) return true;
    }
    return false;
}

void Router::dispatch(const Request& req, Reply reply) const {
    Key k{std::string(req.method_string()), target_path(std::string(req.target()))};
    auto it = routes_.find(k);
    if (it == routes_.end()) {
        if (has_path(k.path)) {
            reply(json_response(req, boost::beast::http::status::method_not_allowed, "{\"error\":\"method not allowed\"}"));
            return;
        }
        reply(json_response(req, boost::beast::http::status::not_found, "{\"error\":\"not found\"}"));
        return;
    }
    it->second(req, std::move(reply));
}
