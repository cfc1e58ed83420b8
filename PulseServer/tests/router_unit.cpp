#include <iostream>
#include <optional>
#include <string>
#include "net/Router.h"
#include "net/Request.h"
#include "net/Response.h"
#include <boost/beast/http.hpp>

using namespace boost::beast::http;

static Request make_request(verb m, const std::string& target) {
    Request req{m, target, 11};
    req.set(field::host, "localhost");
    req.prepare_payload();
    return req;
}

// Runs dispatch and returns the response if reply was called.
static std::optional<Response> route(const Router& r, const Request& req, int* calls = nullptr) {
    std::optional<Response> out;
    int n = 0;
    r.dispatch(req, [&](Response res) { out = std::move(res); ++n; });
    if (calls) *calls = n;
    return out;
}

static Response text(const Request& req, std::string body) {
    Response res{status::ok, req.version()};
    res.set(field::content_type, "text/plain");
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

int main() {
    Router r;

    {
        auto res = route(r, make_request(verb::get, "/nope"));
        if (!res || res->result() != status::not_found) { std::cerr << "expected 404 for /nope\n"; return 1; }
    }

    r.add_route("GET", "/ping", [](const Request& req) { return text(req, "pong"); });

    {
        auto res = route(r, make_request(verb::post, "/ping"));
        if (!res || res->result() != status::method_not_allowed) { std::cerr << "expected 405 for POST /ping\n"; return 1; }
    }

    {
        int calls = 0;
        auto res = route(r, make_request(verb::get, "/ping"), &calls);
        if (!res || res->result() != status::ok) { std::cerr << "expected 200 for GET /ping\n"; return 1; }
        if (res->body() != "pong") { std::cerr << "GET /ping body mismatch: " << res->body() << "\n"; return 1; }
        if (calls != 1) { std::cerr << "reply called " << calls << " times\n"; return 1; }
    }

    // query string does not take part in matching
    {
        auto res = route(r, make_request(verb::get, "/ping?x=1&y=2"));
        if (!res || res->body() != "pong") { std::cerr << "query string broke matching\n"; return 1; }
    }

    r.add_route("GET", "/a/b", [](const Request& req) { return text(req, "exact"); });
    r.add_route("GET", "/a/", [](const Request& req) { return text(req, "prefix"); });
    {
        auto res = route(r, make_request(verb::get, "/a/b"));
        if (!res || res->body() != "exact") { std::cerr << "expected exact match\n"; return 1; }
        auto miss = route(r, make_request(verb::get, "/a/c"));
        if (!miss || miss->result() != status::not_found) { std::cerr << "prefix routes must not match /a/c\n"; return 1; }
    }

    // async handlers may reply later
    Router::Reply parked;
    r.add_async_route("POST", "/api/posts/like", [&parked](const Request&, Router::Reply reply) { parked = std::move(reply); });
    {
        auto req = make_request(verb::post, "/api/posts/like");
        int calls = 0;
        auto res = route(r, req, &calls);
        if (res || calls != 0) { std::cerr << "async route replied early\n"; return 1; }
        if (!parked) { std::cerr << "async handler not invoked\n"; return 1; }
        std::optional<Response> late;
        r.dispatch(req, [&](Response x) { late = std::move(x); });
        parked(text(req, "liked"));
        if (!late || late->body() != "liked") { std::cerr << "deferred reply lost\n"; return 1; }
    }

    if (!r.has_path("/ping") || r.has_path("/pong")) { std::cerr << "has_path mismatch\n"; return 1; }

    std::cout << "router_unit ok\n";
    return 0;
}
