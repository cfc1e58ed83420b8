#pragma once

#include "Request.h"
#include "Response.h"
#include <string>
#include <functional>
#include <unordered_map>
#include <vector>

class Router {
public:
    using Handler = std::function<Response(const Request&)>;
    using Reply = std::function<void(Response)>;
    // Must call reply exactly once, from any thread.
    using AsyncHandler = std::function<void(const Request&, Reply)>;

    void add_route(std::string method, std::string path, Handler h);
    void add_async_route(std::string method, std::string path, AsyncHandler h);
    // Matches on the path only; the query string is ignored.
    void dispatch(const Request& req, Reply reply) const;
    bool has_path(const std::string& path) const;
private:
    struct Key { std::string method; std::string path; };
    struct KeyHash {
        size_t operator()(Key const& k) const noexcept { return std::hash<std::string>()(k.method + "#" + k.path); }
    };
    struct KeyEq { bool operator()(Key const& a, Key const& b) const noexcept { return a.method==b.method && a.path==b.path; } };
    std::unordered_map<Key, AsyncHandler, KeyHash, KeyEq> routes_;
};
