#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <chrono>
#include <memory>
#include "Router.h"
#include "../ratelimit/RateLimiter.h"

namespace realtime { class NotificationHub; }

class HttpServer {
public:
    // port 0 binds an ephemeral port; see port().
    HttpServer(boost::asio::io_context& ioc, unsigned short port, Router& router, bool metrics_enabled, bool access_log,
               std::shared_ptr<ratelimit::RateLimiter> limiter = nullptr, realtime::NotificationHub* hub = nullptr,
               std::chrono::seconds ws_auth_timeout = std::chrono::seconds(5));
    void run();
    void stop();
    unsigned short port() const;
private:
    void do_accept();
    boost::asio::io_context& ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    Router& router_;
    bool metrics_enabled_;
    bool access_log_;
    std::shared_ptr<ratelimit::RateLimiter> limiter_;
    realtime::NotificationHub* hub_;
    std::chrono::seconds ws_auth_timeout_;
};
