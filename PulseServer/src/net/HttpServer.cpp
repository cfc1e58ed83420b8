#include "HttpServer.h"
#include "HttpUtil.h"
#include "Request.h"
#include "Response.h"
#include "../observability/Metrics.h"
#include "../observability/Logging.h"
#include "../realtime/WsSession.h"
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <algorithm>
#include <chrono>
#include <optional>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;

namespace {

const std::size_t MAX_HEADER = 8 * 1024;
const std::size_t MAX_BODY = 1 * 1024 * 1024;

struct Session : std::enable_shared_from_this<Session> {
    net::ip::tcp::socket socket;
    beast::flat_buffer buffer;
    net::steady_timer read_timer;
    Router& router;
    unsigned http_version = 11;
    Request req;
    std::string path;
    bool draining_ = false;
    std::array<char, 4096> drain_buf_{};
    int drain_seconds_ = 5;
    std::chrono::steady_clock::time_point start_ts;
    bool metrics_enabled;
    bool access_log;
    std::shared_ptr<ratelimit::RateLimiter> limiter;
    realtime::NotificationHub* hub = nullptr;
    std::chrono::seconds ws_auth_timeout{5};

    Session(net::ip::tcp::socket&& s, Router& r, bool me, bool al)
        : socket(std::move(s)), buffer(), read_timer(socket.get_executor()), router(r), metrics_enabled(me), access_log(al) {}

    void run() { do_read(); }

    void do_read() {
        auto self = shared_from_this();
        req = {};
        http_version = 11;
        auto parser = std::make_shared<http::request_parser<http::string_body>>();
        parser->header_limit(MAX_HEADER);
        parser->body_limit(MAX_BODY);

        read_timer.expires_after(std::chrono::seconds(5));
        read_timer.async_wait([self](const boost::system::error_code& ec) {
            if (!ec) self->close_socket();
        });

        http::async_read_header(socket, buffer, *parser, [self, parser](beast::error_code ec, std::size_t) {
            self->read_timer.cancel();
            if (ec) {
                if (ec == http::error::header_limit) {
                    self->reply_json_error(http::status::request_header_fields_too_large, "{\"error\":\"header_too_large\"}", "(header)");
                    return;
                }
                if (ec == http::error::bad_target || ec == http::error::bad_method || ec == http::error::bad_version ||
                    ec == http::error::bad_field) {
                    self->reply_json_error(http::status::bad_request, "{\"error\":\"bad_request\"}", "(parse)");
                    return;
                }
                self->close_socket();
                return;
            }
            self->http_version = parser->get().version();

            auto content_len = parser->content_length();
            if (content_len && *content_len > MAX_BODY) {
                observability::log_info("http.oversized_body", {{"len", int64_t(*content_len)}});
                self->drain_seconds_ = std::min(10, std::max(5, int(*content_len / (256 * 1024))));
                self->reply_json_error(http::status::payload_too_large, "{\"error\":\"body_too_large\"}", "(body)");
                return;
            }
            std::size_t len = content_len ? std::size_t(*content_len) : 0;
            if (len == 0) self->read_timer.expires_after(std::chrono::seconds(10));
            else if (len <= 128 * 1024) self->read_timer.expires_after(std::chrono::seconds(20));
            else self->read_timer.expires_after(std::chrono::seconds(60));
            self->read_timer.async_wait([self](const boost::system::error_code& ec2) {
                if (!ec2) self->close_socket();
            });

            http::async_read(self->socket, self->buffer, *parser, [self, parser](beast::error_code ec2, std::size_t) {
                self->read_timer.cancel();
                if (ec2) {
                    if (ec2 == http::error::body_limit) {
                        self->reply_json_error(http::status::payload_too_large, "{\"error\":\"payload_too_large\"}", "(body)");
                        return;
                    }
                    self->close_socket();
                    return;
                }
                self->req = parser->release();
                self->start_ts = std::chrono::steady_clock::now();
                self->handle_request();
            });
        });
    }

    void handle_request() {
        path = target_path(std::string(req.target()));
        auto self = shared_from_this();

        if (req.method() == http::verb::options) {
            auto res = std::make_shared<Response>(http::status::no_content, req.version());
            res->set("Access-Control-Allow-Methods", "GET, POST, PUT, PATCH, DELETE, OPTIONS");
            res->set("Access-Control-Allow-Headers", "Content-Type, Authorization, X-Requested-With, If-None-Match");
            res->keep_alive(req.keep_alive());
            res->prepare_payload();
            send_response(res);
            return;
        }

        if (!limiter || !limiter->enabled() || limiter->is_exempt(path)) {
            proceed(std::nullopt);
            return;
        }

        boost::system::error_code pec;
        auto peer = socket.remote_endpoint(pec);
        std::string key = ratelimit::client_key_from(header_value(req, "X-Forwarded-For").value_or(""),
                                                     header_value(req, "X-Real-IP").value_or(""),
                                                     pec ? std::string() : peer.address().to_string());
        limiter->check(key, [self](ratelimit::Decision d) {
            net::dispatch(self->socket.get_executor(), [self, d]() {
                if (d.allowed) { self->proceed(d); return; }
                observability::log_warn("ratelimit.rejected", {{"path", self->path}, {"count", d.count}});
                auto res = std::make_shared<Response>(json_response(self->req, http::status::too_many_requests, ratelimit::rejection_body(d)));
                res->set(http::field::retry_after, std::to_string(d.retry_after));
                add_limit_headers(*res, d);
                self->send_response(res);
            });
        });
    }

    static void add_limit_headers(Response& res, const ratelimit::Decision& d) {
        res.set("X-RateLimit-Limit", std::to_string(d.limit));
        res.set("X-RateLimit-Window", std::to_string(d.window_seconds));
    }

    // Past the limiter: upgrade /ws, route everything else.
    void proceed(std::optional<ratelimit::Decision> d) {
        if (path == "/ws" && beast::websocket::is_upgrade(req)) {
            if (!hub) {
                send_response(std::make_shared<Response>(json_response(req, http::status::not_found, "{\"error\":\"not found\"}")));
                return;
            }
            observe(101);
            auto ws = std::make_shared<realtime::WsSession>(std::move(socket), *hub, ws_auth_timeout);
            ws->run(std::move(req));
            return;
        }
        dispatch(d);
    }

    void dispatch(std::optional<ratelimit::Decision> d) {
        auto self = shared_from_this();
        router.dispatch(req, [self, d](Response res) {
            auto sp = std::make_shared<Response>(std::move(res));
            if (d.has_value()) add_limit_headers(*sp, *d);
            net::dispatch(self->socket.get_executor(), [self, sp]() { self->send_response(sp); });
        });
    }

    void observe(int code) {
        double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_ts).count();
        std::string method(req.method_string());
        if (metrics_enabled) {
            observability::Metrics::instance().inc(path, method, code);
            observability::Metrics::instance().observe_latency(path, method, ms);
        }
        if (access_log) {
            observability::log_info("access", {{"method", method}, {"path", path}, {"status", int64_t(code)}, {"ms", ms}});
        }
    }

    void send_response(std::shared_ptr<Response> sp) {
        auto self = shared_from_this();
        if (sp->find(http::field::connection) == sp->end()) sp->keep_alive(req.keep_alive());
        auto origin = header_value(req, http::field::origin);
        sp->set("Access-Control-Allow-Origin", origin.value_or("*"));
        sp->set("Access-Control-Allow-Credentials", "true");
        observe(sp->result_int());

        http::async_write(socket, *sp, [self, sp](boost::system::error_code ec, std::size_t) {
            if (ec) {
                observability::log_warn("http.write_error", {{"path", self->path}, {"err", ec.message()}});
                self->close_socket();
                return;
            }
            if (sp->keep_alive()) self->do_read();
            else self->graceful_close_after_write();
        });
    }

    void close_socket(bool hard_shutdown = true) {
        boost::system::error_code ignored;
        read_timer.cancel();
        socket.cancel(ignored);
        if (hard_shutdown) socket.shutdown(net::ip::tcp::socket::shutdown_both, ignored);
        socket.close(ignored);
    }

    void start_drain_timer() {
        auto self = shared_from_this();
        read_timer.expires_after(std::chrono::seconds(drain_seconds_));
        read_timer.async_wait([self](const boost::system::error_code& ec) {
            if (ec) return;
            self->close_socket(false);
        });
    }

    void do_drain_read() {
        auto self = shared_from_this();
        socket.async_read_some(net::buffer(drain_buf_), [self](boost::system::error_code ec, std::size_t) {
            if (ec) {
                if (ec == net::error::operation_aborted) return;
                self->read_timer.cancel();
                self->close_socket(false);
                return;
            }
            self->do_drain_read();
        });
    }

    // Half-close and swallow whatever the client is still sending so that the
    // response is not lost to a reset.
    void graceful_close_after_write() {
        if (draining_) return;
        draining_ = true;
        boost::system::error_code ignored;
        socket.shutdown(net::ip::tcp::socket::shutdown_send, ignored);
        start_drain_timer();
        do_drain_read();
    }

    void reply_json_error(http::status st, const std::string& body, const std::string& where) {
        if (path.empty()) path = where;
        auto res = std::make_shared<Response>(st, http_version);
        res->set(http::field::content_type, "application/json");
        res->set(http::field::connection, "close");
        res->keep_alive(false);
        res->body() = body;
        res->prepare_payload();
        send_response(res);
    }
};

}

HttpServer::HttpServer(net::io_context& ioc, unsigned short port, Router& router, bool metrics_enabled, bool access_log,
                       std::shared_ptr<ratelimit::RateLimiter> limiter, realtime::NotificationHub* hub,
                       std::chrono::seconds ws_auth_timeout)
    : ioc_(ioc), acceptor_(ioc, net::ip::tcp::endpoint(net::ip::address_v4::any(), port)), router_(router),
      metrics_enabled_(metrics_enabled), access_log_(access_log), limiter_(std::move(limiter)), hub_(hub),
      ws_auth_timeout_(ws_auth_timeout) {}

void HttpServer::run() { do_accept(); }

void HttpServer::stop() {
    boost::system::error_code ignored;
    acceptor_.close(ignored);
}

unsigned short HttpServer::port() const {
    boost::system::error_code ec;
    auto ep = acceptor_.local_endpoint(ec);
    return ec ? 0 : ep.port();
}

void HttpServer::do_accept() {
    acceptor_.async_accept(net::make_strand(ioc_), [this](beast::error_code ec, net::ip::tcp::socket socket) {
        if (ec == net::error::operation_aborted) return;
        if (!ec) {
            auto s = std::make_shared<Session>(std::move(socket), router_, metrics_enabled_, access_log_);
            s->limiter = limiter_;
            s->hub = hub_;
            s->ws_auth_timeout = ws_auth_timeout_;
            s->run();
        } else observability::log_warn("http.accept_error", {{"err", ec.message()}});

        do_accept();
    });
}
