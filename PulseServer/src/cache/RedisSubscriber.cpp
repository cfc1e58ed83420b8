#include "RedisSubscriber.h"
#include "../observability/Logging.h"
#include <boost/asio/connect.hpp>
#include <algorithm>

using cache::RespParse;
using cache::RespType;
using cache::RespValue;

RedisSubscriber::RedisSubscriber(IoContext& ioc, std::string host, uint16_t port, std::string pass, std::string channel,
                                 std::chrono::milliseconds timeout)
    : ioc_(ioc), strand_(boost::asio::make_strand(ioc)), host_(std::move(host)), port_(port), pass_(std::move(pass)),
      channel_(std::move(channel)), timeout_(timeout), socket_(strand_), timer_(strand_) {}

void RedisSubscriber::start(MessageCb on_message) {
    boost::asio::dispatch(strand_, [self = shared_from_this(), cb = std::move(on_message)]() mutable {
        self->on_message_ = std::move(cb);
        self->stopped_ = false;
        self->do_connect();
    });
}

void RedisSubscriber::stop() {
    boost::asio::dispatch(strand_, [self = shared_from_this()]() {
        self->stopped_ = true;
        ++self->conn_gen_;
        self->subscribed_ = false;
        self->timer_.cancel();
        boost::system::error_code ig;
        self->socket_.close(ig);
    });
}

void RedisSubscriber::on_failure(const boost::system::error_code& ec) {
    ++conn_gen_;
    subscribed_ = false;
    boost::system::error_code ig;
    socket_.close(ig);
    rbuf_.clear();
    if (stopped_) return;
    if (!reported_down_) {
        observability::log_warn("pubsub.subscriber_down", {{"channel", channel_}, {"err", ec.message()}});
        reported_down_ = true;
    }
    timer_.expires_after(backoff_);
    backoff_ = std::min(backoff_ * 2, std::chrono::milliseconds(30000));
    auto gen = conn_gen_;
    timer_.async_wait([self = shared_from_this(), gen](const boost::system::error_code& tec) {
        if (tec || gen != self->conn_gen_ || self->stopped_) return;
        self->do_connect();
    });
}

void RedisSubscriber::do_connect() {
    auto gen = ++conn_gen_;
    rbuf_.clear();
    timer_.expires_after(timeout_);
    timer_.async_wait([self = shared_from_this(), gen](const boost::system::error_code& ec) {
        if (ec || gen != self->conn_gen_ || self->subscribed_) return;
        self->on_failure(boost::asio::error::timed_out);
    });
    auto resolver = std::make_shared<boost::asio::ip::tcp::resolver>(strand_);
    resolver->async_resolve(host_, std::to_string(port_),
        [self = shared_from_this(), resolver, gen](const boost::system::error_code& ec, boost::asio::ip::tcp::resolver::results_type eps) {
        if (gen != self->conn_gen_) return;
        if (ec) { self->on_failure(ec); return; }
        boost::asio::async_connect(self->socket_, eps, [self, gen](const boost::system::error_code& ec2, const boost::asio::ip::tcp::endpoint&) {
            if (gen != self->conn_gen_) return;
            if (ec2) { self->on_failure(ec2); return; }
            auto subscribe = [self]() {
                self->send(cache::resp_encode({"SUBSCRIBE", self->channel_}), [self]() { self->read_loop(); });
            };
            if (self->pass_.empty()) subscribe();
            else self->send(cache::resp_encode({"AUTH", self->pass_}), subscribe);
        });
    });
}

void RedisSubscriber::send(std::string cmd, std::function<void()> next) {
    auto buf = std::make_shared<std::string>(std::move(cmd));
    auto gen = conn_gen_;
    boost::asio::async_write(socket_, boost::asio::buffer(*buf), [self = shared_from_this(), buf, gen, next = std::move(next)](const boost::system::error_code& ec, std::size_t) {
        if (gen != self->conn_gen_) return;
        if (ec) { self->on_failure(ec); return; }
        next();
    });
}

void RedisSubscriber::read_loop() {
    for (;;) {
        RespValue v;
        size_t consumed = 0;
        auto st = cache::resp_parse_prefix(rbuf_, v, consumed);
        if (st == RespParse::Malformed || rbuf_.size() > MAX_BUFFER) { on_failure(boost::asio::error::fault); return; }
        if (st == RespParse::Incomplete) break;
        rbuf_.erase(0, consumed);
        auto gen = conn_gen_;
        handle(v);
        if (gen != conn_gen_) return;
    }
    auto gen = conn_gen_;
    socket_.async_read_some(boost::asio::buffer(chunk_), [self = shared_from_this(), gen](const boost::system::error_code& ec, std::size_t n) {
        if (gen != self->conn_gen_) return;
        if (ec) { self->on_failure(ec); return; }
        self->rbuf_.append(self->chunk_.data(), n);
        self->read_loop();
    });
}

void RedisSubscriber::handle(const RespValue& v) {
    if (v.type == RespType::Error) {
        observability::log_error("pubsub.subscribe_error", {{"channel", channel_}, {"reply", v.str}});
        on_failure(boost::asio::error::access_denied);
        return;
    }
    // +OK from AUTH
    if (v.type != RespType::Array || v.arr.empty()) return;
    const std::string& kind = v.arr[0].str;
    if (kind == "subscribe") {
        subscribed_ = true;
        backoff_ = std::chrono::milliseconds(500);
        timer_.cancel();
        if (reported_down_) {
            observability::log_info("pubsub.subscriber_restored", {{"channel", channel_}});
            reported_down_ = false;
        } else {
            observability::log_info("pubsub.subscribed", {{"channel", channel_}});
        }
        return;
    }
    if (kind == "message" && v.arr.size() >= 3 && on_message_) {
        boost::asio::post(ioc_, [cb = on_message_, payload = v.arr[2].str]() { cb(payload); });
    }
}
