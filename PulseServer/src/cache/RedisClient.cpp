#include "RedisClient.h"
#include "../observability/Logging.h"
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>

using cache::RespParse;
using cache::RespType;
using cache::RespValue;

RedisClient::RedisClient(IoContext& ioc, std::string host, uint16_t port, std::string pass, std::chrono::milliseconds timeout)
    : ioc_(ioc), strand_(boost::asio::make_strand(ioc)), host_(std::move(host)), port_(port),
      redis_pass_(std::move(pass)), timeout_(timeout), socket_(strand_), timer_(strand_) {}

void RedisClient::start() {
    boost::asio::dispatch(strand_, [self = shared_from_this()]() {
        if (self->state_.load() == State::Disconnected && !self->stopped_) self->do_connect();
    });
}

void RedisClient::stop() {
    boost::asio::dispatch(strand_, [self = shared_from_this()]() {
        self->stopped_ = true;
        self->fail_all(boost::asio::error::operation_aborted);
    });
}

void RedisClient::arm_timer() {
    timer_.expires_after(timeout_);
    timer_.async_wait([self = shared_from_this(), gen = ++timer_gen_](const boost::system::error_code& ec) {
        if (ec || gen != self->timer_gen_) return;
        self->fail_all(boost::asio::error::timed_out);
    });
}

void RedisClient::disarm_timer() {
    ++timer_gen_;
    timer_.cancel();
}

void RedisClient::deliver(ReplyCb cb, boost::system::error_code ec, RespValue v) {
    if (!cb) return;
    boost::asio::post(ioc_, [cb = std::move(cb), ec, v = std::move(v)]() mutable { cb(ec, std::move(v)); });
}

void RedisClient::do_connect() {
    state_ = State::Connecting;
    rbuf_.clear();
    auto gen = ++conn_gen_;
    arm_timer();
    auto resolver = std::make_shared<boost::asio::ip::tcp::resolver>(strand_);
    resolver->async_resolve(host_, std::to_string(port_),
        [self = shared_from_this(), resolver, gen](const boost::system::error_code& ec, boost::asio::ip::tcp::resolver::results_type eps) {
        if (gen != self->conn_gen_) return;
        if (ec) { self->fail_all(ec); return; }
        boost::system::error_code ig; self->socket_.close(ig);
        boost::asio::async_connect(self->socket_, eps, [self, gen](const boost::system::error_code& ec2, const boost::asio::ip::tcp::endpoint&) {
            if (gen != self->conn_gen_) return;
            if (ec2) { self->fail_all(ec2); return; }
            boost::system::error_code nd;
            self->socket_.set_option(boost::asio::ip::tcp::no_delay(true), nd);
            if (self->redis_pass_.empty()) { self->on_connected(); return; }

            auto auth_cmd = std::make_shared<std::string>(cache::resp_encode({"AUTH", self->redis_pass_}));
            boost::asio::async_write(self->socket_, boost::asio::buffer(*auth_cmd), [self, gen, auth_cmd](const boost::system::error_code& ecw, std::size_t) {
                if (gen != self->conn_gen_) return;
                if (ecw) { self->fail_all(ecw); return; }
                self->read_reply([self](RespValue v) {
                    if (v.type == RespType::SimpleString) { self->on_connected(); return; }
                    observability::log_error("redis.auth_failed", {{"host", self->host_}, {"reply", v.str}});
                    self->fail_all(boost::asio::error::access_denied);
                });
            });
        });
    });
}

void RedisClient::on_connected() {
    disarm_timer();
    state_ = State::Ready;
    if (reported_down_) {
        observability::log_info("redis.reconnected", {{"host", host_}, {"port", int64_t(port_)}});
        reported_down_ = false;
    }
    do_write_next();
}

void RedisClient::async_command(std::vector<std::string> args, ReplyCb cb) {
    Pending p;
    p.cmd = cache::resp_encode(args);
    p.cb = std::move(cb);
    boost::asio::dispatch(strand_, [self = shared_from_this(), p = std::move(p)]() mutable {
        if (self->stopped_) { self->deliver(std::move(p.cb), boost::asio::error::operation_aborted, {}); return; }
        if (self->queue_.size() >= MAX_QUEUE) { self->deliver(std::move(p.cb), boost::asio::error::no_buffer_space, {}); return; }
        self->queue_.push_back(std::move(p));
        if (self->state_.load() == State::Disconnected) self->do_connect();
        else self->do_write_next();
    });
}

void RedisClient::do_write_next() {
    if (busy_ || state_.load() != State::Ready || queue_.empty()) return;
    busy_ = true;
    current_ = std::move(queue_.front());
    queue_.pop_front();
    arm_timer();
    auto gen = conn_gen_;
    boost::asio::async_write(socket_, boost::asio::buffer(current_->cmd), [self = shared_from_this(), gen](const boost::system::error_code& ec, std::size_t) {
        if (gen != self->conn_gen_) return;
        if (ec) { self->fail_all(ec); return; }
        self->read_reply([self](RespValue v) { self->complete_current(std::move(v)); });
    });
}

void RedisClient::read_reply(std::function<void(RespValue)> on_reply) {
    RespValue v;
    size_t consumed = 0;
    auto st = cache::resp_parse_prefix(rbuf_, v, consumed);
    if (st == RespParse::Ok) {
        rbuf_.erase(0, consumed);
        on_reply(std::move(v));
        return;
    }
    if (st == RespParse::Malformed || rbuf_.size() > MAX_REPLY) {
        observability::log_warn("redis.protocol_error", {{"host", host_}});
        fail_all(boost::asio::error::fault);
        return;
    }
    auto gen = conn_gen_;
    socket_.async_read_some(boost::asio::buffer(chunk_), [self = shared_from_this(), gen, on_reply = std::move(on_reply)](const boost::system::error_code& ec, std::size_t n) mutable {
        if (gen != self->conn_gen_) return;
        if (ec) { self->fail_all(ec); return; }
        self->rbuf_.append(self->chunk_.data(), n);
        self->read_reply(std::move(on_reply));
    });
}

void RedisClient::complete_current(RespValue v) {
    disarm_timer();
    busy_ = false;
    if (current_.has_value()) {
        auto p = std::move(*current_);
        current_.reset();
        boost::system::error_code ec;
        if (v.type == RespType::Error) ec = boost::asio::error::fault;
        deliver(std::move(p.cb), ec, std::move(v));
    }
    do_write_next();
}

void RedisClient::fail_all(boost::system::error_code ec) {
    disarm_timer();
    ++conn_gen_;
    boost::system::error_code ig;
    socket_.close(ig);
    rbuf_.clear();
    busy_ = false;
    state_ = State::Disconnected;
    if (!reported_down_ && ec != boost::asio::error::operation_aborted) {
        observability::log_warn("redis.unavailable", {{"host", host_}, {"port", int64_t(port_)}, {"err", ec.message()}});
        reported_down_ = true;
    }
    if (current_.has_value()) {
        deliver(std::move(current_->cb), ec, {});
        current_.reset();
    }
    while (!queue_.empty()) {
        deliver(std::move(queue_.front().cb), ec, {});
        queue_.pop_front();
    }
}

void RedisClient::async_ping(std::function<void(boost::system::error_code)> cb) {
    async_command({"PING"}, [cb = std::move(cb)](boost::system::error_code ec, RespValue v) {
        if (!ec && !(v.type == RespType::SimpleString && v.str == "PONG")) ec = boost::asio::error::fault;
        if (cb) cb(ec);
    });
}

static std::function<void(boost::system::error_code, RespValue)> integer_reply(std::function<void(boost::system::error_code, int64_t)> cb) {
    return [cb = std::move(cb)](boost::system::error_code ec, RespValue v) {
        if (!ec && v.type != RespType::Integer) ec = boost::asio::error::fault;
        if (cb) cb(ec, ec ? 0 : v.integer);
    };
}

void RedisClient::async_incr(const std::string& key, std::function<void(boost::system::error_code, int64_t)> cb) {
    async_command({"INCR", key}, integer_reply(std::move(cb)));
}

void RedisClient::async_decr(const std::string& key, std::function<void(boost::system::error_code, int64_t)> cb) {
    async_command({"DECR", key}, integer_reply(std::move(cb)));
}

void RedisClient::async_expire(const std::string& key, int ttl_sec, std::function<void(boost::system::error_code, bool)> cb) {
    async_command({"EXPIRE", key, std::to_string(ttl_sec)}, integer_reply([cb = std::move(cb)](boost::system::error_code ec, int64_t v) {
        if (cb) cb(ec, v > 0);
    }));
}

void RedisClient::async_publish(const std::string& channel, const std::string& message,
                                std::function<void(boost::system::error_code, int64_t)> cb) {
    async_command({"PUBLISH", channel, message}, integer_reply(std::move(cb)));
}
