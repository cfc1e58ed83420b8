#pragma once

#include <boost/asio.hpp>
#include <array>
#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <deque>
#include <memory>
#include <optional>
#include <vector>
#include "Resp.h"

// Single-connection RESP client. Commands run one at a time in submission
// order; the connection is opened lazily and re-opened by the next command
// after a failure. Every command is bounded by the backend timeout, so a
// callback always fires. Callbacks are posted to the io_context.
class RedisClient : public std::enable_shared_from_this<RedisClient> {
public:
    using IoContext = boost::asio::io_context;
    using ReplyCb = std::function<void(boost::system::error_code, cache::RespValue)>;

    RedisClient(IoContext& ioc, std::string host, uint16_t port, std::string pass = std::string(),
                std::chrono::milliseconds timeout = std::chrono::milliseconds(2000));
    void start();
    void stop();

    // Error replies are reported as boost::asio::error::fault with the reply in the value.
    void async_command(std::vector<std::string> args, ReplyCb cb);

    void async_ping(std::function<void(boost::system::error_code)> cb);
    void async_incr(const std::string& key, std::function<void(boost::system::error_code, int64_t)> cb);
    void async_decr(const std::string& key, std::function<void(boost::system::error_code, int64_t)> cb);
    void async_expire(const std::string& key, int ttl_sec, std::function<void(boost::system::error_code, bool)> cb);
    void async_publish(const std::string& channel, const std::string& message,
                       std::function<void(boost::system::error_code, int64_t)> cb);

    bool connected() const { return state_.load() == State::Ready; }
    const std::string& host() const { return host_; }
    uint16_t port() const { return port_; }

private:
    enum class State { Disconnected, Connecting, Ready };
    struct Pending {
        std::string cmd;
        ReplyCb cb;
    };

    void do_connect();
    void on_connected();
    void do_write_next();
    void read_reply(std::function<void(cache::RespValue)> on_reply);
    void complete_current(cache::RespValue v);
    void fail_all(boost::system::error_code ec);
    void arm_timer();
    void disarm_timer();
    void deliver(ReplyCb cb, boost::system::error_code ec, cache::RespValue v);

    IoContext& ioc_;
    boost::asio::strand<IoContext::executor_type> strand_;
    std::string host_;
    uint16_t port_;
    std::string redis_pass_;
    std::chrono::milliseconds timeout_;
    boost::asio::ip::tcp::socket socket_;
    boost::asio::steady_timer timer_;
    uint64_t timer_gen_ = 0;
    uint64_t conn_gen_ = 0;
    std::string rbuf_;
    std::array<char, 4096> chunk_{};
    std::deque<Pending> queue_;
    std::optional<Pending> current_;
    bool busy_ = false;
    bool stopped_ = false;
    bool reported_down_ = false;
    std::atomic<State> state_{State::Disconnected};

    static constexpr std::size_t MAX_QUEUE = 10000;
    static constexpr std::size_t MAX_REPLY = 8 * 1024 * 1024;
};
