#pragma once

#include <boost/asio.hpp>
#include <array>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include "Resp.h"

// Dedicated SUBSCRIBE connection for one channel. Reconnects with
// exponential backoff; messages published while disconnected are lost.
class RedisSubscriber : public std::enable_shared_from_this<RedisSubscriber> {
public:
    using IoContext = boost::asio::io_context;
    using MessageCb = std::function<void(const std::string& payload)>;

    RedisSubscriber(IoContext& ioc, std::string host, uint16_t port, std::string pass, std::string channel,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(2000));
    void start(MessageCb on_message);
    void stop();
    bool subscribed() const { return subscribed_.load(); }

private:
    void do_connect();
    void send(std::string cmd, std::function<void()> next);
    void read_loop();
    void handle(const cache::RespValue& v);
    void on_failure(const boost::system::error_code& ec);

    IoContext& ioc_;
    boost::asio::strand<IoContext::executor_type> strand_;
    std::string host_;
    uint16_t port_;
    std::string pass_;
    std::string channel_;
    std::chrono::milliseconds timeout_;
    boost::asio::ip::tcp::socket socket_;
    boost::asio::steady_timer timer_;
    std::string rbuf_;
    std::array<char, 4096> chunk_{};
    MessageCb on_message_;
    uint64_t conn_gen_ = 0;
    std::chrono::milliseconds backoff_{500};
    bool stopped_ = false;
    bool reported_down_ = false;
    std::atomic<bool> subscribed_{false};

    static constexpr std::size_t MAX_BUFFER = 8 * 1024 * 1024;
};
