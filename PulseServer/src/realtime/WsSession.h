#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <deque>
#include <memory>
#include <string>
#include "NotificationHub.h"
#include "../net/Request.h"

namespace realtime {

// One upgraded /ws connection. Runs on the strand its socket was accepted
// on; every write goes through a FIFO queue on that strand.
class WsSession : public ConnectionSink, public std::enable_shared_from_this<WsSession> {
public:
    WsSession(boost::asio::ip::tcp::socket&& socket, NotificationHub& hub, std::chrono::seconds auth_timeout);

    // req is the upgrade request; its "token" query parameter authenticates
    // the connection, otherwise the first frame must be an auth event.
    void run(Request req);

    void deliver(std::shared_ptr<const std::string> frame) override;
    void close() override;

    ConnState state() const { return state_; }

private:
    void on_accept(const boost::system::error_code& ec, const std::string& token);
    void await_auth_frame();
    void authenticate(const std::string& token);
    void reject(const char* reason);
    void do_read();
    void do_write();
    void do_close(boost::beast::websocket::close_reason reason);
    void on_closed();

    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    boost::beast::flat_buffer buffer_;
    boost::asio::steady_timer auth_timer_;
    NotificationHub& hub_;
    std::chrono::seconds auth_timeout_;
    std::deque<std::shared_ptr<const std::string>> queue_;
    std::string connection_id_;
    ConnState state_ = ConnState::Connecting;
    bool writing_ = false;
    bool close_pending_ = false;
    bool closing_ = false;
    boost::beast::websocket::close_reason pending_reason_;

    static constexpr std::size_t MAX_QUEUE = 1024;
    static constexpr std::size_t MAX_FRAME = 64 * 1024;
};

}
