#include "WsSession.h"
#include "Events.h"
#include "../net/HttpUtil.h"
#include "../net/MiniJson.h"
#include "../observability/Logging.h"
#include <stdexcept>

namespace realtime {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;

WsSession::WsSession(net::ip::tcp::socket&& socket, NotificationHub& hub, std::chrono::seconds auth_timeout)
    : ws_(std::move(socket)), auth_timer_(ws_.get_executor()), hub_(hub), auth_timeout_(auth_timeout) {}

void WsSession::run(Request req) {
    // The HTTP read deadline no longer applies once upgraded.
    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(beast::http::field::server, "pulse-server");
    }));
    ws_.read_message_max(MAX_FRAME);
    auto q = parse_query(std::string(req.target()));
    auto it = q.find("token");
    std::string token = it == q.end() ? std::string() : it->second;
    auto self = shared_from_this();
    auto upgrade = std::make_shared<Request>(std::move(req));
    net::dispatch(ws_.get_executor(), [self, upgrade, token]() {
        self->ws_.async_accept(*upgrade, [self, upgrade, token](beast::error_code ec) { self->on_accept(ec, token); });
    });
}

void WsSession::on_accept(const boost::system::error_code& ec, const std::string& token) {
    if (ec) {
        observability::log_warn("ws.accept_failed", {{"err", ec.message()}});
        state_ = ConnState::Disconnected;
        return;
    }
    if (!token.empty()) { authenticate(token); return; }
    await_auth_frame();
}

void WsSession::await_auth_frame() {
    auto self = shared_from_this();
    auth_timer_.expires_after(auth_timeout_);
    auth_timer_.async_wait([self](const boost::system::error_code& ec) {
        if (ec || self->state_ != ConnState::Connecting) return;
        self->reject("authentication timeout");
    });
    ws_.async_read(buffer_, [self](beast::error_code ec, std::size_t) {
        if (ec) { self->on_closed(); return; }
        if (self->state_ != ConnState::Connecting) return;
        std::string text = beast::buffers_to_string(self->buffer_.data());
        self->buffer_.consume(self->buffer_.size());
        auto frame = parse_client_frame(text);
        std::string token;
        if (frame.has_value() && frame->event == "auth") {
            try {
                token = json_extract_string(frame->data, "token");
            } catch (const std::runtime_error&) {
                token.clear();
            }
        }
        if (token.empty()) { self->reject("authentication required"); return; }
        self->authenticate(token);
    });
}

void WsSession::authenticate(const std::string& token) {
    auto claims = hub_.authenticate(token);
    if (!claims.has_value()) { reject("authentication failed"); return; }
    auth_timer_.cancel();
    state_ = ConnState::Authenticated;
    connection_id_ = hub_.register_connection(shared_from_this(), *claims);
    state_ = ConnState::Joined;
    do_read();
}

void WsSession::reject(const char* reason) {
    observability::log_warn("ws.rejected", {{"reason", std::string(reason)}});
    state_ = ConnState::Disconnected;
    do_close(websocket::close_reason(websocket::close_code::policy_error, reason));
}

void WsSession::do_read() {
    auto self = shared_from_this();
    ws_.async_read(buffer_, [self](beast::error_code ec, std::size_t) {
        if (ec) { self->on_closed(); return; }
        std::string text = beast::buffers_to_string(self->buffer_.data());
        self->buffer_.consume(self->buffer_.size());
        if (self->ws_.got_text()) self->hub_.handle_client_message(self->connection_id_, text);
        if (self->state_ == ConnState::Disconnected) return;
        self->do_read();
    });
}

void WsSession::deliver(std::shared_ptr<const std::string> frame) {
    net::post(ws_.get_executor(), [self = shared_from_this(), frame = std::move(frame)]() {
        if (self->closing_ || self->close_pending_) return;
        if (self->queue_.size() >= MAX_QUEUE) {
            observability::log_warn("ws.slow_consumer", {{"conn", self->connection_id_}, {"queued", int64_t(self->queue_.size())}});
            self->do_close(websocket::close_reason(websocket::close_code::try_again_later, "send queue full"));
            return;
        }
        self->queue_.push_back(frame);
        if (!self->writing_) self->do_write();
    });
}

void WsSession::do_write() {
    if (queue_.empty()) {
        writing_ = false;
        if (close_pending_) { close_pending_ = false; do_close(pending_reason_); }
        return;
    }
    writing_ = true;
    ws_.text(true);
    auto self = shared_from_this();
    ws_.async_write(net::buffer(*queue_.front()), [self](beast::error_code ec, std::size_t) {
        if (ec) {
            self->writing_ = false;
            self->queue_.clear();
            self->on_closed();
            return;
        }
        self->queue_.pop_front();
        self->do_write();
    });
}

void WsSession::close() {
    net::post(ws_.get_executor(), [self = shared_from_this()]() {
        self->do_close(websocket::close_reason(websocket::close_code::normal));
    });
}

void WsSession::do_close(websocket::close_reason reason) {
    if (closing_) return;
    // Frames queued before the close still go out first.
    if (writing_) {
        close_pending_ = true;
        pending_reason_ = reason;
        return;
    }
    closing_ = true;
    auth_timer_.cancel();
    auto self = shared_from_this();
    ws_.async_close(reason, [self](beast::error_code ec) {
        if (ec && ec != net::error::operation_aborted && ec != websocket::error::closed) {
            observability::log_debug("ws.close_error", {{"conn", self->connection_id_}, {"err", ec.message()}});
        }
        self->on_closed();
    });
}

void WsSession::on_closed() {
    auth_timer_.cancel();
    if (state_ == ConnState::Disconnected && connection_id_.empty()) return;
    state_ = ConnState::Disconnected;
    if (!connection_id_.empty()) {
        hub_.unregister_connection(connection_id_);
        connection_id_.clear();
    }
}

}
