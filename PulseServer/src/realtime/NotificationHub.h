#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include "EventBus.h"
#include "../auth/Jwt.h"

namespace realtime {

// Transport side of one client connection. Implementations queue frames and
// write them in the order deliver() was called; neither call may block or
// call back into the hub.
class ConnectionSink {
public:
    virtual ~ConnectionSink() = default;
    virtual void deliver(std::shared_ptr<const std::string> frame) = 0;
    virtual void close() = 0;
};

enum class ConnState { Connecting, Authenticated, Joined, Disconnected };
const char* state_name(ConnState s);

struct ConnectionInfo {
    std::string id;
    std::string user_id;
    std::string user_name;
    std::string authenticated_at;
    std::set<std::string> rooms;
    ConnState state = ConnState::Connecting;
};

std::string user_room(const std::string& user_id);
std::string conversation_room(const std::string& conversation_id);

// Owns every live connection, the room index and presence. All public
// members are thread-safe.
class NotificationHub {
public:
    explicit NotificationHub(std::string jwt_secret, std::shared_ptr<EventBus> bus = nullptr);
    NotificationHub(const NotificationHub&) = delete;
    NotificationHub& operator=(const NotificationHub&) = delete;

    // Subscribes to remote fan-outs.
    void start();
    void stop();

    std::optional<auth::Claims> authenticate(const std::string& token) const;

    // Inserts the connection, joins user_<id>, sends "connected" and
    // announces the user if this is their first connection. Returns the
    // connection id.
    std::string register_connection(std::shared_ptr<ConnectionSink> sink, const auth::Claims& claims);
    // Idempotent.
    void unregister_connection(const std::string& connection_id);

    // Client frames of a registered connection.
    void handle_client_message(const std::string& connection_id, const std::string& text);

    bool join_room(const std::string& connection_id, const std::string& room);
    bool leave_room(const std::string& connection_id, const std::string& room);

    // Each returns the number of local connections the frame was queued to.
    std::size_t send_notification(const std::string& user_id, const std::string& payload_json);
    std::size_t broadcast_like_update(const std::string& post_id, int64_t like_count,
                                      const std::optional<std::string>& user_id = std::nullopt);
    std::size_t broadcast_comment_update(const std::string& post_id, int64_t comment_count,
                                         const std::optional<std::string>& comment_json = std::nullopt);
    std::size_t send_message(const std::string& conversation_id, const std::string& message_json);
    std::size_t typing(const std::string& connection_id, const std::string& conversation_id, bool is_typing);

    std::vector<std::string> get_online_users() const;
    bool is_user_online(const std::string& user_id) const;
    std::size_t connection_count() const;
    std::optional<ConnectionInfo> connection(const std::string& connection_id) const;
    const char* bus_name() const { return bus_->name(); }

    // Applies a fan-out that another process published.
    std::size_t deliver_remote(const BusMessage& m);

private:
    struct Entry {
        ConnectionInfo info;
        std::weak_ptr<ConnectionSink> sink;
    };
    using Handler = std::function<void(const std::string& connection_id, const std::string& data)>;

    std::size_t fan_out(const BusMessage& m, bool publish);
    std::size_t deliver_locked(const BusMessage& m);
    void send_to(const std::string& connection_id, const std::string& event, const std::string& data);
    bool room_op(const std::string& connection_id, const std::string& data, bool join);
    void update_gauge_locked();

    std::string jwt_secret_;
    std::shared_ptr<EventBus> bus_;
    std::unordered_map<std::string, Handler> dispatch_;

    mutable std::mutex mu_;
    std::unordered_map<std::string, Entry> connections_;
    std::unordered_map<std::string, std::set<std::string>> rooms_;
    std::unordered_map<std::string, std::set<std::string>> presence_;
};

}
