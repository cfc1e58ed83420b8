#include "NotificationHub.h"
#include "Events.h"
#include "../net/MiniJson.h"
#include "../observability/Logging.h"
#include "../observability/Metrics.h"
#include <algorithm>
#include <stdexcept>

namespace realtime {

namespace {

// Numeric ids go out as numbers, anything else as a string.
std::string json_id(const std::string& id) {
    if (parse_int64_strict_sv(id).has_value()) return id;
    return json_quote(id);
}

}

const char* state_name(ConnState s) {
    switch (s) {
        case ConnState::Connecting: return "connecting";
        case ConnState::Authenticated: return "authenticated";
        case ConnState::Joined: return "joined";
        case ConnState::Disconnected: return "disconnected";
    }
    return "disconnected";
}

std::string user_room(const std::string& user_id) { return "user_" + user_id; }
std::string conversation_room(const std::string& conversation_id) { return "conversation_" + conversation_id; }

NotificationHub::NotificationHub(std::string jwt_secret, std::shared_ptr<EventBus> bus)
    : jwt_secret_(std::move(jwt_secret)), bus_(bus ? std::move(bus) : std::make_shared<LocalEventBus>()) {
    dispatch_["ping"] = [this](const std::string& id, const std::string&) {
        send_to(id, "pong", "{\"timestamp\":" + json_quote(iso_timestamp_utc()) + "}");
    };
    dispatch_["join_conversation"] = [this](const std::string& id, const std::string& data) { room_op(id, data, true); };
    dispatch_["leave_conversation"] = [this](const std::string& id, const std::string& data) { room_op(id, data, false); };
    dispatch_["typing"] = [this](const std::string& id, const std::string& data) {
        auto conv = json_extract_id_opt(data, "conversation_id");
        if (!conv.has_value()) return;
        typing(id, *conv, json_extract_bool_opt(data, "is_typing").value_or(true));
    };
    dispatch_["logout"] = [this](const std::string& id, const std::string&) {
        std::shared_ptr<ConnectionSink> sink;
        {
            std::lock_guard lock(mu_);
            auto it = connections_.find(id);
            if (it != connections_.end()) sink = it->second.sink.lock();
        }
        unregister_connection(id);
        if (sink) sink->close();
    };
}

void NotificationHub::start() {
    bus_->start([this](const BusMessage& m) { deliver_remote(m); });
}

void NotificationHub::stop() {
    bus_->stop();
    std::vector<std::shared_ptr<ConnectionSink>> sinks;
    {
        std::lock_guard lock(mu_);
        for (auto& kv : connections_) {
            if (auto s = kv.second.sink.lock()) sinks.push_back(std::move(s));
        }
    }
    for (auto& s : sinks) s->close();
}

std::optional<auth::Claims> NotificationHub::authenticate(const std::string& token) const {
    if (token.empty() || jwt_secret_.empty()) return std::nullopt;
    auto claims = auth::verify_jwt(token, jwt_secret_);
    if (!claims.has_value()) observability::log_warn("hub.auth_failed", {});
    return claims;
}

std::string NotificationHub::register_connection(std::shared_ptr<ConnectionSink> sink, const auth::Claims& claims) {
    std::string id = random_id(8);
    std::string room = user_room(claims.sub);
    BusMessage online;
    bool first = false;
    {
        std::lock_guard lock(mu_);
        Entry e;
        e.info.id = id;
        e.info.user_id = claims.sub;
        e.info.user_name = claims.username.empty() ? std::string("Unknown") : claims.username;
        e.info.authenticated_at = iso_timestamp_utc();
        e.info.rooms.insert(room);
        e.info.state = ConnState::Joined;
        e.sink = sink;
        connections_[id] = std::move(e);
        rooms_[room].insert(id);
        auto& conns = presence_[claims.sub];
        first = conns.empty();
        conns.insert(id);
        update_gauge_locked();

        std::string data = "{\"sid\":" + json_quote(id) + ",\"user_id\":" + json_quote(claims.sub) +
                           ",\"timestamp\":" + json_quote(iso_timestamp_utc()) + "}";
        sink->deliver(std::make_shared<const std::string>(make_frame("connected", data)));
        if (first) {
            online.scope = BusMessage::Scope::All;
            online.event = "user_status";
            online.data = "{\"user_id\":" + json_quote(claims.sub) + ",\"status\":\"online\",\"timestamp\":" +
                          json_quote(iso_timestamp_utc()) + "}";
            deliver_locked(online);
        }
    }
    if (first) bus_->publish(online);
    observability::log_info("hub.connected", {{"conn", id}, {"user", claims.sub}});
    return id;
}

void NotificationHub::unregister_connection(const std::string& connection_id) {
    BusMessage offline;
    bool last = false;
    std::string user;
    {
        std::lock_guard lock(mu_);
        auto it = connections_.find(connection_id);
        if (it == connections_.end()) return;
        user = it->second.info.user_id;
        for (const auto& room : it->second.info.rooms) {
            auto r = rooms_.find(room);
            if (r == rooms_.end()) continue;
            r->second.erase(connection_id);
            if (r->second.empty()) rooms_.erase(r);
        }
        auto p = presence_.find(user);
        if (p != presence_.end()) {
            p->second.erase(connection_id);
            if (p->second.empty()) {
                presence_.erase(p);
                last = true;
            }
        }
        connections_.erase(it);
        update_gauge_locked();
        if (last) {
            offline.scope = BusMessage::Scope::All;
            offline.event = "user_status";
            offline.data = "{\"user_id\":" + json_quote(user) + ",\"status\":\"offline\",\"timestamp\":" +
                           json_quote(iso_timestamp_utc()) + "}";
            deliver_locked(offline);
        }
    }
    if (last) bus_->publish(offline);
    observability::log_info("hub.disconnected", {{"conn", connection_id}, {"user", user}});
}

void NotificationHub::handle_client_message(const std::string& connection_id, const std::string& text) {
    auto frame = parse_client_frame(text);
    if (!frame.has_value()) {
        observability::log_debug("hub.bad_frame", {{"conn", connection_id}});
        return;
    }
    {
        std::lock_guard lock(mu_);
        if (connections_.find(connection_id) == connections_.end()) return;
    }
    auto h = dispatch_.find(frame->event);
    if (h == dispatch_.end()) {
        observability::log_debug("hub.unknown_event", {{"conn", connection_id}, {"event", frame->event}});
        return;
    }
    try {
        h->second(connection_id, frame->data);
    } catch (const std::runtime_error& e) {
        observability::log_debug("hub.bad_frame", {{"conn", connection_id}, {"event", frame->event}, {"err", std::string(e.what())}});
    }
}

bool NotificationHub::join_room(const std::string& connection_id, const std::string& room) {
    std::lock_guard lock(mu_);
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) return false;
    it->second.info.rooms.insert(room);
    rooms_[room].insert(connection_id);
    return true;
}

bool NotificationHub::leave_room(const std::string& connection_id, const std::string& room) {
    std::lock_guard lock(mu_);
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) return false;
    if (room == user_room(it->second.info.user_id)) return false;
    it->second.info.rooms.erase(room);
    auto r = rooms_.find(room);
    if (r != rooms_.end()) {
        r->second.erase(connection_id);
        if (r->second.empty()) rooms_.erase(r);
    }
    return true;
}

bool NotificationHub::room_op(const std::string& connection_id, const std::string& data, bool join) {
    auto conv = json_extract_id_opt(data, "conversation_id");
    if (!conv.has_value()) return false;
    std::string room = conversation_room(*conv);
    bool ok = join ? join_room(connection_id, room) : leave_room(connection_id, room);
    if (!ok) return false;
    send_to(connection_id, join ? "joined_conversation" : "left_conversation",
            "{\"conversation_id\":" + json_id(*conv) + "}");
    observability::log_debug(join ? "hub.joined" : "hub.left", {{"conn", connection_id}, {"room", room}});
    return true;
}

std::size_t NotificationHub::send_notification(const std::string& user_id, const std::string& payload_json) {
    auto data = with_timestamp(payload_json);
    if (!data.has_value()) {
        observability::log_warn("hub.bad_payload", {{"event", std::string("notification")}});
        return 0;
    }
    BusMessage m;
    m.scope = BusMessage::Scope::User;
    m.target = user_id;
    m.event = "notification";
    m.data = std::move(*data);
    return fan_out(m, true);
}

std::size_t NotificationHub::broadcast_like_update(const std::string& post_id, int64_t like_count,
                                                   const std::optional<std::string>& user_id) {
    BusMessage m;
    m.event = "like_update";
    m.data = "{\"post_id\":" + json_id(post_id) + ",\"like_count\":" + std::to_string(like_count) +
             ",\"user_id\":" + json_emit_string_or_null(user_id) + ",\"timestamp\":" + json_quote(iso_timestamp_utc()) + "}";
    return fan_out(m, true);
}

std::size_t NotificationHub::broadcast_comment_update(const std::string& post_id, int64_t comment_count,
                                                      const std::optional<std::string>& comment_json) {
    BusMessage m;
    m.event = "comment_update";
    m.data = "{\"post_id\":" + json_id(post_id) + ",\"comment_count\":" + std::to_string(comment_count) +
             ",\"timestamp\":" + json_quote(iso_timestamp_utc());
    if (comment_json.has_value()) {
        if (json_is_object(*comment_json)) m.data += ",\"comment\":" + *comment_json;
        else observability::log_warn("hub.bad_payload", {{"event", m.event}});
    }
    m.data += "}";
    return fan_out(m, true);
}

std::size_t NotificationHub::send_message(const std::string& conversation_id, const std::string& message_json) {
    auto data = with_timestamp(message_json);
    if (!data.has_value()) {
        observability::log_warn("hub.bad_payload", {{"event", std::string("new_message")}});
        return 0;
    }
    BusMessage m;
    m.scope = BusMessage::Scope::Room;
    m.target = conversation_room(conversation_id);
    m.event = "new_message";
    m.data = std::move(*data);
    return fan_out(m, true);
}

std::size_t NotificationHub::typing(const std::string& connection_id, const std::string& conversation_id, bool is_typing) {
    BusMessage m;
    {
        std::lock_guard lock(mu_);
        auto it = connections_.find(connection_id);
        if (it == connections_.end()) return 0;
        const auto& info = it->second.info;
        m.data = "{\"user_id\":" + json_quote(info.user_id) + ",\"user_name\":" + json_quote(info.user_name) +
                 ",\"is_typing\":" + (is_typing ? "true" : "false") + ",\"conversation_id\":" + json_id(conversation_id) + "}";
    }
    m.scope = BusMessage::Scope::Room;
    m.target = conversation_room(conversation_id);
    m.exclude = connection_id;
    m.event = "typing";
    return fan_out(m, true);
}

std::vector<std::string> NotificationHub::get_online_users() const {
    std::vector<std::string> out;
    {
        std::lock_guard lock(mu_);
        out.reserve(presence_.size());
        for (const auto& kv : presence_) out.push_back(kv.first);
    }
    std::sort(out.begin(), out.end());
    return out;
}

bool NotificationHub::is_user_online(const std::string& user_id) const {
    std::lock_guard lock(mu_);
    return presence_.count(user_id) > 0;
}

std::size_t NotificationHub::connection_count() const {
    std::lock_guard lock(mu_);
    return connections_.size();
}

std::optional<ConnectionInfo> NotificationHub::connection(const std::string& connection_id) const {
    std::lock_guard lock(mu_);
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) return std::nullopt;
    return it->second.info;
}

std::size_t NotificationHub::deliver_remote(const BusMessage& m) {
    return fan_out(m, false);
}

std::size_t NotificationHub::fan_out(const BusMessage& m, bool publish) {
    std::size_t n = 0;
    {
        std::lock_guard lock(mu_);
        n = deliver_locked(m);
    }
    if (publish) bus_->publish(m);
    return n;
}

std::size_t NotificationHub::deliver_locked(const BusMessage& m) {
    auto frame = std::make_shared<const std::string>(make_frame(m.event, m.data));
    std::size_t n = 0;
    auto send = [&](const std::string& id, Entry& e) {
        if (!m.exclude.empty() && id == m.exclude) return;
        if (auto sink = e.sink.lock()) {
            sink->deliver(frame);
            ++n;
        }
    };
    if (m.scope == BusMessage::Scope::All) {
        for (auto& kv : connections_) send(kv.first, kv.second);
    } else {
        std::string room = m.scope == BusMessage::Scope::User ? user_room(m.target) : m.target;
        auto r = rooms_.find(room);
        if (r != rooms_.end()) {
            for (const auto& id : r->second) {
                auto c = connections_.find(id);
                if (c != connections_.end()) send(id, c->second);
            }
        }
    }
    observability::Metrics::instance().add("hub_events_total");
    return n;
}

void NotificationHub::send_to(const std::string& connection_id, const std::string& event, const std::string& data) {
    std::lock_guard lock(mu_);
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) return;
    if (auto sink = it->second.sink.lock()) sink->deliver(std::make_shared<const std::string>(make_frame(event, data)));
}

void NotificationHub::update_gauge_locked() {
    observability::Metrics::instance().gauge_set("ws_connections", int64_t(connections_.size()));
}

}
