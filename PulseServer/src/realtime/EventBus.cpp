#include "EventBus.h"
#include "../cache/RedisClient.h"
#include "../cache/RedisSubscriber.h"
#include "../net/MiniJson.h"
#include "../observability/Logging.h"
#include "../observability/Metrics.h"
#include <stdexcept>

namespace realtime {

namespace {

const char* scope_name(BusMessage::Scope s) {
    switch (s) {
        case BusMessage::Scope::User: return "user";
        case BusMessage::Scope::Room: return "room";
        case BusMessage::Scope::All: return "all";
    }
    return "all";
}

std::optional<BusMessage::Scope> scope_from(const std::string& s) {
    if (s == "user") return BusMessage::Scope::User;
    if (s == "room") return BusMessage::Scope::Room;
    if (s == "all") return BusMessage::Scope::All;
    return std::nullopt;
}

}

std::string encode_envelope(const Envelope& e) {
    const auto& m = e.message;
    std::string out = "{\"origin\":" + json_quote(e.origin);
    out += ",\"scope\":\"";
    out += scope_name(m.scope);
    out += "\",\"target\":" + json_quote(m.target);
    out += ",\"exclude\":" + json_quote(m.exclude);
    out += ",\"event\":" + json_quote(m.event);
    out += ",\"data\":" + m.data + "}";
    return out;
}

std::optional<Envelope> decode_envelope(const std::string& text) {
    try {
        if (!json_is_object(text)) return std::nullopt;
        Envelope e;
        e.origin = json_extract_string(text, "origin");
        auto scope = scope_from(json_extract_string(text, "scope"));
        if (e.origin.empty() || !scope.has_value()) return std::nullopt;
        e.message.scope = *scope;
        e.message.target = json_extract_string(text, "target");
        e.message.exclude = json_extract_string(text, "exclude");
        e.message.event = json_extract_string(text, "event");
        auto data = json_extract_raw(text, "data");
        if (e.message.event.empty() || !data.has_value() || !json_is_object(*data)) return std::nullopt;
        e.message.data = *data;
        if (e.message.scope != BusMessage::Scope::All && e.message.target.empty()) return std::nullopt;
        return e;
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
}

RedisEventBus::RedisEventBus(std::shared_ptr<RedisClient> publisher, std::shared_ptr<RedisSubscriber> subscriber,
                             std::string channel, std::string node_id)
    : publisher_(std::move(publisher)), subscriber_(std::move(subscriber)), channel_(std::move(channel)),
      node_id_(std::move(node_id)), publish_down_(std::make_shared<std::atomic<bool>>(false)) {}

void RedisEventBus::start(RemoteHandler on_remote) {
    subscriber_->start([node = node_id_, on_remote = std::move(on_remote)](const std::string& payload) {
        auto env = decode_envelope(payload);
        if (!env.has_value()) {
            observability::log_warn("bus.bad_envelope", {{"bytes", int64_t(payload.size())}});
            return;
        }
        if (env->origin == node) return;
        observability::Metrics::instance().add("bus_received_total");
        if (on_remote) on_remote(env->message);
    });
    observability::log_info("bus.started", {{"backend", std::string(name())}, {"channel", channel_}, {"node", node_id_}});
}

void RedisEventBus::publish(const BusMessage& m) {
    auto down = publish_down_;
    std::string channel = channel_;
    publisher_->async_publish(channel_, encode_envelope({node_id_, m}), [down, channel](boost::system::error_code ec, int64_t) {
        if (ec) {
            if (!down->exchange(true)) observability::log_warn("bus.publish_failed", {{"channel", channel}, {"err", ec.message()}});
            return;
        }
        if (down->exchange(false)) observability::log_info("bus.publish_recovered", {{"channel", channel}});
        observability::Metrics::instance().add("bus_published_total");
    });
}

void RedisEventBus::stop() {
    subscriber_->stop();
}

}
