#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>

class RedisClient;
class RedisSubscriber;

namespace realtime {

// One fan-out as it travels between processes.
struct BusMessage {
    enum class Scope { User, Room, All };
    Scope scope = Scope::All;
    std::string target;    // user id or room name; empty for All
    std::string exclude;   // connection id to skip, if any
    std::string event;
    std::string data;      // JSON object
};

struct Envelope {
    std::string origin;
    BusMessage message;
};

std::string encode_envelope(const Envelope& e);
std::optional<Envelope> decode_envelope(const std::string& text);

// Carries hub fan-outs to sibling processes. Local delivery never goes
// through the bus; a bus only reports messages that originated elsewhere.
class EventBus {
public:
    using RemoteHandler = std::function<void(const BusMessage&)>;

    virtual ~EventBus() = default;
    virtual const char* name() const = 0;
    virtual void start(RemoteHandler on_remote) = 0;
    virtual void publish(const BusMessage& m) = 0;
    virtual void stop() = 0;
};

// Single-process deployments: nothing to relay.
class LocalEventBus : public EventBus {
public:
    const char* name() const override { return "local"; }
    void start(RemoteHandler) override {}
    void publish(const BusMessage&) override {}
    void stop() override {}
};

// PUBLISH on a channel through the shared client, SUBSCRIBE on a dedicated
// connection. A process drops envelopes carrying its own node id.
class RedisEventBus : public EventBus {
public:
    RedisEventBus(std::shared_ptr<RedisClient> publisher, std::shared_ptr<RedisSubscriber> subscriber,
                  std::string channel, std::string node_id);

    const char* name() const override { return "redis"; }
    void start(RemoteHandler on_remote) override;
    void publish(const BusMessage& m) override;
    void stop() override;
    const std::string& node_id() const { return node_id_; }

private:
    std::shared_ptr<RedisClient> publisher_;
    std::shared_ptr<RedisSubscriber> subscriber_;
    std::string channel_;
    std::string node_id_;
    std::shared_ptr<std::atomic<bool>> publish_down_;
};

}
