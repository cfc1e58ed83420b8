#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include "cache/RedisClient.h"
#include "cache/RedisSubscriber.h"
#include "realtime/EventBus.h"
#include "fake_redis.h"
#include "test_util.h"

using namespace realtime;

static const std::string CHANNEL = "pulse:test";

int main() {
    Envelope e;
    e.origin = "node-a";
    e.message.scope = BusMessage::Scope::Room;
    e.message.target = "conversation_9";
    e.message.exclude = "c1";
    e.message.event = "typing";
    e.message.data = "{\"is_typing\":true}";
    auto wire = encode_envelope(e);
    if (wire != "{\"origin\":\"node-a\",\"scope\":\"room\",\"target\":\"conversation_9\",\"exclude\":\"c1\",\"event\":\"typing\",\"data\":{\"is_typing\":true}}") {
        std::cerr << "envelope encoding mismatch: " << wire << "\n"; return 1;
    }
    auto d = decode_envelope(wire);
    if (!d || d->origin != "node-a" || d->message.scope != BusMessage::Scope::Room || d->message.target != "conversation_9" ||
        d->message.exclude != "c1" || d->message.event != "typing" || d->message.data != "{\"is_typing\":true}") {
        std::cerr << "envelope decoding mismatch\n"; return 1;
    }
    const char* bad[] = {
        "not json",
        "{\"scope\":\"all\",\"event\":\"x\",\"data\":{}}",
        "{\"origin\":\"n\",\"scope\":\"everyone\",\"event\":\"x\",\"data\":{}}",
        "{\"origin\":\"n\",\"scope\":\"user\",\"event\":\"x\",\"data\":{}}",
        "{\"origin\":\"n\",\"scope\":\"all\",\"event\":\"x\",\"data\":[1]}",
        "{\"origin\":\"n\",\"scope\":\"all\",\"data\":{}}",
        "{\"origin\":5,\"scope\":\"all\",\"event\":\"x\",\"data\":{}}",
    };
    for (auto b : bad) {
        if (decode_envelope(b).has_value()) { std::cerr << "accepted bad envelope: " << b << "\n"; return 1; }
    }

    LocalEventBus local;
    local.start(nullptr);
    local.publish(e.message);
    local.stop();
    if (std::string(local.name()) != "local") { std::cerr << "local bus name mismatch\n"; return 1; }

    FakeRedis server;
    boost::asio::io_context io;
    auto make_bus = [&](const std::string& node) {
        auto pub = std::make_shared<RedisClient>(io, "127.0.0.1", server.port(), "", std::chrono::milliseconds(500));
        pub->start();
        auto sub = std::make_shared<RedisSubscriber>(io, "127.0.0.1", server.port(), "", CHANNEL, std::chrono::milliseconds(500));
        return std::make_shared<RedisEventBus>(pub, sub, CHANNEL, node);
    };
    auto bus_a = make_bus("node-a");
    auto bus_b = make_bus("node-b");
    std::vector<BusMessage> got_a, got_b;
    bus_a->start([&](const BusMessage& m) { got_a.push_back(m); });
    bus_b->start([&](const BusMessage& m) { got_b.push_back(m); });
    if (!run_until(io, [&] { return server.subscribers(CHANNEL) == 2; })) { std::cerr << "buses never subscribed\n"; return 1; }

    BusMessage note;
    note.scope = BusMessage::Scope::User;
    note.target = "42";
    note.event = "notification";
    note.data = "{\"title\":\"hello\"}";
    bus_a->publish(note);
    if (!run_until(io, [&] { return got_b.size() == 1; })) { std::cerr << "node-b never received the fan-out\n"; return 1; }
    if (got_b[0].target != "42" || got_b[0].event != "notification" || got_b[0].data != note.data) { std::cerr << "relayed message mismatch\n"; return 1; }
    if (server.published(CHANNEL).size() != 1) { std::cerr << "expected one PUBLISH\n"; return 1; }

    // garbage is dropped, foreign origins reach both nodes
    server.inject(CHANNEL, "garbage");
    Envelope foreign;
    foreign.origin = "node-c";
    foreign.message.event = "user_status";
    foreign.message.data = "{\"status\":\"online\"}";
    server.inject(CHANNEL, encode_envelope(foreign));
    if (!run_until(io, [&] { return got_a.size() == 1 && got_b.size() == 2; })) { std::cerr << "foreign envelope not delivered to both nodes\n"; return 1; }
    if (got_a[0].event != "user_status" || got_a[0].scope != BusMessage::Scope::All) { std::cerr << "foreign message mismatch\n"; return 1; }

    // a node never hears its own publish
    io.restart();
    io.run_for(std::chrono::milliseconds(100));
    if (got_a.size() != 1) { std::cerr << "node-a received its own envelope\n"; return 1; }

    bus_a->stop();
    bus_b->stop();
    io.restart();
    io.run_for(std::chrono::milliseconds(50));
    std::cout << "event_bus_unit ok\n";
    return 0;
}
