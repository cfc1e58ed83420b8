#include "Events.h"
#include "../net/MiniJson.h"
#include <openssl/rand.h>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <random>
#include <stdexcept>

namespace realtime {

std::string iso_timestamp_utc() {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count();
    std::time_t t = static_cast<std::time_t>(ms / 1000);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
        tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, int(ms % 1000));
    return std::string(buf);
}

std::string make_frame(const std::string& event, const std::string& data_json) {
    std::string out;
    out.reserve(event.size() + data_json.size() + 20);
    out += "{\"event\":";
    out += json_quote(event);
    out += ",\"data\":";
    out += data_json;
    out += '}';
    return out;
}

std::optional<std::string> with_timestamp(const std::string& data_json) {
    if (!json_is_object(data_json)) return std::nullopt;
    if (json_extract_raw(data_json, "timestamp").has_value()) return data_json;
    auto close = data_json.rfind('}');
    std::string out = data_json.substr(0, close);
    bool empty = json_canonicalize(data_json) == std::optional<std::string>("{}");
    if (!empty) out += ',';
    out += "\"timestamp\":" + json_quote(iso_timestamp_utc()) + "}";
    return out;
}

std::optional<ClientFrame> parse_client_frame(const std::string& text) {
    try {
        if (!json_is_object(text)) return std::nullopt;
        auto ev = json_extract_string_present(text, "event");
        if (!ev.first || ev.second.empty()) return std::nullopt;
        ClientFrame f;
        f.event = ev.second;
        auto data = json_extract_raw(text, "data");
        f.data = (data.has_value() && json_is_object(*data)) ? *data : std::string("{}");
        return f;
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
}

std::string random_id(int bytes) {
    std::string raw(static_cast<size_t>(bytes), '\0');
    if (RAND_bytes(reinterpret_cast<unsigned char*>(&raw[0]), bytes) != 1) {
        std::random_device rd;
        for (auto& c : raw) c = static_cast<char>(rd() & 0xff);
    }
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(raw.size() * 2);
    for (unsigned char c : raw) { out.push_back(hex[c >> 4]); out.push_back(hex[c & 0xf]); }
    return out;
}

}
