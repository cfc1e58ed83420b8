#pragma once

#include <optional>
#include <string>

namespace realtime {

// Current time as ISO-8601 UTC with milliseconds, e.g. 2024-05-01T10:00:00.123Z
std::string iso_timestamp_utc();

// {"event":"<name>","data":<data_json>}
std::string make_frame(const std::string& event, const std::string& data_json);

// Adds "timestamp" to a JSON object that lacks one. nullopt if data_json is
// not an object.
std::optional<std::string> with_timestamp(const std::string& data_json);

struct ClientFrame {
    std::string event;
    std::string data;   // raw JSON, "{}" when absent
};

// nullopt for anything that is not {"event":"...",...}.
std::optional<ClientFrame> parse_client_frame(const std::string& text);

// Random lowercase hex of 2*bytes characters.
std::string random_id(int bytes = 8);

}
