#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
#include <optional>

namespace cache {

enum class RespType { SimpleString, Error, Integer, BulkString, Array, Null };

struct RespValue {
    RespType type = RespType::Null;
    std::string str;
    int64_t integer = 0;
    std::vector<RespValue> arr;
};

enum class RespParse { Ok, Incomplete, Malformed };

std::string resp_encode(const std::vector<std::string>& args);

// Parses one reply from the front of buf. On Ok, consumed is the reply length.
RespParse resp_parse_prefix(std::string_view buf, RespValue& out, size_t& consumed);

// Whole-buffer parse; nullopt if buf is not exactly one complete reply.
std::optional<RespValue> resp_parse(const std::string& buf);

}
