#include "Resp.h"
#include "../net/MiniJson.h"

namespace cache {

namespace {

constexpr int64_t MAX_BULK = 4 * 1024 * 1024;
constexpr int64_t MAX_ARRAY = 1024 * 1024;
constexpr int MAX_NESTING = 16;

RespParse read_line(std::string_view buf, size_t& pos, std::string_view& line) {
    size_t e = buf.find("\r\n", pos);
    if (e == std::string_view::npos) return RespParse::Incomplete;
    line = buf.substr(pos, e - pos);
    pos = e + 2;
    return RespParse::Ok;
}

RespParse parse_single(std::string_view buf, size_t& pos, RespValue& v, int depth) {
    if (depth > MAX_NESTING) return RespParse::Malformed;
    if (pos >= buf.size()) return RespParse::Incomplete;
    char t = buf[pos++];
    std::string_view line;
    auto st = read_line(buf, pos, line);
    if (st != RespParse::Ok) return st;
    switch (t) {
        case '+': v.type = RespType::SimpleString; v.str = std::string(line); return RespParse::Ok;
        case '-': v.type = RespType::Error; v.str = std::string(line); return RespParse::Ok;
        case ':': {
            auto n = parse_int64_strict_sv(line);
            if (!n.has_value()) return RespParse::Malformed;
            v.type = RespType::Integer; v.integer = *n;
            return RespParse::Ok;
        }
        case '$': {
            auto len = parse_int64_strict_sv(line);
            if (!len.has_value() || *len < -1 || *len > MAX_BULK) return RespParse::Malformed;
            if (*len == -1) { v.type = RespType::Null; return RespParse::Ok; }
            size_t n = static_cast<size_t>(*len);
            if (pos + n + 2 > buf.size()) return RespParse::Incomplete;
            if (buf[pos + n] != '\r' || buf[pos + n + 1] != '\n') return RespParse::Malformed;
            v.type = RespType::BulkString;
            v.str = std::string(buf.substr(pos, n));
            pos += n + 2;
            return RespParse::Ok;
        }
        case '*': {
            auto cnt = parse_int64_strict_sv(line);
            if (!cnt.has_value() || *cnt < -1 || *cnt > MAX_ARRAY) return RespParse::Malformed;
            if (*cnt == -1) { v.type = RespType::Null; return RespParse::Ok; }
            v.type = RespType::Array;
            v.arr.clear();
            for (int64_t i = 0; i < *cnt; ++i) {
                RespValue elem;
                auto est = parse_single(buf, pos, elem, depth + 1);
                if (est != RespParse::Ok) return est;
                v.arr.push_back(std::move(elem));
            }
            return RespParse::Ok;
        }
        default:
            return RespParse::Malformed;
    }
}

}

std::string resp_encode(const std::vector<std::string>& args) {
    std::string out;
    out += "*" + std::to_string(args.size()) + "\r\n";
    for (const auto& a : args) {
        out += "$" + std::to_string(a.size()) + "\r\n";
        out += a + "\r\n";
    }
    return out;
}

RespParse resp_parse_prefix(std::string_view buf, RespValue& out, size_t& consumed) {
    size_t pos = 0;
    RespValue v;
    auto st = parse_single(buf, pos, v, 0);
    if (st != RespParse::Ok) return st;
    out = std::move(v);
    consumed = pos;
    return RespParse::Ok;
}

std::optional<RespValue> resp_parse(const std::string& buf) {
    RespValue v;
    size_t consumed = 0;
    if (resp_parse_prefix(buf, v, consumed) != RespParse::Ok) return std::nullopt;
    if (consumed != buf.size()) return std::nullopt;
    return v;
}

}
