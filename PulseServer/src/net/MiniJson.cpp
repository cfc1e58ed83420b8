#include "MiniJson.h"
#include <stdexcept>
#include <cctype>
#include <vector>
#include <algorithm>

namespace {

constexpr int MAX_DEPTH = 64;

void append_utf8(std::string& out, uint32_t code) {
    if (code <= 0x7f) out.push_back((char)code);
    else if (code <= 0x7ff) {
        out.push_back((char)(0xc0 | ((code >> 6) & 0x1f)));
        out.push_back((char)(0x80 | (code & 0x3f)));
    } else if (code <= 0xffff) {
        out.push_back((char)(0xe0 | ((code >> 12) & 0x0f)));
        out.push_back((char)(0x80 | ((code >> 6) & 0x3f)));
        out.push_back((char)(0x80 | (code & 0x3f)));
    } else {
        out.push_back((char)(0xf0 | ((code >> 18) & 0x07)));
        out.push_back((char)(0x80 | ((code >> 12) & 0x3f)));
        out.push_back((char)(0x80 | ((code >> 6) & 0x3f)));
        out.push_back((char)(0x80 | (code & 0x3f)));
    }
}

struct Scanner {
    std::string_view js;
    size_t pos = 0;

    explicit Scanner(std::string_view s) : js(s) {}

    [[noreturn]] static void fail(const char* what) { throw std::runtime_error(what); }

    void skip_ws() {
        while (pos < js.size() && (js[pos] == ' ' || js[pos] == '\t' || js[pos] == '\n' || js[pos] == '\r')) ++pos;
    }
    bool at_end() const { return pos >= js.size(); }
    char peek() const { return pos < js.size() ? js[pos] : '\0'; }
    void expect(char c) {
        if (peek() != c) fail("unexpected character in json");
        ++pos;
    }

    uint32_t read_hex4() {
        if (pos + 4 > js.size()) fail("invalid unicode escape in json string");
        uint32_t code = 0;
        for (int k = 0; k < 4; ++k) {
            char ch = js[pos++];
            code <<= 4;
            if (ch >= '0' && ch <= '9') code += ch - '0';
            else if (ch >= 'a' && ch <= 'f') code += 10 + (ch - 'a');
            else if (ch >= 'A' && ch <= 'F') code += 10 + (ch - 'A');
            else fail("invalid hex in unicode escape");
        }
        return code;
    }

    std::string read_string() {
        expect('"');
        std::string out;
        for (;;) {
            if (at_end()) fail("unterminated json string");
            char c = js[pos++];
            if (c == '"') return out;
            if (static_cast<unsigned char>(c) < 0x20) fail("control character in json string");
            if (c != '\\') { out.push_back(c); continue; }
            if (at_end()) fail("unterminated escape in json string");
            char e = js[pos++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    uint32_t code = read_hex4();
                    if (code >= 0xd800 && code <= 0xdbff) {
                        if (pos + 6 > js.size() || js[pos] != '\\' || js[pos+1] != 'u') fail("unpaired surrogate in json string");
                        pos += 2;
                        uint32_t low = read_hex4();
                        if (low < 0xdc00 || low > 0xdfff) fail("unpaired surrogate in json string");
                        code = 0x10000 + ((code - 0xd800) << 10) + (low - 0xdc00);
                    }
                    append_utf8(out, code);
                    break;
                }
                default: fail("unsupported escape in json string");
            }
        }
    }

    std::string_view read_number() {
        size_t start = pos;
        if (peek() == '-') ++pos;
        if (peek() == '0') ++pos;
        else if (peek() >= '1' && peek() <= '9') { while (std::isdigit((unsigned char)peek())) ++pos; }
        else fail("invalid json number");
        if (peek() == '.') {
            ++pos;
            if (!std::isdigit((unsigned char)peek())) fail("invalid json number");
            while (std::isdigit((unsigned char)peek())) ++pos;
        }
        if (peek() == 'e' || peek() == 'E') {
            ++pos;
            if (peek() == '+' || peek() == '-') ++pos;
            if (!std::isdigit((unsigned char)peek())) fail("invalid json number");
            while (std::isdigit((unsigned char)peek())) ++pos;
        }
        return js.substr(start, pos - start);
    }

    void literal(std::string_view word) {
        if (js.substr(pos, word.size()) != word) fail("invalid json literal");
        pos += word.size();
    }

    // Canonical rendering of the value at pos into out.
    void emit_value(std::string& out, int depth) {
        if (depth > MAX_DEPTH) fail("json nested too deeply");
        skip_ws();
        char c = peek();
        if (c == '{') {
            ++pos;
            std::vector<std::pair<std::string, std::string>> members;
            skip_ws();
            if (peek() == '}') { ++pos; out += "{}"; return; }
            for (;;) {
                skip_ws();
                std::string key = read_string();
                skip_ws();
                expect(':');
                std::string val;
                emit_value(val, depth + 1);
                members.emplace_back(std::move(key), std::move(val));
                skip_ws();
                if (peek() == ',') { ++pos; continue; }
                expect('}');
                break;
            }
            std::stable_sort(members.begin(), members.end(),
                             [](const auto& a, const auto& b) { return a.first < b.first; });
            out.push_back('{');
            for (size_t i = 0; i < members.size(); ++i) {
                if (i) out.push_back(',');
                out += json_quote(members[i].first);
                out.push_back(':');
                out += members[i].second;
            }
            out.push_back('}');
        } else if (c == '[') {
            ++pos;
            out.push_back('[');
            skip_ws();
            if (peek() == ']') { ++pos; out.push_back(']'); return; }
            for (bool first = true;; first = false) {
                if (!first) out.push_back(',');
                emit_value(out, depth + 1);
                skip_ws();
                if (peek() == ',') { ++pos; continue; }
                expect(']');
                break;
            }
            out.push_back(']');
        } else if (c == '"') {
            out += json_quote(read_string());
        } else if (c == 't') {
            literal("true"); out += "true";
        } else if (c == 'f') {
            literal("false"); out += "false";
        } else if (c == 'n') {
            literal("null"); out += "null";
        } else {
            out += std::string(read_number());
        }
    }

    void skip_value() {
        std::string sink;
        emit_value(sink, 0);
    }
};

// Span of the value stored under key in the outermost object.
std::optional<std::pair<size_t, size_t>> find_member(std::string_view js, const std::string& key) {
    Scanner s(js);
    s.skip_ws();
    if (s.peek() != '{') throw std::runtime_error("json value is not an object");
    ++s.pos;
    s.skip_ws();
    if (s.peek() == '}') return std::nullopt;
    for (;;) {
        s.skip_ws();
        std::string k = s.read_string();
        s.skip_ws();
        s.expect(':');
        s.skip_ws();
        size_t start = s.pos;
        s.skip_value();
        if (k == key) return std::make_pair(start, s.pos);
        s.skip_ws();
        if (s.peek() == ',') { ++s.pos; continue; }
        s.expect('}');
        return std::nullopt;
    }
}

}

std::pair<bool,std::string> json_extract_string_present(const std::string& js, const std::string& key) {
    auto span = find_member(js, key);
    if (!span.has_value()) return {false, std::string()};
    Scanner s(std::string_view(js).substr(span->first, span->second - span->first));
    if (s.peek() == 'n') return {true, std::string()};
    if (s.peek() != '"') throw std::runtime_error("invalid type for json string field");
    return {true, s.read_string()};
}

std::string json_extract_string(const std::string& js, const std::string& key) {
    return json_extract_string_present(js, key).second;
}

std::optional<int64_t> json_extract_int_opt(const std::string& js, const std::string& key) {
    auto span = find_member(js, key);
    if (!span.has_value()) return std::nullopt;
    auto sv = std::string_view(js).substr(span->first, span->second - span->first);
    if (sv == "null") return std::nullopt;
    auto parsed = parse_int64_strict_sv(sv);
    if (!parsed.has_value()) throw std::runtime_error("invalid json int value");
    return parsed;
}

std::optional<bool> json_extract_bool_opt(const std::string& js, const std::string& key) {
    auto span = find_member(js, key);
    if (!span.has_value()) return std::nullopt;
    auto sv = std::string_view(js).substr(span->first, span->second - span->first);
    if (sv == "true") return true;
    if (sv == "false") return false;
    if (sv == "null") return std::nullopt;
    throw std::runtime_error("invalid json bool value");
}

std::optional<std::string> json_extract_id_opt(const std::string& js, const std::string& key) {
    auto span = find_member(js, key);
    if (!span.has_value()) return std::nullopt;
    auto sv = std::string_view(js).substr(span->first, span->second - span->first);
    if (sv == "null") return std::nullopt;
    if (!sv.empty() && sv[0] == '"') {
        Scanner s(sv);
        std::string v = s.read_string();
        if (v.empty()) return std::nullopt;
        return v;
    }
    if (!parse_int64_strict_sv(sv).has_value()) throw std::runtime_error("invalid json id value");
    return std::string(sv);
}

std::optional<std::string> json_extract_raw(const std::string& js, const std::string& key) {
    auto span = find_member(js, key);
    if (!span.has_value()) return std::nullopt;
    return js.substr(span->first, span->second - span->first);
}

// escape chars for JSON response strings; escapes control chars < 0x20 with \u00XX
std::string json_escape_resp(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out; out.reserve(s.size()+8);
    for (unsigned char uc : s) {
        if (uc == '"') { out += "\\\""; }
        else if (uc == '\\') { out += "\\\\"; }
        else if (uc == '\n') { out += "\\n"; }
        else if (uc == '\r') { out += "\\r"; }
        else if (uc == '\t') { out += "\\t"; }
        else if (uc < 0x20) {
            out.push_back('\\'); out.push_back('u'); out.push_back('0'); out.push_back('0');
            out.push_back(hex[(uc >> 4) & 0xF]); out.push_back(hex[uc & 0xF]);
        } else out.push_back((char)uc);
    }
    return out;
}

std::string json_quote(const std::string& s) {
    return "\"" + json_escape_resp(s) + "\"";
}

std::optional<std::string> json_canonicalize(std::string_view js) {
    try {
        Scanner s(js);
        std::string out;
        out.reserve(js.size());
        s.emit_value(out, 0);
        s.skip_ws();
        if (!s.at_end()) return std::nullopt;
        return out;
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
}

bool json_is_object(std::string_view js) {
    auto c = json_canonicalize(js);
    return c.has_value() && !c->empty() && c->front() == '{';
}

static bool is_int_strict(const std::string& s) {
    if (s.empty()) return false;
    size_t i = 0;
    if (s[0] == '-') { if (s.size() == 1) return false; i = 1; }
    for (; i < s.size(); ++i) if (s[i] < '0' || s[i] > '9') return false;
    return true;
}

std::string json_emit_int_or_null(const std::optional<std::string>& o) {
    if (!o.has_value() || o->empty() || !is_int_strict(*o)) return std::string("null");
    return *o;
}

std::string json_emit_string_or_null(const std::optional<std::string>& o) {
    if (!o.has_value()) return std::string("null");
    return json_quote(*o);
}

std::optional<int64_t> json_parse_int_strict(const std::optional<std::string>& o) {
    if (!o.has_value() || o->empty() || !is_int_strict(*o)) return std::nullopt;
    return parse_int64_strict_sv(std::string_view(*o));
}
