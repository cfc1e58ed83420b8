#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <string_view>
#include <limits>
#include <utility>

// Lookups only consider members of the outermost object. Malformed input
// throws std::runtime_error; a missing key is not an error.
std::pair<bool,std::string> json_extract_string_present(const std::string& js, const std::string& key);
std::string json_extract_string(const std::string& js, const std::string& key);
std::optional<int64_t> json_extract_int_opt(const std::string& js, const std::string& key);
std::optional<bool> json_extract_bool_opt(const std::string& js, const std::string& key);
// String or integer value, returned as text ("42" for both 42 and "42").
std::optional<std::string> json_extract_id_opt(const std::string& js, const std::string& key);
// Raw JSON text of the value, e.g. an embedded object.
std::optional<std::string> json_extract_raw(const std::string& js, const std::string& key);

std::string json_escape_resp(const std::string& s);
std::string json_quote(const std::string& s);

// Whitespace-free rendering with object keys sorted; nullopt if js is not valid JSON.
std::optional<std::string> json_canonicalize(std::string_view js);
bool json_is_object(std::string_view js);

std::string json_emit_int_or_null(const std::optional<std::string>& o);
std::string json_emit_string_or_null(const std::optional<std::string>& o);
std::optional<int64_t> json_parse_int_strict(const std::optional<std::string>& o);


inline std::optional<int64_t> parse_int64_strict_sv(std::string_view s) {
    if (s.empty()) return std::nullopt;
    size_t i = 0;
    bool neg = false;
    if (s[i] == '-') { neg = true; ++i; }
    if (i >= s.size()) return std::nullopt;

    const uint64_t maxAbs = neg ? (uint64_t(std::numeric_limits<int64_t>::max()) + 1ULL) : uint64_t(std::numeric_limits<int64_t>::max());
    uint64_t v = 0;
    for (; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c < '0' || c > '9') return std::nullopt;
        uint64_t d = uint64_t(c - '0');
        if (v > (maxAbs - d) / 10) return std::nullopt;
        v = v * 10 + d;
    }

    if (!neg) return static_cast<int64_t>(v);
    if (v == (uint64_t(std::numeric_limits<int64_t>::max()) + 1ULL)) return std::numeric_limits<int64_t>::min();
    return -static_cast<int64_t>(v);
}


inline std::optional<int> parse_int_strict_sv(std::string_view s) {
    auto v = parse_int64_strict_sv(s);
    if (!v.has_value()) return std::nullopt;
    if (*v < std::numeric_limits<int>::min() || *v > std::numeric_limits<int>::max()) return std::nullopt;
    return static_cast<int>(*v);
}
