#include "Cursor.h"
#include "../auth/Base64.h"
#include "../net/MiniJson.h"
#include <stdexcept>

namespace pagination {

std::string encode_cursor(const Cursor& c) {
    std::string js = "{\"id\":" + std::to_string(c.id);
    if (c.ts.has_value()) js += ",\"ts\":" + json_quote(*c.ts);
    else if (c.ts_null) js += ",\"ts\":null";
    js += "}";
    return auth::base64url_encode(js);
}

std::optional<Cursor> decode_cursor(const std::string& token) {
    if (token.empty() || token.size() > 1024) return std::nullopt;
    auto js = auth::base64url_decode(token);
    if (!js.has_value() || !json_is_object(*js)) return std::nullopt;
    try {
        auto id = json_extract_int_opt(*js, "id");
        if (!id.has_value()) return std::nullopt;
        Cursor c;
        c.id = *id;
        auto ts = json_extract_string_present(*js, "ts");
        if (ts.first) {
            auto raw = json_extract_raw(*js, "ts");
            if (raw.has_value() && *raw == "null") c.ts_null = true;
            else c.ts = ts.second;
        }
        return c;
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
}

}
