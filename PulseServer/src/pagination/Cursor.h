#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace pagination {

// Position of the last row of a page: its id and, when sorting by another
// column, that column's value. ts_null marks a row whose sort value was NULL.
struct Cursor {
    int64_t id = 0;
    std::optional<std::string> ts;
    bool ts_null = false;

    bool operator==(const Cursor& o) const { return id == o.id && ts == o.ts && ts_null == o.ts_null; }
};

// base64url(JSON {"id":<int>,"ts":"<sort value>"|null}), unpadded.
std::string encode_cursor(const Cursor& c);
// nullopt for anything that encode_cursor could not have produced.
std::optional<Cursor> decode_cursor(const std::string& token);

}
