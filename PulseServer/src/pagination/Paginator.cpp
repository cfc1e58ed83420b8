#include "Paginator.h"
#include "../db/ReadWriteRouter.h"
#include "../net/MiniJson.h"
#include "../observability/Logging.h"
#include <algorithm>
#include <cctype>
#include <limits>
#include <memory>
#include <sstream>

namespace pagination {

namespace {

bool is_identifier(const std::string& s) {
    if (s.empty() || s.size() > 63) return false;
    if (!(std::islower((unsigned char)s[0]) || s[0] == '_')) return false;
    for (char c : s) {
        if (!(std::islower((unsigned char)c) || std::isdigit((unsigned char)c) || c == '_')) return false;
    }
    return true;
}

std::optional<int64_t> param_int(const QueryParams& q, const char* name) {
    auto it = q.find(name);
    if (it == q.end() || it->second.empty()) return std::nullopt;
    return parse_int64_strict_sv(it->second);
}

bool sorts_by_id(const PageParams& p) { return p.order_by == "id"; }

// A cursor positions a keyset scan only if it carries the sort value (or its NULL marker).
bool usable_cursor(const PageParams& p) {
    return p.cursor.has_value() && (sorts_by_id(p) || p.cursor->ts.has_value() || p.cursor->ts_null);
}

}

PageParams parse_page_params(const QueryParams& q, const PaginatorConfig& cfg) {
    PageParams p;
    int64_t limit = param_int(q, "limit").value_or(cfg.default_limit);
    p.limit = static_cast<int>(std::clamp<int64_t>(limit, 1, std::max(1, cfg.max_limit)));

    p.order_by = cfg.default_order_field;
    auto ob = q.find("order_by_field");
    if (ob != q.end()) {
        bool allowed = ob->second == "id" ||
            std::find(cfg.allowed_order_fields.begin(), cfg.allowed_order_fields.end(), ob->second) != cfg.allowed_order_fields.end();
        if (allowed && is_identifier(ob->second)) p.order_by = ob->second;
    }
    auto od = q.find("order_direction");
    p.order = (od != q.end() && od->second == "asc") ? Order::Asc : Order::Desc;
    auto dir = q.find("direction");
    p.direction = (dir != q.end() && dir->second == "previous") ? Direction::Previous : Direction::Next;
    auto ct = q.find("count_total");
    p.count_total = ct != q.end() && (ct->second == "1" || ct->second == "true");

    auto cur = q.find("cursor");
    if (cur != q.end() && !cur->second.empty()) {
        p.mode = Mode::Cursor;
        p.cursor = decode_cursor(cur->second);
        if (p.cursor.has_value() && !usable_cursor(p)) p.cursor.reset();
        if (!p.cursor.has_value()) observability::log_debug("pagination.invalid_cursor", {});
        return p;
    }
    auto skip = param_int(q, "skip");
    auto page = param_int(q, "page");
    if (skip.has_value() || page.has_value()) {
        p.mode = Mode::Offset;
        if (skip.has_value()) p.skip = std::max<int64_t>(0, *skip);
        else if (*page > 0) p.skip = (std::min(*page, std::numeric_limits<int64_t>::max() / p.limit) - 1) * p.limit;
    }
    return p;
}

PageQuery build_page_query(const std::string& base_sql, const db::DbParams& base_params, const PageParams& p) {
    PageQuery out;
    out.params = base_params;
    const std::string sort = "page_src.\"" + p.order_by + "\"";
    const std::string id = "page_src.\"id\"";

    std::ostringstream sql;
    sql << "SELECT row_to_json(page_src)::text AS row_json, " << id << "::text AS page_id, "
        << sort << "::text AS page_sort FROM (" << base_sql << ") AS page_src";

    // Walking backwards flips both the comparison and the scan order.
    // NULL sort values order below every other value in both directions.
    bool ascending_scan = (p.order == Order::Asc) != (p.mode == Mode::Cursor && p.direction == Direction::Previous);
    if (p.mode == Mode::Cursor && usable_cursor(p)) {
        const char* cmp = ascending_scan ? ">" : "<";
        const std::string n = "$" + std::to_string(base_params.size() + 1);
        const std::string n_id = "$" + std::to_string(base_params.size() + 2) + "::bigint";
        if (sorts_by_id(p)) {
            sql << " WHERE " << id << " " << cmp << " " << n << "::bigint";
            out.params.emplace_back(std::to_string(p.cursor->id));
        } else if (p.cursor->ts_null) {
            if (ascending_scan) sql << " WHERE (" << sort << " IS NOT NULL OR " << id << " > " << n << "::bigint)";
            else sql << " WHERE (" << sort << " IS NULL AND " << id << " < " << n << "::bigint)";
            out.params.emplace_back(std::to_string(p.cursor->id));
        } else {
            sql << " WHERE (" << sort << " " << cmp << " " << n << " OR (" << sort << " = " << n << " AND "
                << id << " " << cmp << " " << n_id << ")";
            if (!ascending_scan) sql << " OR " << sort << " IS NULL";
            sql << ")";
            out.params.emplace_back(*p.cursor->ts);
            out.params.emplace_back(std::to_string(p.cursor->id));
        }
    }
    const char* dir = ascending_scan ? "ASC" : "DESC";
    const char* nulls = ascending_scan ? " NULLS FIRST" : " NULLS LAST";
    if (sorts_by_id(p)) sql << " ORDER BY " << id << " " << dir;
    else sql << " ORDER BY " << sort << " " << dir << nulls << ", " << id << " " << dir;
    sql << " LIMIT " << (int64_t(p.limit) + 1);
    if (p.mode == Mode::Offset) {
        sql << " OFFSET " << p.skip;
        if (p.count_total) out.count_sql = "SELECT COUNT(*) FROM (" + base_sql + ") AS page_src";
    }
    out.sql = sql.str();
    return out;
}

Page shape_page(const db::DbResult& r, const PageParams& p, std::optional<int64_t> total) {
    Page page;
    int c_row = r.column_index("row_json");
    int c_id = r.column_index("page_id");
    int c_sort = r.column_index("page_sort");

    struct Row { std::string json; int64_t id; std::optional<std::string> sort; };
    std::vector<Row> rows;
    for (const auto& raw : r.rows) {
        Row row;
        row.json = (c_row >= 0 && raw[c_row].has_value()) ? *raw[c_row] : std::string("null");
        row.id = 0;
        if (c_id >= 0 && raw[c_id].has_value()) row.id = parse_int64_strict_sv(*raw[c_id]).value_or(0);
        if (c_sort >= 0) row.sort = raw[c_sort];
        rows.push_back(std::move(row));
    }
    bool has_more = rows.size() > static_cast<size_t>(p.limit);
    if (has_more) rows.resize(p.limit);

    auto& m = page.meta;
    if (p.mode == Mode::Offset) {
        m.total = total;
        m.page = p.limit > 0 ? p.skip / p.limit + 1 : 1;
        m.per_page = p.limit;
        m.has_next = has_more;
        m.has_previous = p.skip > 0;
    } else {
        if (p.direction == Direction::Previous) {
            std::reverse(rows.begin(), rows.end());
            m.has_previous = has_more;
            m.has_next = p.cursor.has_value();
        } else {
            m.has_next = has_more;
            m.has_previous = p.cursor.has_value();
        }
        if (!rows.empty()) {
            auto cursor_of = [&p](const Row& row) {
                Cursor c;
                c.id = row.id;
                if (!sorts_by_id(p)) {
                    c.ts = row.sort;
                    c.ts_null = !row.sort.has_value();
                }
                return encode_cursor(c);
            };
            m.next_cursor = cursor_of(rows.back());
            m.previous_cursor = cursor_of(rows.front());
        }
        m.total = total;
    }
    page.items.reserve(rows.size());
    for (auto& row : rows) page.items.push_back(std::move(row.json));
    return page;
}

std::string meta_to_json(const PageMeta& m) {
    std::ostringstream ss;
    ss << '{';
    if (m.total.has_value()) ss << "\"total\":" << *m.total << ',';
    if (m.page.has_value()) ss << "\"page\":" << *m.page << ',';
    if (m.per_page.has_value()) ss << "\"per_page\":" << *m.per_page << ',';
    ss << "\"has_next\":" << (m.has_next ? "true" : "false");
    ss << ",\"has_previous\":" << (m.has_previous ? "true" : "false");
    if (m.next_cursor.has_value()) ss << ",\"next_cursor\":" << json_quote(*m.next_cursor);
    if (m.previous_cursor.has_value()) ss << ",\"previous_cursor\":" << json_quote(*m.previous_cursor);
    ss << '}';
    return ss.str();
}

std::string page_to_json(const Page& page) {
    std::string out = "{\"success\":true,\"data\":[";
    for (size_t i = 0; i < page.items.size(); ++i) {
        if (i) out += ',';
        out += page.items[i];
    }
    out += "],\"pagination\":";
    out += meta_to_json(page.meta);
    out += '}';
    return out;
}

Paginator::Paginator(PaginatorConfig cfg) : cfg_(std::move(cfg)) {}

void Paginator::async_paginate(const db::DbSession& session, const std::string& base_sql, db::DbParams base_params,
                               const PageParams& p, PageCb cb) const {
    auto q = std::make_shared<PageQuery>(build_page_query(base_sql, base_params, p));
    auto fetch_page = [session, q, p, cb](std::optional<int64_t> total) {
        session.async_query(q->sql, q->params, [p, total, cb](const boost::system::error_code& ec, db::DbResult r) {
            if (ec) { cb(ec, Page{}); return; }
            if (!r.ok) { cb(boost::system::errc::make_error_code(boost::system::errc::invalid_argument), Page{}); return; }
            cb({}, shape_page(r, p, total));
        });
    };
    if (q->count_sql.empty()) { fetch_page(std::nullopt); return; }
    session.async_query(q->count_sql, base_params, [fetch_page, cb](const boost::system::error_code& ec, db::DbResult r) {
        if (ec) { cb(ec, Page{}); return; }
        std::optional<int64_t> total;
        if (r.ok && !r.rows.empty() && !r.rows[0].empty()) total = json_parse_int_strict(r.rows[0][0]);
        fetch_page(total);
    });
}

}
