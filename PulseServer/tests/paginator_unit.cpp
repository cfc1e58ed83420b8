#include <iostream>
#include <string>
#include "pagination/Paginator.h"
#include "net/MiniJson.h"

using namespace pagination;

static const std::string BASE = "SELECT id, title, created_at FROM jobs WHERE category = $1";

// Rows as the page query returns them, ids in the given order.
static db::DbResult rows(int first_id, int count, int step) {
    db::DbResult r;
    r.ok = true;
    r.columns = {"row_json", "page_id", "page_sort"};
    for (int i = 0; i < count; ++i) {
        int id = first_id + i * step;
        std::string ts = "2024-01-01 00:00:" + std::to_string(100 + id).substr(1);
        r.rows.push_back({"{\"id\":" + std::to_string(id) + "}", std::to_string(id), ts});
    }
    return r;
}

static int fail(const std::string& msg) {
    std::cerr << msg << "\n";
    return 1;
}

int main() {
    PaginatorConfig cfg;
    cfg.allowed_order_fields = {"created_at", "title"};

    auto p = parse_page_params({}, cfg);
    if (p.mode != Mode::Cursor || p.cursor || p.limit != 20 || p.order_by != "created_at" || p.order != Order::Desc || p.direction != Direction::Next) {
        return fail("defaults mismatch");
    }
    if (parse_page_params({{"limit", "500"}}, cfg).limit != 100) return fail("limit not capped");
    if (parse_page_params({{"limit", "0"}}, cfg).limit != 1) return fail("limit not raised to 1");
    if (parse_page_params({{"limit", "abc"}}, cfg).limit != 20) return fail("bad limit should use default");
    if (parse_page_params({{"order_by_field", "password"}}, cfg).order_by != "created_at") return fail("unlisted sort column accepted");
    if (parse_page_params({{"order_by_field", "title"}}, cfg).order_by != "title") return fail("listed sort column rejected");
    if (parse_page_params({{"order_by_field", "id"}}, cfg).order_by != "id") return fail("id must always be sortable");
    if (parse_page_params({{"order_direction", "asc"}}, cfg).order != Order::Asc) return fail("asc not parsed");
    if (!parse_page_params({{"count_total", "true"}}, cfg).count_total) return fail("count_total not parsed");

    auto bad = parse_page_params({{"cursor", "%%%"}}, cfg);
    if (bad.mode != Mode::Cursor || bad.cursor.has_value()) return fail("invalid cursor should restart from the first page");

    auto off = parse_page_params({{"page", "3"}, {"limit", "10"}}, cfg);
    if (off.mode != Mode::Offset || off.skip != 20) return fail("page=3 should skip 20");
    if (parse_page_params({{"skip", "-5"}}, cfg).skip != 0) return fail("negative skip should clamp");
    if (parse_page_params({{"page", "0"}}, cfg).skip != 0) return fail("page 0 should clamp");
    auto huge = parse_page_params({{"page", "9223372036854775807"}, {"limit", "20"}}, cfg);
    if (huge.skip < 0 || huge.skip % 20 != 0 || huge.skip < 9223372036854775807LL - 40) return fail("huge page should saturate, skip=" + std::to_string(huge.skip));
    if (build_page_query(BASE, {}, huge).sql.find("OFFSET -") != std::string::npos) return fail("negative offset emitted");

    // a cursor without its sort value cannot position a created_at scan
    auto bare = parse_page_params({{"cursor", encode_cursor(Cursor{5, std::nullopt})}}, cfg);
    if (bare.cursor.has_value()) return fail("cursor missing its sort value should restart from the first page");

    // first page
    auto q = build_page_query(BASE, {std::string("it")}, p);
    const std::string head = "SELECT row_to_json(page_src)::text AS row_json, page_src.\"id\"::text AS page_id, "
                             "page_src.\"created_at\"::text AS page_sort FROM (" + BASE + ") AS page_src";
    if (q.sql != head + " ORDER BY page_src.\"created_at\" DESC NULLS LAST, page_src.\"id\" DESC LIMIT 21") return fail("first page sql: " + q.sql);
    if (q.params.size() != 1 || !q.count_sql.empty()) return fail("first page params mismatch");

    auto first = shape_page(rows(100, 21, -1), p);
    if (first.items.size() != 20 || !first.meta.has_next || first.meta.has_previous) return fail("first page meta mismatch");
    if (first.items.front() != "{\"id\":100}" || first.items.back() != "{\"id\":81}") return fail("first page rows mismatch");
    auto next = decode_cursor(*first.meta.next_cursor);
    if (!next || next->id != 81 || next->ts != std::string("2024-01-01 00:00:81")) return fail("next cursor should point at the last row");

    // following page
    PageParams p2 = p;
    p2.cursor = next;
    auto q2 = build_page_query(BASE, {std::string("it")}, p2);
    if (q2.sql != head + " WHERE (page_src.\"created_at\" < $2 OR (page_src.\"created_at\" = $2 AND page_src.\"id\" < $3::bigint)"
                         " OR page_src.\"created_at\" IS NULL)"
                         " ORDER BY page_src.\"created_at\" DESC NULLS LAST, page_src.\"id\" DESC LIMIT 21") return fail("second page sql: " + q2.sql);
    if (q2.params.size() != 3 || q2.params[1] != next->ts || q2.params[2] != std::string("81")) return fail("second page params mismatch");

    auto last = shape_page(rows(80, 5, -1), p2);
    if (last.items.size() != 5 || last.meta.has_next || !last.meta.has_previous) return fail("last page meta mismatch");

    // walking back from the first row of the last page
    PageParams back = p2;
    back.direction = Direction::Previous;
    back.cursor = decode_cursor(*last.meta.previous_cursor);
    if (!back.cursor || back.cursor->id != 80) return fail("previous cursor should point at the first row");
    auto qb = build_page_query(BASE, {std::string("it")}, back);
    if (qb.sql != head + " WHERE (page_src.\"created_at\" > $2 OR (page_src.\"created_at\" = $2 AND page_src.\"id\" > $3::bigint))"
                         " ORDER BY page_src.\"created_at\" ASC NULLS FIRST, page_src.\"id\" ASC LIMIT 21") return fail("previous page sql: " + qb.sql);
    auto prev = shape_page(rows(81, 21, 1), back);
    if (prev.items.size() != 20 || prev.items.front() != "{\"id\":100}" || prev.items.back() != "{\"id\":81}") return fail("previous page must come back in display order");
    if (!prev.meta.has_previous || !prev.meta.has_next) return fail("previous page meta mismatch");

    // rows with a NULL sort value sit after every dated row and page by id
    {
        db::DbResult r = rows(12, 3, -1);
        r.rows[1][2] = std::nullopt;
        r.rows[2][2] = std::nullopt;
        PageParams small = p;
        small.limit = 2;
        auto pg = shape_page(r, small);
        auto c = decode_cursor(*pg.meta.next_cursor);
        if (!c || c->id != 11 || c->ts.has_value() || !c->ts_null) return fail("cursor on a NULL sort value must carry the null marker");
        small.cursor = c;
        auto qn = build_page_query(BASE, {std::string("it")}, small);
        if (qn.sql != head + " WHERE (page_src.\"created_at\" IS NULL AND page_src.\"id\" < $2::bigint)"
                             " ORDER BY page_src.\"created_at\" DESC NULLS LAST, page_src.\"id\" DESC LIMIT 3") return fail("null cursor sql: " + qn.sql);
        if (qn.params.size() != 2 || qn.params[1] != std::string("11")) return fail("null cursor params mismatch");
        small.direction = Direction::Previous;
        auto qp = build_page_query(BASE, {std::string("it")}, small);
        if (qp.sql != head + " WHERE (page_src.\"created_at\" IS NOT NULL OR page_src.\"id\" > $2::bigint)"
                             " ORDER BY page_src.\"created_at\" ASC NULLS FIRST, page_src.\"id\" ASC LIMIT 3") return fail("null previous sql: " + qp.sql);
        auto parsed = parse_page_params({{"cursor", *pg.meta.next_cursor}}, cfg);
        if (!parsed.cursor || !parsed.cursor->ts_null) return fail("null marker lost in parsing");
    }

    // id ordering uses the id alone
    PageParams by_id = p;
    by_id.order_by = "id";
    by_id.cursor = Cursor{50, std::nullopt};
    auto qi = build_page_query("SELECT id FROM posts", {}, by_id);
    if (qi.sql.find(" WHERE page_src.\"id\" < $1::bigint ORDER BY page_src.\"id\" DESC LIMIT 21") == std::string::npos) return fail("id sql: " + qi.sql);
    auto id_page = shape_page(rows(49, 3, -1), by_id);
    if (decode_cursor(*id_page.meta.next_cursor)->ts.has_value()) return fail("id cursors carry no sort value");

    // offset mode
    off.count_total = true;
    auto qo = build_page_query(BASE, {std::string("it")}, off);
    if (qo.sql.find(" LIMIT 11 OFFSET 20") == std::string::npos) return fail("offset sql: " + qo.sql);
    if (qo.count_sql != "SELECT COUNT(*) FROM (" + BASE + ") AS page_src") return fail("count sql mismatch");
    auto op = shape_page(rows(30, 11, -1), off, 45);
    if (op.items.size() != 10 || op.meta.next_cursor) return fail("offset page rows mismatch");
    if (meta_to_json(op.meta) != "{\"total\":45,\"page\":3,\"per_page\":10,\"has_next\":true,\"has_previous\":true}") {
        return fail("offset meta json: " + meta_to_json(op.meta));
    }

    auto empty = shape_page(rows(0, 0, 1), p);
    if (!empty.items.empty() || empty.meta.has_next || empty.meta.next_cursor) return fail("empty page meta mismatch");
    if (page_to_json(empty) != "{\"success\":true,\"data\":[],\"pagination\":{\"has_next\":false,\"has_previous\":false}}") {
        return fail("empty page json: " + page_to_json(empty));
    }
    auto body = page_to_json(last);
    if (!json_is_object(body) || body.find("\"data\":[{\"id\":80},") == std::string::npos) return fail("page json: " + body);

    std::cout << "paginator_unit ok\n";
    return 0;
}
