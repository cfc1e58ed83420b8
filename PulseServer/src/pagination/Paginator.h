#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <boost/system/error_code.hpp>
#include "Cursor.h"
#include "../db/DbPool.h"
#include "../net/HttpUtil.h"

namespace db { class DbSession; }

namespace pagination {

enum class Mode { Cursor, Offset };
enum class Direction { Next, Previous };
enum class Order { Asc, Desc };

struct PaginatorConfig {
    int default_limit = 20;
    int max_limit = 100;
    std::string default_order_field = "created_at";
    // Columns of the base query that clients may sort by. "id" is always allowed.
    std::vector<std::string> allowed_order_fields{"created_at"};
};

struct PageParams {
    Mode mode = Mode::Cursor;
    std::optional<Cursor> cursor;
    Direction direction = Direction::Next;
    int64_t skip = 0;
    int limit = 20;
    std::string order_by = "created_at";
    Order order = Order::Desc;
    bool count_total = false;
};

struct PageQuery {
    std::string sql;
    db::DbParams params;
    std::string count_sql;   // empty unless a total was requested
};

struct PageMeta {
    std::optional<int64_t> total;
    std::optional<int64_t> page;
    std::optional<int> per_page;
    bool has_next = false;
    bool has_previous = false;
    std::optional<std::string> next_cursor;
    std::optional<std::string> previous_cursor;
};

struct Page {
    std::vector<std::string> items;   // one JSON object per row
    PageMeta meta;
};

PageParams parse_page_params(const QueryParams& q, const PaginatorConfig& cfg);

// base_sql is wrapped as a subquery; it must expose an integer "id" column and
// the sort column. Its own placeholders $1..$n keep their meaning.
PageQuery build_page_query(const std::string& base_sql, const db::DbParams& base_params, const PageParams& p);

// Expects the columns produced by build_page_query.
Page shape_page(const db::DbResult& r, const PageParams& p, std::optional<int64_t> total = std::nullopt);

std::string meta_to_json(const PageMeta& m);
// {"success":true,"data":[...],"pagination":{...}}
std::string page_to_json(const Page& page);

class Paginator {
public:
    using PageCb = std::function<void(const boost::system::error_code&, Page)>;

    explicit Paginator(PaginatorConfig cfg = PaginatorConfig());
    PageParams parse(const QueryParams& q) const { return parse_page_params(q, cfg_); }
    void async_paginate(const db::DbSession& session, const std::string& base_sql, db::DbParams base_params,
                        const PageParams& p, PageCb cb) const;
    const PaginatorConfig& config() const { return cfg_; }

private:
    PaginatorConfig cfg_;
};

}
