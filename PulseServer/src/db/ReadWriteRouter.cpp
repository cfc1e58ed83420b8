#include "ReadWriteRouter.h"
#include "../net/MiniJson.h"
#include "../observability/Logging.h"
#include <array>
#include <cctype>
#include <sstream>

namespace db {

void DbSession::async_query(const std::string& sql, DbParams params, DbResultCb cb) const {
    router_->run(role_, sql, std::move(params), std::move(cb));
}

ReadWriteRouter::ReadWriteRouter(boost::asio::io_context& ioc, const RouterOptions& opts) : cooldown_(opts.replica_cooldown) {
    primary_ = std::make_shared<DbPool>(ioc, opts.primary_url, opts.primary_workers, "primary", opts.connect_timeout);
    if (opts.replica_url.empty() || opts.replica_url == opts.primary_url) {
        observability::log_info("db.replica_not_configured", {});
        return;
    }
    replica_configured_ = true;
    try {
        auto replica = std::make_shared<DbPool>(ioc, opts.replica_url, opts.replica_workers, "replica", opts.connect_timeout);
        std::string err;
        if (!replica->probe(opts.probe_timeout, &err)) {
            observability::log_warn("db.replica_unreachable", {{"err", err}});
            replica_down_until_ = now_ms() + int64_t(cooldown_.count()) * 1000;
        } else {
            observability::log_info("db.replica_ready", {{"workers", int64_t(opts.replica_workers)}});
        }
        replica_ = std::move(replica);
    } catch (const std::exception& e) {
        observability::log_warn("db.replica_init_failed", {{"err", std::string(e.what())}});
    }
}

ReadWriteRouter::ReadWriteRouter(std::shared_ptr<DbPool> primary, std::shared_ptr<DbPool> replica, std::chrono::seconds replica_cooldown)
    : primary_(std::move(primary)), replica_(std::move(replica)), replica_configured_(replica_ != nullptr), cooldown_(replica_cooldown) {}

int64_t ReadWriteRouter::now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

bool ReadWriteRouter::replica_available() const {
    return replica_ != nullptr && now_ms() >= replica_down_until_.load();
}

void ReadWriteRouter::mark_replica_down(const std::string& reason) const {
    int64_t now = now_ms();
    int64_t prev = replica_down_until_.exchange(now + int64_t(cooldown_.count()) * 1000);
    if (prev <= now) {
        observability::log_warn("db.replica_down", {{"reason", reason}, {"cooldown_sec", int64_t(cooldown_.count())}});
    }
}

DbSession ReadWriteRouter::get_db_read() const {
    return DbSession(*this, replica_available() ? DbSession::Role::Replica : DbSession::Role::Primary);
}

DbSession ReadWriteRouter::session_for(std::string_view sql) const {
    return is_read_query(sql) ? get_db_read() : get_db_write();
}

void ReadWriteRouter::run(DbSession::Role role, const std::string& sql, DbParams params, DbResultCb cb) const {
    if (role == DbSession::Role::Primary || !replica_available()) {
        primary_->async_exec_params(sql, std::move(params), std::move(cb));
        return;
    }
    auto primary = primary_;
    auto retry_params = params;
    replica_->async_exec_params(sql, std::move(params), [this, primary, sql, retry_params, cb](const boost::system::error_code& ec, DbResult r) mutable {
        if (!is_connection_error(ec)) { cb(ec, std::move(r)); return; }
        mark_replica_down(ec.message());
        primary->async_exec_params(sql, std::move(retry_params), std::move(cb));
    });
}

void ReadWriteRouter::async_replica_health(std::function<void(std::string)> cb) const {
    if (!replica_configured_) { cb("{\"status\":\"not_configured\"}"); return; }
    if (!replica_) { cb("{\"status\":\"unavailable\"}"); return; }
    auto start = std::chrono::steady_clock::now();
    replica_->async_exec("SELECT 1", [start, cb](const boost::system::error_code& ec, DbResult r) {
        if (ec || !r.ok) {
            std::string err = ec ? ec.message() : r.message;
            cb("{\"status\":\"unhealthy\",\"error\":" + json_quote(err) + "}");
            return;
        }
        double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
        std::ostringstream ss;
        ss.setf(std::ios::fixed); ss.precision(2);
        ss << "{\"status\":\"healthy\",\"latency_ms\":" << ms << "}";
        cb(ss.str());
    });
}

std::string ReadWriteRouter::pool_status_json() const {
    auto pool_json = [](const DbPool& p) {
        std::ostringstream ss;
        ss << "{\"workers\":" << p.workers() << ",\"connected\":" << p.connected_workers() << ",\"queued\":" << p.queued() << "}";
        return ss.str();
    };
    std::ostringstream ss;
    ss << "{\"primary\":" << pool_json(*primary_);
    if (replica_) ss << ",\"replica\":" << pool_json(*replica_) << ",\"replica_available\":" << (replica_available() ? "true" : "false");
    else ss << ",\"replica\":null";
    ss << "}";
    return ss.str();
}

namespace {

std::string_view skip_space_and_comments(std::string_view s) {
    for (;;) {
        while (!s.empty() && std::isspace((unsigned char)s.front())) s.remove_prefix(1);
        if (s.substr(0, 2) == "--") {
            auto nl = s.find('\n');
            s = nl == std::string_view::npos ? std::string_view() : s.substr(nl + 1);
            continue;
        }
        if (s.substr(0, 2) == "/*") {
            auto end = s.find("*/", 2);
            s = end == std::string_view::npos ? std::string_view() : s.substr(end + 2);
            continue;
        }
        return s;
    }
}

std::string upper(std::string_view s) {
    std::string out(s);
    for (auto& c : out) c = static_cast<char>(std::toupper((unsigned char)c));
    return out;
}

bool has_word(const std::string& upper_sql, const char* word) {
    std::string w(word);
    size_t pos = 0;
    while ((pos = upper_sql.find(w, pos)) != std::string::npos) {
        bool left = pos == 0 || !(std::isalnum((unsigned char)upper_sql[pos-1]) || upper_sql[pos-1] == '_');
        size_t e = pos + w.size();
        bool right = e >= upper_sql.size() || !(std::isalnum((unsigned char)upper_sql[e]) || upper_sql[e] == '_');
        if (left && right) return true;
        pos = e;
    }
    return false;
}

}

bool ReadWriteRouter::is_read_query(std::string_view sql) {
    auto body = upper(skip_space_and_comments(sql));
    size_t end = 0;
    while (end < body.size() && std::isalpha((unsigned char)body[end])) ++end;
    std::string first = body.substr(0, end);
    if (first == "SHOW" || first == "EXPLAIN" || first == "DESCRIBE") return true;
    if (first == "SELECT") {
        // row locks need the primary
        return !(body.find("FOR UPDATE") != std::string::npos || body.find("FOR SHARE") != std::string::npos);
    }
    if (first == "WITH") {
        return !(has_word(body, "INSERT") || has_word(body, "UPDATE") || has_word(body, "DELETE"));
    }
    return false;
}

bool ReadWriteRouter::should_use_replica(std::string_view path) {
    static const std::array<std::string_view, 6> prefixes = {
        "/api/feed", "/api/search", "/api/users/profile", "/api/posts/list", "/api/jobs/list", "/api/notifications/list"
    };
    for (auto p : prefixes) {
        if (path.substr(0, p.size()) == p) return true;
    }
    return false;
}

}
