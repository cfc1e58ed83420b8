#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <boost/asio.hpp>
#include "DbPool.h"

namespace db {

class ReadWriteRouter;

// Handle on the pool chosen for one unit of work. Cheap to copy; must not
// outlive the router.
class DbSession {
public:
    enum class Role { Primary, Replica };

    DbSession(const ReadWriteRouter& router, Role role) : router_(&router), role_(role) {}
    Role role() const { return role_; }
    const char* role_name() const { return role_ == Role::Primary ? "primary" : "replica"; }
    void async_query(const std::string& sql, DbParams params, DbResultCb cb) const;

private:
    const ReadWriteRouter* router_;
    Role role_;
};

struct RouterOptions {
    std::string primary_url;
    std::string replica_url;
    int primary_workers = 16;
    int replica_workers = 16;
    std::chrono::seconds probe_timeout{5};
    // bounds every worker connect and reconnect
    std::chrono::seconds connect_timeout{3};
    std::chrono::seconds replica_cooldown{30};
};

class ReadWriteRouter {
public:
    ReadWriteRouter(boost::asio::io_context& ioc, const RouterOptions& opts);
    ReadWriteRouter(std::shared_ptr<DbPool> primary, std::shared_ptr<DbPool> replica,
                    std::chrono::seconds replica_cooldown = std::chrono::seconds(30));

    DbSession get_db_read() const;
    DbSession get_db_write() const { return DbSession(*this, DbSession::Role::Primary); }
    // Picks by statement text.
    DbSession session_for(std::string_view sql) const;

    bool replica_configured() const { return replica_configured_; }
    bool replica_available() const;
    void mark_replica_down(const std::string& reason) const;

    const std::shared_ptr<DbPool>& primary() const { return primary_; }
    const std::shared_ptr<DbPool>& replica() const { return replica_; }

    // {"status":"not_configured|unavailable|healthy|unhealthy", ...}
    void async_replica_health(std::function<void(std::string)> cb) const;
    std::string pool_status_json() const;

    static bool is_read_query(std::string_view sql);
    static bool should_use_replica(std::string_view path);

private:
    friend class DbSession;
    void run(DbSession::Role role, const std::string& sql, DbParams params, DbResultCb cb) const;
    static int64_t now_ms();

    std::shared_ptr<DbPool> primary_;
    std::shared_ptr<DbPool> replica_;
    bool replica_configured_ = false;
    std::chrono::seconds cooldown_{30};
    mutable std::atomic<int64_t> replica_down_until_{0};
};

}
