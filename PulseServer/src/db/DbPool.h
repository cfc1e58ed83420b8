#pragma once

#include <libpq-fe.h>
#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <functional>
#include <vector>
#include <memory>
#include <boost/asio.hpp>

namespace db {

struct DbResult {
    bool ok = false;
    std::string sqlstate;
    std::string message;
    std::vector<std::string> columns;
    std::vector<std::vector<std::optional<std::string>>> rows;
    int affected_rows = 0;

    int column_index(const std::string& name) const;
};

// nullopt binds SQL NULL
using DbParams = std::vector<std::optional<std::string>>;
using DbResultCb = std::function<void(const boost::system::error_code&, DbResult)>;

// Connection-level failures, as opposed to SQL errors reported in DbResult.
bool is_connection_error(const boost::system::error_code& ec);

// Appends connect_timeout in key=value or URI form. A conninfo that already
// sets connect_timeout is returned unchanged.
std::string with_connect_timeout(const std::string& conninfo, long long secs);

// Fixed set of worker threads, each owning one PGconn. Results are posted
// back to the application io_context. A broken connection is re-opened once
// per query before the error is reported.
class DbPool {
public:
    // Worker connects and reconnects give up after connect_timeout.
    DbPool(boost::asio::io_context& app_ioc, const std::string& conninfo, int workers = 4, std::string name = "primary",
           std::chrono::seconds connect_timeout = std::chrono::seconds(5));
    ~DbPool();

    void async_exec(const std::string& sql, DbResultCb cb);
    void async_exec_params(const std::string& sql, DbParams params, DbResultCb cb);

    // Opens and closes one connection on the calling thread.
    bool probe(std::chrono::seconds timeout, std::string* error = nullptr) const;

    const std::string& name() const;
    // conninfo used by the workers
    const std::string& conninfo() const;
    int workers() const;
    int connected_workers() const;
    std::size_t queued() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
