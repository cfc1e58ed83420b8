#include "DbPool.h"
#include <cstdlib>
#include <stdexcept>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include "../observability/Logging.h"
#include <algorithm>
#include <vector>

namespace db {

int DbResult::column_index(const std::string& name) const {
    for (size_t i = 0; i < columns.size(); ++i) {
        if (columns[i] == name) return static_cast<int>(i);
    }
    return -1;
}

bool is_connection_error(const boost::system::error_code& ec) {
    return ec == boost::system::errc::host_unreachable || ec == boost::system::errc::io_error;
}

static DbResult to_db_result(PGresult* pr) {
    DbResult r;
    ExecStatusType st = PQresultStatus(pr);
    r.ok = (st == PGRES_TUPLES_OK || st == PGRES_COMMAND_OK);
    const char* ss = PQresultErrorField(pr, PG_DIAG_SQLSTATE);
    r.sqlstate = ss ? ss : std::string();
    const char* msg = PQresultErrorMessage(pr);
    r.message = msg ? msg : std::string();
    int nfields = PQnfields(pr);
    for (int i = 0; i < nfields; ++i) r.columns.emplace_back(PQfname(pr, i) ? PQfname(pr, i) : "");
    int ntuples = PQntuples(pr);
    r.rows.reserve(ntuples);
    for (int i = 0; i < ntuples; ++i) {
        std::vector<std::optional<std::string>> row; row.reserve(nfields);
        for (int j = 0; j < nfields; ++j) {
            if (PQgetisnull(pr, i, j)) row.emplace_back(std::nullopt);
            else row.emplace_back(std::string(PQgetvalue(pr, i, j), PQgetlength(pr, i, j)));
        }
        r.rows.emplace_back(std::move(row));
    }
    if (st == PGRES_COMMAND_OK) {
        char* ct = PQcmdTuples(pr);
        r.affected_rows = (ct && *ct) ? std::atoi(ct) : 0;
    } else {
        r.affected_rows = ntuples;
    }
    if (!r.ok) {
        observability::log_warn("dbpool.query_failed", {{"status", std::string(PQresStatus(st))}, {"sqlstate", r.sqlstate}, {"msg", r.message}});
    }
    return r;
}

struct DbPool::Impl {
    boost::asio::io_context& app_ioc;
    std::string conninfo;
    std::string worker_conninfo;
    std::string name;
    int workers = 2;

    struct Task { std::function<void(PGconn*&)> fn; };
    std::queue<Task> tasks;
    mutable std::mutex mu_tasks;
    std::condition_variable cv_tasks;
    bool stopping = false;
    std::atomic<int> connected{0};

    std::vector<std::thread> threads;

    Impl(boost::asio::io_context& ioc, const std::string& ci, int workers_, std::string name_, std::chrono::seconds timeout)
        : app_ioc(ioc), conninfo(ci), worker_conninfo(with_connect_timeout(ci, std::max<long long>(1, timeout.count()))),
          name(std::move(name_)), workers(workers_) {
        for (int i = 0; i < workers; ++i) threads.emplace_back([this]{ this->worker_loop(); });
    }

    ~Impl() {
        { std::lock_guard<std::mutex> lk(mu_tasks); stopping = true; }
        cv_tasks.notify_all();
        for (auto &t : threads) if (t.joinable()) t.join();
    }

    PGconn* connect_one() {
        PGconn* c = PQconnectdb(worker_conninfo.c_str());
        if (c == nullptr) return nullptr;
        if (PQstatus(c) != CONNECTION_OK) {
            PQfinish(c);
            return nullptr;
        }
        connected += 1;
        return c;
    }

    void drop(PGconn*& c) {
        if (!c) return;
        PQfinish(c);
        c = nullptr;
        connected -= 1;
    }

    void worker_loop() {
        PGconn* local_conn = connect_one();
        observability::log_debug("dbpool.worker_started", {{"pool", name}, {"conn", local_conn ? std::string("ok") : std::string("null")}});
        while (true) {
            Task task;
            {
                std::unique_lock<std::mutex> lk(mu_tasks);
                cv_tasks.wait(lk, [this]{ return stopping || !tasks.empty(); });
                if (stopping && tasks.empty()) {
                    drop(local_conn);
                    return;
                }
                task = std::move(tasks.front()); tasks.pop();
            }
            try {
                task.fn(local_conn);
            } catch (const std::exception& e) {
                observability::log_error("dbpool.task_exception", {{"pool", name}, {"err", std::string(e.what())}});
            }
        }
    }

    void post_task(std::function<void(PGconn*&)> f) {
        {
            std::lock_guard<std::mutex> lk(mu_tasks);
            tasks.push(Task{std::move(f)});
        }
        cv_tasks.notify_one();
    }

    // Runs exec on a live connection, reconnecting once if the connection broke.
    void run(std::function<PGresult*(PGconn*)> exec, DbResultCb cb) {
        post_task([this, exec = std::move(exec), cb = std::move(cb)](PGconn*& local_conn) {
            boost::system::error_code ec;
            PGresult* r = nullptr;
            for (int attempt = 0; attempt < 2; ++attempt) {
                if (local_conn && PQstatus(local_conn) != CONNECTION_OK) {
                    PQreset(local_conn);
                    if (PQstatus(local_conn) != CONNECTION_OK) drop(local_conn);
                }
                if (!local_conn) {
                    local_conn = connect_one();
                    if (!local_conn) { ec = boost::system::errc::make_error_code(boost::system::errc::host_unreachable); break; }
                }
                r = exec(local_conn);
                if (!r) { drop(local_conn); ec = boost::system::errc::make_error_code(boost::system::errc::io_error); continue; }
                if (PQresultStatus(r) == PGRES_FATAL_ERROR && PQstatus(local_conn) == CONNECTION_BAD) {
                    PQclear(r); r = nullptr;
                    drop(local_conn);
                    ec = boost::system::errc::make_error_code(boost::system::errc::io_error);
                    continue;
                }
                ec = {};
                break;
            }
            DbResult res;
            if (r) {
                res = to_db_result(r);
                PQclear(r);
            } else {
                observability::log_warn("dbpool.exec_failed", {{"pool", name}, {"err", ec.message()}});
            }
            boost::asio::post(app_ioc, [cb, ec, res = std::move(res)]() mutable { cb(ec, std::move(res)); });
        });
    }
};

DbPool::DbPool(boost::asio::io_context& app_ioc, const std::string& conninfo, int workers, std::string name,
               std::chrono::seconds connect_timeout) {
    impl_ = std::make_unique<Impl>(app_ioc, conninfo, workers, std::move(name), connect_timeout);
}

DbPool::~DbPool() = default;

void DbPool::async_exec(const std::string& sql, DbResultCb cb) {
    impl_->run([sql](PGconn* c) { return PQexec(c, sql.c_str()); }, std::move(cb));
}

void DbPool::async_exec_params(const std::string& sql, DbParams params, DbResultCb cb) {
    impl_->run([sql, params = std::move(params)](PGconn* c) {
        std::vector<const char*> cparams; cparams.reserve(params.size());
        for (const auto& p : params) cparams.push_back(p.has_value() ? p->c_str() : nullptr);
        return PQexecParams(c, sql.c_str(), int(cparams.size()), nullptr, cparams.data(), nullptr, nullptr, 0);
    }, std::move(cb));
}

std::string with_connect_timeout(const std::string& conninfo, long long secs) {
    if (conninfo.find("connect_timeout") != std::string::npos) return conninfo;
    std::string opt = "connect_timeout=" + std::to_string(secs);
    bool uri = conninfo.rfind("postgres://", 0) == 0 || conninfo.rfind("postgresql://", 0) == 0;
    if (!uri) return conninfo + " " + opt;
    return conninfo + (conninfo.find('?') == std::string::npos ? "?" : "&") + opt;
}

bool DbPool::probe(std::chrono::seconds timeout, std::string* error) const {
    std::string ci = with_connect_timeout(impl_->conninfo, std::max<long long>(1, timeout.count()));
    PGconn* c = PQconnectdb(ci.c_str());
    bool ok = c && PQstatus(c) == CONNECTION_OK;
    if (!ok && error) *error = c ? PQerrorMessage(c) : "out of memory";
    if (c) PQfinish(c);
    return ok;
}

const std::string& DbPool::name() const { return impl_->name; }
const std::string& DbPool::conninfo() const { return impl_->worker_conninfo; }
int DbPool::workers() const { return impl_->workers; }
int DbPool::connected_workers() const { return impl_->connected.load(); }

std::size_t DbPool::queued() const {
    std::lock_guard<std::mutex> lk(impl_->mu_tasks);
    return impl_->tasks.size();
}

}
