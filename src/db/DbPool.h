#pragma once

#include <libpq-fe.h>
#include <optional>
#include <string>
#include <functional>
#include <vector>
#include <memory>
#include <boost/asio.hpp>

namespace db {

using Param = std::optional<std::string>;   // nullopt binds SQL NULL
using Row = std::vector<std::optional<std::string>>;

struct DbResult {
    bool ok = false;
    std::string sqlstate;
    std::string message;
    std::vector<std::string> columns;
    std::vector<Row> rows;
    int affected_rows = 0;
};

using DbResultCb = std::function<void(const boost::system::error_code&, DbResult)>;

// Fixed set of worker threads, each owning one lazily opened PGconn.
// Statements are queued FIFO; completions are posted to `app_ioc`, so callbacks
// run on whichever thread drives that io_context.
//
// Error reporting: `ec` is set when no result could be obtained at all
// (host_unreachable: cannot connect, io_error: connection lost twice).
// Otherwise `ec` is clear and DbResult::ok tells whether the server accepted
// the statement, with sqlstate/message filled in on failure.
class DbPool {
public:
    DbPool(boost::asio::io_context& app_ioc, const std::string& conninfo, int workers = 2);
    ~DbPool();

    DbPool(const DbPool&) = delete;
    DbPool& operator=(const DbPool&) = delete;

    void async_exec(const std::string& sql, DbResultCb cb);
    void async_exec_params(const std::string& sql, std::vector<Param> params, DbResultCb cb);

    using ScalarIntCb = std::function<void(const boost::system::error_code&, int)>;
    void async_scalar_int(const std::string& sql, ScalarIntCb cb);

    int workers() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
