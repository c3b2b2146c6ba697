#include <iostream>
#include <chrono>
#include <atomic>
#include <cstdlib>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include "db/DbPool.h"
#include "observability/Logging.h"

// Talks to a live PostgreSQL from DATABASE_URL; exits 77 (skipped) without one.
int main() {
    const char* url = std::getenv("DATABASE_URL");
    if (!url || !url[0]) {
        std::cerr << "DATABASE_URL not set, skipping\n";
        return 77;
    }
    observability::set_log_level(observability::LEVEL_ERROR);

    boost::asio::io_context ioc;
    auto work_guard = boost::asio::make_work_guard(ioc);
    db::DbPool pool(ioc, std::string(url), 3);
    if (pool.workers() != 3) { std::cerr << "workers mismatch\n"; return 1; }

    std::atomic<int> exit_code{0};
    std::atomic<int> finished{0};
    auto fail = [&](const std::string& what) {
        std::cerr << what << "\n";
        exit_code = 1;
    };

    pool.async_scalar_int("SELECT 41 + 1", [&](const boost::system::error_code& ec, int v) {
        if (ec || v != 42) fail("scalar: " + (ec ? ec.message() : std::to_string(v)));
        ++finished;
    });

    pool.async_exec_params("SELECT $1::text AS a, $2::text AS b", {std::string("x"), std::nullopt},
        [&](const boost::system::error_code& ec, db::DbResult r) {
            ++finished;
            if (ec || !r.ok || r.rows.size() != 1) { fail("params query failed"); return; }
            if (r.columns != std::vector<std::string>{"a", "b"}) fail("column names mismatch");
            if (!r.rows[0][0] || *r.rows[0][0] != "x") fail("param value mismatch");
            if (r.rows[0][1].has_value()) fail("NULL param should come back as NULL");
        });

    pool.async_exec("SELECT * FROM definitely_not_a_table_xyz", [&](const boost::system::error_code& ec, db::DbResult r) {
        ++finished;
        if (ec) { fail("server error should not set ec"); return; }
        if (r.ok) fail("bad statement reported ok");
        if (r.sqlstate != "42P01") fail("expected undefined_table sqlstate, got " + r.sqlstate);
        if (r.message.empty()) fail("error message missing");
    });

    pool.async_exec("CREATE TEMP TABLE IF NOT EXISTS t (v int); SELECT 1", [&](const boost::system::error_code& ec, db::DbResult r) {
        if (ec || !r.ok) fail("multi-statement exec failed");
        ++finished;
    });

    // more statements than workers, all must complete
    std::atomic<int> done{0};
    const int n = 20;
    for (int i = 0; i < n; ++i) {
        pool.async_scalar_int("SELECT " + std::to_string(i), [&, i](const boost::system::error_code& ec, int v) {
            if (ec || v != i) fail("burst statement " + std::to_string(i) + " failed");
            ++done;
            ++finished;
        });
    }

    const int expected = 4 + n;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(20);
    while (finished < expected && std::chrono::steady_clock::now() < deadline) {
        ioc.run_for(std::chrono::milliseconds(50));
    }
    work_guard.reset();
    if (done != n) { std::cerr << "only " << done << " of " << n << " statements completed\n"; return 1; }

    // an unreachable server is reported through ec, not by throwing
    {
        boost::asio::io_context ioc2;
        auto guard2 = boost::asio::make_work_guard(ioc2);
        db::DbPool bad(ioc2, "host=127.0.0.1 port=1 connect_timeout=2", 1);
        bool called = false;
        bad.async_exec("SELECT 1", [&](const boost::system::error_code& ec, db::DbResult r) {
            called = true;
            if (!ec) fail("unreachable server should set ec");
            if (r.ok) fail("unreachable server reported ok");
        });
        auto deadline2 = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (!called && std::chrono::steady_clock::now() < deadline2) {
            ioc2.run_for(std::chrono::milliseconds(50));
        }
        guard2.reset();
        if (!called) fail("callback not invoked for unreachable server");
    }

    if (exit_code != 0) return 1;
    std::cout << "dbpool_smoke ok\n";
    return 0;
}
