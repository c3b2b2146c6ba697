#include <iostream>
#include <chrono>
#include <cstdlib>
#include <functional>
#include <memory>
#include <string>
#include <boost/asio.hpp>
#include "db/DbPool.h"
#include "db/PgTodoStore.h"
#include "observability/Logging.h"

// PgTodoStore against a live PostgreSQL from DATABASE_URL; exits 77 (skipped) without one.
// Rows it creates are removed again; other rows in `todos` are left alone.

namespace {

struct Runner {
    boost::asio::io_context ioc;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> guard = boost::asio::make_work_guard(ioc);
    int exit_code = 0;

    // Runs one async step to completion; returns false on timeout.
    bool step(const std::function<void(std::function<void()>)>& start) {
        bool finished = false;
        start([&finished] { finished = true; });
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (!finished && std::chrono::steady_clock::now() < deadline) {
            ioc.run_for(std::chrono::milliseconds(20));
        }
        if (!finished) { std::cerr << "step timed out\n"; exit_code = 1; }
        return finished;
    }

    void fail(const std::string& what) {
        std::cerr << what << "\n";
        exit_code = 1;
    }
};

}

int main() {
    const char* url = std::getenv("DATABASE_URL");
    if (!url || !url[0]) {
        std::cerr << "DATABASE_URL not set, skipping\n";
        return 77;
    }
    observability::set_log_level(observability::LEVEL_ERROR);

    Runner run;
    auto pool = std::make_shared<db::DbPool>(run.ioc, std::string(url), 2);
    db::PgTodoStore store(pool);

    // schema creation is idempotent
    for (int i = 0; i < 2; ++i) {
        run.step([&](std::function<void()> done) {
            store.async_init([&, done](const boost::system::error_code& ec) {
                if (ec) run.fail("init failed: " + ec.message());
                done();
            });
        });
        if (run.exit_code) return 1;
    }

    run.step([&](std::function<void()> done) {
        store.async_ping([&, done](const boost::system::error_code& ec) {
            if (ec) run.fail("ping failed: " + ec.message());
            done();
        });
    });

    const std::string tag = std::to_string(std::chrono::system_clock::now().time_since_epoch().count());
    todo::Todo first, second;

    run.step([&](std::function<void()> done) {
        store.async_create("smoke first " + tag, [&, done](const boost::system::error_code& ec, std::optional<todo::Todo> t) {
            if (ec || !t) run.fail("create first failed");
            else first = *t;
            done();
        });
    });
    run.step([&](std::function<void()> done) {
        store.async_create("smoke \"second\" ✅ " + tag, [&, done](const boost::system::error_code& ec, std::optional<todo::Todo> t) {
            if (ec || !t) run.fail("create second failed");
            else second = *t;
            done();
        });
    });
    if (run.exit_code) return 1;

    if (first.completed || first.created.size() != 24 || first.created.back() != 'Z') run.fail("create defaults wrong: " + first.created);
    if (second.id <= first.id) run.fail("ids must increase");
    if (second.title != "smoke \"second\" ✅ " + tag) run.fail("title not stored verbatim");

    run.step([&](std::function<void()> done) {
        store.async_list([&, done](const boost::system::error_code& ec, std::vector<todo::Todo> all) {
            if (ec) { run.fail("list failed"); done(); return; }
            size_t pos_first = all.size(), pos_second = all.size();
            for (size_t i = 0; i < all.size(); ++i) {
                if (all[i].id == first.id) pos_first = i;
                if (all[i].id == second.id) pos_second = i;
            }
            if (pos_first == all.size() || pos_second == all.size()) run.fail("created rows missing from list");
            else if (pos_second > pos_first) run.fail("list must be newest first");
            done();
        });
    });

    run.step([&](std::function<void()> done) {
        todo::TodoPatch p;
        p.completed = true;
        store.async_update(first.id, p, [&, done](const boost::system::error_code& ec, std::optional<todo::Todo> t) {
            if (ec || !t) run.fail("update completed failed");
            else if (!t->completed || t->title != first.title || t->created != first.created) run.fail("partial update touched other fields");
            done();
        });
    });
    run.step([&](std::function<void()> done) {
        todo::TodoPatch p;
        p.title = std::string("renamed " + tag);
        store.async_update(first.id, p, [&, done](const boost::system::error_code& ec, std::optional<todo::Todo> t) {
            if (ec || !t) run.fail("update title failed");
            else if (t->title != "renamed " + tag || !t->completed) run.fail("title update lost completed flag");
            done();
        });
    });
    run.step([&](std::function<void()> done) {
        store.async_get(first.id, [&, done](const boost::system::error_code& ec, std::optional<todo::Todo> t) {
            if (ec || !t || t->title != "renamed " + tag) run.fail("get after update mismatch");
            done();
        });
    });

    // seeding is a no-op while the table has rows
    run.step([&](std::function<void()> done) {
        store.async_seed({"seed marker " + tag}, [&, done](const boost::system::error_code& ec) {
            if (ec) run.fail("seed failed: " + ec.message());
            done();
        });
    });
    run.step([&](std::function<void()> done) {
        store.async_list([&, done](const boost::system::error_code& ec, std::vector<todo::Todo> all) {
            if (ec) run.fail("list after seed failed");
            for (const auto& t : all) if (t.title == "seed marker " + tag) run.fail("seed inserted into a non-empty table");
            done();
        });
    });

    for (int64_t id : {first.id, second.id}) {
        run.step([&](std::function<void()> done) {
            store.async_remove(id, [&, done](const boost::system::error_code& ec, bool removed) {
                if (ec || !removed) run.fail("remove failed for " + std::to_string(id));
                done();
            });
        });
    }
    run.step([&](std::function<void()> done) {
        store.async_remove(first.id, [&, done](const boost::system::error_code& ec, bool removed) {
            if (ec || removed) run.fail("second remove should report not found");
            done();
        });
    });
    run.step([&](std::function<void()> done) {
        store.async_get(first.id, [&, done](const boost::system::error_code& ec, std::optional<todo::Todo> t) {
            if (ec || t) run.fail("get after remove should be absent");
            done();
        });
    });
    run.step([&](std::function<void()> done) {
        todo::TodoPatch p;
        p.completed = false;
        store.async_update(second.id, p, [&, done](const boost::system::error_code& ec, std::optional<todo::Todo> t) {
            if (ec || t) run.fail("update of removed row should be absent");
            done();
        });
    });

    // a fresh row never reuses a removed id
    run.step([&](std::function<void()> done) {
        store.async_create("smoke third " + tag, [&, done](const boost::system::error_code& ec, std::optional<todo::Todo> t) {
            if (ec || !t) { run.fail("create third failed"); done(); return; }
            if (t->id <= second.id) run.fail("id reused after delete");
            store.async_remove(t->id, [&, done](const boost::system::error_code&, bool) { done(); });
        });
    });

    if (run.exit_code != 0) return 1;
    std::cout << "db_smoke ok\n";
    return 0;
}
