#include <boost/asio.hpp>
#include <iostream>
#include <string>
#include <memory>
#include "net/Router.h"
#include "net/HttpServer.h"
#include "observability/Logging.h"
#include "config/Config.h"
#include "db/DbPool.h"
#include "db/PgTodoStore.h"
#include "api/TodoApi.h"
#include "todo/Todo.h"

using config::Config;
using observability::log_info;
using observability::log_warn;
using observability::log_error;
using observability::set_log_level;

int main(int argc, char** argv) {
    Config cfg;
    try {
        cfg = Config::from_env(argc, argv);
    } catch (const config::ConfigError& e) {
        std::cerr << "config error: " << e.what() << std::endl;
        return 2;
    }
    set_log_level(cfg.log_level_number());

    int exit_code = 0;
    try {
        boost::asio::io_context io;

        if (cfg.database_url.empty()) log_warn("db_url_not_set", {{"fallback", std::string("libpq defaults")}});
        auto dbpool = std::make_shared<db::DbPool>(io, cfg.database_url, cfg.db_workers);
        auto store = std::make_shared<db::PgTodoStore>(dbpool);

        Router router;
        api::register_service_routes(router, store, cfg.metrics_enabled);
        api::register_todo_routes(router, store);

        std::unique_ptr<HttpServer> server;

        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int sig) {
            if (ec) return;
            log_info("server_stop", {{"signal", int64_t(sig)}});
            if (server) server->stop();
            io.stop();
        });

        auto fail = [&](const std::string& what, const boost::system::error_code& ec) {
            log_error(what, {{"err", ec.message()}});
            exit_code = 1;
            signals.cancel();
            io.stop();
        };

        auto start_server = [&]() {
            server = std::make_unique<HttpServer>(io, cfg.bind_address, cfg.port, router, cfg.metrics_enabled, cfg.access_log, cfg.cors_allow_origin);
            server->run();
            log_info("server_start", {
                {"address", cfg.bind_address},
                {"port", int64_t(server->local_port())},
                {"db_workers", int64_t(dbpool->workers())}});
            log_info("endpoints", {{"todos", std::string("GET,POST /todos; GET,PUT,DELETE /todos/{id}")},
                                   {"service", std::string(cfg.metrics_enabled ? "/health /db/health /metrics" : "/health /db/health")}});
        };

        store->async_init([&](const boost::system::error_code& ec) {
            if (ec) { fail("schema_init_failed", ec); return; }
            log_info("schema_ready");
            if (!cfg.seed_sample_todos) { start_server(); return; }
            store->async_seed(todo::default_sample_titles(), [&](const boost::system::error_code& ec2) {
                if (ec2) { fail("seed_failed", ec2); return; }
                log_info("seed_done");
                start_server();
            });
        });

        io.run();
    } catch (const std::exception& e) {
        std::cerr << "server error: " << e.what() << std::endl;
        return 1;
    }

    return exit_code;
}
