#include "TodoApi.h"
#include "net/MiniJson.h"
#include "observability/Logging.h"
#include "observability/Metrics.h"
#include <cctype>
#include <stdexcept>

namespace api {

namespace http = boost::beast::http;

namespace {

// What a deferred handler needs to answer once the store calls back; the
// Request itself is not kept.
struct Responder {
    unsigned version;
    bool keep_alive;
    Router::Reply reply;

    Responder(const Request& req, Router::Reply r)
        : version(req.version()), keep_alive(req.keep_alive()), reply(std::move(r)) {}

    void json(http::status st, std::string body) const {
        reply(make_json_response(st, version, keep_alive, std::move(body)));
    }
    void error(http::status st, const std::string& msg) const {
        json(st, "{\"error\":" + json_quote(msg) + "}");
    }
    void internal() const { error(http::status::internal_server_error, "internal"); }
};

const char* const kNotFound = "todo not found";

// Empty bodies count as {} so that a bare POST reports the missing title.
bool parse_body_object(const std::string& body, std::string& out) {
    bool blank = true;
    for (char c : body) if (!isspace(static_cast<unsigned char>(c))) { blank = false; break; }
    if (blank) { out = "{}"; return true; }
    if (!json_is_object(body)) return false;
    out = body;
    return true;
}

bool id_param(const Router::Params& params, const Responder& r, int64_t& id) {
    std::optional<int64_t> parsed;
    auto it = params.find("id");
    if (it != params.end()) parsed = todo::parse_id(it->second);
    if (!parsed) {
        r.error(http::status::bad_request, "invalid id");
        return false;
    }
    id = *parsed;
    return true;
}

void list_todos(todo::TodoStore& store, const Request& req, Router::Reply reply) {
    Responder r(req, std::move(reply));
    store.async_list([r](const boost::system::error_code& ec, std::vector<todo::Todo> todos) {
        if (ec) { r.internal(); return; }
        r.json(http::status::ok, todo::to_json(todos));
    });
}

void get_todo(todo::TodoStore& store, const Request& req, const Router::Params& params, Router::Reply reply) {
    Responder r(req, std::move(reply));
    int64_t id = 0;
    if (!id_param(params, r, id)) return;
    store.async_get(id, [r](const boost::system::error_code& ec, std::optional<todo::Todo> t) {
        if (ec) { r.internal(); return; }
        if (!t) { r.error(http::status::not_found, kNotFound); return; }
        r.json(http::status::ok, todo::to_json(*t));
    });
}

void create_todo(todo::TodoStore& store, const Request& req, Router::Reply reply) {
    Responder r(req, std::move(reply));
    std::string body;
    if (!parse_body_object(req.body(), body)) { r.error(http::status::bad_request, "invalid json"); return; }

    std::pair<bool, std::optional<std::string>> title;
    try {
        title = json_extract_string_opt_present(body, "title");
    } catch (const std::runtime_error&) {
        r.error(http::status::bad_request, "title must be a string");
        return;
    }
    std::string trimmed = title.second.has_value() ? todo::trim(*title.second) : std::string();
    if (trimmed.empty()) { r.error(http::status::bad_request, "title is required"); return; }

    store.async_create(std::move(trimmed), [r](const boost::system::error_code& ec, std::optional<todo::Todo> t) {
        if (ec || !t) { r.internal(); return; }
        observability::log_debug("todo_created", {{"id", t->id}});
        r.json(http::status::created, todo::to_json(*t));
    });
}

void update_todo(todo::TodoStore& store, const Request& req, const Router::Params& params, Router::Reply reply) {
    Responder r(req, std::move(reply));
    int64_t id = 0;
    if (!id_param(params, r, id)) return;
    std::string body;
    if (!parse_body_object(req.body(), body)) { r.error(http::status::bad_request, "invalid json"); return; }

    todo::TodoPatch patch;
    try {
        auto title = json_extract_string_opt_present(body, "title");
        if (title.first) {
            std::string trimmed = title.second.has_value() ? todo::trim(*title.second) : std::string();
            if (trimmed.empty()) { r.error(http::status::bad_request, "title must be a non-empty string"); return; }
            patch.title = std::move(trimmed);
        }
    } catch (const std::runtime_error&) {
        r.error(http::status::bad_request, "title must be a non-empty string");
        return;
    }
    try {
        auto completed = json_extract_bool_present(body, "completed");
        if (completed.first) patch.completed = completed.second;
    } catch (const std::runtime_error&) {
        r.error(http::status::bad_request, "completed must be a boolean");
        return;
    }

    store.async_update(id, std::move(patch), [r](const boost::system::error_code& ec, std::optional<todo::Todo> t) {
        if (ec) { r.internal(); return; }
        if (!t) { r.error(http::status::not_found, kNotFound); return; }
        r.json(http::status::ok, todo::to_json(*t));
    });
}

void delete_todo(todo::TodoStore& store, const Request& req, const Router::Params& params, Router::Reply reply) {
    Responder r(req, std::move(reply));
    int64_t id = 0;
    if (!id_param(params, r, id)) return;
    store.async_remove(id, [r, id](const boost::system::error_code& ec, bool removed) {
        if (ec) { r.internal(); return; }
        if (!removed) { r.error(http::status::not_found, kNotFound); return; }
        r.json(http::status::ok, "{\"deleted\":" + std::to_string(id) + "}");
    });
}

}

void register_todo_routes(Router& router, std::shared_ptr<todo::TodoStore> store) {
    router.add_async_route("GET", "/todos", [store](const Request& req, const Router::Params&, Router::Reply reply) {
        list_todos(*store, req, std::move(reply));
    });
    router.add_async_route("POST", "/todos", [store](const Request& req, const Router::Params&, Router::Reply reply) {
        create_todo(*store, req, std::move(reply));
    });
    router.add_async_route("GET", "/todos/{id}", [store](const Request& req, const Router::Params& params, Router::Reply reply) {
        get_todo(*store, req, params, std::move(reply));
    });
    router.add_async_route("PUT", "/todos/{id}", [store](const Request& req, const Router::Params& params, Router::Reply reply) {
        update_todo(*store, req, params, std::move(reply));
    });
    router.add_async_route("DELETE", "/todos/{id}", [store](const Request& req, const Router::Params& params, Router::Reply reply) {
        delete_todo(*store, req, params, std::move(reply));
    });
}

void register_service_routes(Router& router, std::shared_ptr<todo::TodoStore> store, bool metrics_enabled) {
    router.add_route("GET", "/health", [](const Request& req) {
        return make_json_response(http::status::ok, req, "{\"status\":\"ok\"}");
    });

    router.add_async_route("GET", "/db/health", [store](const Request& req, const Router::Params&, Router::Reply reply) {
        Responder r(req, std::move(reply));
        store->async_ping([r](const boost::system::error_code& ec) {
            if (ec) {
                observability::log_warn("db_health_down", {{"err", ec.message()}});
                r.json(http::status::internal_server_error, "{\"db\":\"down\"}");
                return;
            }
            r.json(http::status::ok, "{\"db\":\"ok\"}");
        });
    });

    if (metrics_enabled) {
        router.add_route("GET", "/metrics", [](const Request& req) {
            Response res{http::status::ok, req.version()};
            res.set(http::field::content_type, "text/plain; version=0.0.4");
            res.keep_alive(req.keep_alive());
            res.body() = observability::Metrics::instance().scrape();
            res.prepare_payload();
            return res;
        });
    }
}

}
