#include "PgTodoStore.h"
#include "net/MiniJson.h"
#include "observability/Logging.h"

namespace db {

namespace {

const char* const kColumns =
    "id, title, completed, "
    "to_char(created AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS.MS\"Z\"') AS created";

boost::system::error_code statement_failed() {
    return boost::system::errc::make_error_code(boost::system::errc::io_error);
}

boost::system::error_code bad_row() {
    return boost::system::errc::make_error_code(boost::system::errc::bad_message);
}

// Folds a non-ok DbResult into an error code and logs the server's reason.
boost::system::error_code check(const char* op, const boost::system::error_code& ec, const DbResult& r) {
    if (ec) {
        observability::log_error("todo_store.failed", {{"op", std::string(op)}, {"err", ec.message()}});
        return ec;
    }
    if (!r.ok) {
        observability::log_error("todo_store.failed", {{"op", std::string(op)}, {"sqlstate", r.sqlstate}, {"msg", r.message}});
        return statement_failed();
    }
    return {};
}

// Single-row statements (SELECT by id, INSERT/UPDATE ... RETURNING).
DbResultCb single_row(const char* op, todo::TodoCb cb) {
    return [op, cb = std::move(cb)](const boost::system::error_code& ec, DbResult r) {
        if (auto err = check(op, ec, r)) { cb(err, std::nullopt); return; }
        if (r.rows.empty()) { cb({}, std::nullopt); return; }
        auto t = todo_from_row(r.rows[0]);
        if (!t) {
            observability::log_error("todo_store.bad_row", {{"op", std::string(op)}});
            cb(bad_row(), std::nullopt);
            return;
        }
        cb({}, std::move(t));
    };
}

DbResultCb done(const char* op, todo::DoneCb cb) {
    return [op, cb = std::move(cb)](const boost::system::error_code& ec, DbResult r) {
        cb(check(op, ec, r));
    };
}

}

PgTodoStore::PgTodoStore(std::shared_ptr<DbPool> pool) : pool_(std::move(pool)) {}

const char* PgTodoStore::schema_sql() {
    return "CREATE TABLE IF NOT EXISTS todos ("
           " id        BIGSERIAL   PRIMARY KEY,"
           " title     TEXT        NOT NULL,"
           " completed BOOLEAN     NOT NULL DEFAULT FALSE,"
           " created   TIMESTAMPTZ NOT NULL DEFAULT NOW()"
           ")";
}

std::optional<todo::Todo> todo_from_row(const Row& row) {
    if (row.size() < 4) return std::nullopt;
    if (!row[0] || !row[1] || !row[2] || !row[3]) return std::nullopt;
    auto id = parse_int64_strict_sv(*row[0]);
    if (!id || *id <= 0) return std::nullopt;
    todo::Todo t;
    t.id = *id;
    t.title = *row[1];
    const std::string& c = *row[2];
    if (c == "t" || c == "true") t.completed = true;
    else if (c == "f" || c == "false") t.completed = false;
    else return std::nullopt;
    t.created = *row[3];
    return t;
}

std::string pg_text_array_literal(const std::vector<std::string>& vals) {
    std::string out = "{";
    for (size_t i = 0; i < vals.size(); ++i) {
        if (i) out += ',';
        out += '"';
        for (char c : vals[i]) {
            if (c == '"' || c == '\\') out += '\\';
            out += c;
        }
        out += '"';
    }
    out += '}';
    return out;
}

void PgTodoStore::async_init(todo::DoneCb cb) {
    pool_->async_exec(schema_sql(), done("init", std::move(cb)));
}

void PgTodoStore::async_seed(std::vector<std::string> titles, todo::DoneCb cb) {
    if (titles.empty()) { cb({}); return; }
    const std::string sql =
        "INSERT INTO todos (title) "
        "SELECT t FROM unnest($1::text[]) WITH ORDINALITY AS s(t, n) "
        "WHERE NOT EXISTS (SELECT 1 FROM todos) "
        "ORDER BY n "
        "ON CONFLICT DO NOTHING";
    pool_->async_exec_params(sql, {pg_text_array_literal(titles)}, done("seed", std::move(cb)));
}

void PgTodoStore::async_list(todo::TodoListCb cb) {
    const std::string sql = std::string("SELECT ") + kColumns + " FROM todos ORDER BY created DESC, id DESC";
    pool_->async_exec(sql, [cb = std::move(cb)](const boost::system::error_code& ec, DbResult r) {
        if (auto err = check("list", ec, r)) { cb(err, {}); return; }
        std::vector<todo::Todo> out;
        out.reserve(r.rows.size());
        for (const auto& row : r.rows) {
            auto t = todo_from_row(row);
            if (!t) {
                observability::log_error("todo_store.bad_row", {{"op", std::string("list")}});
                cb(bad_row(), {});
                return;
            }
            out.push_back(std::move(*t));
        }
        cb({}, std::move(out));
    });
}

void PgTodoStore::async_get(int64_t id, todo::TodoCb cb) {
    const std::string sql = std::string("SELECT ") + kColumns + " FROM todos WHERE id = $1";
    pool_->async_exec_params(sql, {std::to_string(id)}, single_row("get", std::move(cb)));
}

void PgTodoStore::async_create(std::string title, todo::TodoCb cb) {
    const std::string sql = std::string("INSERT INTO todos (title) VALUES ($1) RETURNING ") + kColumns;
    pool_->async_exec_params(sql, {std::move(title)}, single_row("create", std::move(cb)));
}

void PgTodoStore::async_update(int64_t id, todo::TodoPatch patch, todo::TodoCb cb) {
    const std::string sql =
        std::string("UPDATE todos SET title = COALESCE($2::text, title), completed = COALESCE($3::boolean, completed) "
                    "WHERE id = $1 RETURNING ") + kColumns;
    Param completed;
    if (patch.completed.has_value()) completed = std::string(*patch.completed ? "true" : "false");
    pool_->async_exec_params(sql, {std::to_string(id), std::move(patch.title), std::move(completed)}, single_row("update", std::move(cb)));
}

void PgTodoStore::async_remove(int64_t id, todo::RemoveCb cb) {
    pool_->async_exec_params("DELETE FROM todos WHERE id = $1 RETURNING id", {std::to_string(id)},
        [cb = std::move(cb)](const boost::system::error_code& ec, DbResult r) {
            if (auto err = check("remove", ec, r)) { cb(err, false); return; }
            cb({}, !r.rows.empty());
        });
}

void PgTodoStore::async_ping(todo::DoneCb cb) {
    pool_->async_scalar_int("SELECT 1", [cb = std::move(cb)](const boost::system::error_code& ec, int v) {
        if (ec) { cb(ec); return; }
        if (v != 1) { cb(statement_failed()); return; }
        cb({});
    });
}

}
