#pragma once

#include "DbPool.h"
#include "todo/TodoStore.h"
#include <memory>

namespace db {

// TodoStore backed by PostgreSQL through DbPool.
class PgTodoStore : public todo::TodoStore {
public:
    explicit PgTodoStore(std::shared_ptr<DbPool> pool);

    void async_init(todo::DoneCb cb) override;
    void async_seed(std::vector<std::string> titles, todo::DoneCb cb) override;
    void async_list(todo::TodoListCb cb) override;
    void async_get(int64_t id, todo::TodoCb cb) override;
    void async_create(std::string title, todo::TodoCb cb) override;
    void async_update(int64_t id, todo::TodoPatch patch, todo::TodoCb cb) override;
    void async_remove(int64_t id, todo::RemoveCb cb) override;
    void async_ping(todo::DoneCb cb) override;

    static const char* schema_sql();

private:
    std::shared_ptr<DbPool> pool_;
};

// Parses one `id, title, completed, created` row; nullopt if any column is malformed.
std::optional<todo::Todo> todo_from_row(const Row& row);

// Postgres text[] literal; elements are always quoted.
std::string pg_text_array_literal(const std::vector<std::string>& vals);

}
