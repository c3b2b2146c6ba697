#pragma once

#include "Todo.h"
#include <boost/system/error_code.hpp>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace todo {

// Fields a PUT may change; nullopt leaves the stored value untouched.
struct TodoPatch {
    std::optional<std::string> title;
    std::optional<bool> completed;
};

using DoneCb = std::function<void(const boost::system::error_code&)>;
using TodoCb = std::function<void(const boost::system::error_code&, std::optional<Todo>)>;
using TodoListCb = std::function<void(const boost::system::error_code&, std::vector<Todo>)>;
using RemoveCb = std::function<void(const boost::system::error_code&, bool removed)>;

// Persistence for the single `todos` table. Every operation is one statement
// against the backing store. A set error_code means the store failed; a
// missing row is not an error and is reported as nullopt / removed=false.
class TodoStore {
public:
    virtual ~TodoStore() = default;

    virtual void async_init(DoneCb cb) = 0;
    // Inserts `titles` only when the table holds no rows at all.
    virtual void async_seed(std::vector<std::string> titles, DoneCb cb) = 0;
    virtual void async_list(TodoListCb cb) = 0;
    virtual void async_get(int64_t id, TodoCb cb) = 0;
    virtual void async_create(std::string title, TodoCb cb) = 0;
    virtual void async_update(int64_t id, TodoPatch patch, TodoCb cb) = 0;
    virtual void async_remove(int64_t id, RemoveCb cb) = 0;
    virtual void async_ping(DoneCb cb) = 0;
};

}
