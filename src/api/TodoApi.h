#pragma once

#include "net/Router.h"
#include "todo/TodoStore.h"
#include <memory>

namespace api {

// GET/POST /todos, GET/PUT/DELETE /todos/{id}
void register_todo_routes(Router& router, std::shared_ptr<todo::TodoStore> store);

// GET /health, GET /db/health and, when enabled, GET /metrics
void register_service_routes(Router& router, std::shared_ptr<todo::TodoStore> store, bool metrics_enabled);

}
