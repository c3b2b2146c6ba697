#include "Router.h"
#include "observability/Logging.h"
#include <boost/beast/http.hpp>
#include <exception>
#include <memory>

namespace http = boost::beast::http;

static std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> out;
    size_t pos = 1;
    while (pos <= path.size()) {
        size_t slash = path.find('/', pos);
        if (slash == std::string::npos) slash = path.size();
        out.push_back(path.substr(pos, slash - pos));
        pos = slash + 1;
    }
    return out;
}

static bool is_capture(const std::string& seg) {
    return seg.size() > 2 && seg.front() == '{' && seg.back() == '}';
}

static bool match_segments(const std::vector<std::string>& pattern, const std::vector<std::string>& path, Router::Params& params) {
    if (pattern.size() != path.size()) return false;
    Router::Params found;
    for (size_t i = 0; i < pattern.size(); ++i) {
        if (is_capture(pattern[i])) {
            if (path[i].empty()) return false;
            found[pattern[i].substr(1, pattern[i].size() - 2)] = path[i];
        } else if (pattern[i] != path[i]) {
            return false;
        }
    }
    params = std::move(found);
    return true;
}

std::string Router::normalize_path(const std::string& target) {
    std::string path = target;
    auto qpos = path.find('?');
    if (qpos != std::string::npos) path.erase(qpos);
    if (path.empty() || path[0] != '/') path.insert(path.begin(), '/');
    while (path.size() > 1 && path.back() == '/') path.pop_back();
    return path;
}

void Router::add_route(std::string method, std::string path, Handler h) {
    add_async_route(std::move(method), std::move(path), [h = std::move(h)](const Request& req, const Params&, Reply reply) {
        reply(h(req));
    });
}

void Router::add_async_route(std::string method, std::string path, AsyncHandler h) {
    Route r;
    r.method = std::move(method);
    r.pattern = normalize_path(path);
    r.segments = split_path(r.pattern);
    r.handler = std::move(h);
    bool has_capture = false;
    for (const auto& s : r.segments) if (is_capture(s)) { has_capture = true; break; }
    if (has_capture) {
        patterns_.push_back(std::move(r));
    } else {
        Key k{r.method, r.pattern};
        exact_.emplace(std::move(k), std::move(r));
    }
}

const Router::Route* Router::find(const std::string& method, const std::string& path, Params& params, bool& path_known) const {
    path_known = false;
    auto it = exact_.find(Key{method, path});
    if (it != exact_.end()) { path_known = true; return &it->second; }
    for (const auto& p : exact_) {
        if (p.first.path == path) { path_known = true; break; }
    }
    auto segs = split_path(path);
    for (const auto& r : patterns_) {
        Params tmp;
        if (!match_segments(r.segments, segs, tmp)) continue;
        path_known = true;
        if (r.method == method) { params = std::move(tmp); return &r; }
    }
    return nullptr;
}

std::string Router::label_for(const Request& req) const {
    Params params;
    bool path_known = false;
    const Route* r = find(std::string(req.method_string()), normalize_path(std::string(req.target())), params, path_known);
    return r ? r->pattern : std::string("(unmatched)");
}

void Router::dispatch(const Request& req, Reply reply) const {
    const std::string path = normalize_path(std::string(req.target()));
    Params params;
    bool path_known = false;
    const Route* r = find(std::string(req.method_string()), path, params, path_known);
    if (!r) {
        if (path_known) {
            reply(make_json_response(http::status::method_not_allowed, req, "{\"error\":\"method not allowed\"}"));
            return;
        }
        reply(make_json_response(http::status::not_found, req, "{\"error\":\"not found\"}"));
        return;
    }
    // a handler that throws may already have replied; never answer twice
    auto replied = std::make_shared<bool>(false);
    Reply once = [replied, reply](Response res) {
        if (*replied) return;
        *replied = true;
        reply(std::move(res));
    };
    try {
        r->handler(req, params, once);
    } catch (const std::exception& e) {
        observability::log_error("handler_exception", {{"path", r->pattern}, {"err", std::string(e.what())}});
        once(make_json_response(http::status::internal_server_error, req, "{\"error\":\"internal\"}"));
    }
}
