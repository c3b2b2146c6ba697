#pragma once

#include "Request.h"
#include "Response.h"
#include <string>
#include <functional>
#include <unordered_map>
#include <vector>

// Maps METHOD + path to handlers. Paths are either exact ("/health") or
// patterns with whole-segment captures ("/todos/{id}"). Exact routes win over
// patterns; patterns are tried in registration order.
class Router {
public:
    using Params = std::unordered_map<std::string, std::string>;
    using Reply = std::function<void(Response)>;
    using Handler = std::function<Response(const Request&)>;
    using AsyncHandler = std::function<void(const Request&, const Params&, Reply)>;

    void add_route(std::string method, std::string path, Handler h);
    void add_async_route(std::string method, std::string path, AsyncHandler h);

    // Invokes the matching handler, or replies 404/405. `reply` is called exactly once,
    // possibly after this returns. Exceptions escaping a handler become a 500.
    void dispatch(const Request& req, Reply reply) const;

    // Route pattern the request resolves to, for metrics labels; "(unmatched)" otherwise.
    std::string label_for(const Request& req) const;

    static std::string normalize_path(const std::string& target);

private:
    struct Route {
        std::string method;
        std::string pattern;
        std::vector<std::string> segments;
        AsyncHandler handler;
    };
    struct Key { std::string method; std::string path; };
    struct KeyHash {
        size_t operator()(Key const& k) const noexcept { return std::hash<std::string>()(k.method + "#" + k.path); }
    };
    struct KeyEq { bool operator()(Key const& a, Key const& b) const noexcept { return a.method==b.method && a.path==b.path; } };

    const Route* find(const std::string& method, const std::string& path, Params& params, bool& path_known) const;

    std::unordered_map<Key, Route, KeyHash, KeyEq> exact_;
    std::vector<Route> patterns_;
};
