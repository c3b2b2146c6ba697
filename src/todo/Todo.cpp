#include "Todo.h"
#include "net/MiniJson.h"
#include <cctype>
#include <sstream>

namespace todo {

std::string to_json(const Todo& t) {
    std::ostringstream ss;
    ss << '{';
    ss << "\"id\":" << t.id;
    ss << ",\"title\":" << json_quote(t.title);
    ss << ",\"completed\":" << (t.completed ? "true" : "false");
    ss << ",\"created\":" << json_quote(t.created);
    ss << '}';
    return ss.str();
}

std::string to_json(const std::vector<Todo>& todos) {
    std::string out = "[";
    for (size_t i = 0; i < todos.size(); ++i) {
        if (i) out += ',';
        out += to_json(todos[i]);
    }
    out += ']';
    return out;
}

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e-1]))) --e;
    return s.substr(b, e - b);
}

std::optional<int64_t> parse_id(const std::string& s) {
    if (s.empty() || s[0] == '-' || s[0] == '+') return std::nullopt;
    auto v = parse_int64_strict_sv(s);
    if (!v.has_value() || *v <= 0) return std::nullopt;
    return v;
}

std::vector<std::string> default_sample_titles() {
    return {"Dockerize the app \xE2\x9C\x85", "Add more features"};
}

}
