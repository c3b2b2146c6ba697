#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace todo {

struct Todo {
    int64_t id = 0;
    std::string title;
    bool completed = false;
    std::string created;   // ISO-8601 UTC, e.g. 2026-10-18T13:32:00.123Z
};

std::string to_json(const Todo& t);
std::string to_json(const std::vector<Todo>& todos);

// ASCII whitespace only; titles are otherwise stored verbatim.
std::string trim(const std::string& s);

// Decimal, strictly positive, fits in int64. Anything else is rejected.
std::optional<int64_t> parse_id(const std::string& s);

std::vector<std::string> default_sample_titles();

}
