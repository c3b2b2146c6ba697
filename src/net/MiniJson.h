#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <string_view>
#include <limits>
#include <utility>

// Minimal JSON helpers for flat request bodies. Extractors look only at the
// top-level members of an object and throw std::runtime_error on malformed
// input or on a value of the wrong type; absent keys are reported via .first.

bool json_is_object(const std::string& js);

std::pair<bool, std::optional<std::string>> json_extract_string_opt_present(const std::string& js, const std::string& key);
std::string json_extract_string(const std::string& js, const std::string& key);
std::pair<bool,int64_t> json_extract_int_present(const std::string& js, const std::string& key);
std::optional<int64_t> json_extract_int_opt(const std::string& js, const std::string& key);
std::pair<bool,bool> json_extract_bool_present(const std::string& js, const std::string& key);

std::string json_escape_resp(const std::string& s);
std::string json_quote(const std::string& s);


inline std::optional<int64_t> parse_int64_strict_sv(std::string_view s) {
    if (s.empty()) return std::nullopt;
    size_t i = 0;
    bool neg = false;
    if (s[i] == '-') { neg = true; ++i; }
    if (i >= s.size()) return std::nullopt;

    const uint64_t maxAbs = neg ? (uint64_t(std::numeric_limits<int64_t>::max()) + 1ULL) : uint64_t(std::numeric_limits<int64_t>::max());
    uint64_t v = 0;
    for (; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c < '0' || c > '9') return std::nullopt;
        uint64_t d = uint64_t(c - '0');
        if (v > (maxAbs - d) / 10) return std::nullopt;
        v = v * 10 + d;
    }

    if (!neg) return static_cast<int64_t>(v);
    if (v == (uint64_t(std::numeric_limits<int64_t>::max()) + 1ULL)) return std::numeric_limits<int64_t>::min();
    return -static_cast<int64_t>(v);
}
