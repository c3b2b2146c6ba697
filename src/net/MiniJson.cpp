#include "MiniJson.h"
#include <stdexcept>
#include <cctype>
#include <cstring>
#include <vector>

namespace {

int hex_value(char ch) {
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'f') return 10 + (ch - 'a');
    if (ch >= 'A' && ch <= 'F') return 10 + (ch - 'A');
    return -1;
}

void append_utf8(std::string& out, int code) {
    if (code <= 0x7f) out.push_back((char)code);
    else if (code <= 0x7ff) {
        out.push_back((char)(0xc0 | ((code >> 6) & 0x1f)));
        out.push_back((char)(0x80 | (code & 0x3f)));
    } else if (code <= 0xffff) {
        out.push_back((char)(0xe0 | ((code >> 12) & 0x0f)));
        out.push_back((char)(0x80 | ((code >> 6) & 0x3f)));
        out.push_back((char)(0x80 | (code & 0x3f)));
    } else {
        out.push_back((char)(0xf0 | ((code >> 18) & 0x07)));
        out.push_back((char)(0x80 | ((code >> 12) & 0x3f)));
        out.push_back((char)(0x80 | ((code >> 6) & 0x3f)));
        out.push_back((char)(0x80 | (code & 0x3f)));
    }
}

int hex4_at(const std::string& js, size_t pos) {
    if (pos + 4 > js.size()) return -1;
    int code = 0;
    for (size_t k = pos; k < pos + 4; ++k) {
        int h = hex_value(js[k]);
        if (h < 0) return -1;
        code = (code << 4) | h;
    }
    return code;
}

// `pos` is at the backslash of a \u escape. Returns the code point and sets
// `len` to the escape length (12 for a surrogate pair), or -1 for a bad hex
// digit, a lone surrogate or U+0000 (which would end the text at libpq).
int unicode_escape_at(const std::string& js, size_t pos, size_t& len) {
    int hi = hex4_at(js, pos + 2);
    if (hi <= 0) return -1;
    len = 6;
    if (hi >= 0xdc00 && hi <= 0xdfff) return -1;
    if (hi < 0xd800 || hi > 0xdbff) return hi;
    if (pos + 7 >= js.size() || js[pos + 6] != '\\' || js[pos + 7] != 'u') return -1;
    int lo = hex4_at(js, pos + 8);
    if (lo < 0xdc00 || lo > 0xdfff) return -1;
    len = 12;
    return 0x10000 + ((hi - 0xd800) << 10) + (lo - 0xdc00);
}

// Length of the well-formed UTF-8 sequence starting at `pos`, 0 if there is none.
size_t utf8_sequence_at(const std::string& s, size_t pos) {
    const unsigned char c = (unsigned char)s[pos];
    size_t len;
    unsigned char lo = 0x80, hi = 0xbf;
    if (c < 0x80) return 1;
    if (c >= 0xc2 && c <= 0xdf) len = 2;
    else if (c >= 0xe0 && c <= 0xef) {
        len = 3;
        if (c == 0xe0) lo = 0xa0;
        else if (c == 0xed) hi = 0x9f;
    } else if (c >= 0xf0 && c <= 0xf4) {
        len = 4;
        if (c == 0xf0) lo = 0x90;
        else if (c == 0xf4) hi = 0x8f;
    } else return 0;
    if (pos + len > s.size()) return 0;
    const unsigned char second = (unsigned char)s[pos + 1];
    if (second < lo || second > hi) return 0;
    for (size_t k = pos + 2; k < pos + len; ++k) {
        const unsigned char cc = (unsigned char)s[k];
        if (cc < 0x80 || cc > 0xbf) return 0;
    }
    return len;
}

// start points just past the opening quote; returns decoded text and the index of the closing quote
std::pair<std::string,size_t> decode_string(const std::string& js, size_t start) {
    const size_t n = js.size();
    std::string out;
    size_t i = start;
    for (;; ++i) {
        if (i >= n) throw std::runtime_error("unterminated json string");
        char c = js[i];
        if (c == '"') return {out, i};
        if (c == '\\') {
            if (i + 1 >= n) throw std::runtime_error("unterminated escape in json string");
            char e = js[i+1];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'u': {
                    size_t len = 0;
                    int code = unicode_escape_at(js, i, len);
                    if (code < 0) throw std::runtime_error("invalid unicode escape in json string");
                    append_utf8(out, code);
                    i += len - 2;
                    break;
                }
                default: throw std::runtime_error("unsupported escape in json string");
            }
            ++i;
            continue;
        }
        out.push_back(c);
    }
}

size_t skip_ws(const std::string& js, size_t i) {
    while (i < js.size() && isspace((unsigned char)js[i])) ++i;
    return i;
}

// Position of the value for a member of the outermost object, or npos when absent.
size_t find_top_level_value(const std::string& js, const std::string& key) {
    const size_t n = js.size();
    std::vector<char> stack;
    for (size_t i = 0; i < n; ++i) {
        char c = js[i];
        if (c == '"') {
            auto dec = decode_string(js, i+1);
            size_t closing = dec.second;

            size_t before = i;
            while (before > 0 && isspace((unsigned char)js[before-1])) --before;
            bool prev_obj_or_comma = (before > 0 && (js[before-1] == '{' || js[before-1] == ','));
            size_t after = skip_ws(js, closing + 1);
            bool top_level_object = (stack.size() == 1 && stack.back() == '{');

            if (top_level_object && prev_obj_or_comma) {
                if (after >= n || js[after] != ':') throw std::runtime_error("missing ':' after object key");
                if (dec.first == key) {
                    size_t valpos = skip_ws(js, after + 1);
                    if (valpos >= n) throw std::runtime_error("missing value for field");
                    return valpos;
                }
            }
            i = closing;
            continue;
        }
        if (c == '{' || c == '[') stack.push_back(c);
        else if (c == '}' || c == ']') { if (!stack.empty()) stack.pop_back(); }
    }
    return std::string::npos;
}

bool literal_at(const std::string& js, size_t pos, const char* word) {
    size_t len = std::strlen(word);
    return js.compare(pos, len, word) == 0;
}

// the scalar ending at `end` must be followed by a member separator
void expect_member_end(const std::string& js, size_t end, const char* what) {
    size_t after_tok = skip_ws(js, end);
    if (after_tok >= js.size() || (js[after_tok] != ',' && js[after_tok] != '}')) {
        throw std::runtime_error(std::string("invalid json ") + what + " terminator");
    }
}

class Validator {
public:
    explicit Validator(const std::string& s) : s_(s) {}

    bool top_level_object() {
        i_ = skip_ws(s_, 0);
        if (i_ >= s_.size() || s_[i_] != '{') return false;
        if (!value()) return false;
        i_ = skip_ws(s_, i_);
        return i_ == s_.size();
    }

private:
    static constexpr int kMaxDepth = 64;

    bool value() {
        i_ = skip_ws(s_, i_);
        if (i_ >= s_.size()) return false;
        char c = s_[i_];
        if (c == '{') return object();
        if (c == '[') return array();
        if (c == '"') return string();
        if (c == '-' || (c >= '0' && c <= '9')) return number();
        if (literal_at(s_, i_, "true")) { i_ += 4; return true; }
        if (literal_at(s_, i_, "false")) { i_ += 5; return true; }
        if (literal_at(s_, i_, "null")) { i_ += 4; return true; }
        return false;
    }

    bool object() {
        if (++depth_ > kMaxDepth) return false;
        ++i_;
        i_ = skip_ws(s_, i_);
        if (i_ < s_.size() && s_[i_] == '}') { ++i_; --depth_; return true; }
        for (;;) {
            i_ = skip_ws(s_, i_);
            if (i_ >= s_.size() || s_[i_] != '"') return false;
            if (!string()) return false;
            i_ = skip_ws(s_, i_);
            if (i_ >= s_.size() || s_[i_] != ':') return false;
            ++i_;
            if (!value()) return false;
            i_ = skip_ws(s_, i_);
            if (i_ >= s_.size()) return false;
            if (s_[i_] == ',') { ++i_; continue; }
            if (s_[i_] == '}') { ++i_; --depth_; return true; }
            return false;
        }
    }

    bool array() {
        if (++depth_ > kMaxDepth) return false;
        ++i_;
        i_ = skip_ws(s_, i_);
        if (i_ < s_.size() && s_[i_] == ']') { ++i_; --depth_; return true; }
        for (;;) {
            if (!value()) return false;
            i_ = skip_ws(s_, i_);
            if (i_ >= s_.size()) return false;
            if (s_[i_] == ',') { ++i_; continue; }
            if (s_[i_] == ']') { ++i_; --depth_; return true; }
            return false;
        }
    }

    bool string() {
        ++i_;
        while (i_ < s_.size()) {
            unsigned char c = (unsigned char)s_[i_];
            if (c == '"') { ++i_; return true; }
            if (c < 0x20) return false;
            if (c == '\\') {
                if (i_ + 1 >= s_.size()) return false;
                char e = s_[i_+1];
                if (e == 'u') {
                    size_t len = 0;
                    if (unicode_escape_at(s_, i_, len) < 0) return false;
                    i_ += len;
                    continue;
                }
                if (!std::strchr("\"\\/bfnrt", e)) return false;
                i_ += 2;
                continue;
            }
            size_t len = utf8_sequence_at(s_, i_);
            if (len == 0) return false;
            i_ += len;
        }
        return false;
    }

    bool number() {
        auto digits = [&]() {
            size_t start = i_;
            while (i_ < s_.size() && s_[i_] >= '0' && s_[i_] <= '9') ++i_;
            return i_ > start;
        };
        if (s_[i_] == '-') ++i_;
        if (i_ >= s_.size()) return false;
        if (s_[i_] == '0') ++i_;
        else if (!digits()) return false;
        if (i_ < s_.size() && s_[i_] == '.') { ++i_; if (!digits()) return false; }
        if (i_ < s_.size() && (s_[i_] == 'e' || s_[i_] == 'E')) {
            ++i_;
            if (i_ < s_.size() && (s_[i_] == '+' || s_[i_] == '-')) ++i_;
            if (!digits()) return false;
        }
        return true;
    }

    const std::string& s_;
    size_t i_ = 0;
    int depth_ = 0;
};

}

bool json_is_object(const std::string& js) {
    return Validator(js).top_level_object();
}

std::pair<bool, std::optional<std::string>> json_extract_string_opt_present(const std::string& js, const std::string& key) {
    size_t valpos = find_top_level_value(js, key);
    if (valpos == std::string::npos) return {false, std::nullopt};
    if (literal_at(js, valpos, "null")) return {true, std::nullopt};
    if (js[valpos] != '"') throw std::runtime_error("invalid type for json string field");
    return {true, decode_string(js, valpos+1).first};
}

// returns empty string on not-found or explicit null
std::string json_extract_string(const std::string& js, const std::string& key) {
    auto pr = json_extract_string_opt_present(js, key);
    if (!pr.first) return std::string();
    if (!pr.second.has_value()) return std::string();
    return pr.second.value();
}

std::pair<bool,int64_t> json_extract_int_present(const std::string& js, const std::string& key) {
    const size_t n = js.size();
    size_t valpos = find_top_level_value(js, key);
    if (valpos == std::string::npos) return {false, 0};
    if (literal_at(js, valpos, "null")) throw std::runtime_error("null not allowed for integer field");
    size_t end = valpos; if (end < n && js[end] == '-') ++end; while (end < n && js[end] >= '0' && js[end] <= '9') ++end;
    if (end == valpos || (end == valpos+1 && js[valpos] == '-')) throw std::runtime_error("invalid json int");
    expect_member_end(js, end, "int");
    auto parsed = parse_int64_strict_sv(std::string_view(js).substr(valpos, end - valpos));
    if (!parsed.has_value()) throw std::runtime_error("invalid json int value");
    return {true, *parsed};
}

std::optional<int64_t> json_extract_int_opt(const std::string& js, const std::string& key) {
    auto p = json_extract_int_present(js, key);
    if (!p.first) return std::nullopt;
    return p.second;
}

std::pair<bool,bool> json_extract_bool_present(const std::string& js, const std::string& key) {
    size_t valpos = find_top_level_value(js, key);
    if (valpos == std::string::npos) return {false, false};
    if (literal_at(js, valpos, "true")) { expect_member_end(js, valpos + 4, "bool"); return {true, true}; }
    if (literal_at(js, valpos, "false")) { expect_member_end(js, valpos + 5, "bool"); return {true, false}; }
    throw std::runtime_error("invalid type for json bool field");
}

// escapes control chars < 0x20 with \u00XX
std::string json_escape_resp(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out; out.reserve(s.size()+8);
    for (unsigned char uc : s) {
        if (uc == '"') { out += "\\\""; }
        else if (uc == '\\') { out += "\\\\"; }
        else if (uc == '\n') { out += "\\n"; }
        else if (uc == '\r') { out += "\\r"; }
        else if (uc == '\t') { out += "\\t"; }
        else if (uc < 0x20) {
            out.push_back('\\'); out.push_back('u'); out.push_back('0'); out.push_back('0');
            out.push_back(hex[(uc >> 4) & 0xF]); out.push_back(hex[uc & 0xF]);
        } else out.push_back((char)uc);
    }
    return out;
}

std::string json_quote(const std::string& s) {
    return "\"" + json_escape_resp(s) + "\"";
}
