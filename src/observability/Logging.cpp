#include "Logging.h"
#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace observability {

static std::atomic<int> g_level{LEVEL_INFO};
static std::mutex g_out_mu;

void set_log_level(int level) { g_level.store(level); }

int log_level() { return g_level.load(); }

static int64_t now_ms() {
    using namespace std::chrono;
    return static_cast<int64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

static std::string escape_json(const std::string& s) {
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    out += "\\u00";
                    out.push_back(hex[(c >> 4) & 0xF]);
                    out.push_back(hex[c & 0xF]);
                } else {
                    out.push_back(static_cast<char>(c));
                }
                break;
        }
    }
    return out;
}

std::string format_log_line(int64_t ts_ms, const std::string& level_name, const std::string& msg, const Fields& fields) {
    std::ostringstream ss;
    ss << '{';
    ss << "\"ts\":" << ts_ms << ',';
    ss << "\"level\":\"" << level_name << "\",";
    ss << "\"msg\":\"" << escape_json(msg) << "\"";
    for (const auto& p : fields) {
        ss << ",\"" << escape_json(p.first) << "\":";
        if (std::holds_alternative<std::string>(p.second)) {
            ss << '\"' << escape_json(std::get<std::string>(p.second)) << '\"';
        } else if (std::holds_alternative<int64_t>(p.second)) {
            ss << std::get<int64_t>(p.second);
        } else if (std::holds_alternative<double>(p.second)) {
            std::ostringstream tmp; tmp << std::fixed << std::setprecision(3) << std::get<double>(p.second);
            ss << tmp.str();
        }
    }
    ss << '}';
    return ss.str();
}

static void log_generic(int level, const char* lvl_name, const std::string& msg, const Fields& fields) {
    if (level < g_level.load()) return;
    std::string line = format_log_line(now_ms(), lvl_name, msg, fields);
    // one write per line so worker threads cannot interleave output
    std::lock_guard<std::mutex> lk(g_out_mu);
    std::cout << line << '\n';
    std::cout.flush();
}

void log_debug(const std::string& msg, const Fields& fields) { log_generic(LEVEL_DEBUG, "DEBUG", msg, fields); }
void log_info(const std::string& msg, const Fields& fields) { log_generic(LEVEL_INFO, "INFO", msg, fields); }
void log_warn(const std::string& msg, const Fields& fields) { log_generic(LEVEL_WARN, "WARN", msg, fields); }
void log_error(const std::string& msg, const Fields& fields) { log_generic(LEVEL_ERROR, "ERROR", msg, fields); }

} // namespace observability
