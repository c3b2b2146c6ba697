#include "Config.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace config {

static std::string getenv_or(const char* name, const char* def) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string(def);
}

static bool flag_from_env(const char* name, bool def) {
    std::string v = getenv_or(name, def ? "1" : "0");
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    return !(v == "0" || v == "false" || v == "no" || v == "off" || v.empty());
}

static Config::LogLevel parse_level(const std::string& s) {
    std::string u = s;
    std::transform(u.begin(), u.end(), u.begin(), [](unsigned char c) { return std::toupper(c); });
    if (u == "DEBUG") return Config::LogLevel::DEBUG;
    if (u == "WARN" || u == "WARNING") return Config::LogLevel::WARN;
    if (u == "ERROR") return Config::LogLevel::ERROR;
    return Config::LogLevel::INFO;
}

static long parse_port(const std::string& s, long fallback) {
    try {
        size_t used = 0;
        long v = std::stol(s, &used);
        if (used != s.size()) return fallback;
        return v;
    } catch (const std::logic_error&) {
        return fallback;
    }
}

Config Config::from_env(int argc, char** argv) {
    Config c;
    long port = parse_port(getenv_or("PORT", "5000"), 5000);
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--port" && i+1 < argc) port = parse_port(argv[i+1], port);
    }
    if (port < 1 || port > 65535) throw ConfigError("invalid port: " + std::to_string(port));
    c.port = static_cast<uint16_t>(port);

    c.bind_address = getenv_or("BIND_ADDRESS", "0.0.0.0");
    c.log_level = parse_level(getenv_or("LOG_LEVEL", "INFO"));
    c.metrics_enabled = flag_from_env("METRICS_ENABLED", true);
    c.access_log = flag_from_env("ACCESS_LOG", true);
    c.database_url = getenv_or("DATABASE_URL", "");
    c.seed_sample_todos = flag_from_env("SEED_SAMPLE_TODOS", false);
    c.cors_allow_origin = getenv_or("CORS_ALLOW_ORIGIN", "*");

    try {
        auto w = getenv_or("DB_WORKERS", "");
        if (!w.empty()) c.db_workers = std::stoi(w);
        else c.db_workers = std::stoi(getenv_or("DB_POOL_SIZE", "2"));
    } catch (const std::logic_error&) {
        c.db_workers = 2;
    }
    c.db_workers = std::clamp(c.db_workers, 1, 64);
    return c;
}

int Config::log_level_number() const {
    switch (log_level) {
        case LogLevel::DEBUG: return 1;
        case LogLevel::INFO: return 2;
        case LogLevel::WARN: return 3;
        case LogLevel::ERROR: return 4;
    }
    return 2;
}

}
