#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace config {

struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct Config {
    enum class LogLevel { DEBUG, INFO, WARN, ERROR };
    uint16_t port = 5000;
    std::string bind_address = "0.0.0.0";
    LogLevel log_level = LogLevel::INFO;
    bool metrics_enabled = true;
    bool access_log = true;
    std::string database_url;
    int db_workers = 2;
    bool seed_sample_todos = false;
    std::string cors_allow_origin = "*";

    // Environment first, then `--port N` on the command line.
    // Throws ConfigError when the resulting port is out of range.
    static Config from_env(int argc, char** argv);
    int log_level_number() const;
};

}
