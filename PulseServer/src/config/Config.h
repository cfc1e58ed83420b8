#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace config {

struct Config {
    enum class LogLevel { DEBUG, INFO, WARN, ERROR };
    uint16_t port = 8080;
    LogLevel log_level = LogLevel::INFO;
    bool metrics_enabled = true;
    bool access_log = true;

    // Shared store. Empty host means no Redis at all.
    std::string redis_host = "127.0.0.1";
    uint16_t redis_port = 6379;
    std::string redis_pass;
    int backend_timeout_ms = 2000;

    bool rate_limit_enabled = true;
    int rate_limit_requests = 100;
    int rate_limit_window_sec = 60;
    int rate_limit_reprobe_sec = 30;
    std::vector<std::string> rate_limit_exclude_paths{"/health", "/live", "/ready", "/metrics"};

    bool cache_enabled = true;

    std::string database_url;
    std::string database_url_read;
    int db_workers = 16;
    int db_read_workers = 16;

    std::string jwt_secret;

    bool pubsub_enabled = true;
    std::string pubsub_channel = "pulse:events";
    int ws_auth_timeout_sec = 5;

    static Config from_env(int argc, char** argv);
};

std::vector<std::string> split_csv(const std::string& s);

}
