#include "Config.h"
#include "../net/MiniJson.h"
#include <cstdlib>
#include <string>
#include <algorithm>

namespace config {

static std::string getenv_or(const char* name, const char* def) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string(def);
}

static Config::LogLevel parse_level(const std::string& s) {
    std::string u = s;
    std::transform(u.begin(), u.end(), u.begin(), ::toupper);
    if (u == "DEBUG") return Config::LogLevel::DEBUG;
    if (u == "WARN") return Config::LogLevel::WARN;
    if (u == "ERROR") return Config::LogLevel::ERROR;
    return Config::LogLevel::INFO;
}

// Unset or malformed values leave out untouched.
static void read_int(const char* name, int& out) {
    const char* v = std::getenv(name);
    if (!v || !*v) return;
    if (auto n = parse_int_strict_sv(v)) out = *n;
}

static void read_port(const char* text, uint16_t& out) {
    auto n = parse_int_strict_sv(text ? text : "");
    if (n && *n > 0 && *n <= 65535) out = static_cast<uint16_t>(*n);
}

std::vector<std::string> split_csv(const std::string& s) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= s.size()) {
        size_t comma = s.find(',', start);
        if (comma == std::string::npos) comma = s.size();
        std::string item = s.substr(start, comma - start);
        size_t b = item.find_first_not_of(" \t");
        size_t e = item.find_last_not_of(" \t");
        if (b != std::string::npos) out.push_back(item.substr(b, e - b + 1));
        start = comma + 1;
    }
    return out;
}

Config Config::from_env(int argc, char** argv) {
    Config c;
    read_port(std::getenv("PORT"), c.port);
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--port" && i+1 < argc) read_port(argv[i+1], c.port);
    }
    c.log_level = parse_level(getenv_or("LOG_LEVEL", "INFO"));
    c.metrics_enabled = getenv_or("METRICS_ENABLED", "1") != "0";
    c.access_log = getenv_or("ACCESS_LOG", "1") != "0";

    c.redis_host = getenv_or("REDIS_HOST", "127.0.0.1");
    read_port(std::getenv("REDIS_PORT"), c.redis_port);
    c.redis_pass = getenv_or("REDIS_PASS", "");
    read_int("BACKEND_TIMEOUT_MS", c.backend_timeout_ms);
    c.backend_timeout_ms = std::clamp(c.backend_timeout_ms, 50, 30000);

    c.rate_limit_enabled = getenv_or("RATE_LIMIT_ENABLED", "1") != "0";
    read_int("RATE_LIMIT_REQUESTS", c.rate_limit_requests);
    read_int("RATE_LIMIT_WINDOW", c.rate_limit_window_sec);
    read_int("RATE_LIMIT_REPROBE_SEC", c.rate_limit_reprobe_sec);
    c.rate_limit_requests = std::max(1, c.rate_limit_requests);
    c.rate_limit_window_sec = std::max(1, c.rate_limit_window_sec);
    c.rate_limit_reprobe_sec = std::max(1, c.rate_limit_reprobe_sec);
    const char* excl = std::getenv("RATE_LIMIT_EXCLUDE_PATHS");
    if (excl) c.rate_limit_exclude_paths = split_csv(excl);

    c.cache_enabled = getenv_or("CACHE_ENABLED", "1") != "0";

    c.database_url = getenv_or("DATABASE_URL", "");
    c.database_url_read = getenv_or("DATABASE_URL_READ", "");
    read_int("DB_POOL_SIZE", c.db_workers);
    read_int("DB_WORKERS", c.db_workers);
    c.db_workers = std::clamp(c.db_workers, 1, 256);
    read_int("DB_READ_POOL_SIZE", c.db_read_workers);
    read_int("DB_READ_WORKERS", c.db_read_workers);
    c.db_read_workers = std::clamp(c.db_read_workers, 1, 256);

    c.jwt_secret = getenv_or("JWT_SECRET", "");

    c.pubsub_enabled = getenv_or("PUBSUB_ENABLED", "1") != "0";
    c.pubsub_channel = getenv_or("PUBSUB_CHANNEL", "pulse:events");
    if (c.pubsub_channel.empty()) c.pubsub_channel = "pulse:events";
    read_int("WS_AUTH_TIMEOUT_SEC", c.ws_auth_timeout_sec);
    c.ws_auth_timeout_sec = std::clamp(c.ws_auth_timeout_sec, 1, 60);
    return c;
}

}
