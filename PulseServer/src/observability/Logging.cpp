#include "Logging.h"
#include <atomic>
#include <iostream>
#include <chrono>
#include <map>
#include <mutex>
#include <sstream>
#include <iomanip>

namespace observability {

static std::atomic<int> g_level{2};
static std::mutex g_out_mu;

void set_log_level(int level) { g_level.store(level); }
int log_level() { return g_level.load(); }

static int64_t now_ms() {
    using namespace std::chrono;
    return static_cast<int64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

static std::string escape_json(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

std::string format_log_line(int64_t ts_ms, const std::string& level, const std::string& msg, const Fields& fields) {
    std::ostringstream ss;
    ss << '{';
    ss << "\"ts\":" << ts_ms << ',';
    ss << "\"level\":\"" << level << "\",";
    ss << "\"msg\":\"" << escape_json(msg) << "\"";
    // stable field order keeps lines diffable
    std::map<std::string, const FieldValue*> ordered;
    for (const auto& p : fields) ordered.emplace(p.first, &p.second);
    for (const auto& p : ordered) {
        if (p.first == "ts" || p.first == "level" || p.first == "msg") continue;
        ss << ",\"" << escape_json(p.first) << "\":";
        const FieldValue& v = *p.second;
        if (std::holds_alternative<std::string>(v)) {
            ss << '\"' << escape_json(std::get<std::string>(v)) << '\"';
        } else if (std::holds_alternative<int64_t>(v)) {
            ss << std::get<int64_t>(v);
        } else if (std::holds_alternative<double>(v)) {
            std::ostringstream tmp; tmp << std::fixed << std::setprecision(3) << std::get<double>(v);
            ss << tmp.str();
        }
    }
    ss << '}';
    return ss.str();
}

static void log_generic(int level, const char* lvl_name, const std::string& msg, const Fields& fields) {
    if (level < g_level.load()) return;
    std::string line = format_log_line(now_ms(), lvl_name, msg, fields);
    std::lock_guard<std::mutex> lk(g_out_mu);
    std::cout << line << std::endl;
}

void log_debug(const std::string& msg, const Fields& fields) { log_generic(1, "DEBUG", msg, fields); }
void log_info(const std::string& msg, const Fields& fields) { log_generic(2, "INFO", msg, fields); }
void log_warn(const std::string& msg, const Fields& fields) { log_generic(3, "WARN", msg, fields); }
void log_error(const std::string& msg, const Fields& fields) { log_generic(4, "ERROR", msg, fields); }

} // namespace observability
