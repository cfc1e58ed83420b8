#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>

namespace observability {

using FieldValue = std::variant<std::string, int64_t, double>;
using Fields = std::unordered_map<std::string, FieldValue>;

void log_debug(const std::string& msg, const Fields& fields = {});
void log_info(const std::string& msg, const Fields& fields = {});
void log_warn(const std::string& msg, const Fields& fields = {});
void log_error(const std::string& msg, const Fields& fields = {});

// 1 = DEBUG .. 4 = ERROR
void set_log_level(int level);
int log_level();

// Renders a log line without writing it. Used by tests.
std::string format_log_line(int64_t ts_ms, const std::string& level, const std::string& msg, const Fields& fields);

}
