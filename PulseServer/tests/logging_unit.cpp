#include <unistd.h>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include "../src/observability/Logging.h"

using namespace observability;

static bool is_json_line(const std::string& s) {
    if (s.empty()) return false;
    return s.front() == '{' && s.back() == '}' && s.find("\"level\"") != std::string::npos && s.find("\"msg\"") != std::string::npos;
}

// Runs fn with stdout redirected to path and returns what was written.
template <typename Fn>
static bool capture_stdout(const char* path, Fn fn, std::string& out) {
    std::fflush(stdout);
    int saved = dup(fileno(stdout));
    if (saved == -1) return false;
    if (!freopen(path, "w+", stdout)) return false;
    fn();
    std::fflush(stdout);
    std::cout.flush();
    if (dup2(saved, fileno(stdout)) == -1) return false;
    close(saved);
    std::ifstream ifs(path);
    if (!ifs) return false;
    out.assign((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    return true;
}

int main() {
    {
        auto line = format_log_line(1700000000000, "WARN", "ratelimit.degraded",
                                    {{"zeta", std::string("z")}, {"alpha", int64_t(7)}, {"ratio", 0.5}, {"msg", std::string("ignored")}});
        std::string want = "{\"ts\":1700000000000,\"level\":\"WARN\",\"msg\":\"ratelimit.degraded\",\"alpha\":7,\"ratio\":0.500,\"zeta\":\"z\"}";
        if (line != want) { std::cerr << "format_log_line mismatch:\n" << line << "\n" << want << "\n"; return 1; }
        auto esc = format_log_line(1, "INFO", "a\"b\n", {{"k", std::string("\x01")}});
        if (esc.find("a\\\"b\\n") == std::string::npos || esc.find("\\u0001") == std::string::npos) {
            std::cerr << "escaping failed: " << esc << "\n"; return 1;
        }
    }

    set_log_level(2);
    std::string out;
    bool ok = capture_stdout("/tmp/logging_unit_stage1.txt", [] {
        log_debug("debug-message");
        log_info("info-message", {{"path", std::string("/api/feed")}});
        log_warn("warn-message");
        log_error("error-message");
    }, out);
    if (!ok) { std::cerr << "stdout capture failed\n"; return 1; }

    std::istringstream in(out);
    std::string line;
    bool saw_info = false, saw_warn = false, saw_error = false;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        if (!is_json_line(line)) { std::cerr << "line not json: " << line << "\n"; return 1; }
        if (line.find("\"level\":\"INFO\"") != std::string::npos) saw_info = true;
        if (line.find("\"level\":\"WARN\"") != std::string::npos) saw_warn = true;
        if (line.find("\"level\":\"ERROR\"") != std::string::npos) saw_error = true;
    }
    if (!saw_info || !saw_warn || !saw_error) { std::cerr << "missing level outputs info=" << saw_info << " warn=" << saw_warn << " err=" << saw_error << "\n"; return 1; }
    if (out.find("debug-message") != std::string::npos) { std::cerr << "debug line written at INFO level\n"; return 1; }
    if (out.find("\"path\":\"/api/feed\"") == std::string::npos) { std::cerr << "field missing\n"; return 1; }

    set_log_level(4);
    ok = capture_stdout("/tmp/logging_unit_stage2.txt", [] {
        log_warn("suppressed");
        log_error("kept");
    }, out);
    if (!ok) { std::cerr << "stdout capture failed\n"; return 1; }
    if (out.find("suppressed") != std::string::npos || out.find("kept") == std::string::npos) { std::cerr << "ERROR threshold not honored\n"; return 1; }
    set_log_level(2);

    const int threads = 4;
    const int iters = 500;
    ok = capture_stdout("/tmp/logging_unit_stage3.txt", [] {
        std::vector<std::thread> th;
        for (int t = 0; t < threads; ++t) {
            th.emplace_back([t]() {
                for (int i = 0; i < iters; ++i) log_info("t" + std::to_string(t) + " msg " + std::to_string(i), {{"i", int64_t(i)}});
            });
        }
        for (auto& tt : th) tt.join();
    }, out);
    if (!ok) { std::cerr << "stdout capture failed\n"; return 1; }
    std::istringstream in3(out);
    int count = 0;
    while (std::getline(in3, line)) {
        if (line.empty()) continue;
        if (!is_json_line(line)) { std::cerr << "interleaved line: " << line << "\n"; return 1; }
        ++count;
    }
    if (count != threads * iters) { std::cerr << "expected " << threads * iters << " lines, got " << count << "\n"; return 1; }

    std::cout << "logging_unit ok\n";
    return 0;
}
