#include <iostream>
#include <string>
#include "../src/cache/Resp.h"

using namespace cache;

int main() {
    std::string s = resp_encode({"SET", "key", "value"});
    if (s != "*3\r\n$3\r\nSET\r\n$3\r\nkey\r\n$5\r\nvalue\r\n") { std::cerr << "resp_encode mismatch: " << s << "\n"; return 1; }
    if (resp_encode({"PUBLISH", "ch", ""}).find("$0\r\n\r\n") == std::string::npos) { std::cerr << "empty bulk not encoded\n"; return 1; }

    auto a = resp_parse("+OK\r\n");
    if (!a.has_value() || a->type != RespType::SimpleString || a->str != "OK") { std::cerr << "simple parse failed\n"; return 1; }

    auto err = resp_parse("-ERR wrong type\r\n");
    if (!err.has_value() || err->type != RespType::Error || err->str != "ERR wrong type") { std::cerr << "error parse failed\n"; return 1; }

    auto b = resp_parse(":-123\r\n");
    if (!b.has_value() || b->type != RespType::Integer || b->integer != -123) { std::cerr << "int parse failed\n"; return 1; }

    auto c = resp_parse("$7\r\nhe\r\nllo\r\n");
    if (!c.has_value() || c->type != RespType::BulkString || c->str != "he\r\nllo") { std::cerr << "binary-safe bulk failed\n"; return 1; }

    auto d = resp_parse("$-1\r\n");
    if (!d.has_value() || d->type != RespType::Null) { std::cerr << "null bulk failed\n"; return 1; }

    auto e = resp_parse("*3\r\n$7\r\nmessage\r\n$2\r\nch\r\n$4\r\n{\"a\"\r\n");
    if (!e.has_value() || e->type != RespType::Array || e->arr.size() != 3) { std::cerr << "array parse failed\n"; return 1; }
    if (e->arr[0].str != "message" || e->arr[2].str != "{\"a\"") { std::cerr << "array element mismatch\n"; return 1; }

    // pipelined replies come apart one at a time
    {
        std::string buf = ":1\r\n+PONG\r\n";
        RespValue v;
        size_t used = 0;
        if (resp_parse_prefix(buf, v, used) != RespParse::Ok || v.integer != 1 || used != 4) { std::cerr << "prefix parse failed\n"; return 1; }
        buf.erase(0, used);
        if (resp_parse_prefix(buf, v, used) != RespParse::Ok || v.str != "PONG" || used != buf.size()) { std::cerr << "second prefix parse failed\n"; return 1; }
    }

    const char* incomplete[] = {"", "+OK", "$5\r\nhe", "*2\r\n:1\r\n", ":12"};
    for (const char* in : incomplete) {
        RespValue v;
        size_t used = 0;
        if (resp_parse_prefix(in, v, used) != RespParse::Incomplete) { std::cerr << "expected Incomplete for '" << in << "'\n"; return 1; }
    }

    const char* malformed[] = {"?x\r\n", ":abc\r\n", "$-2\r\n", "$3\r\nabcXY", "*x\r\n", "$99999999\r\n"};
    for (const char* in : malformed) {
        RespValue v;
        size_t used = 0;
        if (resp_parse_prefix(in, v, used) != RespParse::Malformed) { std::cerr << "expected Malformed for '" << in << "'\n"; return 1; }
    }

    if (resp_parse("+OK\r\n+OK\r\n").has_value()) { std::cerr << "trailing data accepted\n"; return 1; }

    std::cout << "resp_unit ok\n";
    return 0;
}
