#include <iostream>
#include <string>
#include <optional>
#include <stdexcept>
#include "net/MiniJson.h"

template <typename Fn>
static bool throws(Fn fn) {
    try { fn(); } catch (const std::runtime_error&) { return true; }
    return false;
}

int main() {
    auto e1 = json_escape_resp("abc");
    if (e1 != "abc") { std::cerr << "json_escape_resp changed plain text\n"; return 1; }
    if (json_escape_resp("a\"b") != "a\\\"b") { std::cerr << "json_escape_resp did not escape quote\n"; return 1; }
    if (json_escape_resp("a\\b") != "a\\\\b") { std::cerr << "json_escape_resp did not escape backslash\n"; return 1; }
    if (json_escape_resp("\n\t\r") != "\\n\\t\\r") { std::cerr << "json_escape_resp did not escape control chars\n"; return 1; }
    if (json_escape_resp(std::string("\x01", 1)) != "\\u0001") { std::cerr << "json_escape_resp low control char\n"; return 1; }
    if (json_escape_resp("привет") != "привет") { std::cerr << "json_escape_resp mangled utf-8\n"; return 1; }
    if (json_quote("x") != "\"x\"") { std::cerr << "json_quote\n"; return 1; }

    {
        auto pr = json_extract_string_present("{\"a\":\"b\"}", "a");
        if (!pr.first || pr.second != "b") { std::cerr << "json_extract_string_present wrong value: " << pr.second << "\n"; return 1; }
        if (json_extract_string("{}", "nope") != "") { std::cerr << "missing key should be empty\n"; return 1; }
        auto nul = json_extract_string_present("{\"a\":null}", "a");
        if (!nul.first || !nul.second.empty()) { std::cerr << "null string should be present and empty\n"; return 1; }
        if (json_extract_string("{\"u\":\"\\u00e9\\ud83d\\ude00\"}", "u") != "\xc3\xa9\xf0\x9f\x98\x80") { std::cerr << "unicode escapes\n"; return 1; }
    }
    // Only the outermost object counts.
    if (json_extract_string("{\"inner\":{\"a\":\"deep\"},\"a\":\"top\"}", "a") != "top") { std::cerr << "nested key leaked\n"; return 1; }
    if (json_extract_string_present("{\"inner\":{\"a\":\"deep\"}}", "a").first) { std::cerr << "nested key reported present\n"; return 1; }

    if (!throws([] { json_extract_string_present("{\"a\":123}", "a"); })) { std::cerr << "numeric accepted as string\n"; return 1; }

    auto oi = json_extract_int_opt("{\"n\":42}", "n");
    if (!oi.has_value() || *oi != 42) { std::cerr << "json_extract_int_opt failed\n"; return 1; }
    if (json_extract_int_opt("{\"n\":null}", "n").has_value()) { std::cerr << "null int should be nullopt\n"; return 1; }
    if (!throws([] { json_extract_int_opt("{\"n\":1.5}", "n"); })) { std::cerr << "fraction accepted as int\n"; return 1; }
    if (!throws([] { json_extract_int_opt("{\"n\":99999999999999999999}", "n"); })) { std::cerr << "overflow accepted\n"; return 1; }

    auto b = json_extract_bool_opt("{\"t\":true,\"f\":false}", "f");
    if (!b.has_value() || *b) { std::cerr << "json_extract_bool_opt\n"; return 1; }
    if (!throws([] { json_extract_bool_opt("{\"t\":1}", "t"); })) { std::cerr << "int accepted as bool\n"; return 1; }

    if (json_extract_id_opt("{\"id\":7}", "id") != std::optional<std::string>("7")) { std::cerr << "int id\n"; return 1; }
    if (json_extract_id_opt("{\"id\":\"7\"}", "id") != std::optional<std::string>("7")) { std::cerr << "string id\n"; return 1; }
    if (json_extract_id_opt("{\"id\":\"\"}", "id").has_value()) { std::cerr << "empty id should be nullopt\n"; return 1; }
    if (!throws([] { json_extract_id_opt("{\"id\":true}", "id"); })) { std::cerr << "bool accepted as id\n"; return 1; }

    auto raw = json_extract_raw("{\"d\": {\"x\": [1, 2]}, \"e\":1}", "d");
    if (!raw.has_value() || *raw != "{\"x\": [1, 2]}") { std::cerr << "json_extract_raw: " << raw.value_or("<none>") << "\n"; return 1; }

    if (!throws([] { json_extract_string("", "a"); })) { std::cerr << "empty input should throw\n"; return 1; }
    if (!throws([] { json_extract_string("{", "a"); })) { std::cerr << "truncated input should throw\n"; return 1; }
    if (!throws([] { json_extract_string("[]", "a"); })) { std::cerr << "array input should throw\n"; return 1; }
    if (!throws([] { json_extract_string("{a:1}", "a"); })) { std::cerr << "unquoted key should throw\n"; return 1; }

    auto canon = json_canonicalize(" { \"b\" : 1 , \"a\" : [ true , null ] } ");
    if (!canon.has_value() || *canon != "{\"a\":[true,null],\"b\":1}") { std::cerr << "canonicalize: " << canon.value_or("<none>") << "\n"; return 1; }
    if (json_canonicalize("{\"a\":1} x").has_value()) { std::cerr << "trailing garbage accepted\n"; return 1; }
    if (json_canonicalize("{\"a\":01}").has_value()) { std::cerr << "leading zero accepted\n"; return 1; }
    if (!json_is_object("{}") || json_is_object("[1]") || json_is_object("nope")) { std::cerr << "json_is_object\n"; return 1; }

    if (json_emit_int_or_null(std::optional<std::string>("12")) != "12") { std::cerr << "emit int\n"; return 1; }
    if (json_emit_int_or_null(std::optional<std::string>("1x")) != "null") { std::cerr << "emit bad int\n"; return 1; }
    if (json_emit_string_or_null(std::nullopt) != "null") { std::cerr << "emit null string\n"; return 1; }
    if (json_parse_int_strict(std::optional<std::string>("-5")) != std::optional<int64_t>(-5)) { std::cerr << "parse int strict\n"; return 1; }
    if (parse_int_strict_sv("3000000000").has_value()) { std::cerr << "int32 overflow accepted\n"; return 1; }

    std::cout << "minijson_unit ok\n";
    return 0;
}
