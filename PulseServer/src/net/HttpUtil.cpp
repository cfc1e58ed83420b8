#include "HttpUtil.h"

std::string url_decode(std::string_view s) {
    std::string out; out.reserve(s.size());
    auto hex = [](char h)->int {
        if (h >= '0' && h <= '9') return h - '0';
        if (h >= 'a' && h <= 'f') return 10 + (h - 'a');
        if (h >= 'A' && h <= 'F') return 10 + (h - 'A');
        return -1;
    };
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '%' && i + 2 < s.size()) {
            int hi = hex(s[i+1]); int lo = hex(s[i+2]);
            if (hi >= 0 && lo >= 0) { out.push_back(char((hi << 4) | lo)); i += 2; continue; }
            out.push_back(c);
        } else if (c == '+') out.push_back(' ');
        else out.push_back(c);
    }
    return out;
}

std::string url_encode(std::string_view s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out; out.reserve(s.size());
    for (unsigned char c : s) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back((char)c);
        } else {
            out.push_back('%'); out.push_back(hex[c >> 4]); out.push_back(hex[c & 0xF]);
        }
    }
    return out;
}

std::string target_path(std::string_view target) {
    auto q = target.find('?');
    return std::string(q == std::string_view::npos ? target : target.substr(0, q));
}

QueryParams parse_query(std::string_view target) {
    QueryParams out;
    auto q = target.find('?');
    if (q == std::string_view::npos) return out;
    std::string_view qs = target.substr(q + 1);
    while (!qs.empty()) {
        auto amp = qs.find('&');
        std::string_view pair = qs.substr(0, amp);
        if (!pair.empty()) {
            auto eq = pair.find('=');
            std::string k = url_decode(pair.substr(0, eq));
            std::string v = eq == std::string_view::npos ? std::string() : url_decode(pair.substr(eq + 1));
            if (!k.empty()) out[k] = v;
        }
        if (amp == std::string_view::npos) break;
        qs.remove_prefix(amp + 1);
    }
    return out;
}

Response json_response(const Request& req, boost::beast::http::status st, std::string body) {
    Response res{st, req.version()};
    res.set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
    res.keep_alive(req.keep_alive());
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

std::optional<std::string> header_value(const Request& req, boost::beast::http::field f) {
    auto it = req.find(f);
    if (it == req.end()) return std::nullopt;
    return std::string(it->value());
}

std::optional<std::string> header_value(const Request& req, std::string_view name) {
    auto it = req.find(boost::beast::string_view(name.data(), name.size()));
    if (it == req.end()) return std::nullopt;
    return std::string(it->value());
}
