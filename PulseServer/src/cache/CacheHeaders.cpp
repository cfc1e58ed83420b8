#include "CacheHeaders.h"
#include "../net/MiniJson.h"
#include <openssl/evp.h>
#include <ctime>

namespace cache {

const CacheHeaderSet& headers_for(CacheStrategy s) {
    static const CacheHeaderSet immutable{"public, max-age=31536000, immutable", "public, max-age=31536000", "Accept-Encoding", false};
    static const CacheHeaderSet static_assets{"public, max-age=86400, stale-while-revalidate=604800", "public, max-age=604800", "Accept-Encoding", false};
    static const CacheHeaderSet public_list{"public, max-age=60, stale-while-revalidate=300", "public, max-age=120", "Accept-Encoding", false};
    static const CacheHeaderSet posts{"public, max-age=30, stale-while-revalidate=60", "public, max-age=60", "Accept-Encoding", false};
    static const CacheHeaderSet jobs{"public, max-age=120, stale-while-revalidate=600", "public, max-age=300", "Accept-Encoding", false};
    static const CacheHeaderSet profile{"public, max-age=300, stale-while-revalidate=3600", "public, max-age=600", "Accept-Encoding", false};
    static const CacheHeaderSet private_dynamic{"private, max-age=0, must-revalidate", "no-store", "Authorization, Accept-Encoding", true};
    static const CacheHeaderSet no_cache{"no-store, no-cache, must-revalidate", "no-store", "Authorization", true};
    switch (s) {
        case CacheStrategy::Immutable: return immutable;
        case CacheStrategy::StaticAssets: return static_assets;
        case CacheStrategy::PublicList: return public_list;
        case CacheStrategy::Posts: return posts;
        case CacheStrategy::Jobs: return jobs;
        case CacheStrategy::PublicProfile: return profile;
        case CacheStrategy::PrivateDynamic: return private_dynamic;
        case CacheStrategy::NoCache: return no_cache;
    }
    return no_cache;
}

const char* strategy_name(CacheStrategy s) {
    switch (s) {
        case CacheStrategy::Immutable: return "immutable";
        case CacheStrategy::StaticAssets: return "static_assets";
        case CacheStrategy::PublicList: return "public_list";
        case CacheStrategy::Posts: return "posts";
        case CacheStrategy::Jobs: return "jobs";
        case CacheStrategy::PublicProfile: return "public_profile";
        case CacheStrategy::PrivateDynamic: return "private_dynamic";
        case CacheStrategy::NoCache: return "no_cache";
    }
    return "no_cache";
}

std::optional<std::string> generate_etag(std::string_view body) {
    auto canonical = json_canonicalize(body);
    if (!canonical.has_value()) return std::nullopt;
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(canonical->data(), canonical->size(), md, &len, EVP_md5(), nullptr) != 1) return std::nullopt;
    static const char* hex = "0123456789abcdef";
    std::string out = "\"";
    for (unsigned int i = 0; i < len; ++i) {
        out.push_back(hex[md[i] >> 4]);
        out.push_back(hex[md[i] & 0xF]);
    }
    out.push_back('"');
    return out;
}

static std::string_view strip_weak(std::string_view tag) {
    while (!tag.empty() && (tag.front() == ' ' || tag.front() == '\t')) tag.remove_prefix(1);
    while (!tag.empty() && (tag.back() == ' ' || tag.back() == '\t')) tag.remove_suffix(1);
    if (tag.size() >= 2 && (tag[0] == 'W' || tag[0] == 'w') && tag[1] == '/') tag.remove_prefix(2);
    return tag;
}

bool check_etag_match(std::string_view if_none_match, std::string_view etag) {
    if (etag.empty()) return false;
    auto want = strip_weak(etag);
    while (!if_none_match.empty()) {
        auto comma = if_none_match.find(',');
        auto candidate = strip_weak(if_none_match.substr(0, comma));
        if (candidate == "*" || candidate == want) return true;
        if (comma == std::string_view::npos) break;
        if_none_match.remove_prefix(comma + 1);
    }
    return false;
}

std::string http_date(int64_t unix_seconds) {
    std::time_t t = static_cast<std::time_t>(unix_seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[64];
    std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S GMT", &tm);
    return std::string(buf);
}

}
