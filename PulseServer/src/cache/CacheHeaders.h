#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cache {

enum class CacheStrategy {
    Immutable,
    StaticAssets,
    PublicList,
    Posts,
    Jobs,
    PublicProfile,
    PrivateDynamic,
    NoCache
};

struct CacheHeaderSet {
    const char* cache_control;
    const char* cdn_cache_control;
    const char* vary;
    bool user_scoped;   // cache key and Vary depend on the caller
};

const CacheHeaderSet& headers_for(CacheStrategy s);
const char* strategy_name(CacheStrategy s);

// Quoted MD5 of the canonical JSON form; nullopt when body is not JSON.
std::optional<std::string> generate_etag(std::string_view body);

// If-None-Match semantics: "*", comma separated lists, weak validators.
bool check_etag_match(std::string_view if_none_match, std::string_view etag);

// RFC 7231 IMF-fixdate.
std::string http_date(int64_t unix_seconds);

}
