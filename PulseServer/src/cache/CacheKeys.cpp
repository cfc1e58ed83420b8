#include "CacheKeys.h"
#include "../net/HttpUtil.h"

namespace cache {

std::string api_cache_key(std::string_view path, const std::map<std::string, std::string>& query,
                          const std::optional<std::string>& user) {
    std::string key = api_cache_prefix(path);
    bool first = true;
    // std::map iterates in name order
    for (const auto& kv : query) {
        key += first ? '?' : '&';
        first = false;
        key += url_encode(kv.first);
        key += '=';
        key += url_encode(kv.second);
    }
    if (user.has_value()) {
        key += "#u=";
        key += url_encode(*user);
    }
    return key;
}

std::string api_cache_prefix(std::string_view path_prefix) {
    return "api:" + std::string(path_prefix);
}

}
