#pragma once
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace cache {

// api:<path>?<k=v&... sorted by name>[#u=<user>]
// Every key of a path starts with "api:<path>", which prefix invalidation relies on.
std::string api_cache_key(std::string_view path, const std::map<std::string, std::string>& query,
                          const std::optional<std::string>& user = std::nullopt);

std::string api_cache_prefix(std::string_view path_prefix);

}
