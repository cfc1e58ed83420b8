#pragma once

#include <cstdint>
#include <string>
#include <optional>

namespace auth {

struct Claims {
    std::string sub;       // user id
    std::string username;
    std::string email;
    int64_t iat = 0;
    int64_t exp = 0;
};

std::string create_jwt(const Claims& c, const std::string& secret);

// HS256 only. Accepts the user id under "sub" or "user_id", as string or integer.
std::optional<Claims> verify_jwt(const std::string& token, const std::string& secret);

// Token from an "Authorization: Bearer <token>" header value.
std::optional<std::string> bearer_token(const std::string& header_value);

}
