#pragma once

#include <optional>
#include <string>

namespace auth {

// RFC 4648 section 5 alphabet, no padding on output.
std::string base64url_encode(const std::string& in);
// Padding is optional on input. nullopt for characters outside the alphabet.
std::optional<std::string> base64url_decode(const std::string& in);

}
