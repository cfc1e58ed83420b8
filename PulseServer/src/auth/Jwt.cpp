#include "Jwt.h"
#include "Base64.h"
#include "../net/MiniJson.h"
#include <openssl/hmac.h>
#include <openssl/evp.h>
#include <openssl/crypto.h>
#include <ctime>
#include <sstream>
#include <stdexcept>

namespace {

std::string hmac_sha256(const std::string& key, const std::string& data) {
    unsigned int len = EVP_MAX_MD_SIZE;
    unsigned char md[EVP_MAX_MD_SIZE];
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), md, &len);
    return std::string(reinterpret_cast<char*>(md), len);
}

}

namespace auth {

std::string create_jwt(const Claims& c, const std::string& secret) {
    std::string header_s = "{\"alg\":\"HS256\",\"typ\":\"JWT\"}";
    std::ostringstream oss;
    oss << "{";
    oss << "\"sub\":" << json_quote(c.sub);
    if (!c.username.empty()) oss << ",\"username\":" << json_quote(c.username);
    if (!c.email.empty()) oss << ",\"email\":" << json_quote(c.email);
    oss << ",\"iat\":" << c.iat;
    oss << ",\"exp\":" << c.exp;
    oss << "}";
    std::string to_sign = base64url_encode(header_s) + "." + base64url_encode(oss.str());
    return to_sign + "." + base64url_encode(hmac_sha256(secret, to_sign));
}

std::optional<Claims> verify_jwt(const std::string& token, const std::string& secret) {
    const size_t MAX_TOKEN = 8 * 1024;
    if (token.empty() || token.size() > MAX_TOKEN || secret.empty()) return std::nullopt;
    size_t p1 = token.find('.');
    if (p1 == std::string::npos) return std::nullopt;
    size_t p2 = token.find('.', p1 + 1);
    if (p2 == std::string::npos || token.find('.', p2 + 1) != std::string::npos) return std::nullopt;
    std::string h_enc = token.substr(0, p1);
    std::string p_enc = token.substr(p1 + 1, p2 - p1 - 1);
    auto sig = base64url_decode(token.substr(p2 + 1));
    if (!sig.has_value()) return std::nullopt;
    std::string expected_sig = hmac_sha256(secret, h_enc + "." + p_enc);
    // constant time compare
    if (sig->size() != expected_sig.size()) return std::nullopt;
    if (CRYPTO_memcmp(sig->data(), expected_sig.data(), sig->size()) != 0) return std::nullopt;

    auto header_s = base64url_decode(h_enc);
    auto payload_s = base64url_decode(p_enc);
    if (!header_s.has_value() || !payload_s.has_value()) return std::nullopt;
    Claims cl;
    try {
        if (json_extract_string(*header_s, "alg") != "HS256") return std::nullopt;
        auto typ = json_extract_string(*header_s, "typ");
        if (!typ.empty() && typ != "JWT") return std::nullopt;
        auto sub = json_extract_id_opt(*payload_s, "sub");
        if (!sub.has_value()) sub = json_extract_id_opt(*payload_s, "user_id");
        if (!sub.has_value()) return std::nullopt;
        cl.sub = *sub;
        cl.username = json_extract_string(*payload_s, "username");
        if (cl.username.empty()) cl.username = json_extract_string(*payload_s, "name");
        cl.email = json_extract_string(*payload_s, "email");
        cl.iat = json_extract_int_opt(*payload_s, "iat").value_or(0);
        cl.exp = json_extract_int_opt(*payload_s, "exp").value_or(0);
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
    auto now = std::time(nullptr);
    if (cl.exp != 0 && now >= cl.exp) return std::nullopt;
    if (cl.iat != 0 && cl.iat > now + 60) return std::nullopt;
    return cl;
}

std::optional<std::string> bearer_token(const std::string& header_value) {
    const std::string prefix = "Bearer ";
    if (header_value.size() <= prefix.size()) return std::nullopt;
    if (header_value.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
    return header_value.substr(prefix.size());
}

}
