#include <iostream>
#include <string>
#include <optional>
#include <ctime>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include "auth/Base64.h"
#include "auth/Jwt.h"

// Signs an arbitrary payload the way another issuer would.
static std::string sign(const std::string& header, const std::string& payload, const std::string& secret) {
    std::string to_sign = auth::base64url_encode(header) + "." + auth::base64url_encode(payload);
    unsigned int len = 0;
    unsigned char md[EVP_MAX_MD_SIZE];
    HMAC(EVP_sha256(), secret.data(), int(secret.size()), reinterpret_cast<const unsigned char*>(to_sign.data()), to_sign.size(), md, &len);
    return to_sign + "." + auth::base64url_encode(std::string(reinterpret_cast<char*>(md), len));
}

int main() {
    if (auth::base64url_encode("") != "") { std::cerr << "empty encode\n"; return 1; }
    if (auth::base64url_encode("f") != "Zg" || auth::base64url_encode("foob") != "Zm9vYg") { std::cerr << "encode padding\n"; return 1; }
    if (auth::base64url_encode("\xfb\xff") != "-_8") { std::cerr << "url alphabet\n"; return 1; }
    if (auth::base64url_decode("Zm9vYg") != std::optional<std::string>("foob")) { std::cerr << "decode unpadded\n"; return 1; }
    if (auth::base64url_decode("Zm9vYg==") != std::optional<std::string>("foob")) { std::cerr << "decode padded\n"; return 1; }
    if (auth::base64url_decode("Zm9v+g").has_value()) { std::cerr << "decode accepted '+'\n"; return 1; }
    if (auth::base64url_decode("Zm9vY").has_value()) { std::cerr << "decode accepted impossible length\n"; return 1; }

    auth::Claims c;
    c.sub = "u1";
    c.username = "alice";
    c.email = "a@b.c";
    c.iat = 1700000000;
    c.exp = 4000000000;
    const std::string secret = "secret";
    std::string token = auth::create_jwt(c, secret);
    auto ok = auth::verify_jwt(token, secret);
    if (!ok.has_value()) { std::cerr << "verify_jwt(valid) failed\n"; return 1; }
    if (ok->sub != c.sub || ok->username != "alice" || ok->email != c.email) { std::cerr << "verify_jwt: claims mismatch\n"; return 1; }

    if (auth::verify_jwt(token, "wrongsecret").has_value()) { std::cerr << "verify_jwt(wrongsecret) unexpectedly succeeded\n"; return 1; }
    if (auth::verify_jwt(token, "").has_value()) { std::cerr << "verify_jwt(empty secret) unexpectedly succeeded\n"; return 1; }

    std::string corrupted = token;
    size_t sig_start = corrupted.rfind('.') + 1;
    corrupted[sig_start] = corrupted[sig_start] == 'A' ? 'B' : 'A';
    if (auth::verify_jwt(corrupted, secret).has_value()) { std::cerr << "verify_jwt(corrupted sig) unexpectedly succeeded\n"; return 1; }

    auth::Claims c_exp = c;
    c_exp.exp = std::time(nullptr) - 10;
    if (auth::verify_jwt(auth::create_jwt(c_exp, secret), secret).has_value()) { std::cerr << "verify_jwt(expired) unexpectedly succeeded\n"; return 1; }

    const std::string hs = "{\"alg\":\"HS256\",\"typ\":\"JWT\"}";
    auto numeric = auth::verify_jwt(sign(hs, "{\"user_id\":42,\"name\":\"bob\"}", secret), secret);
    if (!numeric.has_value() || numeric->sub != "42" || numeric->username != "bob") { std::cerr << "user_id/name fallback failed\n"; return 1; }
    if (auth::verify_jwt(sign(hs, "{\"username\":\"nobody\"}", secret), secret).has_value()) { std::cerr << "token without subject accepted\n"; return 1; }
    if (auth::verify_jwt(sign("{\"alg\":\"none\"}", "{\"sub\":\"1\"}", secret), secret).has_value()) { std::cerr << "alg none accepted\n"; return 1; }
    if (auth::verify_jwt(sign(hs, "{\"sub\":\"1\"", secret), secret).has_value()) { std::cerr << "malformed payload accepted\n"; return 1; }

    if (auth::verify_jwt("abc.def", secret).has_value()) { std::cerr << "verify_jwt(malformed 2-part) unexpectedly succeeded\n"; return 1; }
    if (auth::verify_jwt("abc", secret).has_value()) { std::cerr << "verify_jwt(malformed 1-part) unexpectedly succeeded\n"; return 1; }
    if (auth::verify_jwt("a.b.c.d", secret).has_value()) { std::cerr << "verify_jwt(4-part) unexpectedly succeeded\n"; return 1; }

    if (auth::bearer_token("Bearer abc") != std::optional<std::string>("abc")) { std::cerr << "bearer_token\n"; return 1; }
    if (auth::bearer_token("Basic abc").has_value() || auth::bearer_token("Bearer ").has_value()) { std::cerr << "bearer_token accepted junk\n"; return 1; }

    std::cout << "auth_unit ok\n";
    return 0;
}
