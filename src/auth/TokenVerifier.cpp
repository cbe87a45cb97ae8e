#include "auth/TokenVerifier.h"

#include <boost/json.hpp>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <utility>

namespace pairlink::auth {

namespace json = boost::json;

const char* to_string(AuthError e) noexcept {
    switch (e) {
        case AuthError::None:    return "none";
        case AuthError::Missing: return "missing token";
        case AuthError::Invalid: return "invalid token";
        case AuthError::Expired: return "expired token";
    }
    return "unknown";
}

std::string base64url_encode(std::string_view data) {
    if (data.empty()) return {};

    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                            reinterpret_cast<const unsigned char*>(data.data()),
                            static_cast<int>(data.size()));
    out.resize(static_cast<std::size_t>(n));

    while (!out.empty() && out.back() == '=') out.pop_back();
    for (char& c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return out;
}

namespace {

// Value of a standard-alphabet base64 character (after the url-safe mapping).
unsigned sextet(char c) {
    if (c >= 'A' && c <= 'Z') return static_cast<unsigned>(c - 'A');
    if (c >= 'a' && c <= 'z') return static_cast<unsigned>(c - 'a' + 26);
    if (c >= '0' && c <= '9') return static_cast<unsigned>(c - '0' + 52);
    return c == '+' ? 62u : 63u;
}

// NumericDate as whole seconds. Fractions and values outside int64 are rejected.
bool exp_seconds(const json::value& v, std::int64_t& out) {
    if (auto* i = v.if_int64()) {
        out = *i;
        return true;
    }
    if (auto* u = v.if_uint64()) {
        if (*u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) return false;
        out = static_cast<std::int64_t>(*u);
        return true;
    }
    if (auto* d = v.if_double()) {
        // 2^63 is exactly representable; anything at or past it does not fit.
        constexpr double kLimit = 9223372036854775808.0;
        if (!std::isfinite(*d) || std::trunc(*d) != *d || *d >= kLimit || *d < -kLimit) return false;
        out = static_cast<std::int64_t>(*d);
        return true;
    }
    return false;
}

} // namespace

bool base64url_decode(std::string_view in, std::string& out) {
    out.clear();
    if (in.empty()) return true;
    if (in.size() % 4 == 1) return false;

    std::string b64;
    b64.reserve(in.size() + 3);
    for (char c : in) {
        if (c == '-') b64.push_back('+');
        else if (c == '_') b64.push_back('/');
        else if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) b64.push_back(c);
        else return false;
    }
    std::size_t pad = (4 - b64.size() % 4) % 4;

    // The final character of a short group carries unused low bits; anything
    // but zero there is a second spelling of the same bytes.
    if (pad != 0) {
        const unsigned mask = pad == 2 ? 0x0Fu : 0x03u;
        if (sextet(b64.back()) & mask) return false;
    }
    b64.append(pad, '=');

    out.resize(3 * (b64.size() / 4));
    int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                            reinterpret_cast<const unsigned char*>(b64.data()),
                            static_cast<int>(b64.size()));
    if (n < 0) return false;

    // EVP_DecodeBlock counts the padding bytes as output.
    out.resize(static_cast<std::size_t>(n) - pad);
    return true;
}

TokenVerifier::TokenVerifier(std::string secret, std::chrono::seconds leeway)
    : secret_(std::move(secret)),
      leeway_(leeway) {}

std::string TokenVerifier::sign(std::string_view signing_input) const {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    HMAC(EVP_sha256(),
         secret_.data(), static_cast<int>(secret_.size()),
         reinterpret_cast<const unsigned char*>(signing_input.data()), signing_input.size(),
         digest, &len);
    return std::string(reinterpret_cast<const char*>(digest), len);
}

VerifyResult TokenVerifier::verify(std::string_view token) const {
    return verify(token, Clock::now());
}

VerifyResult TokenVerifier::verify(std::string_view token, Clock::time_point now) const {
    VerifyResult r;
    if (token.empty()) {
        r.error = AuthError::Missing;
        return r;
    }

    const auto dot1 = token.find('.');
    if (dot1 == std::string_view::npos) return r;
    const auto dot2 = token.find('.', dot1 + 1);
    if (dot2 == std::string_view::npos || token.find('.', dot2 + 1) != std::string_view::npos) return r;

    const std::string_view header_b64 = token.substr(0, dot1);
    const std::string_view claims_b64 = token.substr(dot1 + 1, dot2 - dot1 - 1);
    const std::string_view sig_b64 = token.substr(dot2 + 1);

    std::string header_raw, claims_raw, sig;
    if (!base64url_decode(header_b64, header_raw) ||
        !base64url_decode(claims_b64, claims_raw) ||
        !base64url_decode(sig_b64, sig)) {
        return r;
    }

    // Signature first: nothing in an unauthenticated body is trusted.
    const std::string expected = sign(token.substr(0, dot2));
    if (sig.size() != expected.size() ||
        CRYPTO_memcmp(sig.data(), expected.data(), expected.size()) != 0) {
        return r;
    }

    json::error_code ec;
    json::value header = json::parse(header_raw, ec);
    if (ec || !header.is_object()) return r;
    auto* alg = header.as_object().if_contains("alg");
    if (!alg || !alg->is_string() || alg->as_string() != "HS256") return r;

    json::error_code claims_ec;
    json::value claims = json::parse(claims_raw, claims_ec);
    if (claims_ec || !claims.is_object()) return r;
    const auto& obj = claims.as_object();

    auto* sub = obj.if_contains("sub");
    if (!sub || !sub->is_string() || sub->as_string().empty()) return r;

    auto* exp = obj.if_contains("exp");
    std::int64_t exp_s = 0;
    if (!exp || !exp_seconds(*exp, exp_s)) return r;

    const std::int64_t now_s =
        std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
    if (exp_s <= now_s - leeway_.count()) {
        r.error = AuthError::Expired;
        return r;
    }

    r.error = AuthError::None;
    r.identity = std::string(sub->as_string());
    return r;
}

std::string TokenVerifier::issue(const std::string& identity, std::chrono::seconds ttl) const {
    return issue(identity, Clock::now() + ttl);
}

std::string TokenVerifier::issue(const std::string& identity, Clock::time_point expires_at) const {
    const auto exp_s = std::chrono::duration_cast<std::chrono::seconds>(expires_at.time_since_epoch()).count();

    const std::string header = json::serialize(json::object{{"alg", "HS256"}, {"typ", "JWT"}});
    const std::string claims = json::serialize(json::object{{"sub", identity}, {"exp", exp_s}});

    std::string input = base64url_encode(header) + "." + base64url_encode(claims);
    std::string mac = base64url_encode(sign(input));
    return input + "." + mac;
}

} // namespace pairlink::auth
