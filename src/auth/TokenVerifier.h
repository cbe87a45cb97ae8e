#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace pairlink::auth {

enum class AuthError { None, Missing, Invalid, Expired };

const char* to_string(AuthError e) noexcept;

struct VerifyResult {
    AuthError error = AuthError::Invalid;
    std::string identity;  // "sub" claim, set only when error == None

    bool ok() const noexcept { return error == AuthError::None; }
};

// HS256 compact JWS tokens: base64url(header).base64url(claims).base64url(mac).
// Stateless apart from the shared secret; safe to call from any thread.
class TokenVerifier {
public:
    using Clock = std::chrono::system_clock;

    explicit TokenVerifier(std::string secret, std::chrono::seconds leeway = std::chrono::seconds{0});

    VerifyResult verify(std::string_view token) const;
    VerifyResult verify(std::string_view token, Clock::time_point now) const;

    // Issuing half of the login contract (tests, --issue-token).
    std::string issue(const std::string& identity, std::chrono::seconds ttl) const;
    std::string issue(const std::string& identity, Clock::time_point expires_at) const;

private:
    std::string sign(std::string_view signing_input) const;

    std::string secret_;
    std::chrono::seconds leeway_;
};

// Exposed for tests.
std::string base64url_encode(std::string_view data);
bool base64url_decode(std::string_view in, std::string& out);

} // namespace pairlink::auth
