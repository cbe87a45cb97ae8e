#pragma once

#include <string>
#include <string_view>

#include "auth/RateLimiter.h"
#include "auth/TokenVerifier.h"

namespace pairlink::signaling {

enum class AdmissionStatus { Admitted, RateLimited, Unauthenticated };

struct AdmissionDecision {
    AdmissionStatus status = AdmissionStatus::Unauthenticated;
    auth::AuthError auth_error = auth::AuthError::None;
    std::string identity;
};

// Runs before a session exists: source address bucket first (so a credential
// stuffer is turned away without a signature check), then the token, then the
// identity's own connection bucket. Touches nothing but the limiter.
class ConnectionGate {
public:
    ConnectionGate(const auth::TokenVerifier& verifier, auth::RateLimiter& limiter)
        : verifier_(verifier), limiter_(limiter) {}

    AdmissionDecision admit(const std::string& address, std::string_view token);

private:
    const auth::TokenVerifier& verifier_;
    auth::RateLimiter& limiter_;
};

} // namespace pairlink::signaling
