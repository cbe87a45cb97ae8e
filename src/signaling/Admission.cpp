#include "signaling/Admission.h"

#include "logging/Log.h"

namespace pairlink::signaling {

using auth::RateLimiter;

AdmissionDecision ConnectionGate::admit(const std::string& address, std::string_view token) {
    AdmissionDecision d;

    if (!limiter_.admit("addr:" + address, RateLimiter::Kind::Connection)) {
        d.status = AdmissionStatus::RateLimited;
        log::warn("Gate", "connection rate exceeded for " + address);
        return d;
    }

    auto verified = verifier_.verify(token);
    if (!verified.ok()) {
        d.status = AdmissionStatus::Unauthenticated;
        d.auth_error = verified.error;
        log::info("Gate", std::string("refused ") + address + ": " + auth::to_string(verified.error));
        return d;
    }

    if (!limiter_.admit("id:" + verified.identity, RateLimiter::Kind::Connection)) {
        d.status = AdmissionStatus::RateLimited;
        log::warn("Gate", "connection rate exceeded for identity " + verified.identity);
        return d;
    }

    d.status = AdmissionStatus::Admitted;
    d.identity = std::move(verified.identity);
    return d;
}

} // namespace pairlink::signaling
