#include "signaling/Admission.h"

#include "auth/RateLimiter.h"
#include "auth/TokenVerifier.h"
#include "signaling/RoomRegistry.h"

#include <gtest/gtest.h>

#include <chrono>
#include <string>

using namespace pairlink::signaling;
using pairlink::auth::AuthError;
using pairlink::auth::RateLimiter;
using pairlink::auth::TokenVerifier;
using namespace std::chrono_literals;

TEST(ConnectionGate, AdmitsValidToken) {
    TokenVerifier verifier("k");
    RateLimiter limiter({10, 1}, {10, 1});
    ConnectionGate gate(verifier, limiter);

    auto d = gate.admit("10.0.0.1", verifier.issue("alice", 1h));
    EXPECT_EQ(d.status, AdmissionStatus::Admitted);
    EXPECT_EQ(d.identity, "alice");
}

TEST(ConnectionGate, ReportsTheAuthError) {
    TokenVerifier verifier("k");
    RateLimiter limiter({10, 1}, {10, 1});
    ConnectionGate gate(verifier, limiter);

    auto missing = gate.admit("10.0.0.1", "");
    EXPECT_EQ(missing.status, AdmissionStatus::Unauthenticated);
    EXPECT_EQ(missing.auth_error, AuthError::Missing);

    auto expired = gate.admit("10.0.0.1", verifier.issue("alice", TokenVerifier::Clock::now() - 1min));
    EXPECT_EQ(expired.auth_error, AuthError::Expired);

    auto forged = gate.admit("10.0.0.1", TokenVerifier("other").issue("alice", 1h));
    EXPECT_EQ(forged.auth_error, AuthError::Invalid);
    EXPECT_TRUE(forged.identity.empty());
}

// 50 attempts from one address, capacity 10: exactly 10 get through and the
// rest are refused before their token is looked at.
TEST(ConnectionGate, AddressFloodIsRefusedBeforeAuthentication) {
    TokenVerifier verifier("k");
    RateLimiter limiter({10, 0}, {10, 0});
    ConnectionGate gate(verifier, limiter);
    const std::string good = verifier.issue("alice", 1h);

    int admitted = 0;
    int limited = 0;
    for (int i = 0; i < 50; ++i) {
        auto d = gate.admit("203.0.113.9", good);
        if (d.status == AdmissionStatus::Admitted) ++admitted;
        if (d.status == AdmissionStatus::RateLimited) {
            ++limited;
            EXPECT_EQ(d.auth_error, AuthError::None);
            EXPECT_TRUE(d.identity.empty());
        }
    }
    EXPECT_EQ(admitted, 10);
    EXPECT_EQ(limited, 40);

    // Once the address is throttled even a garbage token is not inspected.
    EXPECT_EQ(gate.admit("203.0.113.9", "garbage").status, AdmissionStatus::RateLimited);
}

TEST(ConnectionGate, IdentityBucketSpansAddresses) {
    TokenVerifier verifier("k");
    RateLimiter limiter({2, 0}, {10, 0});
    ConnectionGate gate(verifier, limiter);
    const std::string token = verifier.issue("alice", 1h);

    EXPECT_EQ(gate.admit("10.0.0.1", token).status, AdmissionStatus::Admitted);
    EXPECT_EQ(gate.admit("10.0.0.2", token).status, AdmissionStatus::Admitted);
    EXPECT_EQ(gate.admit("10.0.0.3", token).status, AdmissionStatus::RateLimited);
}

TEST(ConnectionGate, AuthFailureHasNoRegistrySideEffects) {
    TokenVerifier verifier("k");
    RateLimiter limiter({10, 1}, {10, 1});
    ConnectionGate gate(verifier, limiter);
    RoomRegistry registry;

    std::string tampered = verifier.issue("alice", 1h);
    tampered[tampered.find('.') + 3] ^= 0x01;

    EXPECT_EQ(gate.admit("10.0.0.1", tampered).status, AdmissionStatus::Unauthenticated);
    EXPECT_EQ(gate.admit("10.0.0.1", verifier.issue("bob", TokenVerifier::Clock::now() - 1s)).status,
              AdmissionStatus::Unauthenticated);
    EXPECT_EQ(registry.room_count(), 0u);
}
