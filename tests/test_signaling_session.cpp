#include "signaling/SignalingSession.h"

#include "auth/RateLimiter.h"
#include "signaling/MessageRouter.h"
#include "signaling/RoomRegistry.h"
#include "test_support.h"

#include <gtest/gtest.h>

#include <string>

using namespace pairlink::signaling;
using pairlink::auth::RateLimiter;
using pairlink::testing::TestClient;

using State = SignalingSession::State;
using Disposition = SignalingSession::Disposition;

namespace {

std::string join_frame(const std::string& room) {
    return R"({"type":"join","payload":{"room":")" + room + R"("}})";
}

std::string offer_frame(const std::string& sdp) {
    return R"({"type":"offer","payload":{"sdp":")" + sdp + R"("}})";
}

std::string answer_frame(const std::string& sdp) {
    return R"({"type":"answer","payload":{"sdp":")" + sdp + R"("}})";
}

class SignalingSessionTest : public ::testing::Test {
protected:
    RoomRegistry registry;
    MessageRouter router{registry};
    RateLimiter limiter{{10, 1}, {1000, 1000}};

    TestClient client(const std::string& id, SignalingSession::Limits limits = {}) {
        return TestClient(id, "user-" + id, router, limiter, limits);
    }
};

} // namespace

TEST_F(SignalingSessionTest, StartsConnectingAndIgnoresFramesUntilOpen) {
    auto a = client("A");
    EXPECT_EQ(a.session->state(), State::Connecting);
    EXPECT_EQ(a.session->on_frame(join_frame("r1")), Disposition::Continue);
    EXPECT_EQ(registry.room_count(), 0u);
    EXPECT_EQ(a.wire->size(), 0u);

    a.session->open();
    EXPECT_EQ(a.session->state(), State::Authenticated);
}

TEST_F(SignalingSessionTest, PairOfferAnswerAndDisconnect) {
    auto a = client("A");
    auto b = client("B");
    a.session->open();
    b.session->open();

    a.session->on_frame(join_frame("r1"));
    EXPECT_EQ(a.session->state(), State::AwaitingPeer);
    EXPECT_EQ(a.wire->last().type, MessageType::Joined);
    EXPECT_EQ(a.session->role(), Role::Offerer);

    b.session->on_frame(join_frame("r1"));
    EXPECT_EQ(a.session->state(), State::Paired);
    EXPECT_EQ(b.session->state(), State::Paired);
    EXPECT_EQ(b.session->role(), Role::Answerer);

    ASSERT_EQ(a.wire->count(MessageType::PeerJoined), 1u);
    EXPECT_EQ(a.wire->last().peer, "B");
    ASSERT_EQ(b.wire->count(MessageType::PeerJoined), 1u);
    EXPECT_EQ(b.wire->last().peer, "A");

    const std::string offer = offer_frame("sdp1");
    a.session->on_frame(offer);
    EXPECT_EQ(b.wire->last().type, MessageType::Offer);
    EXPECT_EQ(encode(b.wire->last()), offer);

    const std::string answer = answer_frame("sdp2");
    b.session->on_frame(answer);
    EXPECT_EQ(a.wire->last().type, MessageType::Answer);
    EXPECT_EQ(encode(a.wire->last()), answer);

    a.session->close();
    EXPECT_EQ(a.session->state(), State::Closed);
    EXPECT_EQ(b.wire->last().type, MessageType::PeerLeft);
    EXPECT_EQ(b.wire->last().peer, "A");
    EXPECT_EQ(b.session->state(), State::AwaitingPeer);
    EXPECT_EQ(registry.session_ids("r1"), (std::vector<std::string>{"B"}));
}

TEST_F(SignalingSessionTest, NewcomerGetsJoinedBeforePeerJoined) {
    auto a = client("A");
    auto b = client("B");
    a.session->open();
    b.session->open();
    a.session->on_frame(join_frame("r1"));
    b.session->on_frame(join_frame("r1"));

    auto got = b.wire->received();
    ASSERT_EQ(got.size(), 2u);
    EXPECT_EQ(got[0].type, MessageType::Joined);
    EXPECT_EQ(got[1].type, MessageType::PeerJoined);
}

TEST_F(SignalingSessionTest, ThirdClientGetsRoomFullAndOthersHearNothing) {
    auto a = client("A");
    auto b = client("B");
    auto c = client("C");
    a.session->open();
    b.session->open();
    c.session->open();
    a.session->on_frame(join_frame("r1"));
    b.session->on_frame(join_frame("r1"));
    const auto a_before = a.wire->size();
    const auto b_before = b.wire->size();

    EXPECT_EQ(c.session->on_frame(join_frame("r1")), Disposition::Continue);
    EXPECT_EQ(c.session->state(), State::AwaitingPeer);
    EXPECT_FALSE(c.session->joined());
    EXPECT_EQ(c.wire->last().type, MessageType::Error);
    EXPECT_EQ(c.wire->last().reason, ErrorReason::RoomFull);

    EXPECT_EQ(a.wire->size(), a_before);
    EXPECT_EQ(b.wire->size(), b_before);
    EXPECT_EQ(registry.occupancy("r1"), 2u);
}

TEST_F(SignalingSessionTest, RoomFullClientCanRetryAfterCleanup) {
    auto a = client("A");
    auto b = client("B");
    auto c = client("C");
    a.session->open();
    b.session->open();
    c.session->open();
    a.session->on_frame(join_frame("r1"));
    b.session->on_frame(join_frame("r1"));
    c.session->on_frame(join_frame("r1"));

    a.session->close();
    c.session->on_frame(join_frame("r1"));
    EXPECT_EQ(c.session->state(), State::Paired);
    EXPECT_EQ(b.session->state(), State::Paired);
    EXPECT_EQ(c.session->role(), Role::Offerer);
}

TEST_F(SignalingSessionTest, RelayWithoutPeerIsNonFatalNoPeer) {
    auto a = client("A");
    a.session->open();
    EXPECT_EQ(a.session->on_frame(offer_frame("early")), Disposition::Continue);
    EXPECT_EQ(a.wire->last().reason, ErrorReason::NoPeer);

    a.session->on_frame(join_frame("r1"));
    EXPECT_EQ(a.session->on_frame(offer_frame("still-early")), Disposition::Continue);
    EXPECT_EQ(a.wire->last().reason, ErrorReason::NoPeer);
    EXPECT_EQ(a.session->state(), State::AwaitingPeer);
}

TEST_F(SignalingSessionTest, ProtocolErrorsKeepTheConnection) {
    auto a = client("A", SignalingSession::Limits{8});
    a.session->open();

    EXPECT_EQ(a.session->on_frame("{nope"), Disposition::Continue);
    EXPECT_EQ(a.wire->last().reason, ErrorReason::MalformedMessage);

    EXPECT_EQ(a.session->on_frame(R"({"type":"dance"})"), Disposition::Continue);
    EXPECT_EQ(a.wire->last().reason, ErrorReason::UnknownMessage);

    EXPECT_EQ(a.session->on_frame(R"({"type":"peer-left","payload":{}})"), Disposition::Continue);
    EXPECT_EQ(a.wire->last().reason, ErrorReason::UnknownMessage);

    EXPECT_EQ(a.session->on_frame(offer_frame("123456789")), Disposition::Continue);
    EXPECT_EQ(a.wire->last().reason, ErrorReason::PayloadTooLarge);

    EXPECT_EQ(a.session->on_frame(join_frame("../etc")), Disposition::Continue);
    EXPECT_EQ(a.wire->last().reason, ErrorReason::InvalidRoom);

    EXPECT_NE(a.session->state(), State::Closed);
}

TEST_F(SignalingSessionTest, SecondJoinIsAlreadyJoined) {
    auto a = client("A");
    a.session->open();
    a.session->on_frame(join_frame("r1"));
    a.session->on_frame(join_frame("r2"));
    EXPECT_EQ(a.wire->last().reason, ErrorReason::AlreadyJoined);
    EXPECT_EQ(a.session->room(), "r1");
    EXPECT_EQ(registry.occupancy("r2"), 0u);
}

TEST_F(SignalingSessionTest, PathRoomJoinsOnOpen) {
    auto a = client("A");
    a.session->open("lobby-7");
    EXPECT_EQ(a.session->state(), State::AwaitingPeer);
    EXPECT_EQ(a.session->room(), "lobby-7");
}

TEST_F(SignalingSessionTest, LeaveClosesAndNotifiesPeer) {
    auto a = client("A");
    auto b = client("B");
    a.session->open("r1");
    b.session->open("r1");

    EXPECT_EQ(a.session->on_frame(R"({"type":"leave"})"), Disposition::Close);
    EXPECT_EQ(a.session->state(), State::Closed);
    EXPECT_EQ(b.wire->last().type, MessageType::PeerLeft);
    EXPECT_EQ(registry.occupancy("r1"), 1u);
}

TEST_F(SignalingSessionTest, ClosedSessionSendsNothing) {
    auto a = client("A");
    auto b = client("B");
    a.session->open("r1");
    b.session->open("r1");
    b.session->close();
    const auto before = b.wire->size();

    // A's offer races with B's close: A is told NoPeer, B's wire stays quiet.
    a.session->on_frame(offer_frame("late"));
    b.session->deliver(SignalMessage::offer("direct"));
    EXPECT_EQ(b.wire->size(), before);
    EXPECT_EQ(b.session->on_frame(offer_frame("x")), Disposition::Close);
}

TEST_F(SignalingSessionTest, CloseIsIdempotentAndLeavesOnce) {
    auto a = client("A");
    auto b = client("B");
    a.session->open("r1");
    b.session->open("r1");

    a.session->close();
    a.session->close();
    EXPECT_EQ(b.wire->count(MessageType::PeerLeft), 1u);
}

TEST_F(SignalingSessionTest, DestructionLeavesTheRoom) {
    auto b = client("B");
    b.session->open("r1");
    {
        auto a = client("A");
        a.session->open("r1");
        EXPECT_EQ(registry.occupancy("r1"), 2u);
    }
    EXPECT_EQ(registry.occupancy("r1"), 1u);
    EXPECT_EQ(b.session->state(), State::AwaitingPeer);
}

TEST_F(SignalingSessionTest, PingIsAnsweredWithPong) {
    auto a = client("A");
    a.session->open();
    EXPECT_EQ(a.session->on_frame(R"({"type":"ping"})"), Disposition::Continue);
    EXPECT_EQ(a.wire->last().type, MessageType::Pong);
}

TEST(SignalingSessionRateLimit, MessageFloodClosesWithPolicyViolation) {
    RoomRegistry registry;
    MessageRouter router(registry);
    RateLimiter limiter({10, 1}, {3, 0});

    TestClient a("A", "user-A", router, limiter);
    TestClient b("B", "user-B", router, limiter);
    a.session->open("r1");
    b.session->open("r1");

    EXPECT_EQ(a.session->on_frame(offer_frame("1")), Disposition::Continue);
    EXPECT_EQ(a.session->on_frame(offer_frame("2")), Disposition::Continue);
    EXPECT_EQ(a.session->on_frame(offer_frame("3")), Disposition::Continue);
    EXPECT_EQ(a.session->on_frame(offer_frame("4")), Disposition::CloseViolation);

    EXPECT_EQ(a.wire->last().reason, ErrorReason::RateLimited);
    EXPECT_EQ(a.session->state(), State::Closed);
    EXPECT_EQ(b.wire->last().type, MessageType::PeerLeft);

    // B's own budget is untouched by A's flood.
    EXPECT_EQ(b.session->on_frame(R"({"type":"ping"})"), Disposition::Continue);
}
