#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

#include "auth/RateLimiter.h"
#include "signaling/MessageRouter.h"
#include "signaling/SignalMessage.h"
#include "signaling/SignalSink.h"

namespace pairlink::signaling {

// Server side of one client connection.
//
//   Connecting -> Authenticated -> AwaitingPeer <-> Paired
//        \              \               \            /
//         +--------------+---------------+--> Closed
//
// Not thread-safe: the owner serializes open(), on_frame(), deliver() and
// close() (the networking layer runs them on the connection's strand).
class SignalingSession {
public:
    using Clock = std::chrono::steady_clock;

    enum class State { Connecting, Authenticated, AwaitingPeer, Paired, Closed };

    // What the transport should do after a call returns.
    enum class Disposition { Continue, Close, CloseViolation };

    struct Limits {
        std::size_t max_payload_bytes = 10 * 1024;
    };

    SignalingSession(std::string session_id,
                     std::string identity,
                     MessageRouter& router,
                     auth::RateLimiter& limiter,
                     Limits limits,
                     std::shared_ptr<SignalSink> outbound);
    ~SignalingSession();

    SignalingSession(const SignalingSession&) = delete;
    SignalingSession& operator=(const SignalingSession&) = delete;

    // Sink the registry pushes peer events and relayed messages into. It must
    // end up calling deliver() in the owner's serialized context.
    void set_inbox(std::shared_ptr<SignalSink> inbox) { inbox_ = std::move(inbox); }

    // Transport handshake finished. A room named in the connection path is
    // joined immediately.
    Disposition open(const std::string& path_room = {});

    Disposition on_frame(const std::string& text);

    // Registry-pushed message for this session's client.
    void deliver(const SignalMessage& msg);

    // Idempotent. Leaves the room and drops the outbound channel.
    void close();

    State state() const noexcept { return state_; }
    const std::string& id() const noexcept { return session_id_; }
    const std::string& identity() const noexcept { return identity_; }
    const std::string& room() const noexcept { return room_; }
    bool joined() const noexcept { return !room_.empty(); }
    Role role() const noexcept { return role_; }
    Clock::time_point joined_at() const noexcept { return joined_at_; }
    Clock::time_point last_activity() const noexcept { return last_activity_; }

    void touch() noexcept { last_activity_ = Clock::now(); }

private:
    Disposition handle_join(const std::string& room);
    Disposition handle_relay(const SignalMessage& msg);

    RouteContext context() const;
    void send(const SignalMessage& msg);
    void send_error(ErrorReason reason, std::string detail);

    std::string session_id_;
    std::string identity_;
    MessageRouter& router_;
    auth::RateLimiter& limiter_;
    Limits limits_;

    std::shared_ptr<SignalSink> outbound_;
    std::shared_ptr<SignalSink> inbox_;

    State state_ = State::Connecting;
    std::string room_;
    Role role_ = Role::Offerer;

    Clock::time_point joined_at_{};
    Clock::time_point last_activity_;
};

const char* to_string(SignalingSession::State s) noexcept;

} // namespace pairlink::signaling
