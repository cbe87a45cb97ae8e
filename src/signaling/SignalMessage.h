#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace pairlink::signaling {

enum class MessageType {
    Join,
    Offer,
    Answer,
    IceCandidate,
    Leave,
    Ping,
    // server -> client only
    Joined,
    PeerJoined,
    PeerLeft,
    Pong,
    Error,
};

enum class ErrorReason {
    None,
    MalformedMessage,
    UnknownMessage,
    PayloadTooLarge,
    InvalidRoom,
    RoomFull,
    AlreadyJoined,
    NoPeer,
    RateLimited,
};

const char* to_string(MessageType t) noexcept;
const char* to_string(ErrorReason r) noexcept;

enum class Role { Offerer, Answerer };
const char* to_string(Role r) noexcept;

// One frame of the signaling protocol. Only the fields relevant to `type`
// are meaningful. Relay-class messages (offer/answer/ice-candidate) keep the
// received frame in `raw` so the peer gets exactly what was sent.
struct SignalMessage {
    MessageType type = MessageType::Error;

    std::string room;       // join, joined
    std::string body;       // sdp or candidate
    std::string peer;       // peer-joined / peer-left: peer session id
    std::string session;    // joined: own session id
    Role role = Role::Offerer;
    std::uint64_t seq = 0;  // lifecycle events
    ErrorReason reason = ErrorReason::None;
    std::string detail;     // error text

    std::string raw;

    bool is_relay() const noexcept {
        return type == MessageType::Offer || type == MessageType::Answer || type == MessageType::IceCandidate;
    }

    static SignalMessage join(std::string room);
    static SignalMessage offer(std::string sdp);
    static SignalMessage answer(std::string sdp);
    static SignalMessage ice_candidate(std::string candidate);
    static SignalMessage leave();
    static SignalMessage joined(std::string room, std::string session, Role role);
    static SignalMessage peer_joined(std::string peer, Role role, std::uint64_t seq);
    static SignalMessage peer_left(std::string peer, Role role, std::uint64_t seq);
    static SignalMessage pong();
    static SignalMessage error(ErrorReason reason, std::string detail = {});
};

struct DecodeResult {
    ErrorReason error = ErrorReason::None;
    SignalMessage message;

    bool ok() const noexcept { return error == ErrorReason::None; }
};

// Client -> server direction. Server-only types decode as UnknownMessage.
DecodeResult decode(const std::string& text, std::size_t max_payload_bytes);

// Relay-class messages with a non-empty `raw` are emitted unchanged.
std::string encode(const SignalMessage& msg);

} // namespace pairlink::signaling
