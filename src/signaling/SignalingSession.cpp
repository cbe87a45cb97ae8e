#include "signaling/SignalingSession.h"

#include "logging/Log.h"
#include "signaling/Room.h"

#include <utility>

namespace pairlink::signaling {

const char* to_string(SignalingSession::State s) noexcept {
    switch (s) {
        case SignalingSession::State::Connecting:    return "Connecting";
        case SignalingSession::State::Authenticated: return "Authenticated";
        case SignalingSession::State::AwaitingPeer:  return "AwaitingPeer";
        case SignalingSession::State::Paired:        return "Paired";
        case SignalingSession::State::Closed:        return "Closed";
    }
    return "?";
}

SignalingSession::SignalingSession(std::string session_id,
                                   std::string identity,
                                   MessageRouter& router,
                                   auth::RateLimiter& limiter,
                                   Limits limits,
                                   std::shared_ptr<SignalSink> outbound)
    : session_id_(std::move(session_id)),
      identity_(std::move(identity)),
      router_(router),
      limiter_(limiter),
      limits_(limits),
      outbound_(std::move(outbound)),
      last_activity_(Clock::now()) {}

SignalingSession::~SignalingSession() {
    close();
}

RouteContext SignalingSession::context() const {
    return RouteContext{session_id_, identity_, room_, inbox_};
}

void SignalingSession::send(const SignalMessage& msg) {
    if (outbound_) outbound_->deliver(msg);
}

void SignalingSession::send_error(ErrorReason reason, std::string detail) {
    send(SignalMessage::error(reason, std::move(detail)));
}

SignalingSession::Disposition SignalingSession::open(const std::string& path_room) {
    if (state_ != State::Connecting) return Disposition::Continue;

    state_ = State::Authenticated;
    touch();
    log::info("Session", session_id_ + " authenticated as " + identity_);

    if (!path_room.empty()) return handle_join(path_room);
    return Disposition::Continue;
}

SignalingSession::Disposition SignalingSession::on_frame(const std::string& text) {
    if (state_ == State::Closed) return Disposition::Close;
    if (state_ == State::Connecting) return Disposition::Continue;

    touch();

    if (!limiter_.admit(identity_, auth::RateLimiter::Kind::Message)) {
        log::warn("Session", session_id_ + " exceeded the message rate");
        send_error(ErrorReason::RateLimited, "message rate exceeded");
        close();
        return Disposition::CloseViolation;
    }

    DecodeResult decoded = decode(text, limits_.max_payload_bytes);
    if (!decoded.ok()) {
        send_error(decoded.error, {});
        return Disposition::Continue;
    }

    const SignalMessage& msg = decoded.message;
    switch (msg.type) {
        case MessageType::Ping:
            send(SignalMessage::pong());
            return Disposition::Continue;

        case MessageType::Join:
            return handle_join(msg.room);

        case MessageType::Leave:
            close();
            return Disposition::Close;

        case MessageType::Offer:
        case MessageType::Answer:
        case MessageType::IceCandidate:
            return handle_relay(msg);

        default:
            // decode() never yields server-only types.
            send_error(ErrorReason::UnknownMessage, {});
            return Disposition::Continue;
    }
}

SignalingSession::Disposition SignalingSession::handle_join(const std::string& room) {
    if (joined()) {
        send_error(ErrorReason::AlreadyJoined, "already in room " + room_);
        return Disposition::Continue;
    }
    if (!is_valid_room_name(room)) {
        send_error(ErrorReason::InvalidRoom, "room names are 1-64 characters of A-Z a-z 0-9 _ . -");
        return Disposition::Continue;
    }

    RouteResult r = router_.route(context(), SignalMessage::join(room));
    switch (r.outcome) {
        case RouteOutcome::Joined:
            break;
        case RouteOutcome::RoomFull:
            state_ = State::AwaitingPeer;
            log::info("Session", session_id_ + " refused: room " + room + " is full");
            send_error(ErrorReason::RoomFull, "room is full, retry later");
            return Disposition::Continue;
        default:
            send_error(ErrorReason::AlreadyJoined, {});
            return Disposition::Continue;
    }

    room_ = room;
    role_ = r.join.role;
    joined_at_ = Clock::now();
    state_ = State::AwaitingPeer;
    log::info("Session", session_id_ + " joined " + room_ + " as " + to_string(role_));

    send(SignalMessage::joined(room_, session_id_, role_));

    if (r.join.peer) {
        // Synthetic counterpart of the PeerJoined the registry pushed to the
        // existing occupant. Sent inline so it precedes anything that peer
        // relays to us.
        deliver(SignalMessage::peer_joined(r.join.peer->session_id, r.join.peer->role, r.join.seq));
    }
    return Disposition::Continue;
}

SignalingSession::Disposition SignalingSession::handle_relay(const SignalMessage& msg) {
    if (state_ != State::Paired) {
        send_error(ErrorReason::NoPeer, "no peer in room");
        return Disposition::Continue;
    }

    RouteResult r = router_.route(context(), msg);
    if (r.outcome != RouteOutcome::Delivered) {
        send_error(ErrorReason::NoPeer, "no peer in room");
    }
    return Disposition::Continue;
}

void SignalingSession::deliver(const SignalMessage& msg) {
    if (state_ == State::Closed) return;

    switch (msg.type) {
        case MessageType::PeerJoined:
            if (joined()) state_ = State::Paired;
            break;
        case MessageType::PeerLeft:
            if (state_ == State::Paired) state_ = State::AwaitingPeer;
            break;
        default:
            break;
    }
    send(msg);
}

void SignalingSession::close() {
    if (state_ == State::Closed) return;

    if (joined()) {
        router_.route(context(), SignalMessage::leave());
        log::info("Session", session_id_ + " left " + room_);
        room_.clear();
    }
    state_ = State::Closed;
    outbound_.reset();
    inbox_.reset();
}

} // namespace pairlink::signaling
