#include "signaling/SignalMessage.h"

#include <boost/json.hpp>

#include <utility>

namespace pairlink::signaling {

namespace json = boost::json;

const char* to_string(MessageType t) noexcept {
    switch (t) {
        case MessageType::Join:         return "join";
        case MessageType::Offer:        return "offer";
        case MessageType::Answer:       return "answer";
        case MessageType::IceCandidate: return "ice-candidate";
        case MessageType::Leave:        return "leave";
        case MessageType::Ping:         return "ping";
        case MessageType::Joined:       return "joined";
        case MessageType::PeerJoined:   return "peer-joined";
        case MessageType::PeerLeft:     return "peer-left";
        case MessageType::Pong:         return "pong";
        case MessageType::Error:        return "error";
    }
    return "unknown";
}

const char* to_string(ErrorReason r) noexcept {
    switch (r) {
        case ErrorReason::None:             return "None";
        case ErrorReason::MalformedMessage: return "MalformedMessage";
        case ErrorReason::UnknownMessage:   return "UnknownMessage";
        case ErrorReason::PayloadTooLarge:  return "PayloadTooLarge";
        case ErrorReason::InvalidRoom:      return "InvalidRoom";
        case ErrorReason::RoomFull:         return "RoomFull";
        case ErrorReason::AlreadyJoined:    return "AlreadyJoined";
        case ErrorReason::NoPeer:           return "NoPeer";
        case ErrorReason::RateLimited:      return "RateLimited";
    }
    return "Unknown";
}

const char* to_string(Role r) noexcept {
    return r == Role::Offerer ? "offerer" : "answerer";
}

SignalMessage SignalMessage::join(std::string room) {
    SignalMessage m;
    m.type = MessageType::Join;
    m.room = std::move(room);
    return m;
}

SignalMessage SignalMessage::offer(std::string sdp) {
    SignalMessage m;
    m.type = MessageType::Offer;
    m.body = std::move(sdp);
    return m;
}

SignalMessage SignalMessage::answer(std::string sdp) {
    SignalMessage m;
    m.type = MessageType::Answer;
    m.body = std::move(sdp);
    return m;
}

SignalMessage SignalMessage::ice_candidate(std::string candidate) {
    SignalMessage m;
    m.type = MessageType::IceCandidate;
    m.body = std::move(candidate);
    return m;
}

SignalMessage SignalMessage::leave() {
    SignalMessage m;
    m.type = MessageType::Leave;
    return m;
}

SignalMessage SignalMessage::joined(std::string room, std::string session, Role role) {
    SignalMessage m;
    m.type = MessageType::Joined;
    m.room = std::move(room);
    m.session = std::move(session);
    m.role = role;
    return m;
}

SignalMessage SignalMessage::peer_joined(std::string peer, Role role, std::uint64_t seq) {
    SignalMessage m;
    m.type = MessageType::PeerJoined;
    m.peer = std::move(peer);
    m.role = role;
    m.seq = seq;
    return m;
}

SignalMessage SignalMessage::peer_left(std::string peer, Role role, std::uint64_t seq) {
    SignalMessage m;
    m.type = MessageType::PeerLeft;
    m.peer = std::move(peer);
    m.role = role;
    m.seq = seq;
    return m;
}

SignalMessage SignalMessage::pong() {
    SignalMessage m;
    m.type = MessageType::Pong;
    return m;
}

SignalMessage SignalMessage::error(ErrorReason reason, std::string detail) {
    SignalMessage m;
    m.type = MessageType::Error;
    m.reason = reason;
    m.detail = std::move(detail);
    return m;
}

namespace {

DecodeResult fail(ErrorReason r) {
    DecodeResult d;
    d.error = r;
    return d;
}

// Reads payload[key] as a string into out. Missing payload, missing key or a
// non-string value is malformed.
ErrorReason payload_string(const json::object& root, const char* key, std::string& out) {
    auto* payload = root.if_contains("payload");
    if (!payload || !payload->is_object()) return ErrorReason::MalformedMessage;
    auto* v = payload->as_object().if_contains(key);
    if (!v || !v->is_string()) return ErrorReason::MalformedMessage;
    out = std::string(v->as_string());
    return ErrorReason::None;
}

} // namespace

DecodeResult decode(const std::string& text, std::size_t max_payload_bytes) {
    json::error_code ec;
    json::value v = json::parse(text, ec);
    if (ec) return fail(ErrorReason::MalformedMessage);

    auto* obj = v.if_object();
    if (!obj) return fail(ErrorReason::MalformedMessage);

    auto* tv = obj->if_contains("type");
    if (!tv || !tv->is_string()) return fail(ErrorReason::MalformedMessage);
    const json::string& type = tv->as_string();

    DecodeResult d;
    SignalMessage& m = d.message;

    if (type == "join") {
        m.type = MessageType::Join;
        d.error = payload_string(*obj, "room", m.room);
        return d;
    }
    if (type == "leave") {
        m.type = MessageType::Leave;
        return d;
    }
    if (type == "ping") {
        m.type = MessageType::Ping;
        return d;
    }

    const char* key = nullptr;
    if (type == "offer") {
        m.type = MessageType::Offer;
        key = "sdp";
    } else if (type == "answer") {
        m.type = MessageType::Answer;
        key = "sdp";
    } else if (type == "ice-candidate") {
        m.type = MessageType::IceCandidate;
        key = "candidate";
    } else {
        return fail(ErrorReason::UnknownMessage);
    }

    d.error = payload_string(*obj, key, m.body);
    if (!d.ok()) return d;
    if (m.body.empty()) return fail(ErrorReason::MalformedMessage);
    if (m.body.size() > max_payload_bytes) return fail(ErrorReason::PayloadTooLarge);

    m.raw = text;
    return d;
}

std::string encode(const SignalMessage& msg) {
    if (msg.is_relay() && !msg.raw.empty()) return msg.raw;

    json::object payload;
    switch (msg.type) {
        case MessageType::Join:
            payload["room"] = msg.room;
            break;
        case MessageType::Offer:
        case MessageType::Answer:
            payload["sdp"] = msg.body;
            break;
        case MessageType::IceCandidate:
            payload["candidate"] = msg.body;
            break;
        case MessageType::Joined:
            payload["room"] = msg.room;
            payload["session"] = msg.session;
            payload["role"] = to_string(msg.role);
            break;
        case MessageType::PeerJoined:
        case MessageType::PeerLeft:
            payload["peer"] = msg.peer;
            payload["role"] = to_string(msg.role);
            payload["seq"] = msg.seq;
            break;
        case MessageType::Error:
            payload["reason"] = to_string(msg.reason);
            if (!msg.detail.empty()) payload["message"] = msg.detail;
            break;
        case MessageType::Leave:
        case MessageType::Ping:
        case MessageType::Pong:
            break;
    }

    json::object out{{"type", to_string(msg.type)}};
    if (!payload.empty()) out["payload"] = std::move(payload);
    return json::serialize(out);
}

} // namespace pairlink::signaling
