#include "signaling/MessageRouter.h"

namespace pairlink::signaling {

RouteResult MessageRouter::do_join(const RouteContext& ctx, const std::string& room) {
    RouteResult r;

    Participant p;
    p.session_id = ctx.session_id;
    p.identity = ctx.identity;
    p.sink = ctx.inbox;

    r.join = registry_.join(room, std::move(p));
    switch (r.join.status) {
        case JoinStatus::Joined:        r.outcome = RouteOutcome::Joined; break;
        case JoinStatus::RoomFull:      r.outcome = RouteOutcome::RoomFull; break;
        case JoinStatus::AlreadyJoined: r.outcome = RouteOutcome::AlreadyJoined; break;
    }
    return r;
}

RouteResult MessageRouter::route(const RouteContext& ctx, const SignalMessage& msg) {
    RouteResult r;

    switch (msg.type) {
        case MessageType::Join:
            if (!ctx.room.empty()) {
                r.outcome = RouteOutcome::AlreadyJoined;
                return r;
            }
            return do_join(ctx, msg.room);

        case MessageType::Leave:
            if (ctx.room.empty()) {
                r.outcome = RouteOutcome::NotJoined;
                return r;
            }
            registry_.leave(ctx.room, ctx.session_id);
            r.outcome = RouteOutcome::Left;
            return r;

        case MessageType::Offer:
        case MessageType::Answer:
        case MessageType::IceCandidate:
            if (ctx.room.empty()) {
                r.outcome = RouteOutcome::NoPeer;
                return r;
            }
            r.outcome = registry_.relay(ctx.room, ctx.session_id, msg) == RelayResult::Delivered
                            ? RouteOutcome::Delivered
                            : RouteOutcome::NoPeer;
            return r;

        // Lifecycle events travel registry -> participant sink, never inbound.
        case MessageType::PeerJoined:
        case MessageType::PeerLeft:
        case MessageType::Ping:
        case MessageType::Joined:
        case MessageType::Pong:
        case MessageType::Error:
            break;
    }
    return r;
}

} // namespace pairlink::signaling
