#pragma once

#include <memory>
#include <string>

#include "signaling/RoomRegistry.h"
#include "signaling/SignalMessage.h"
#include "signaling/SignalSink.h"

namespace pairlink::signaling {

// What a session knows about itself when it hands a message to the router.
struct RouteContext {
    std::string session_id;
    std::string identity;
    std::string room;                    // empty until joined
    std::shared_ptr<SignalSink> inbox;   // where the registry pushes to this session
};

enum class RouteOutcome {
    Joined,
    RoomFull,
    AlreadyJoined,
    Delivered,
    NoPeer,
    Left,
    NotJoined,
    Ignored,
};

struct RouteResult {
    RouteOutcome outcome = RouteOutcome::Ignored;
    JoinResult join;  // valid for Joined
};

// Dispatches one inbound message. Relay-class messages go to the sender's
// room peer and join/leave mutate the registry. Lifecycle events are pushed by
// the registry into the addressed participant's inbox, so they are Ignored
// here. Sessions never address each other except through this path.
class MessageRouter {
public:
    explicit MessageRouter(RoomRegistry& registry) : registry_(registry) {}

    RouteResult route(const RouteContext& ctx, const SignalMessage& msg);

    RoomRegistry& registry() noexcept { return registry_; }

private:
    RouteResult do_join(const RouteContext& ctx, const std::string& room);

    RoomRegistry& registry_;
};

} // namespace pairlink::signaling
