#pragma once

#include "signaling/SignalMessage.h"

namespace pairlink::signaling {

// Outbound channel of one session. deliver() must not block and must not
// call back into the registry: the registry invokes it under a room lock.
class SignalSink {
public:
    virtual ~SignalSink() = default;
    virtual void deliver(const SignalMessage& msg) = 0;
};

} // namespace pairlink::signaling
