#pragma once

#include <algorithm>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "signaling/SignalingSession.h"
#include "signaling/SignalSink.h"

namespace pairlink::testing {

using signaling::MessageType;
using signaling::SignalMessage;

// Collects everything delivered to it. Thread-safe so registry storms can
// share one.
class RecordingSink : public signaling::SignalSink {
public:
    void deliver(const SignalMessage& msg) override {
        std::lock_guard<std::mutex> lk(mu_);
        received_.push_back(msg);
    }

    std::vector<SignalMessage> received() const {
        std::lock_guard<std::mutex> lk(mu_);
        return received_;
    }

    std::size_t count(MessageType type) const {
        std::lock_guard<std::mutex> lk(mu_);
        return static_cast<std::size_t>(std::count_if(
            received_.begin(), received_.end(), [&](const SignalMessage& m) { return m.type == type; }));
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return received_.size();
    }

    SignalMessage last() const {
        std::lock_guard<std::mutex> lk(mu_);
        return received_.back();
    }

    void clear() {
        std::lock_guard<std::mutex> lk(mu_);
        received_.clear();
    }

private:
    mutable std::mutex mu_;
    std::vector<SignalMessage> received_;
};

// Registry -> session without a strand in between.
class DirectInbox : public signaling::SignalSink {
public:
    explicit DirectInbox(signaling::SignalingSession* session) : session_(session) {}
    void deliver(const SignalMessage& msg) override { session_->deliver(msg); }

private:
    signaling::SignalingSession* session_;
};

// One fake client: a session wired to a recording outbound channel.
struct TestClient {
    std::shared_ptr<RecordingSink> wire = std::make_shared<RecordingSink>();
    std::unique_ptr<signaling::SignalingSession> session;

    TestClient(const std::string& id,
               const std::string& identity,
               signaling::MessageRouter& router,
               auth::RateLimiter& limiter,
               signaling::SignalingSession::Limits limits = {}) {
        session = std::make_unique<signaling::SignalingSession>(id, identity, router, limiter, limits, wire);
        session->set_inbox(std::make_shared<DirectInbox>(session.get()));
    }
};

} // namespace pairlink::testing
