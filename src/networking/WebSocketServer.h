#pragma once

#include <boost/asio/io_context.hpp>

#include <cstddef>
#include <memory>

#include "config/Config.h"

namespace pairlink::auth { class RateLimiter; }

namespace pairlink::signaling {
class ConnectionGate;
class IdGenerator;
class MessageRouter;
} // namespace pairlink::signaling

namespace pairlink::networking {

// Accepts HTTP/WebSocket connections. Routes:
//   GET /            plain-text greeting
//   GET /healthz     {"status":"ok","rooms":N}
//   GET /ws[/<room>] WebSocket upgrade, token in ?token= or Authorization
// Every connection runs on its own strand; run the io_context from as many
// threads as you like.
class WebSocketServer {
public:
    struct Services {
        signaling::ConnectionGate& gate;
        auth::RateLimiter& limiter;
        signaling::MessageRouter& router;
        signaling::IdGenerator& ids;
    };

    // Binds immediately; throws boost::system::system_error if it cannot.
    WebSocketServer(boost::asio::io_context& ioc, const config::Config& cfg, Services services);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    void start();  // start accepting
    void stop();   // stop accepting + close active connections

    // Connections not yet finished, including ones still closing after stop().
    std::size_t connection_count() const;
    unsigned short port() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace pairlink::networking
