#include "networking/WebSocketServer.h"

#include "logging/Log.h"
#include "networking/HttpTarget.h"
#include "signaling/Admission.h"
#include "signaling/IdGenerator.hpp"
#include "signaling/MessageRouter.h"
#include "signaling/Room.h"
#include "signaling/SignalingSession.h"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace pairlink::networking {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
namespace json = boost::json;
using tcp = asio::ip::tcp;

using ConnectionId = std::uint64_t;

namespace {

constexpr auto kHandshakeTimeout = std::chrono::seconds(30);
constexpr std::size_t kMaxRequestBody = 10 * 1024;
constexpr char kServerName[] = "pairlink";

std::string as_string(beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

} // namespace

class WebSocketServer::Impl {
public:
    Impl(asio::io_context& ioc, const config::Config& cfg, Services services)
        : ioc_(ioc),
          cfg_(cfg),
          services_(services),
          acceptor_(ioc, tcp::endpoint(asio::ip::make_address(cfg.address), cfg.port)) {}

    void start() { do_accept(); }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);

        // Close all connections; each one leaves its room and removes itself
        // once its close handshake is done.
        std::lock_guard<std::mutex> lk(mu_);
        for (auto& entry : connections_) {
            entry.second->close();
        }
    }

    std::size_t connection_count() const {
        std::lock_guard<std::mutex> lk(mu_);
        return connections_.size();
    }

    unsigned short port() const {
        beast::error_code ec;
        auto ep = acceptor_.local_endpoint(ec);
        return ec ? 0 : ep.port();
    }

private:
    class Connection : public std::enable_shared_from_this<Connection> {
    public:
        Connection(Impl& server, tcp::socket socket, ConnectionId id)
            : server_(server),
              id_(id),
              ws_(std::move(socket)) {}

        void start() {
            beast::error_code ec;
            auto ep = beast::get_lowest_layer(ws_).socket().remote_endpoint(ec);
            remote_ = ec ? std::string("unknown") : ep.address().to_string();

            parser_.emplace();
            parser_->body_limit(kMaxRequestBody);

            beast::get_lowest_layer(ws_).expires_after(kHandshakeTimeout);
            http::async_read(
                ws_.next_layer(), buffer_, *parser_,
                [self = shared_from_this()](beast::error_code ec, std::size_t) {
                    self->on_request(ec);
                });
        }

        // Safe from any thread.
        void send(std::string frame) {
            asio::post(
                ws_.get_executor(),
                [self = shared_from_this(), frame = std::move(frame)]() mutable {
                    if (self->finished_ || self->close_sent_) return;

                    if (self->write_queue_.size() >= self->server_.cfg_.max_outbound_queue) {
                        log::warn("Connection", "[" + std::to_string(self->id_) + "] outbound queue full, dropping client");
                        self->abort();
                        return;
                    }

                    bool writing = !self->write_queue_.empty();
                    self->write_queue_.push_back(std::move(frame));
                    if (!writing) self->do_write();
                });
        }

        // Safe from any thread.
        void close() {
            asio::post(
                ws_.get_executor(),
                [self = shared_from_this()] {
                    if (self->upgraded_) {
                        self->begin_close(websocket::close_code::going_away);
                    } else {
                        self->abort();
                    }
                });
        }

        // Registry -> session, hopped onto this connection's strand.
        void push(const signaling::SignalMessage& msg) {
            asio::post(
                ws_.get_executor(),
                [self = shared_from_this(), msg] {
                    if (self->session_) self->session_->deliver(msg);
                });
        }

    private:
        // Session -> own client.
        class Outbound : public signaling::SignalSink {
        public:
            explicit Outbound(std::weak_ptr<Connection> conn) : conn_(std::move(conn)) {}
            void deliver(const signaling::SignalMessage& msg) override {
                if (auto c = conn_.lock()) c->send(signaling::encode(msg));
            }

        private:
            std::weak_ptr<Connection> conn_;
        };

        // Registry -> this session.
        class Inbox : public signaling::SignalSink {
        public:
            explicit Inbox(std::weak_ptr<Connection> conn) : conn_(std::move(conn)) {}
            void deliver(const signaling::SignalMessage& msg) override {
                if (auto c = conn_.lock()) c->push(msg);
            }

        private:
            std::weak_ptr<Connection> conn_;
        };

        void on_request(beast::error_code ec) {
            if (ec) {
                if (ec != http::error::end_of_stream) fail("read request", ec);
                return finish();
            }

            req_ = parser_->release();
            parser_.reset();

            HttpTarget target;
            if (!parse_target(as_string(req_.target()), target)) {
                return respond(http::status::bad_request, "bad request target\n");
            }

            if (target.path == "/" && req_.method() == http::verb::get) {
                return respond(http::status::ok, "Hello, PairLink signaling relay!\n");
            }
            if (target.path == "/healthz" && req_.method() == http::verb::get) {
                json::object body{
                    {"status", "ok"},
                    {"rooms", server_.services_.router.registry().room_count()},
                    {"connections", server_.connection_count()}};
                return respond(http::status::ok, json::serialize(body), "application/json");
            }

            const std::string ws_prefix = "/ws";
            if (target.path != ws_prefix && target.path.rfind(ws_prefix + "/", 0) != 0) {
                return respond(http::status::not_found, "not found\n");
            }
            if (!websocket::is_upgrade(req_)) {
                return respond(http::status::bad_request, "expected a websocket upgrade\n");
            }

            const std::string origin = as_string(req_[http::field::origin]);
            if (!origin.empty() && !server_.cfg_.origin_allowed(origin)) {
                log::info("Connection", "[" + std::to_string(id_) + "] origin not allowed: " + origin);
                return respond(http::status::forbidden, "origin not allowed\n");
            }

            if (target.path.size() > ws_prefix.size() + 1) {
                path_room_ = target.path.substr(ws_prefix.size() + 1);
                if (!signaling::is_valid_room_name(path_room_)) {
                    return respond(http::status::bad_request, "invalid room name\n");
                }
            }

            std::string token;
            if (const std::string* t = target.param("token")) {
                token = *t;
            } else {
                token = bearer_token(as_string(req_[http::field::authorization]));
            }

            auto decision = server_.services_.gate.admit(remote_, token);
            switch (decision.status) {
                case signaling::AdmissionStatus::RateLimited:
                    return respond(http::status::too_many_requests, "too many connection attempts\n");
                case signaling::AdmissionStatus::Unauthenticated:
                    return respond(http::status::unauthorized,
                                   std::string(auth::to_string(decision.auth_error)) + "\n");
                case signaling::AdmissionStatus::Admitted:
                    break;
            }

            accept_websocket(std::move(decision.identity));
        }

        void accept_websocket(std::string identity) {
            const auto& cfg = server_.cfg_;

            signaling::SignalingSession::Limits limits;
            limits.max_payload_bytes = cfg.max_payload_bytes;

            auto weak = weak_from_this();
            session_ = std::make_unique<signaling::SignalingSession>(
                server_.services_.ids.session_id(),
                std::move(identity),
                server_.services_.router,
                server_.services_.limiter,
                limits,
                std::make_shared<Outbound>(weak));
            session_->set_inbox(std::make_shared<Inbox>(weak));

            beast::get_lowest_layer(ws_).expires_never();

            // No server pings: a peer that stops sending anything, keepalives
            // included, is dropped after the idle timeout.
            websocket::stream_base::timeout opt{
                kHandshakeTimeout,
                std::chrono::seconds(cfg.idle_timeout_seconds),
                false};
            ws_.set_option(opt);
            ws_.read_message_max(cfg.max_frame_bytes);
            ws_.set_option(websocket::stream_base::decorator(
                [](websocket::response_type& res) { res.set(http::field::server, kServerName); }));

            ws_.async_accept(
                req_,
                [self = shared_from_this()](beast::error_code ec) {
                    if (ec) {
                        self->fail("accept", ec);
                        return self->finish();
                    }

                    self->upgraded_ = true;
                    log::info("Connection", "[" + std::to_string(self->id_) + "] " + self->remote_ +
                                                " is " + self->session_->id());

                    auto d = self->session_->open(self->path_room_);
                    if (d != signaling::SignalingSession::Disposition::Continue) return self->apply(d);
                    self->do_read();
                });
        }

        void respond(http::status status, std::string body, const char* content_type = "text/plain") {
            auto res = std::make_shared<http::response<http::string_body>>(status, req_.version());
            res->set(http::field::server, kServerName);
            res->set(http::field::content_type, content_type);
            res->keep_alive(false);
            res->body() = std::move(body);
            res->prepare_payload();

            http::async_write(
                ws_.next_layer(), *res,
                [self = shared_from_this(), res](beast::error_code ec, std::size_t) {
                    if (ec) self->fail("write response", ec);
                    beast::error_code ignored;
                    beast::get_lowest_layer(self->ws_).socket().shutdown(tcp::socket::shutdown_send, ignored);
                    self->finish();
                });
        }

        void do_read() {
            ws_.async_read(
                buffer_,
                [self = shared_from_this()](beast::error_code ec, std::size_t) {
                    if (ec) return self->on_close_or_fail(ec);

                    std::string msg = beast::buffers_to_string(self->buffer_.data());
                    self->buffer_.consume(self->buffer_.size());

                    auto d = self->session_->on_frame(msg);
                    if (d != signaling::SignalingSession::Disposition::Continue) return self->apply(d);

                    self->do_read();
                });
        }

        void do_write() {
            ws_.text(true);
            ws_.async_write(
                asio::buffer(write_queue_.front()),
                [self = shared_from_this()](beast::error_code ec, std::size_t) {
                    if (ec) return self->on_close_or_fail(ec);

                    self->write_queue_.pop_front();
                    if (!self->write_queue_.empty()) return self->do_write();
                    if (self->pending_close_) self->do_close(*self->pending_close_);
                });
        }

        // Frames the session produced during this call were posted, not queued
        // yet. The close decision is posted behind them so it sees them queued.
        void apply(signaling::SignalingSession::Disposition d) {
            using D = signaling::SignalingSession::Disposition;
            if (d == D::Continue) return;

            const auto code = d == D::CloseViolation ? websocket::close_code::policy_error
                                                     : websocket::close_code::normal;
            asio::post(
                ws_.get_executor(),
                [self = shared_from_this(), code] { self->begin_close(code); });
        }

        // Flushes queued frames (an Error frame may be among them), then closes.
        void begin_close(websocket::close_code code) {
            if (pending_close_ || close_sent_ || finished_) return;
            pending_close_ = code;
            if (write_queue_.empty()) do_close(code);
        }

        void do_close(websocket::close_code code) {
            if (close_sent_) return;
            close_sent_ = true;
            ws_.async_close(
                code,
                [self = shared_from_this()](beast::error_code ec) {
                    if (ec && ec != websocket::error::closed) self->fail("close", ec);
                    self->finish();
                });
        }

        // Transport failure: tear the socket down, pending operations abort.
        void abort() {
            beast::error_code ec;
            beast::get_lowest_layer(ws_).socket().close(ec);
            finish();
        }

        void on_close_or_fail(beast::error_code ec) {
            // WebSocket close, idle timeout and cancellation are ordinary ends.
            if (ec != websocket::error::closed && ec != beast::error::timeout &&
                ec != asio::error::operation_aborted) {
                fail("io", ec);
            } else if (ec == beast::error::timeout) {
                log::info("Connection", "[" + std::to_string(id_) + "] idle timeout");
            }
            finish();
        }

        // Runs once: leave the room, forget the connection.
        void finish() {
            if (finished_) return;
            finished_ = true;
            write_queue_.clear();

            if (session_) {
                session_->close();
                log::info("Connection", "[" + std::to_string(id_) + "] " + session_->id() + " closed");
            }
            server_.remove_connection(id_);
        }

        void fail(const char* what, beast::error_code ec) {
            log::warn("Connection", "[" + std::to_string(id_) + "] " + what + ": " + ec.message());
        }

        Impl& server_;
        ConnectionId id_;
        std::string remote_;

        websocket::stream<beast::tcp_stream> ws_;

        beast::flat_buffer buffer_;
        std::optional<http::request_parser<http::string_body>> parser_;
        http::request<http::string_body> req_;
        std::string path_room_;

        std::unique_ptr<signaling::SignalingSession> session_;

        std::deque<std::string> write_queue_;
        std::optional<websocket::close_code> pending_close_;
        bool upgraded_ = false;
        bool close_sent_ = false;
        bool finished_ = false;
    };

    void do_accept() {
        // Each connection gets its own strand; all of its handlers run there.
        acceptor_.async_accept(
            asio::make_strand(ioc_),
            [this](beast::error_code ec, tcp::socket socket) {
                if (ec) {
                    // If acceptor closed during shutdown, ignore.
                    if (ec == asio::error::operation_aborted) return;
                    log::error("Accept", ec.message());
                    return do_accept();
                }

                auto id = next_connection_id_++;
                auto conn = std::make_shared<Connection>(*this, std::move(socket), id);

                {
                    std::lock_guard<std::mutex> lk(mu_);
                    connections_[id] = conn;
                }

                conn->start();
                do_accept();
            });
    }

    void remove_connection(ConnectionId id) {
        std::lock_guard<std::mutex> lk(mu_);
        connections_.erase(id);
    }

private:
    asio::io_context& ioc_;
    const config::Config& cfg_;
    Services services_;
    tcp::acceptor acceptor_;

    std::atomic<ConnectionId> next_connection_id_{1};

    mutable std::mutex mu_;
    std::unordered_map<ConnectionId, std::shared_ptr<Connection>> connections_;
};

// ---- WebSocketServer wrapper ----

WebSocketServer::WebSocketServer(asio::io_context& ioc, const config::Config& cfg, Services services)
    : impl_(new Impl(ioc, cfg, services)) {}

void WebSocketServer::start() { impl_->start(); }
void WebSocketServer::stop() { impl_->stop(); }

std::size_t WebSocketServer::connection_count() const { return impl_->connection_count(); }
unsigned short WebSocketServer::port() const { return impl_->port(); }

WebSocketServer::~WebSocketServer() = default;

} // namespace pairlink::networking
