#include "auth/RateLimiter.h"
#include "auth/TokenVerifier.h"
#include "config/Config.h"
#include "logging/Log.h"
#include "networking/WebSocketServer.h"
#include "signaling/Admission.h"
#include "signaling/IdGenerator.hpp"
#include "signaling/MessageRouter.h"
#include "signaling/RoomRegistry.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/system_error.hpp>

#include <chrono>
#include <csignal>
#include <functional>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

namespace {

constexpr auto kPruneEvery = std::chrono::seconds(60);
constexpr auto kBucketIdle = std::chrono::seconds(600);
constexpr auto kIssuedTokenTtl = std::chrono::hours(24);
constexpr auto kDrainPoll = std::chrono::milliseconds(100);
constexpr auto kDrainTimeout = std::chrono::seconds(5);

void print_usage(const char* argv0) {
    std::cout
        << "usage: " << argv0 << " [--config file.json] [--address A] [--port P] [--threads N]\n"
        << "       " << argv0 << " --issue-token <subject>   (development: print a 24h token)\n"
        << "\n"
        << "environment: PAIRLINK_TOKEN_SECRET (required), PAIRLINK_ADDRESS, PAIRLINK_PORT,\n"
        << "  PAIRLINK_THREADS, PAIRLINK_TOKEN_LEEWAY_SECONDS, PAIRLINK_CONNECTION_RATE_CAPACITY,\n"
        << "  PAIRLINK_CONNECTION_RATE_REFILL, PAIRLINK_MESSAGE_RATE_CAPACITY, PAIRLINK_MESSAGE_RATE_REFILL,\n"
        << "  PAIRLINK_IDLE_TIMEOUT_SECONDS, PAIRLINK_MAX_PAYLOAD_BYTES, PAIRLINK_MAX_FRAME_BYTES,\n"
        << "  PAIRLINK_MAX_OUTBOUND_QUEUE, PAIRLINK_ALLOWED_ORIGINS, PAIRLINK_LOG_LEVEL\n";
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace pairlink;

    config::Config cfg;
    config::CommandLine cli;
    try {
        cfg = config::load(argc, argv, cli);
        if (cli.show_help) {
            print_usage(argv[0]);
            return 0;
        }
        cfg.validate();
    } catch (const config::ConfigError& e) {
        std::cerr << "[PairLink] configuration error: " << e.what() << "\n";
        return 2;
    }

    log::set_level(cfg.log_level);

    auth::TokenVerifier verifier(cfg.token_secret, std::chrono::seconds(cfg.token_leeway_seconds));

    if (cli.issue_token) {
        std::cout << verifier.issue(cli.issue_subject, kIssuedTokenTtl) << "\n";
        return 0;
    }

    auth::RateLimiter limiter(
        {cfg.connection_rate.capacity, cfg.connection_rate.refill_per_second},
        {cfg.message_rate.capacity, cfg.message_rate.refill_per_second});

    signaling::RoomRegistry registry;
    signaling::MessageRouter router(registry);
    signaling::ConnectionGate gate(verifier, limiter);
    signaling::IdGenerator ids;

    boost::asio::io_context ioc;

    std::unique_ptr<networking::WebSocketServer> server;
    try {
        server = std::make_unique<networking::WebSocketServer>(
            ioc, cfg, networking::WebSocketServer::Services{gate, limiter, router, ids});
    } catch (const boost::system::system_error& e) {
        log::error("PairLink", "cannot listen on " + cfg.address + ":" + std::to_string(cfg.port) + ": " + e.what());
        return 1;
    }

    server->start();

    // Keep the limiter's bucket map bounded.
    boost::asio::steady_timer prune_timer(ioc);
    std::function<void()> schedule_prune = [&] {
        prune_timer.expires_after(kPruneEvery);
        prune_timer.async_wait([&](const boost::system::error_code& ec) {
            if (ec) return;
            auto removed = limiter.prune(kBucketIdle);
            if (removed > 0) log::debug("PairLink", "pruned " + std::to_string(removed) + " rate buckets");
            schedule_prune();
        });
    };
    schedule_prune();

    // Shutdown waits for close handshakes, up to kDrainTimeout.
    boost::asio::steady_timer drain_timer(ioc);
    std::chrono::steady_clock::time_point drain_deadline;
    std::function<void()> wait_for_drain = [&] {
        const auto open = server->connection_count();
        if (open == 0 || std::chrono::steady_clock::now() >= drain_deadline) {
            if (open != 0) log::warn("PairLink", std::to_string(open) + " connections did not close in time");
            ioc.stop();
            return;
        }
        drain_timer.expires_after(kDrainPoll);
        drain_timer.async_wait([&](const boost::system::error_code& ec) {
            if (!ec) wait_for_drain();
        });
    };

    // Graceful shutdown on Ctrl+C / SIGTERM
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int) {
        if (ec) return;
        log::info("PairLink", "shutting down...");
        prune_timer.cancel();
        server->stop();
        drain_deadline = std::chrono::steady_clock::now() + kDrainTimeout;
        wait_for_drain();
    });

    unsigned threads = cfg.threads != 0 ? cfg.threads : std::thread::hardware_concurrency();
    if (threads == 0) threads = 1;

    log::info("PairLink", "signaling relay on ws://" + cfg.address + ":" + std::to_string(server->port()) +
                              "/ws (" + std::to_string(threads) + " threads)");

    std::vector<std::thread> pool;
    pool.reserve(threads - 1);
    for (unsigned i = 1; i < threads; ++i) {
        pool.emplace_back([&ioc] { ioc.run(); });
    }
    ioc.run();
    for (auto& t : pool) t.join();

    registry.clear();

    log::info("PairLink", "exit.");
    return 0;
}
