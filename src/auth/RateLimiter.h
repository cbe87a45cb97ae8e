#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace pairlink::auth {

// Token bucket admission control. Connection attempts and signaling
// messages draw from separate buckets so a message flood can never eat into
// the connection budget (or the other way round).
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    enum class Kind { Connection, Message };

    struct Limits {
        double capacity = 10.0;
        double refill_per_second = 1.0;
    };

    RateLimiter(Limits connection, Limits message);

    bool admit(const std::string& key, Kind kind);
    bool admit(const std::string& key, Kind kind, Clock::time_point now);

    // Drops buckets that have been full and untouched for at least `idle`.
    std::size_t prune(std::chrono::seconds idle);
    std::size_t prune(std::chrono::seconds idle, Clock::time_point now);

    std::size_t bucket_count() const;

private:
    struct Bucket {
        double tokens = 0.0;
        Clock::time_point updated{};
    };

    const Limits& limits_of(Kind kind) const noexcept;
    static void refill(Bucket& b, const Limits& lim, Clock::time_point now) noexcept;

    Limits connection_;
    Limits message_;

    mutable std::mutex mu_;
    std::unordered_map<std::string, Bucket> connection_buckets_;
    std::unordered_map<std::string, Bucket> message_buckets_;
};

} // namespace pairlink::auth
