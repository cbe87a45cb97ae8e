#include "auth/RateLimiter.h"

#include <algorithm>

namespace pairlink::auth {

RateLimiter::RateLimiter(Limits connection, Limits message)
    : connection_(connection),
      message_(message) {}

const RateLimiter::Limits& RateLimiter::limits_of(Kind kind) const noexcept {
    return kind == Kind::Connection ? connection_ : message_;
}

void RateLimiter::refill(Bucket& b, const Limits& lim, Clock::time_point now) noexcept {
    if (now <= b.updated) return;
    const double elapsed = std::chrono::duration<double>(now - b.updated).count();
    b.tokens = std::min(lim.capacity, b.tokens + elapsed * lim.refill_per_second);
    b.updated = now;
}

bool RateLimiter::admit(const std::string& key, Kind kind) {
    return admit(key, kind, Clock::now());
}

bool RateLimiter::admit(const std::string& key, Kind kind, Clock::time_point now) {
    const Limits& lim = limits_of(kind);

    std::lock_guard<std::mutex> lk(mu_);
    auto& buckets = kind == Kind::Connection ? connection_buckets_ : message_buckets_;

    auto [it, inserted] = buckets.try_emplace(key);
    Bucket& b = it->second;
    if (inserted) {
        b.tokens = lim.capacity;
        b.updated = now;
    } else {
        refill(b, lim, now);
    }

    if (b.tokens < 1.0) return false;
    b.tokens -= 1.0;
    return true;
}

std::size_t RateLimiter::prune(std::chrono::seconds idle) {
    return prune(idle, Clock::now());
}

std::size_t RateLimiter::prune(std::chrono::seconds idle, Clock::time_point now) {
    std::lock_guard<std::mutex> lk(mu_);
    std::size_t removed = 0;

    auto sweep = [&](std::unordered_map<std::string, Bucket>& buckets, const Limits& lim) {
        for (auto it = buckets.begin(); it != buckets.end();) {
            Bucket& b = it->second;
            const bool stale = now - b.updated >= idle;
            refill(b, lim, now);
            if (stale && b.tokens >= lim.capacity) {
                it = buckets.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    };

    sweep(connection_buckets_, connection_);
    sweep(message_buckets_, message_);
    return removed;
}

std::size_t RateLimiter::bucket_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return connection_buckets_.size() + message_buckets_.size();
}

} // namespace pairlink::auth
