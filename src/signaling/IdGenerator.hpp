#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace pairlink::signaling {

// "session-<ULID>": 48-bit millisecond timestamp + 80 random bits, Crockford
// base32. Monotonic within one millisecond. Thread-safe.
class IdGenerator {
public:
    IdGenerator()
        : rng_(seed_engine()) {}

    std::string session_id() { return "session-" + next_ulid(); }

    std::string next_ulid() {
        std::array<std::uint8_t, 16> bytes{};
        const std::uint64_t ts_ms = now_ms();

        for (int i = 0; i < 6; ++i) {
            bytes[static_cast<std::size_t>(i)] = static_cast<std::uint8_t>(ts_ms >> (8 * (5 - i)));
        }

        {
            std::lock_guard<std::mutex> lk(mu_);
            if (ts_ms != last_ts_ms_) {
                last_ts_ms_ = ts_ms;
                hi_ = static_cast<std::uint16_t>(rng_() & 0xFFFF);
                lo_ = rng_();
            } else if (++lo_ == 0) {
                ++hi_;
            }
            bytes[6] = static_cast<std::uint8_t>(hi_ >> 8);
            bytes[7] = static_cast<std::uint8_t>(hi_);
            for (int i = 0; i < 8; ++i) {
                bytes[static_cast<std::size_t>(8 + i)] = static_cast<std::uint8_t>(lo_ >> (8 * (7 - i)));
            }
        }

        return encode(bytes);
    }

private:
    static std::mt19937_64 seed_engine() {
        std::random_device rd;
        std::seed_seq seq{
            rd(), rd(), rd(), rd(),
            static_cast<unsigned>(std::chrono::high_resolution_clock::now().time_since_epoch().count()),
            static_cast<unsigned>(reinterpret_cast<std::uintptr_t>(&rd))
        };
        return std::mt19937_64(seq);
    }

    static std::uint64_t now_ms() {
        using namespace std::chrono;
        return static_cast<std::uint64_t>(
            duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
    }

    // 128 bits -> 26 chars; the two leading pad bits are zero.
    static std::string encode(const std::array<std::uint8_t, 16>& bytes) {
        static constexpr char alphabet[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

        std::string out;
        out.reserve(26);

        std::uint32_t buffer = 0;
        int bits = 2;  // leading zero pad
        for (std::uint8_t b : bytes) {
            buffer = (buffer << 8) | b;
            bits += 8;
            while (bits >= 5) {
                bits -= 5;
                out.push_back(alphabet[(buffer >> bits) & 0x1F]);
            }
            buffer &= (1u << bits) - 1u;
        }
        return out;
    }

    std::mt19937_64 rng_;

    std::mutex mu_;
    std::uint64_t last_ts_ms_ = 0;
    std::uint16_t hi_ = 0;
    std::uint64_t lo_ = 0;
};

} // namespace pairlink::signaling
