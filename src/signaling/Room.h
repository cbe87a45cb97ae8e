#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "signaling/SignalMessage.h"
#include "signaling/SignalSink.h"

namespace pairlink::signaling {

static constexpr std::size_t kMaxRoomNameLen = 64;

// 1..64 bytes of [A-Za-z0-9_.-], and not "." or "..".
bool is_valid_room_name(std::string_view name) noexcept;

struct Participant {
    using Clock = std::chrono::steady_clock;

    std::string session_id;
    std::string identity;
    Role role = Role::Offerer;
    Clock::time_point joined_at{};
    std::shared_ptr<SignalSink> sink;
};

// Two participant slots. Not synchronized; RoomRegistry guards each Room.
class Room {
public:
    using Clock = std::chrono::steady_clock;
    static constexpr std::size_t kCapacity = 2;

    explicit Room(std::string name);

    const std::string& name() const noexcept { return name_; }
    Clock::time_point created_at() const noexcept { return created_at_; }

    std::size_t size() const noexcept;
    bool empty() const noexcept { return size() == 0; }
    bool full() const noexcept { return size() == kCapacity; }

    bool contains(std::string_view session_id) const noexcept;
    std::vector<std::string> session_ids() const;

    // The occupant that is not `session_id`, if any.
    const Participant* other(std::string_view session_id) const noexcept;
    const Participant* find(std::string_view session_id) const noexcept;

    // Role the next participant gets: the one not held by the current occupant.
    Role vacant_role() const noexcept;

    // Requires !full().
    const Participant& add(Participant p);
    std::optional<Participant> remove(std::string_view session_id);

    std::uint64_t next_seq() noexcept { return ++seq_; }
    std::uint64_t seq() const noexcept { return seq_; }

private:
    std::string name_;
    Clock::time_point created_at_;
    std::array<std::optional<Participant>, kCapacity> slots_;
    std::uint64_t seq_ = 0;
};

} // namespace pairlink::signaling
