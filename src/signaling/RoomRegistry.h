#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "signaling/Room.h"
#include "signaling/SignalMessage.h"

namespace pairlink::signaling {

enum class JoinStatus { Joined, RoomFull, AlreadyJoined };
enum class RelayResult { Delivered, NoPeer };

struct PeerInfo {
    std::string session_id;
    std::string identity;
    Role role = Role::Offerer;
};

struct JoinResult {
    JoinStatus status = JoinStatus::RoomFull;
    Role role = Role::Offerer;
    std::uint64_t seq = 0;
    std::optional<PeerInfo> peer;  // set when the room already had an occupant
};

// Process-wide map room name -> Room.
//
// The map itself sits behind a shared mutex (lookups shared, create/erase
// exclusive); every Room has its own mutex which serializes join, leave and
// relay on that room only. Lock order is map before room, and the map lock is
// never held while a room lock is taken for a mutation.
//
// Lifecycle events and relayed messages are handed to the recipient's
// SignalSink while the room lock is held, which fixes their order.
class RoomRegistry {
public:
    RoomRegistry() = default;

    RoomRegistry(const RoomRegistry&) = delete;
    RoomRegistry& operator=(const RoomRegistry&) = delete;

    // RoomFull / AlreadyJoined leave the registry untouched. On Joined with a
    // peer present, the existing occupant receives PeerJoined naming the
    // newcomer; the newcomer learns about the peer from the result.
    JoinResult join(const std::string& room, Participant participant);

    // Returns false when the session was not in the room. The survivor, if
    // any, receives exactly one PeerLeft. An emptied room is removed.
    bool leave(const std::string& room, const std::string& session_id);

    // Forwards msg unmodified to the other occupant of `room`. A sender that
    // is not itself an occupant gets NoPeer.
    RelayResult relay(const std::string& room, const std::string& from_session_id, const SignalMessage& msg);

    std::size_t room_count() const;
    std::size_t occupancy(const std::string& room) const;
    std::vector<std::string> session_ids(const std::string& room) const;

    // Shutdown: drops every room without notifying anyone.
    void clear();

private:
    struct Entry {
        explicit Entry(std::string name) : room(std::move(name)) {}

        std::mutex mu;
        Room room;
        std::atomic<bool> retired{false};  // set under mu once the room is empty
    };

    std::shared_ptr<Entry> find(const std::string& room) const;
    std::shared_ptr<Entry> find_or_create(const std::string& room);
    void erase_if_retired(const std::string& room, const std::shared_ptr<Entry>& entry);

    mutable std::shared_mutex mu_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> rooms_;
};

} // namespace pairlink::signaling
