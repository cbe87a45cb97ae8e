#include "signaling/RoomRegistry.h"

#include "logging/Log.h"

#include <utility>

namespace pairlink::signaling {

std::shared_ptr<RoomRegistry::Entry> RoomRegistry::find(const std::string& room) const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    auto it = rooms_.find(room);
    if (it == rooms_.end()) return nullptr;
    return it->second;
}

std::shared_ptr<RoomRegistry::Entry> RoomRegistry::find_or_create(const std::string& room) {
    if (auto e = find(room); e && !e->retired.load()) return e;

    std::unique_lock<std::shared_mutex> lk(mu_);
    auto& slot = rooms_[room];
    if (!slot || slot->retired.load()) {
        slot = std::make_shared<Entry>(room);
    }
    return slot;
}

void RoomRegistry::erase_if_retired(const std::string& room, const std::shared_ptr<Entry>& entry) {
    std::unique_lock<std::shared_mutex> lk(mu_);
    auto it = rooms_.find(room);
    // A newer entry may already have replaced the retired one.
    if (it != rooms_.end() && it->second == entry) {
        rooms_.erase(it);
    }
}

JoinResult RoomRegistry::join(const std::string& room, Participant participant) {
    for (;;) {
        auto entry = find_or_create(room);
        std::lock_guard<std::mutex> lk(entry->mu);

        // Emptied and retired between lookup and lock: start over on a fresh entry.
        if (entry->retired.load()) continue;

        Room& r = entry->room;
        JoinResult result;

        if (r.contains(participant.session_id)) {
            result.status = JoinStatus::AlreadyJoined;
            return result;
        }
        if (r.full()) {
            result.status = JoinStatus::RoomFull;
            return result;
        }

        participant.role = r.vacant_role();
        if (participant.joined_at == Participant::Clock::time_point{}) {
            participant.joined_at = Participant::Clock::now();
        }

        const Participant& added = r.add(std::move(participant));
        result.status = JoinStatus::Joined;
        result.role = added.role;

        if (const Participant* existing = r.other(added.session_id)) {
            result.seq = r.next_seq();
            result.peer = PeerInfo{existing->session_id, existing->identity, existing->role};
            if (existing->sink) {
                existing->sink->deliver(SignalMessage::peer_joined(added.session_id, added.role, result.seq));
            }
        }

        log::debug("Registry", added.session_id + " joined " + room + " as " + to_string(added.role));
        return result;
    }
}

bool RoomRegistry::leave(const std::string& room, const std::string& session_id) {
    auto entry = find(room);
    if (!entry) return false;

    bool now_empty = false;
    {
        std::lock_guard<std::mutex> lk(entry->mu);
        if (entry->retired.load()) return false;

        Room& r = entry->room;
        auto removed = r.remove(session_id);
        if (!removed) return false;

        if (const Participant* survivor = r.other(session_id)) {
            if (survivor->sink) {
                survivor->sink->deliver(SignalMessage::peer_left(removed->session_id, removed->role, r.next_seq()));
            }
        }

        if (r.empty()) {
            entry->retired.store(true);
            now_empty = true;
        }
    }

    if (now_empty) erase_if_retired(room, entry);

    log::debug("Registry", session_id + " left " + room);
    return true;
}

RelayResult RoomRegistry::relay(const std::string& room, const std::string& from_session_id,
                                const SignalMessage& msg) {
    auto entry = find(room);
    if (!entry) return RelayResult::NoPeer;

    std::lock_guard<std::mutex> lk(entry->mu);
    if (entry->retired.load()) return RelayResult::NoPeer;

    const Room& r = entry->room;
    if (!r.contains(from_session_id)) return RelayResult::NoPeer;

    const Participant* peer = r.other(from_session_id);
    if (!peer || !peer->sink) return RelayResult::NoPeer;

    peer->sink->deliver(msg);
    return RelayResult::Delivered;
}

std::size_t RoomRegistry::room_count() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    return rooms_.size();
}

std::size_t RoomRegistry::occupancy(const std::string& room) const {
    auto entry = find(room);
    if (!entry) return 0;
    std::lock_guard<std::mutex> lk(entry->mu);
    return entry->retired.load() ? 0 : entry->room.size();
}

std::vector<std::string> RoomRegistry::session_ids(const std::string& room) const {
    auto entry = find(room);
    if (!entry) return {};

    std::lock_guard<std::mutex> lk(entry->mu);
    if (entry->retired.load()) return {};
    return entry->room.session_ids();
}

void RoomRegistry::clear() {
    std::unordered_map<std::string, std::shared_ptr<Entry>> dropped;
    {
        std::unique_lock<std::shared_mutex> lk(mu_);
        dropped.swap(rooms_);
    }
    for (auto& [name, entry] : dropped) {
        std::lock_guard<std::mutex> lk(entry->mu);
        entry->retired.store(true);
    }
}

} // namespace pairlink::signaling
