#include "signaling/Room.h"

#include <stdexcept>
#include <utility>

namespace pairlink::signaling {

bool is_valid_room_name(std::string_view name) noexcept {
    if (name.empty() || name.size() > kMaxRoomNameLen) return false;
    if (name == "." || name == "..") return false;

    for (char c : name) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                        c == '-' || c == '_' || c == '.';
        if (!ok) return false;
    }
    return true;
}

Room::Room(std::string name)
    : name_(std::move(name)),
      created_at_(Clock::now()) {}

std::size_t Room::size() const noexcept {
    std::size_t n = 0;
    for (const auto& s : slots_) {
        if (s) ++n;
    }
    return n;
}

bool Room::contains(std::string_view session_id) const noexcept {
    return find(session_id) != nullptr;
}

std::vector<std::string> Room::session_ids() const {
    std::vector<std::string> out;
    for (const auto& s : slots_) {
        if (s) out.push_back(s->session_id);
    }
    return out;
}

const Participant* Room::find(std::string_view session_id) const noexcept {
    for (const auto& s : slots_) {
        if (s && s->session_id == session_id) return &*s;
    }
    return nullptr;
}

const Participant* Room::other(std::string_view session_id) const noexcept {
    for (const auto& s : slots_) {
        if (s && s->session_id != session_id) return &*s;
    }
    return nullptr;
}

Role Room::vacant_role() const noexcept {
    for (const auto& s : slots_) {
        if (s) return s->role == Role::Offerer ? Role::Answerer : Role::Offerer;
    }
    return Role::Offerer;
}

const Participant& Room::add(Participant p) {
    for (auto& s : slots_) {
        if (!s) {
            s = std::move(p);
            return *s;
        }
    }
    // Callers check full() under the room lock first.
    throw std::logic_error("Room::add on a full room");
}

std::optional<Participant> Room::remove(std::string_view session_id) {
    for (auto& s : slots_) {
        if (s && s->session_id == session_id) {
            std::optional<Participant> out = std::move(s);
            s.reset();
            return out;
        }
    }
    return std::nullopt;
}

} // namespace pairlink::signaling
