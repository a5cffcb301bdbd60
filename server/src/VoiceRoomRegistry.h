#pragma once
#include "Outbox.h"
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace Qalla {

    // ---------------------------------------------------------------------------
    // Voice rooms for WebRTC peer discovery. Each room's member list doubles as
    // its broadcast group: peer_joined / peer_left go to exactly these ids.
    // Rooms appear on first join and disappear when the last member leaves.
    // ---------------------------------------------------------------------------
    class VoiceRoomRegistry {
    public:
        static constexpr size_t kRoomCapacity = 4;
        static constexpr const char* kRoomFullReason = "Room full (max 4)";

        enum class JoinResult {
            Joined,
            AlreadyMember,
            Denied
        };

        explicit VoiceRoomRegistry(Outbox& outbox);

        // room must already be sanitized.
        JoinResult Join(const std::string& connectionId, const std::string& room);
        // False (and no notification) if connectionId was not a member.
        bool Leave(const std::string& connectionId, const std::string& room);
        // Removes connectionId from every room. Returns how many rooms it left.
        size_t DisconnectCleanup(const std::string& connectionId);

        std::vector<std::string> Members(const std::string& room) const;
        bool HasRoom(const std::string& room) const;
        size_t RoomCount() const;

    private:
        // Must be called while m_Mutex is held.
        void NotifyPeerLeftLocked(const std::string& room,
            const std::vector<std::string>& members, const std::string& peerId);

        Outbox&                                                   m_Outbox;
        mutable std::mutex                                        m_Mutex;
        std::unordered_map<std::string, std::vector<std::string>> m_Rooms;
    };

} // namespace Qalla
