#include "VoiceRoomRegistry.h"
#include "Logger.h"
#include <algorithm>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace Qalla {

    VoiceRoomRegistry::VoiceRoomRegistry(Outbox& outbox)
        : m_Outbox(outbox) {
    }

    VoiceRoomRegistry::JoinResult VoiceRoomRegistry::Join(const std::string& connectionId,
        const std::string& room)
    {
        std::lock_guard lock(m_Mutex);
        auto& members = m_Rooms[room];

        auto peersExcluding = [&members, &connectionId]() {
            json peers = json::array();
            for (const auto& id : members)
                if (id != connectionId) peers.push_back(id);
            return peers;
        };

        // A repeated join refreshes the peer list but is not a new peer. Checked
        // before capacity: a member of a full room is never denied its own room.
        if (std::find(members.begin(), members.end(), connectionId) != members.end()) {
            m_Outbox.SendTo(connectionId, PacketType::Rtc_Peers,
                json{ { "room", room }, { "peers", peersExcluding() } }.dump());
            return JoinResult::AlreadyMember;
        }

        if (members.size() >= kRoomCapacity) {
            m_Outbox.SendTo(connectionId, PacketType::Rtc_Join_Denied,
                json{ { "reason", kRoomFullReason } }.dump());
            RelayTrace::log(connectionId, "step=rtc_join_denied room=" + room);
            return JoinResult::Denied;
        }

        std::vector<std::string> existing = members;
        members.push_back(connectionId);

        m_Outbox.SendTo(connectionId, PacketType::Rtc_Peers,
            json{ { "room", room }, { "peers", peersExcluding() } }.dump());
        m_Outbox.SendToMany(existing, PacketType::Rtc_Peer_Joined,
            json{ { "room", room }, { "peerId", connectionId } }.dump());

        RelayTrace::log(connectionId, "step=rtc_join room=" + room
            + " members=" + std::to_string(members.size()));
        return JoinResult::Joined;
    }

    bool VoiceRoomRegistry::Leave(const std::string& connectionId, const std::string& room) {
        std::lock_guard lock(m_Mutex);
        auto it = m_Rooms.find(room);
        if (it == m_Rooms.end()) return false;

        auto& members = it->second;
        auto pos = std::find(members.begin(), members.end(), connectionId);
        if (pos == members.end()) return false;
        members.erase(pos);

        NotifyPeerLeftLocked(room, members, connectionId);
        if (members.empty()) m_Rooms.erase(it);
        return true;
    }

    size_t VoiceRoomRegistry::DisconnectCleanup(const std::string& connectionId) {
        std::lock_guard lock(m_Mutex);
        size_t left = 0;
        for (auto it = m_Rooms.begin(); it != m_Rooms.end(); ) {
            auto& members = it->second;
            auto pos = std::find(members.begin(), members.end(), connectionId);
            if (pos != members.end()) {
                members.erase(pos);
                ++left;
                NotifyPeerLeftLocked(it->first, members, connectionId);
            }
            if (members.empty()) it = m_Rooms.erase(it);
            else ++it;
        }
        return left;
    }

    std::vector<std::string> VoiceRoomRegistry::Members(const std::string& room) const {
        std::lock_guard lock(m_Mutex);
        auto it = m_Rooms.find(room);
        if (it == m_Rooms.end()) return {};
        return it->second;
    }

    bool VoiceRoomRegistry::HasRoom(const std::string& room) const {
        std::lock_guard lock(m_Mutex);
        return m_Rooms.count(room) > 0;
    }

    size_t VoiceRoomRegistry::RoomCount() const {
        std::lock_guard lock(m_Mutex);
        return m_Rooms.size();
    }

    void VoiceRoomRegistry::NotifyPeerLeftLocked(const std::string& room,
        const std::vector<std::string>& members, const std::string& peerId)
    {
        if (!members.empty())
            m_Outbox.SendToMany(members, PacketType::Rtc_Peer_Left,
                json{ { "room", room }, { "peerId", peerId } }.dump());
        RelayTrace::log(peerId, "step=rtc_leave room=" + room
            + " members=" + std::to_string(members.size()));
    }

} // namespace Qalla
