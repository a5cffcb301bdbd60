#include "PresenceTracker.h"
#include "Logger.h"
#include <algorithm>

using json = nlohmann::json;

namespace Qalla {

    void to_json(json& j, const PresenceEntry& e) {
        j = json{ { "id", e.id }, { "name", e.name }, { "color", e.color } };
    }

    PresenceTracker::PresenceTracker(Outbox& outbox)
        : m_Outbox(outbox) {
    }

    void PresenceTracker::Set(const PresenceEntry& entry) {
        std::lock_guard lock(m_Mutex);
        auto it = std::find_if(m_Entries.begin(), m_Entries.end(),
            [&entry](const PresenceEntry& e) { return e.id == entry.id; });
        if (it != m_Entries.end()) *it = entry;
        else m_Entries.push_back(entry);
        PublishLocked();
    }

    void PresenceTracker::Remove(const std::string& connectionId) {
        std::lock_guard lock(m_Mutex);
        m_Entries.erase(std::remove_if(m_Entries.begin(), m_Entries.end(),
            [&connectionId](const PresenceEntry& e) { return e.id == connectionId; }),
            m_Entries.end());
        PublishLocked();
    }

    std::vector<PresenceEntry> PresenceTracker::Roster() const {
        std::lock_guard lock(m_Mutex);
        return m_Entries;
    }

    size_t PresenceTracker::Size() const {
        std::lock_guard lock(m_Mutex);
        return m_Entries.size();
    }

    // Publishing under the lock keeps roster snapshots in mutation order on
    // every connection.
    void PresenceTracker::PublishLocked() {
        m_Outbox.SendToAll(PacketType::Presence_List, json(m_Entries).dump());
        RelayTrace::log("step=presence_publish count=" + std::to_string(m_Entries.size()));
    }

} // namespace Qalla
