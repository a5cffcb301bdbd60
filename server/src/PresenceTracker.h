#pragma once
#include "Outbox.h"
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace Qalla {

    struct PresenceEntry {
        std::string id;
        std::string name;
        std::string color;
    };

    void to_json(nlohmann::json& j, const PresenceEntry& e);

    // Roster of handshake-completed connections in first-seen order. Every
    // change republishes the full list to all connections; there are no deltas.
    class PresenceTracker {
    public:
        explicit PresenceTracker(Outbox& outbox);

        // Updates an existing entry in place, otherwise appends.
        void Set(const PresenceEntry& entry);
        // Publishes even when the id was not present.
        void Remove(const std::string& connectionId);

        std::vector<PresenceEntry> Roster() const;
        size_t Size() const;

    private:
        void PublishLocked();

        Outbox&                    m_Outbox;
        mutable std::mutex         m_Mutex;
        std::vector<PresenceEntry> m_Entries;
    };

} // namespace Qalla
