#pragma once
#include "Protocol.h"
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace Qalla {

    struct SessionState {
        std::string id;
        std::string name = kDefaultName;
        std::string color = kDefaultColor;
        std::string channelId = kDefaultChannel;
    };

    // One SessionState per live connection. Every accessor tolerates an id that
    // was already removed: disconnects race with in-flight packets.
    class SessionRegistry {
    public:
        // False if the id is already registered.
        bool Create(const std::string& connectionId);
        bool Update(const std::string& connectionId, const std::string& name, const std::string& color);
        bool SetChannel(const std::string& connectionId, const std::string& channelId);
        std::optional<SessionState> Get(const std::string& connectionId) const;
        bool Remove(const std::string& connectionId);
        size_t Size() const;

    private:
        mutable std::shared_mutex                     m_Mutex;
        std::unordered_map<std::string, SessionState> m_Sessions;
    };

} // namespace Qalla
