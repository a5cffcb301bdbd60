#include "SessionRegistry.h"
#include <mutex>

namespace Qalla {

    bool SessionRegistry::Create(const std::string& connectionId) {
        std::unique_lock lock(m_Mutex);
        SessionState state;
        state.id = connectionId;
        return m_Sessions.emplace(connectionId, std::move(state)).second;
    }

    bool SessionRegistry::Update(const std::string& connectionId,
        const std::string& name, const std::string& color)
    {
        std::unique_lock lock(m_Mutex);
        auto it = m_Sessions.find(connectionId);
        if (it == m_Sessions.end()) return false;
        it->second.name = name;
        it->second.color = color;
        return true;
    }

    bool SessionRegistry::SetChannel(const std::string& connectionId, const std::string& channelId) {
        std::unique_lock lock(m_Mutex);
        auto it = m_Sessions.find(connectionId);
        if (it == m_Sessions.end()) return false;
        it->second.channelId = channelId;
        return true;
    }

    std::optional<SessionState> SessionRegistry::Get(const std::string& connectionId) const {
        std::shared_lock lock(m_Mutex);
        auto it = m_Sessions.find(connectionId);
        if (it == m_Sessions.end()) return std::nullopt;
        return it->second;
    }

    bool SessionRegistry::Remove(const std::string& connectionId) {
        std::unique_lock lock(m_Mutex);
        return m_Sessions.erase(connectionId) > 0;
    }

    size_t SessionRegistry::Size() const {
        std::shared_lock lock(m_Mutex);
        return m_Sessions.size();
    }

} // namespace Qalla
