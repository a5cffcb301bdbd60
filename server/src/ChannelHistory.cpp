#include "ChannelHistory.h"
#include "SessionRegistry.h"
#include "Identifiers.h"
#include "Logger.h"

using json = nlohmann::json;

namespace {

    template <typename Messages>
    std::string BuildHistoryPayload(const std::string& channelId, const Messages& messages) {
        json out;
        out["channelId"] = channelId;
        out["messages"] = json::array();
        for (const auto& m : messages) out["messages"].push_back(m);
        return out.dump();
    }

} // namespace

namespace Qalla {

    void to_json(json& j, const ChannelInfo& c) {
        j = json{ { "id", c.id }, { "name", c.name } };
    }

    void to_json(json& j, const ChatMessage& m) {
        j = json{
            { "id", m.id },
            { "channelId", m.channelId },
            { "user", m.user },
            { "color", m.color },
            { "type", m.type },
            { "text", m.text },
            { "url", m.url },
            { "ts", m.ts }
        };
    }

    ChannelHistoryStore::ChannelHistoryStore(Outbox& outbox, std::vector<ChannelInfo> catalog)
        : m_Outbox(outbox)
        , m_Catalog(std::move(catalog))
    {
        for (const auto& c : m_Catalog)
            m_Logs.emplace(c.id, std::make_unique<ChannelLog>());
    }

    std::vector<ChannelInfo> ChannelHistoryStore::DefaultCatalog() {
        return {
            { "general", "general" },
            { "gaming", "gaming" },
            { "music", "music" },
            { "memes", "memes" }
        };
    }

    const ChannelHistoryStore::ChannelLog* ChannelHistoryStore::Find(const std::string& channelId) const {
        auto it = m_Logs.find(channelId);
        return it == m_Logs.end() ? nullptr : it->second.get();
    }

    ChannelHistoryStore::ChannelLog* ChannelHistoryStore::Find(const std::string& channelId) {
        auto it = m_Logs.find(channelId);
        return it == m_Logs.end() ? nullptr : it->second.get();
    }

    bool ChannelHistoryStore::HasChannel(const std::string& channelId) const {
        return Find(channelId) != nullptr;
    }

    std::string ChannelHistoryStore::CatalogJSON() const {
        return json(m_Catalog).dump();
    }

    bool ChannelHistoryStore::Append(ChatMessage message) {
        ChannelLog* log = Find(message.channelId);
        if (!log) return false;

        std::lock_guard lock(log->mutex);
        // Stamped under the lock: timestamps never decrease along the log.
        message.ts = NowMs();
        if (!log->messages.empty() && message.ts < log->messages.back().ts)
            message.ts = log->messages.back().ts;
        message.id = GenerateMessageId(message.ts);

        const std::string payload = json(message).dump();
        log->messages.push_back(std::move(message));
        while (log->messages.size() > kMaxHistory) log->messages.pop_front();
        m_Outbox.SendToAll(PacketType::Message, payload);

        const ChatMessage& stored = log->messages.back();
        RelayTrace::log("step=message_append channel=" + stored.channelId
            + " id=" + stored.id
            + " size=" + std::to_string(log->messages.size()));
        return true;
    }

    std::vector<ChatMessage> ChannelHistoryStore::Replay(const std::string& channelId) const {
        const ChannelLog* log = Find(channelId);
        if (!log) return {};
        std::lock_guard lock(log->mutex);
        return { log->messages.begin(), log->messages.end() };
    }

    std::string ChannelHistoryStore::HistoryJSON(const std::string& channelId) const {
        const ChannelLog* log = Find(channelId);
        if (!log) return BuildHistoryPayload(channelId, std::deque<ChatMessage>{});
        std::lock_guard lock(log->mutex);
        return BuildHistoryPayload(channelId, log->messages);
    }

    bool ChannelHistoryStore::Join(SessionRegistry& sessions,
        const std::string& connectionId, const std::string& channelId)
    {
        const ChannelLog* log = Find(channelId);
        if (!log) return false;
        if (!sessions.SetChannel(connectionId, channelId)) return false;

        // Snapshot and send under the channel lock so no append can slip between
        // the replay and the live stream for this connection.
        std::lock_guard lock(log->mutex);
        m_Outbox.SendTo(connectionId, PacketType::History, BuildHistoryPayload(channelId, log->messages));
        return true;
    }

} // namespace Qalla
