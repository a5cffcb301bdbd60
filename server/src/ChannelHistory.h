#pragma once
#include "Outbox.h"
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace Qalla {

    class SessionRegistry;

    struct ChannelInfo {
        std::string id;
        std::string name;
    };

    // Immutable once appended. Exactly one of text/url is non-empty, chosen by type.
    struct ChatMessage {
        std::string id;
        std::string channelId;
        std::string user;
        std::string color;
        std::string type;
        std::string text;
        std::string url;
        int64_t     ts{ 0 };
    };

    void to_json(nlohmann::json& j, const ChannelInfo& c);
    void to_json(nlohmann::json& j, const ChatMessage& m);

    // ---------------------------------------------------------------------------
    // Bounded per-channel message log. The channel set is fixed at construction,
    // so the map itself is never mutated and each channel carries its own lock.
    // Append and the following broadcast happen under that lock, which keeps
    // delivery order equal to append order within a channel.
    // ---------------------------------------------------------------------------
    class ChannelHistoryStore {
    public:
        static constexpr size_t kMaxHistory = 200;

        ChannelHistoryStore(Outbox& outbox, std::vector<ChannelInfo> catalog);

        static std::vector<ChannelInfo> DefaultCatalog();

        bool HasChannel(const std::string& channelId) const;
        const std::vector<ChannelInfo>& Catalog() const { return m_Catalog; }
        std::string CatalogJSON() const;

        // No-op (false) for an unknown channel. Assigns ts and id, then
        // broadcasts to every connection.
        bool Append(ChatMessage message);

        std::vector<ChatMessage> Replay(const std::string& channelId) const;
        std::string HistoryJSON(const std::string& channelId) const;

        // Moves the session to channelId and replays its history to that session
        // only. No-op for an unknown channel or a session already torn down.
        bool Join(SessionRegistry& sessions, const std::string& connectionId, const std::string& channelId);

    private:
        struct ChannelLog {
            mutable std::mutex      mutex;
            std::deque<ChatMessage> messages;
        };

        const ChannelLog* Find(const std::string& channelId) const;
        ChannelLog* Find(const std::string& channelId);

        Outbox&                                                      m_Outbox;
        std::vector<ChannelInfo>                                     m_Catalog;
        std::unordered_map<std::string, std::unique_ptr<ChannelLog>> m_Logs;
    };

} // namespace Qalla
