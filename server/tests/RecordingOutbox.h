#pragma once
#include "Outbox.h"
#include <algorithm>
#include <iterator>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace Qalla::Testing {

    struct SentPacket {
        std::string    to;
        PacketType     type;
        nlohmann::json body;
    };

    // Outbox double: records every delivery per recipient. Only ids passed to
    // Connect() count as live connections.
    class RecordingOutbox : public Outbox {
    public:
        void Connect(const std::string& id) {
            std::lock_guard lock(m_Mutex);
            m_Live.insert(id);
        }

        bool SendTo(const std::string& connectionId, PacketType type, const std::string& payload) override {
            std::lock_guard lock(m_Mutex);
            if (!m_Live.count(connectionId)) return false;
            m_Sent.push_back({ connectionId, type, nlohmann::json::parse(payload) });
            return true;
        }

        void SendToMany(const std::vector<std::string>& connectionIds, PacketType type, const std::string& payload) override {
            std::lock_guard lock(m_Mutex);
            for (const auto& id : connectionIds)
                if (m_Live.count(id)) m_Sent.push_back({ id, type, nlohmann::json::parse(payload) });
        }

        void SendToAll(PacketType type, const std::string& payload) override {
            std::lock_guard lock(m_Mutex);
            for (const auto& id : m_Live)
                m_Sent.push_back({ id, type, nlohmann::json::parse(payload) });
        }

        void Disconnect(const std::string& connectionId) override {
            std::lock_guard lock(m_Mutex);
            m_Closed.push_back(connectionId);
            m_Live.erase(connectionId);
        }

        std::vector<SentPacket> Sent() const {
            std::lock_guard lock(m_Mutex);
            return m_Sent;
        }

        std::vector<SentPacket> SentTo(const std::string& id) const {
            std::lock_guard lock(m_Mutex);
            std::vector<SentPacket> out;
            std::copy_if(m_Sent.begin(), m_Sent.end(), std::back_inserter(out),
                [&id](const SentPacket& p) { return p.to == id; });
            return out;
        }

        std::vector<SentPacket> SentOfType(PacketType type) const {
            std::lock_guard lock(m_Mutex);
            std::vector<SentPacket> out;
            std::copy_if(m_Sent.begin(), m_Sent.end(), std::back_inserter(out),
                [type](const SentPacket& p) { return p.type == type; });
            return out;
        }

        std::vector<std::string> Closed() const {
            std::lock_guard lock(m_Mutex);
            return m_Closed;
        }

        void Clear() {
            std::lock_guard lock(m_Mutex);
            m_Sent.clear();
        }

    private:
        mutable std::mutex       m_Mutex;
        std::set<std::string>    m_Live;
        std::vector<SentPacket>  m_Sent;
        std::vector<std::string> m_Closed;
    };

} // namespace Qalla::Testing
