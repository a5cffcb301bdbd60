#pragma once

#include "Outbox.h"
#include "Protocol.h"
#include "RelayController.h"
#include "ServerConfig.h"
#include "StickerStore.h"
#include <asio.hpp>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace Qalla {

    class ChatSession;

    // ---------------------------------------------------------------------------
    // RelayServer: TCP acceptor plus the connection table the relay core
    // delivers through.
    // ---------------------------------------------------------------------------
    class RelayServer : public Outbox {
    public:
        RelayServer(asio::io_context& io_context, const ServerConfig& config);

        // Called by ChatSession on connect / disconnect.
        void Register(std::shared_ptr<ChatSession> session);
        void Unregister(const std::shared_ptr<ChatSession>& session);

        // Closes every connection and stops accepting.
        void Shutdown();

        RelayController& Controller() { return m_Controller; }
        const StickerStore& Stickers() const { return m_Stickers; }
        const ServerConfig& Config() const { return m_Config; }

        // Outbox
        bool SendTo(const std::string& connectionId, PacketType type, const std::string& payload) override;
        void SendToMany(const std::vector<std::string>& connectionIds, PacketType type, const std::string& payload) override;
        void SendToAll(PacketType type, const std::string& payload) override;
        void Disconnect(const std::string& connectionId) override;

    private:
        static constexpr int kHealthCheckIntervalSec = 5;

        void DoAccept();
        void StartConnectionHealthCheck();

        // --- ASIO handles -------------------------------------------------------
        asio::ip::tcp::acceptor m_Acceptor;
        asio::io_context&       m_IoContext;
        const ServerConfig      m_Config;

        // --- Connection table (guarded by m_ConnectionMutex) --------------------
        // Lock order: relay registry locks may be held while taking this one,
        // never the other way round.
        mutable std::shared_mutex                                     m_ConnectionMutex;
        std::unordered_map<std::string, std::shared_ptr<ChatSession>> m_Connections;

        StickerStore    m_Stickers;
        RelayController m_Controller;
    };

} // namespace Qalla
