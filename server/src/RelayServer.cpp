#include "RelayServer.h"
#include "ChatSession.h"   // full definition required: RelayServer.cpp dereferences shared_ptr<ChatSession>
#include "Identifiers.h"
#include "Logger.h"
#include <chrono>
#include <cstdio>
#include <mutex>

using asio::ip::tcp;

namespace Qalla {

    RelayServer::RelayServer(asio::io_context& io_context, const ServerConfig& config)
        : m_Acceptor(io_context, tcp::endpoint(tcp::v4(), config.port))
        , m_IoContext(io_context)
        , m_Config(config)
        , m_Stickers(config.stickerDir, config.maxStickerBytes)
        , m_Controller(*this, config.inviteCode)
    {
        DoAccept();
        StartConnectionHealthCheck();
    }

    // ---------------------------------------------------------------------------
    // Connection table
    // ---------------------------------------------------------------------------

    void RelayServer::Register(std::shared_ptr<ChatSession> session) {
        const std::string id = session->GetId();
        {
            std::unique_lock lock(m_ConnectionMutex);
            m_Connections.emplace(id, std::move(session));
        }
        m_Controller.OnConnect(id);
    }

    void RelayServer::Unregister(const std::shared_ptr<ChatSession>& session) {
        const std::string& id = session->GetId();
        {
            std::unique_lock lock(m_ConnectionMutex);
            auto it = m_Connections.find(id);
            if (it == m_Connections.end() || it->second != session) return;
            m_Connections.erase(it);
        }
        // Registry cleanup publishes to other connections, so it runs after the
        // connection lock is released.
        m_Controller.OnDisconnect(id);
        std::fprintf(stderr, "[Qalla Server] Client %s disconnected\n", id.c_str());
    }

    void RelayServer::Shutdown() {
        std::error_code ec;
        m_Acceptor.close(ec);

        std::vector<std::shared_ptr<ChatSession>> sessions;
        {
            std::shared_lock lock(m_ConnectionMutex);
            sessions.reserve(m_Connections.size());
            for (const auto& [id, s] : m_Connections) sessions.push_back(s);
        }
        for (const auto& s : sessions) s->Close();
    }

    // ---------------------------------------------------------------------------
    // Outbox
    // ---------------------------------------------------------------------------

    bool RelayServer::SendTo(const std::string& connectionId, PacketType type, const std::string& payload) {
        std::shared_lock lock(m_ConnectionMutex);
        auto it = m_Connections.find(connectionId);
        if (it == m_Connections.end()) return false;
        it->second->SendShared(MakePacket(type, payload));
        return true;
    }

    void RelayServer::SendToMany(const std::vector<std::string>& connectionIds,
        PacketType type, const std::string& payload)
    {
        if (connectionIds.empty()) return;
        auto buf = MakePacket(type, payload);
        std::shared_lock lock(m_ConnectionMutex);
        for (const auto& id : connectionIds) {
            auto it = m_Connections.find(id);
            if (it != m_Connections.end()) it->second->SendShared(buf);
        }
    }

    void RelayServer::SendToAll(PacketType type, const std::string& payload) {
        auto buf = MakePacket(type, payload);
        std::shared_lock lock(m_ConnectionMutex);
        for (const auto& [id, s] : m_Connections) s->SendShared(buf);
    }

    void RelayServer::Disconnect(const std::string& connectionId) {
        std::shared_lock lock(m_ConnectionMutex);
        auto it = m_Connections.find(connectionId);
        if (it != m_Connections.end()) it->second->CloseAfterFlush();
    }

    // ---------------------------------------------------------------------------
    // Two-phase health check.
    //   Phase 1 - shared read lock: collect unhealthy / idle sessions.
    //   Phase 2 - no lock: close them; Unregister takes the write lock itself.
    // ---------------------------------------------------------------------------
    void RelayServer::StartConnectionHealthCheck() {
        auto timer = std::make_shared<asio::steady_timer>(
            m_IoContext, std::chrono::seconds(kHealthCheckIntervalSec));

        timer->async_wait([this, timer](const std::error_code& ec) {
            if (ec) return;

            const int64_t nowMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now().time_since_epoch()).count();

            std::vector<std::shared_ptr<ChatSession>> deadSessions;
            {
                std::shared_lock readLock(m_ConnectionMutex);
                for (const auto& [id, session] : m_Connections) {
                    if (!session->IsHealthy()
                        || m_Config.IsIdleExpired(nowMs - session->GetLastActivityTimeMs()))
                        deadSessions.push_back(session);
                }
            }

            for (const auto& session : deadSessions) {
                RelayTrace::log(session->GetId(), "step=health_evict");
                session->Close();
            }

            StartConnectionHealthCheck();
            });
    }

    // ---------------------------------------------------------------------------
    // TCP accept loop
    // ---------------------------------------------------------------------------
    void RelayServer::DoAccept() {
        m_Acceptor.async_accept([this](std::error_code ec, tcp::socket socket) {
            if (!ec) {
                std::error_code optEc;
                socket.set_option(tcp::no_delay(true), optEc);

                std::string id;
                {
                    std::shared_lock lock(m_ConnectionMutex);
                    do { id = GenerateConnectionId(); } while (m_Connections.count(id) > 0);
                }
                std::fprintf(stderr, "[Qalla Server] New TCP client connected: %s\n", id.c_str());
                std::make_shared<ChatSession>(std::move(socket), *this, std::move(id))->Start();
            }
            else if (ec == asio::error::operation_aborted) {
                return;
            }
            DoAccept();
            });
    }

} // namespace Qalla
