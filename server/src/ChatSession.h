#pragma once
#include <memory>
#include <vector>
#include <deque>
#include <string>
#include <atomic>
#include "Protocol.h"
#include "StickerStore.h"
#include <asio.hpp>
#include <nlohmann/json.hpp>

namespace Qalla {
    class RelayServer;
}

namespace Qalla {

    // One TCP connection. Reads, packet handling and writes all run on the
    // session strand, so a connection's events never interleave with each other.
    class ChatSession : public std::enable_shared_from_this<ChatSession> {
    public:
        ChatSession(asio::ip::tcp::socket socket, RelayServer& server, std::string id);

        void Start();
        const std::string& GetId() const { return m_Id; }
        bool IsHealthy() const { return m_IsHealthy.load(std::memory_order_relaxed); }
        int64_t GetLastActivityTimeMs() const { return m_LastActivityTimeMs.load(std::memory_order_relaxed); }

        void UpdateActivity();
        void SendShared(std::shared_ptr<std::vector<uint8_t>> buffer);

        // Stops handling input and closes once the write queue drains.
        void CloseAfterFlush();
        // Closes immediately, dropping anything still queued.
        void Close();

    private:
        void ReadHeader();
        void ReadBody();
        void ProcessPacket();
        void DoWrite();
        void Disconnect();

        void SendLocal(PacketType type, const std::string& data);
        void HandleStickerRequest(const nlohmann::json& j);
        void HandleStickerChunk();
        void HandleStickerComplete();
        void HandleStickerFetch(const nlohmann::json& j);

        asio::ip::tcp::socket m_Socket;
        RelayServer& m_Server;
        asio::strand<asio::any_io_executor> m_Strand;
        const std::string m_Id;
        Qalla::PacketHeader m_Header;
        std::vector<uint8_t> m_Body;
        std::deque<std::shared_ptr<std::vector<uint8_t>>> m_WriteQueue;

        std::atomic<bool> m_IsHealthy{ true };
        std::atomic<bool> m_Disconnected{ false };
        std::atomic<int64_t> m_LastActivityTimeMs{ 0 };
        bool m_Closing{ false };

        std::unique_ptr<StickerUpload> m_Upload;
    };

} // namespace Qalla
