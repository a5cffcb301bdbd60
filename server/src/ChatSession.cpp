#include "ChatSession.h"
#include "RelayServer.h"
#include "Logger.h"
#include "Protocol.h"
#include "Sanitizer.h"
#include "Version.h"
#include <cstdio>
#include <cstring>
#include <chrono>

using json = nlohmann::json;
using asio::ip::tcp;

namespace {

    constexpr size_t kMaxQueuedPackets = 200;
    constexpr size_t kMaxMimeLength = 64;

    size_t ReadSize(const json& value) {
        if (value.is_number_unsigned()) return value.get<size_t>();
        if (value.is_number_integer()) {
            const auto v = value.get<int64_t>();
            return v > 0 ? static_cast<size_t>(v) : 0;
        }
        return 0;
    }

} // namespace

namespace Qalla {

    ChatSession::ChatSession(tcp::socket socket, RelayServer& server, std::string id)
        : m_Socket(std::move(socket))
        , m_Server(server)
        , m_Strand(asio::make_strand(m_Socket.get_executor()))
        , m_Id(std::move(id)) {
    }

    void ChatSession::Start() {
        UpdateActivity();
        m_Server.Register(shared_from_this());
        asio::post(m_Strand, [this, self = shared_from_this()]() { ReadHeader(); });
    }

    void ChatSession::Disconnect() {
        if (m_Disconnected.exchange(true)) return;
        // Dropping an unfinished upload deletes its partial file.
        m_Upload.reset();
        std::error_code ec;
        m_Socket.shutdown(tcp::socket::shutdown_both, ec);
        m_Socket.close(ec);
        m_Server.Unregister(shared_from_this());
    }

    void ChatSession::CloseAfterFlush() {
        asio::post(m_Strand, [this, self = shared_from_this()]() {
            m_Closing = true;
            if (m_WriteQueue.empty()) Disconnect();
        });
    }

    void ChatSession::Close() {
        asio::post(m_Strand, [this, self = shared_from_this()]() { Disconnect(); });
    }

    void ChatSession::ReadHeader() {
        asio::async_read(m_Socket, asio::buffer(&m_Header, sizeof(Qalla::PacketHeader)),
            asio::bind_executor(m_Strand, [this, self = shared_from_this()](std::error_code ec, std::size_t) {
                if (!ec) {
                    m_Header.ToHost();
                    if (m_Header.size > kMaxPacketBody) { Disconnect(); return; }
                    m_Body.resize(m_Header.size);
                    ReadBody();
                }
                else {
                    if (ec != asio::error::eof && ec != asio::error::operation_aborted)
                        std::fprintf(stderr, "[Qalla Server] ReadHeader error: %s (%d), disconnecting\n", ec.message().c_str(), ec.value());
                    Disconnect();
                }
                }));
    }

    void ChatSession::ReadBody() {
        asio::async_read(m_Socket, asio::buffer(m_Body),
            asio::bind_executor(m_Strand, [this, self = shared_from_this()](std::error_code ec, std::size_t) {
                if (!ec) {
                    ProcessPacket();
                    if (!m_Closing && !m_Disconnected) ReadHeader();
                }
                else {
                    std::fprintf(stderr, "[Qalla Server] ReadBody error: %s (%d), disconnecting\n", ec.message().c_str(), ec.value());
                    Disconnect();
                }
                }));
    }

    void ChatSession::DoWrite() {
        if (m_WriteQueue.empty()) return;

        asio::async_write(m_Socket, asio::buffer(*m_WriteQueue.front()),
            asio::bind_executor(m_Strand, [this, self = shared_from_this()](std::error_code ec, std::size_t) {
                if (!ec) {
                    m_WriteQueue.pop_front();
                    if (!m_WriteQueue.empty()) DoWrite();
                    else if (m_Closing) Disconnect();
                }
                else {
                    m_IsHealthy.store(false, std::memory_order_relaxed);
                    Disconnect();
                }
                }));
    }

    void ChatSession::SendShared(std::shared_ptr<std::vector<uint8_t>> buffer) {
        asio::post(m_Strand, [this, self = shared_from_this(), buffer]() {
            if (m_Disconnected) return;
            // Never pop a queued buffer here: the front one may be mid-write.
            if (m_WriteQueue.size() >= kMaxQueuedPackets) {
                RelayTrace::log(m_Id, "step=send_drop reason=queue_full");
                return;
            }
            bool writeInProgress = !m_WriteQueue.empty();
            m_WriteQueue.push_back(buffer);
            if (!writeInProgress) DoWrite();
        });
    }

    void ChatSession::SendLocal(PacketType type, const std::string& data) {
        SendShared(MakePacket(type, data));
    }

    void ChatSession::UpdateActivity() {
        auto now = std::chrono::steady_clock::now();
        int64_t ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
        m_LastActivityTimeMs.store(ms, std::memory_order_relaxed);
    }

    void ChatSession::ProcessPacket() {
        UpdateActivity();

        // A connection that failed authentication gets nothing more handled.
        if (m_Closing) return;

        if (m_Header.type == PacketType::Sticker_Upload_Chunk) {
            HandleStickerChunk();
            return;
        }

        if (m_Header.type == PacketType::Echo_Request) {
            SendShared(MakePacket(PacketType::Echo_Response, m_Body.data(), m_Body.size()));
            return;
        }

        if (m_Header.type == PacketType::Health_Request) {
            json res;
            res["ok"] = true;
            res["app"] = "Qalla Server";
            res["version"] = QALLA_VERSION_STRING;
            res["port"] = m_Server.Config().port;
            SendLocal(PacketType::Health_Response, res.dump());
            return;
        }

        std::string payload(m_Body.begin(), m_Body.end());
        try {
            json j = payload.empty() ? json::object() : json::parse(payload);

            if (m_Server.Controller().Dispatch(m_Id, m_Header.type, j)) return;

            if (m_Header.type == PacketType::Sticker_Upload_Request) {
                HandleStickerRequest(j);
                return;
            }

            if (m_Header.type == PacketType::Sticker_Upload_Complete) {
                HandleStickerComplete();
                return;
            }

            if (m_Header.type == PacketType::Sticker_Fetch_Request) {
                HandleStickerFetch(j);
                return;
            }

            RelayTrace::log(m_Id, "step=packet_ignored type="
                + std::to_string(static_cast<int>(m_Header.type)));
        }
        catch (const json::exception& e) {
            RelayTrace::log(m_Id, std::string("step=json_error msg=") + e.what());
            std::fprintf(stderr, "[Qalla Server] ProcessPacket json_error (%s): %s\n",
                PacketTypeName(m_Header.type), e.what());
        }
        catch (const std::exception& e) {
            RelayTrace::log(m_Id, std::string("step=std_error msg=") + e.what());
            std::fprintf(stderr, "[Qalla Server] ProcessPacket std_error (%s): %s\n",
                PacketTypeName(m_Header.type), e.what());
        }
    }

    // ---------------------------------------------------------------------------
    // Sticker upload: request -> chunks -> complete, one upload at a time.
    // ---------------------------------------------------------------------------

    void ChatSession::HandleStickerRequest(const json& j) {
        m_Upload.reset();
        const std::string mime = ClampString(FieldOrNull(j, "mime"), kMaxMimeLength);
        const size_t size = ReadSize(FieldOrNull(j, "size"));

        auto result = m_Server.Stickers().Begin(mime, size);
        json res;
        if (!result.upload) {
            res["ok"] = false;
            res["message"] = result.error;
        }
        else {
            m_Upload = std::move(result.upload);
            res["ok"] = true;
            res["action"] = "upload_approved";
            res["id"] = m_Upload->FileName();
        }
        SendLocal(PacketType::Sticker_Upload_Result, res.dump());
    }

    void ChatSession::HandleStickerChunk() {
        if (!m_Upload) return;
        // Writing past the declared size is treated as abuse, like an oversized body.
        if (!m_Upload->Write(m_Body.data(), m_Body.size())) {
            RelayTrace::log(m_Id, "step=sticker_abort file=" + m_Upload->FileName());
            m_Upload.reset();
            Disconnect();
        }
    }

    void ChatSession::HandleStickerComplete() {
        json res;
        if (!m_Upload) {
            res["ok"] = false;
            res["message"] = "No file uploaded";
        }
        else if (m_Upload->Finish()) {
            res["ok"] = true;
            res["url"] = StickerStore::UrlFor(m_Upload->FileName());
            RelayTrace::log(m_Id, "step=sticker_stored file=" + m_Upload->FileName());
        }
        else {
            res["ok"] = false;
            res["message"] = "Incomplete upload";
        }
        m_Upload.reset();
        SendLocal(PacketType::Sticker_Upload_Result, res.dump());
    }

    void ChatSession::HandleStickerFetch(const json& j) {
        const std::string url = ClampString(FieldOrNull(j, "url"), kMaxUrlLength);
        auto data = m_Server.Stickers().Read(url);
        if (!data) {
            SendShared(MakePacket(PacketType::Sticker_Fetch_Response, nullptr, 0));
            return;
        }
        SendShared(MakePacket(PacketType::Sticker_Fetch_Response, data->data(), data->size()));
    }

} // namespace Qalla
