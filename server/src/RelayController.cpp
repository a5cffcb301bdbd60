#include "RelayController.h"
#include "Logger.h"
#include "Sanitizer.h"

using json = nlohmann::json;

namespace Qalla {

    RelayController::RelayController(Outbox& outbox, std::string inviteCode)
        : m_Outbox(outbox)
        , m_InviteCode(std::move(inviteCode))
        , m_History(outbox, ChannelHistoryStore::DefaultCatalog())
        , m_Presence(outbox)
        , m_VoiceRooms(outbox)
        , m_Signaling(outbox)
    {
    }

    void RelayController::OnConnect(const std::string& connectionId) {
        m_Sessions.Create(connectionId);
        RelayTrace::log(connectionId, "step=connect");
    }

    void RelayController::OnDisconnect(const std::string& connectionId) {
        m_Sessions.Remove(connectionId);
        m_Presence.Remove(connectionId);
        const size_t rooms = m_VoiceRooms.DisconnectCleanup(connectionId);
        RelayTrace::log(connectionId, "step=disconnect voice_rooms_left=" + std::to_string(rooms));
    }

    bool RelayController::Dispatch(const std::string& connectionId, PacketType type, const json& body) {
        switch (type) {
        case PacketType::Hello:        OnHello(connectionId, body); return true;
        case PacketType::Join_Channel: OnJoin(connectionId, body); return true;
        case PacketType::Message:      OnMessage(connectionId, body); return true;
        case PacketType::Rtc_Join:     OnRtcJoin(connectionId, body); return true;
        case PacketType::Rtc_Leave:    OnRtcLeave(connectionId, body); return true;
        case PacketType::Rtc_Offer:    OnRtcSignal(SignalKind::Offer, connectionId, body); return true;
        case PacketType::Rtc_Answer:   OnRtcSignal(SignalKind::Answer, connectionId, body); return true;
        case PacketType::Rtc_Ice:      OnRtcSignal(SignalKind::Ice, connectionId, body); return true;
        default:
            return false;
        }
    }

    void RelayController::OnHello(const std::string& connectionId, const json& body) {
        const std::string name = ClampOr(FieldOrNull(body, "name"), kMaxNameLength, kDefaultName);
        const std::string color = NormalizeColor(FieldOrNull(body, "color"));
        const std::string invite = ClampString(FieldOrNull(body, "invite"), kMaxInviteLength);

        if (!m_InviteCode.empty() && invite != m_InviteCode) {
            // No further session state for this connection: later packets that
            // race the close find no session and do nothing.
            m_Sessions.Remove(connectionId);
            m_Outbox.SendTo(connectionId, PacketType::Auth_Error,
                json{ { "message", "Invalid invite code." } }.dump());
            m_Outbox.Disconnect(connectionId);
            RelayTrace::log(connectionId, "step=auth_error");
            return;
        }

        if (!m_Sessions.Update(connectionId, name, color)) return;
        auto session = m_Sessions.Get(connectionId);
        if (!session) return;

        m_Outbox.SendTo(connectionId, PacketType::Channel_List, m_History.CatalogJSON());
        m_Outbox.SendTo(connectionId, PacketType::History, m_History.HistoryJSON(session->channelId));
        m_Outbox.SendTo(connectionId, PacketType::Auth_Ok,
            json{ { "name", name }, { "color", color }, { "channelId", session->channelId } }.dump());

        m_Presence.Set({ connectionId, name, color });
        RelayTrace::log(connectionId, "step=auth_ok name=" + name);
    }

    void RelayController::OnJoin(const std::string& connectionId, const json& body) {
        const std::string channelId = ClampOr(FieldOrNull(body, "channelId"), kMaxChannelIdLength, kDefaultChannel);
        m_History.Join(m_Sessions, connectionId, channelId);
    }

    void RelayController::OnMessage(const std::string& connectionId, const json& body) {
        const std::string type = ClampOr(FieldOrNull(body, "type"), kMaxKindLength, "text");
        const std::string text = ClampString(FieldOrNull(body, "text"), kMaxTextLength);
        const std::string url = ClampString(FieldOrNull(body, "url"), kMaxUrlLength);

        const bool isText = (type == "text");
        const bool isSticker = (type == "sticker");
        if (!isText && !isSticker) return;
        if (isText && text.empty()) return;
        if (isSticker && url.empty()) return;

        auto session = m_Sessions.Get(connectionId);
        if (!session) return;
        if (!m_History.HasChannel(session->channelId)) return;

        ChatMessage msg;
        msg.channelId = session->channelId;
        msg.user = session->name;
        msg.color = session->color;
        msg.type = type;
        msg.text = isText ? text : std::string();
        msg.url = isSticker ? url : std::string();
        m_History.Append(std::move(msg));
    }

    void RelayController::OnRtcJoin(const std::string& connectionId, const json& body) {
        if (!m_Sessions.Get(connectionId)) return;
        const std::string room = ClampOr(FieldOrNull(body, "room"), kMaxRoomLength, kDefaultRoom);
        m_VoiceRooms.Join(connectionId, room);
    }

    void RelayController::OnRtcLeave(const std::string& connectionId, const json& body) {
        const std::string room = ClampOr(FieldOrNull(body, "room"), kMaxRoomLength, kDefaultRoom);
        m_VoiceRooms.Leave(connectionId, room);
    }

    void RelayController::OnRtcSignal(SignalKind kind, const std::string& connectionId, const json& body) {
        if (!m_Sessions.Get(connectionId)) return;
        m_Signaling.Relay(kind, connectionId, body);
    }

} // namespace Qalla
