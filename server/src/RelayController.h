#pragma once
#include "ChannelHistory.h"
#include "Outbox.h"
#include "PresenceTracker.h"
#include "Protocol.h"
#include "SessionRegistry.h"
#include "SignalingRelay.h"
#include "VoiceRoomRegistry.h"
#include <string>
#include <nlohmann/json.hpp>

namespace Qalla {

    // ---------------------------------------------------------------------------
    // Connection lifecycle: owns the shared registries and turns inbound events
    // into registry operations. Every handler treats bad input and a session that
    // has already been torn down as a silent no-op.
    // ---------------------------------------------------------------------------
    class RelayController {
    public:
        RelayController(Outbox& outbox, std::string inviteCode);

        void OnConnect(const std::string& connectionId);
        void OnDisconnect(const std::string& connectionId);

        // Routes one decoded client event. Returns false for types that are not
        // relay events (the transport handles those itself).
        bool Dispatch(const std::string& connectionId, PacketType type, const nlohmann::json& body);

        void OnHello(const std::string& connectionId, const nlohmann::json& body);
        void OnJoin(const std::string& connectionId, const nlohmann::json& body);
        void OnMessage(const std::string& connectionId, const nlohmann::json& body);
        void OnRtcJoin(const std::string& connectionId, const nlohmann::json& body);
        void OnRtcLeave(const std::string& connectionId, const nlohmann::json& body);
        void OnRtcSignal(SignalKind kind, const std::string& connectionId, const nlohmann::json& body);

        SessionRegistry& Sessions() { return m_Sessions; }
        ChannelHistoryStore& History() { return m_History; }
        PresenceTracker& Presence() { return m_Presence; }
        VoiceRoomRegistry& VoiceRooms() { return m_VoiceRooms; }

    private:
        Outbox&             m_Outbox;
        const std::string   m_InviteCode;
        SessionRegistry     m_Sessions;
        ChannelHistoryStore m_History;
        PresenceTracker     m_Presence;
        VoiceRoomRegistry   m_VoiceRooms;
        SignalingRelay      m_Signaling;
    };

} // namespace Qalla
