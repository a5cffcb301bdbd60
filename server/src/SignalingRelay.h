#pragma once
#include "Outbox.h"
#include <string>
#include <nlohmann/json.hpp>

namespace Qalla {

    enum class SignalKind {
        Offer,
        Answer,
        Ice
    };

    // Point-to-point forwarding of WebRTC signaling. The server does not check
    // that sender and recipient share a room; the room tag is for the client.
    class SignalingRelay {
    public:
        explicit SignalingRelay(Outbox& outbox);

        // body: {to, room, sdp} for offer/answer, {to, room, candidate} for ICE.
        // Returns true if a packet was handed to the recipient's connection.
        bool Relay(SignalKind kind, const std::string& fromId, const nlohmann::json& body);

        static PacketType PacketFor(SignalKind kind) noexcept;
        static const char* PayloadField(SignalKind kind) noexcept;

    private:
        Outbox& m_Outbox;
    };

} // namespace Qalla
