#include "SignalingRelay.h"
#include "Sanitizer.h"
#include "Logger.h"

using json = nlohmann::json;

namespace Qalla {

    SignalingRelay::SignalingRelay(Outbox& outbox)
        : m_Outbox(outbox) {
    }

    PacketType SignalingRelay::PacketFor(SignalKind kind) noexcept {
        switch (kind) {
        case SignalKind::Offer:  return PacketType::Rtc_Offer;
        case SignalKind::Answer: return PacketType::Rtc_Answer;
        case SignalKind::Ice:    return PacketType::Rtc_Ice;
        }
        return PacketType::Rtc_Ice;
    }

    const char* SignalingRelay::PayloadField(SignalKind kind) noexcept {
        return kind == SignalKind::Ice ? "candidate" : "sdp";
    }

    bool SignalingRelay::Relay(SignalKind kind, const std::string& fromId, const json& body) {
        const json& to = FieldOrNull(body, "to");
        const char* field = PayloadField(kind);
        const json& payload = FieldOrNull(body, field);
        if (!to.is_string() || !IsPresent(to) || !IsPresent(payload)) return false;

        json out;
        out["from"] = fromId;
        out["room"] = ClampString(FieldOrNull(body, "room"), kMaxRoomLength);
        out[field] = payload;

        const std::string& target = to.get_ref<const std::string&>();
        const bool delivered = m_Outbox.SendTo(target, PacketFor(kind), out.dump());
        RelayTrace::log(fromId, std::string("step=") + PacketTypeName(PacketFor(kind))
            + " to=" + target
            + " delivered=" + (delivered ? "1" : "0"));
        return delivered;
    }

} // namespace Qalla
