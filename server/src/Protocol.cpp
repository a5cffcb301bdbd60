#include "Protocol.h"

namespace Qalla {

    const char* PacketTypeName(PacketType type) noexcept {
        switch (type) {
        case PacketType::Hello:                   return "hello";
        case PacketType::Auth_Ok:                 return "auth:ok";
        case PacketType::Auth_Error:              return "auth:error";
        case PacketType::Channel_List:            return "channels";
        case PacketType::Join_Channel:            return "join";
        case PacketType::History:                 return "history";
        case PacketType::Message:                 return "message";
        case PacketType::Presence_List:           return "presence:list";
        case PacketType::Rtc_Join:                return "rtc:join";
        case PacketType::Rtc_Leave:               return "rtc:leave";
        case PacketType::Rtc_Peers:               return "rtc:peers";
        case PacketType::Rtc_Peer_Joined:         return "rtc:peer_joined";
        case PacketType::Rtc_Peer_Left:           return "rtc:peer_left";
        case PacketType::Rtc_Join_Denied:         return "rtc:join_denied";
        case PacketType::Rtc_Offer:               return "rtc:offer";
        case PacketType::Rtc_Answer:              return "rtc:answer";
        case PacketType::Rtc_Ice:                 return "rtc:ice";
        case PacketType::Sticker_Upload_Request:  return "sticker:upload";
        case PacketType::Sticker_Upload_Chunk:    return "sticker:chunk";
        case PacketType::Sticker_Upload_Complete: return "sticker:complete";
        case PacketType::Sticker_Upload_Result:   return "sticker:result";
        case PacketType::Sticker_Fetch_Request:   return "sticker:fetch";
        case PacketType::Sticker_Fetch_Response:  return "sticker:data";
        case PacketType::Echo_Request:            return "echo";
        case PacketType::Echo_Response:           return "echo:reply";
        case PacketType::Health_Request:          return "health";
        case PacketType::Health_Response:         return "health:reply";
        }
        return "unknown";
    }

} // namespace Qalla
