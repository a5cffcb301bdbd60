#pragma once
#include <cstdint>
#include <cstring>
#include <cstddef>
#include <memory>
#include <vector>
#include <string>

namespace Qalla {

    // ---------------------------------------------------------------------------
    // Endianness detection, C++17 compatible.
    //
    // std::memcpy into uint8_t reads the object representation without a
    // pointer-cast aliasing warning.
    // ---------------------------------------------------------------------------
    namespace detail {
        inline bool IsLittleEndian() noexcept {
            static constexpr uint32_t kOne = 1u;
            uint8_t b;
            std::memcpy(&b, &kOne, 1);
            return b == 1u;
        }
    }

    inline uint32_t Swap32(uint32_t v) noexcept {
        return ((v & 0xFFU) << 24) | ((v & 0xFF00U) << 8)
            | ((v & 0xFF0000U) >> 8) | ((v & 0xFF000000U) >> 24);
    }

    inline uint32_t HostToNet32(uint32_t v) noexcept {
        return detail::IsLittleEndian() ? Swap32(v) : v;
    }
    inline uint32_t NetToHost32(uint32_t v) noexcept { return HostToNet32(v); }

    constexpr uint16_t SERVER_PORT = 3000;

    // Bodies above this size close the connection.
    constexpr uint32_t kMaxPacketBody = 10 * 1024 * 1024;

    // Field limits applied by the sanitizer.
    constexpr size_t kMaxNameLength = 32;
    constexpr size_t kMaxInviteLength = 64;
    constexpr size_t kMaxChannelIdLength = 32;
    constexpr size_t kMaxKindLength = 16;
    constexpr size_t kMaxTextLength = 2000;
    constexpr size_t kMaxUrlLength = 400;
    constexpr size_t kMaxRoomLength = 32;

    constexpr const char* kDefaultName = "Guest";
    constexpr const char* kDefaultColor = "#5865F2";
    constexpr const char* kDefaultChannel = "general";
    constexpr const char* kDefaultRoom = "general";

    enum class PacketType : uint8_t {
        // --- HANDSHAKE ---
        Hello,               // Client -> Server: {name, color, invite}
        Auth_Ok,             // Server -> Client: {name, color, channelId}
        Auth_Error,          // Server -> Client: {message}, connection closes afterwards
        Channel_List,        // Server -> Client: [{id, name}]

        // --- CHAT ---
        Join_Channel,        // Client -> Server: {channelId}
        History,             // Server -> Client: {channelId, messages}
        Message,             // Client -> Server: {type, text, url}; Server -> All: full message

        // --- PRESENCE ---
        Presence_List,       // Server -> All: [{id, name, color}]

        // --- VOICE SIGNALING ---
        Rtc_Join,            // Client -> Server: {room}
        Rtc_Leave,           // Client -> Server: {room}
        Rtc_Peers,           // Server -> Client: {room, peers}
        Rtc_Peer_Joined,     // Server -> Room: {room, peerId}
        Rtc_Peer_Left,       // Server -> Room: {room, peerId}
        Rtc_Join_Denied,     // Server -> Client: {reason}
        Rtc_Offer,           // Client -> Server: {to, room, sdp}; Server -> Peer: {from, room, sdp}
        Rtc_Answer,          // Client -> Server: {to, room, sdp}; Server -> Peer: {from, room, sdp}
        Rtc_Ice,             // Client -> Server: {to, room, candidate}; Server -> Peer: {from, room, candidate}

        // --- STICKERS ---
        Sticker_Upload_Request,   // Client -> Server: {mime, size}
        Sticker_Upload_Chunk,     // Client -> Server: raw bytes
        Sticker_Upload_Complete,  // Client -> Server: {}
        Sticker_Upload_Result,    // Server -> Client: {ok, ...}
        Sticker_Fetch_Request,    // Client -> Server: {url}
        Sticker_Fetch_Response,   // Server -> Client: raw bytes, empty when unknown

        // --- DIAGNOSTIC ---
        Echo_Request,
        Echo_Response,
        Health_Request,
        Health_Response
    };

    const char* PacketTypeName(PacketType type) noexcept;

#pragma pack(push, 1)
    struct PacketHeader {
        PacketType type;
        uint32_t   size;

        void ToNetwork() { size = HostToNet32(size); }
        void ToHost() { size = NetToHost32(size); }
    };
#pragma pack(pop)

    // Frames a body behind a network-order header. The buffer is shared so one
    // encoded packet can be queued on many sessions.
    inline std::shared_ptr<std::vector<uint8_t>>
        MakePacket(PacketType type, const uint8_t* data, size_t len) {
        PacketHeader header{ type, static_cast<uint32_t>(len) };
        header.ToNetwork();
        auto buf = std::make_shared<std::vector<uint8_t>>(sizeof(header) + len);
        std::memcpy(buf->data(), &header, sizeof(header));
        if (len > 0) std::memcpy(buf->data() + sizeof(header), data, len);
        return buf;
    }

    inline std::shared_ptr<std::vector<uint8_t>>
        MakePacket(PacketType type, const std::string& data) {
        return MakePacket(type, reinterpret_cast<const uint8_t*>(data.data()), data.size());
    }

} // namespace Qalla
