#include "Protocol.h"
#include <gtest/gtest.h>

using namespace Qalla;

TEST(ProtocolTest, HeaderIsFiveBytesPacked) {
    EXPECT_EQ(sizeof(PacketHeader), 5u);
}

TEST(ProtocolTest, MakePacketWritesBigEndianLength) {
    auto buf = MakePacket(PacketType::Message, std::string(300, 'x'));
    ASSERT_EQ(buf->size(), sizeof(PacketHeader) + 300);
    EXPECT_EQ((*buf)[0], static_cast<uint8_t>(PacketType::Message));
    EXPECT_EQ((*buf)[1], 0x00);
    EXPECT_EQ((*buf)[2], 0x00);
    EXPECT_EQ((*buf)[3], 0x01);
    EXPECT_EQ((*buf)[4], 0x2C);
    EXPECT_EQ((*buf)[5], 'x');
}

TEST(ProtocolTest, HeaderRestoresHostOrder) {
    auto buf = MakePacket(PacketType::Rtc_Ice, std::string("{}"));
    PacketHeader h{};
    std::memcpy(&h, buf->data(), sizeof(h));
    h.ToHost();
    EXPECT_EQ(h.type, PacketType::Rtc_Ice);
    EXPECT_EQ(h.size, 2u);
}

TEST(ProtocolTest, EmptyBodyProducesHeaderOnly) {
    auto buf = MakePacket(PacketType::Sticker_Fetch_Response, nullptr, 0);
    EXPECT_EQ(buf->size(), sizeof(PacketHeader));
}

TEST(ProtocolTest, PacketNamesMatchEventNames) {
    EXPECT_STREQ(PacketTypeName(PacketType::Hello), "hello");
    EXPECT_STREQ(PacketTypeName(PacketType::Presence_List), "presence:list");
    EXPECT_STREQ(PacketTypeName(PacketType::Rtc_Join_Denied), "rtc:join_denied");
}
