#include "VoiceRoomRegistry.h"
#include "RecordingOutbox.h"
#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>

using namespace Qalla;
using Qalla::Testing::RecordingOutbox;

namespace {

    class VoiceRoomRegistryTest : public ::testing::Test {
    protected:
        void SetUp() override {
            for (const char* id : { "p1", "p2", "p3", "p4", "p5" }) outbox.Connect(id);
        }

        RecordingOutbox   outbox;
        VoiceRoomRegistry rooms{ outbox };
    };

} // namespace

TEST_F(VoiceRoomRegistryTest, FirstJoinCreatesRoomAndRepliesWithNoPeers) {
    EXPECT_EQ(rooms.Join("p1", "general"), VoiceRoomRegistry::JoinResult::Joined);
    EXPECT_TRUE(rooms.HasRoom("general"));

    auto sent = outbox.SentTo("p1");
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].type, PacketType::Rtc_Peers);
    EXPECT_EQ(sent[0].body["room"], "general");
    EXPECT_TRUE(sent[0].body["peers"].empty());
}

TEST_F(VoiceRoomRegistryTest, JoinNotifiesExistingMembers) {
    rooms.Join("p1", "lounge");
    rooms.Join("p2", "lounge");
    outbox.Clear();

    rooms.Join("p3", "lounge");
    auto toNew = outbox.SentTo("p3");
    ASSERT_EQ(toNew.size(), 1u);
    EXPECT_EQ(toNew[0].body["peers"], nlohmann::json::array({ "p1", "p2" }));

    auto joined = outbox.SentOfType(PacketType::Rtc_Peer_Joined);
    ASSERT_EQ(joined.size(), 2u);
    EXPECT_EQ(joined[0].to, "p1");
    EXPECT_EQ(joined[1].to, "p2");
    EXPECT_EQ(joined[0].body["peerId"], "p3");
    EXPECT_EQ(joined[0].body["room"], "lounge");
}

TEST_F(VoiceRoomRegistryTest, FifthJoinIsDeniedWithoutChangingMembership) {
    for (const char* id : { "p1", "p2", "p3", "p4" })
        ASSERT_EQ(rooms.Join(id, "general"), VoiceRoomRegistry::JoinResult::Joined);
    outbox.Clear();

    EXPECT_EQ(rooms.Join("p5", "general"), VoiceRoomRegistry::JoinResult::Denied);
    EXPECT_EQ(rooms.Members("general").size(), VoiceRoomRegistry::kRoomCapacity);

    auto sent = outbox.Sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].to, "p5");
    EXPECT_EQ(sent[0].type, PacketType::Rtc_Join_Denied);
    EXPECT_EQ(sent[0].body["reason"], "Room full (max 4)");
}

TEST_F(VoiceRoomRegistryTest, RepeatedJoinDoesNotAnnounceAgain) {
    rooms.Join("p1", "general");
    rooms.Join("p2", "general");
    outbox.Clear();

    EXPECT_EQ(rooms.Join("p2", "general"), VoiceRoomRegistry::JoinResult::AlreadyMember);
    EXPECT_EQ(rooms.Members("general").size(), 2u);
    EXPECT_TRUE(outbox.SentOfType(PacketType::Rtc_Peer_Joined).empty());
    auto peers = outbox.SentTo("p2");
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers[0].body["peers"], nlohmann::json::array({ "p1" }));
}

TEST_F(VoiceRoomRegistryTest, MemberOfAFullRoomRejoinsWithoutDenial) {
    for (const char* id : { "p1", "p2", "p3", "p4" })
        ASSERT_EQ(rooms.Join(id, "general"), VoiceRoomRegistry::JoinResult::Joined);
    outbox.Clear();

    EXPECT_EQ(rooms.Join("p3", "general"), VoiceRoomRegistry::JoinResult::AlreadyMember);
    EXPECT_TRUE(outbox.SentOfType(PacketType::Rtc_Join_Denied).empty());
    auto sent = outbox.Sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].to, "p3");
    EXPECT_EQ(sent[0].type, PacketType::Rtc_Peers);
    EXPECT_EQ(sent[0].body["peers"], nlohmann::json::array({ "p1", "p2", "p4" }));
    EXPECT_EQ(rooms.Members("general").size(), VoiceRoomRegistry::kRoomCapacity);
}

TEST_F(VoiceRoomRegistryTest, LeaveNotifiesRemainingAndDestroysEmptyRoom) {
    rooms.Join("p1", "general");
    rooms.Join("p2", "general");
    outbox.Clear();

    EXPECT_TRUE(rooms.Leave("p1", "general"));
    auto left = outbox.SentOfType(PacketType::Rtc_Peer_Left);
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0].to, "p2");
    EXPECT_EQ(left[0].body["peerId"], "p1");

    EXPECT_TRUE(rooms.Leave("p2", "general"));
    EXPECT_FALSE(rooms.HasRoom("general"));
    EXPECT_EQ(rooms.RoomCount(), 0u);
}

TEST_F(VoiceRoomRegistryTest, LeavingARoomNeverJoinedIsANoOp) {
    rooms.Join("p1", "general");
    outbox.Clear();

    EXPECT_FALSE(rooms.Leave("p2", "general"));
    EXPECT_FALSE(rooms.Leave("p2", "nowhere"));
    EXPECT_TRUE(outbox.Sent().empty());
    EXPECT_EQ(rooms.Members("general"), std::vector<std::string>{ "p1" });
    EXPECT_FALSE(rooms.HasRoom("nowhere"));
}

TEST_F(VoiceRoomRegistryTest, DisconnectCleanupSweepsEveryRoom) {
    rooms.Join("p1", "a");
    rooms.Join("p2", "a");
    rooms.Join("p1", "b");
    rooms.Join("p3", "c");
    outbox.Clear();

    EXPECT_EQ(rooms.DisconnectCleanup("p1"), 2u);
    EXPECT_EQ(rooms.Members("a"), std::vector<std::string>{ "p2" });
    EXPECT_FALSE(rooms.HasRoom("b"));
    EXPECT_TRUE(rooms.HasRoom("c"));

    auto left = outbox.SentOfType(PacketType::Rtc_Peer_Left);
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0].to, "p2");
    EXPECT_EQ(left[0].body["room"], "a");
}

TEST_F(VoiceRoomRegistryTest, ConcurrentJoinsNeverExceedCapacity) {
    std::vector<std::thread> threads;
    std::atomic<int> joined{ 0 };
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([this, i, &joined] {
            if (rooms.Join("t" + std::to_string(i), "crowded") == VoiceRoomRegistry::JoinResult::Joined)
                ++joined;
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(joined.load(), 4);
    EXPECT_EQ(rooms.Members("crowded").size(), VoiceRoomRegistry::kRoomCapacity);
}
