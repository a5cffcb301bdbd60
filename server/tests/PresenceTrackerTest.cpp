#include "PresenceTracker.h"
#include "RecordingOutbox.h"
#include <gtest/gtest.h>

using namespace Qalla;
using Qalla::Testing::RecordingOutbox;

TEST(PresenceTrackerTest, SetPublishesFullRosterToEveryone) {
    RecordingOutbox outbox;
    outbox.Connect("a");
    outbox.Connect("b");
    PresenceTracker presence(outbox);

    presence.Set({ "a", "Ana", "#111111" });
    presence.Set({ "b", "Ben", "#222222" });

    auto lists = outbox.SentOfType(PacketType::Presence_List);
    ASSERT_EQ(lists.size(), 4u);
    const auto& last = lists.back().body;
    ASSERT_EQ(last.size(), 2u);
    EXPECT_EQ(last[0]["id"], "a");
    EXPECT_EQ(last[0]["name"], "Ana");
    EXPECT_EQ(last[1]["color"], "#222222");
}

TEST(PresenceTrackerTest, RepeatedSetUpdatesInPlace) {
    RecordingOutbox outbox;
    PresenceTracker presence(outbox);
    presence.Set({ "a", "Ana", "#111111" });
    presence.Set({ "b", "Ben", "#222222" });
    presence.Set({ "a", "Anna", "#333333" });

    auto roster = presence.Roster();
    ASSERT_EQ(roster.size(), 2u);
    EXPECT_EQ(roster[0].id, "a");
    EXPECT_EQ(roster[0].name, "Anna");
    EXPECT_EQ(roster[1].id, "b");
}

TEST(PresenceTrackerTest, RemoveShrinksRosterAndRepublishes) {
    RecordingOutbox outbox;
    outbox.Connect("b");
    PresenceTracker presence(outbox);
    presence.Set({ "a", "Ana", "#111111" });
    presence.Set({ "b", "Ben", "#222222" });
    outbox.Clear();

    presence.Remove("a");
    EXPECT_EQ(presence.Size(), 1u);
    auto lists = outbox.SentOfType(PacketType::Presence_List);
    ASSERT_EQ(lists.size(), 1u);
    ASSERT_EQ(lists[0].body.size(), 1u);
    EXPECT_EQ(lists[0].body[0]["id"], "b");
}

TEST(PresenceTrackerTest, RemovingUnknownIdStillPublishes) {
    RecordingOutbox outbox;
    outbox.Connect("a");
    PresenceTracker presence(outbox);
    presence.Remove("ghost");
    auto lists = outbox.SentOfType(PacketType::Presence_List);
    ASSERT_EQ(lists.size(), 1u);
    EXPECT_TRUE(lists[0].body.empty());
}
