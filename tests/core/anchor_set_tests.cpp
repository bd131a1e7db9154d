#include <gtest/gtest.h>

#include "../../src/core/anchor_set.h"

using xanchor::core::AnchorRecord;
using xanchor::core::AnchorSet;

static AnchorRecord Record(xanchor::core::AnchorHandle handle, float x = 0.0f) {
    AnchorRecord record;
    record.handle = handle;
    record.world_pose.orientation = XrQuaternionf{0.0f, 0.0f, 0.0f, 1.0f};
    record.world_pose.position = XrVector3f{x, 0.0f, 0.0f};
    return record;
}

TEST(AnchorSetTest, Insert_KeepsInsertionOrder) {
    AnchorSet set;
    EXPECT_TRUE(set.Insert(Record(30)));
    EXPECT_TRUE(set.Insert(Record(10)));
    EXPECT_TRUE(set.Insert(Record(20)));

    ASSERT_EQ(set.Size(), 3u);
    EXPECT_EQ(set.Records()[0].handle, 30u);
    EXPECT_EQ(set.Records()[1].handle, 10u);
    EXPECT_EQ(set.Records()[2].handle, 20u);
}

TEST(AnchorSetTest, Insert_DuplicateHandle_Rejected) {
    AnchorSet set;
    ASSERT_TRUE(set.Insert(Record(5, 1.0f)));

    EXPECT_FALSE(set.Insert(Record(5, 2.0f)));
    EXPECT_EQ(set.Size(), 1u);
    EXPECT_FLOAT_EQ(set.Find(5)->world_pose.position.x, 1.0f);
}

TEST(AnchorSetTest, Insert_NullHandle_Rejected) {
    AnchorSet set;
    EXPECT_FALSE(set.Insert(Record(xanchor::core::XA_NULL_ANCHOR)));
    EXPECT_TRUE(set.Empty());
}

TEST(AnchorSetTest, Erase_Middle_ReindexesRemaining) {
    AnchorSet set;
    set.Insert(Record(1, 1.0f));
    set.Insert(Record(2, 2.0f));
    set.Insert(Record(3, 3.0f));

    EXPECT_TRUE(set.Erase(2));
    EXPECT_FALSE(set.Erase(2));

    ASSERT_EQ(set.Size(), 2u);
    EXPECT_FALSE(set.Contains(2));
    ASSERT_NE(set.Find(3), nullptr);
    EXPECT_FLOAT_EQ(set.Find(3)->world_pose.position.x, 3.0f);
    EXPECT_EQ(set.Records()[1].handle, 3u);
}

TEST(AnchorSetTest, Find_Mutable_UpdatesInPlace) {
    AnchorSet set;
    set.Insert(Record(8));

    set.Find(8)->is_persisted = true;
    set.Find(8)->persisted_name = "anchor/0008";

    const AnchorSet& view = set;
    EXPECT_TRUE(view.Find(8)->is_persisted);
    EXPECT_EQ(view.Find(8)->persisted_name, "anchor/0008");
    EXPECT_EQ(view.Find(9), nullptr);
}

TEST(AnchorSetTest, Clear_RemovesEverything) {
    AnchorSet set;
    set.Insert(Record(1));
    set.Insert(Record(2));

    set.Clear();

    EXPECT_TRUE(set.Empty());
    EXPECT_FALSE(set.Contains(1));
    EXPECT_TRUE(set.Insert(Record(1)));
}
