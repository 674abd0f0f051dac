#include <gtest/gtest.h>
#include <kara/timeline.hpp>
#include <string>

#include "ui/snapshot_history.hpp"

using namespace kara;

namespace
{

AnimationData make_data(int n)
{
    AnimationData data;
    for (int i = 0; i < n; ++i)
        data.add_line("line " + std::to_string(i), static_cast<float>(i), static_cast<float>(i) + 1.0f);
    return data;
}

}   // namespace

TEST(SnapshotHistory, StartsEmpty)
{
    SnapshotHistory history;
    EXPECT_FALSE(history.can_undo());
    EXPECT_FALSE(history.can_redo());
    EXPECT_EQ(history.capacity(), SnapshotHistory::DEFAULT_CAPACITY);
    EXPECT_EQ(history.undo_description(), "");

    AnimationData live = make_data(1);
    EXPECT_FALSE(history.undo(live));
    EXPECT_FALSE(history.redo(live));
    EXPECT_EQ(live, make_data(1));
}

TEST(SnapshotHistory, UndoRestoresSnapshot)
{
    SnapshotHistory history;
    AnimationData   live = make_data(1);

    history.push("Add line", live);
    live.add_line("extra", 5.0f, 6.0f);

    EXPECT_EQ(history.undo_description(), "Add line");
    ASSERT_TRUE(history.undo(live));
    EXPECT_EQ(live, make_data(1));
    EXPECT_TRUE(history.can_redo());
    EXPECT_EQ(history.redo_description(), "Add line");
}

TEST(SnapshotHistory, RedoReappliesUndoneEdit)
{
    SnapshotHistory history;
    AnimationData   live = make_data(1);

    history.push("Edit", live);
    live = make_data(3);

    ASSERT_TRUE(history.undo(live));
    ASSERT_TRUE(history.redo(live));
    EXPECT_EQ(live, make_data(3));
    EXPECT_TRUE(history.can_undo());
    EXPECT_FALSE(history.can_redo());
}

TEST(SnapshotHistory, PushDropsRedo)
{
    SnapshotHistory history;
    AnimationData   live = make_data(1);

    history.push("First", live);
    live = make_data(2);
    history.undo(live);
    ASSERT_TRUE(history.can_redo());

    history.push("Second", live);
    EXPECT_FALSE(history.can_redo());
    EXPECT_EQ(history.undo_count(), 1u);
}

TEST(SnapshotHistory, MultipleUndoWalksBack)
{
    SnapshotHistory history;
    AnimationData   live = make_data(0);

    for (int i = 1; i <= 3; ++i)
    {
        history.push("step", live);
        live = make_data(i);
    }

    history.undo(live);
    EXPECT_EQ(live, make_data(2));
    history.undo(live);
    EXPECT_EQ(live, make_data(1));
    history.undo(live);
    EXPECT_EQ(live, make_data(0));
    EXPECT_FALSE(history.undo(live));
    EXPECT_EQ(history.redo_count(), 3u);
}

TEST(SnapshotHistory, CapacityDropsOldest)
{
    SnapshotHistory history(3);
    AnimationData   live = make_data(0);

    for (int i = 1; i <= 5; ++i)
    {
        history.push("step", live);
        live = make_data(i);
    }
    EXPECT_EQ(history.undo_count(), 3u);

    while (history.undo(live))
    {
    }
    EXPECT_EQ(live, make_data(2));
}

TEST(SnapshotHistory, ZeroCapacityKeepsOne)
{
    SnapshotHistory history(0);
    EXPECT_EQ(history.capacity(), 1u);
}

TEST(SnapshotHistory, SnapshotsAreIndependentCopies)
{
    SnapshotHistory history;
    AnimationData   live = make_data(1);

    history.push("Rename", live);
    live.lines[0].text = "changed";

    history.undo(live);
    EXPECT_EQ(live.lines[0].text, "line 0");
}

TEST(SnapshotHistory, Clear)
{
    SnapshotHistory history;
    AnimationData   live = make_data(1);
    history.push("a", live);
    history.push("b", live);
    history.undo(live);

    history.clear();
    EXPECT_FALSE(history.can_undo());
    EXPECT_FALSE(history.can_redo());
}
