#include <gtest/gtest.h>

#include "host/drag_stabilizer.hpp"

using namespace hostkit;

TEST(DragStabilizer, PressCapturesBounds)
{
    DragStabilizer d;
    EXPECT_FALSE(d.is_press_detected());

    d.on_press({10, 20, 300, 200}, {6, 0, 308, 224});
    EXPECT_TRUE(d.is_press_detected());
    EXPECT_FALSE(d.is_move_detected());
    EXPECT_EQ(d.client_bounds_at_press(), (Rect{10, 20, 300, 200}));
    EXPECT_EQ(d.window_bounds_at_press(), (Rect{6, 0, 308, 224}));
}

TEST(DragStabilizer, MoveWithoutPressIsIgnored)
{
    DragStabilizer d;
    d.on_drag_move(false);
    EXPECT_FALSE(d.is_move_detected());
    EXPECT_EQ(d.client_bounds_at_press(), Rect{});
}

TEST(DragStabilizer, BlockedMoveIsNotDetected)
{
    DragStabilizer d;
    d.on_press({0, 0, 10, 10}, {0, 0, 10, 10});
    d.on_drag_move(true);
    EXPECT_FALSE(d.is_move_detected());
    d.on_drag_move(false);
    EXPECT_TRUE(d.is_move_detected());
}

TEST(DragStabilizer, EndReturnsLastQueuedTargetAfterMove)
{
    DragStabilizer d;
    d.on_press({0, 0, 10, 10}, {0, 0, 10, 10});
    d.on_drag_move(false);
    d.queue_target({{1, 1, 50, 50}, BoundsSpace::Client});
    d.queue_target({{2, 2, 60, 60}, BoundsSpace::Window});
    ASSERT_TRUE(d.queued_target().has_value());

    const auto target = d.end();
    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target->rect, (Rect{2, 2, 60, 60}));
    EXPECT_EQ(target->space, BoundsSpace::Window);
    EXPECT_FALSE(d.is_press_detected());
    EXPECT_FALSE(d.queued_target().has_value());
}

TEST(DragStabilizer, EndWithoutMoveDropsTarget)
{
    DragStabilizer d;
    d.on_press({0, 0, 10, 10}, {0, 0, 10, 10});
    d.queue_target({{1, 1, 50, 50}, BoundsSpace::Client});
    EXPECT_FALSE(d.end().has_value());
}

TEST(DragStabilizer, QueueWithoutSessionIsIgnored)
{
    DragStabilizer d;
    d.queue_target({{1, 1, 50, 50}, BoundsSpace::Client});
    EXPECT_FALSE(d.queued_target().has_value());
    EXPECT_FALSE(d.end().has_value());
}

TEST(DragStabilizer, CancelDiscardsEverything)
{
    DragStabilizer d;
    d.on_press({0, 0, 10, 10}, {0, 0, 10, 10});
    d.on_drag_move(false);
    d.queue_target({{1, 1, 50, 50}, BoundsSpace::Client});
    d.cancel();
    EXPECT_FALSE(d.is_press_detected());
    EXPECT_FALSE(d.end().has_value());
}

TEST(DragStabilizer, NewPressStartsFreshSession)
{
    DragStabilizer d;
    d.on_press({0, 0, 10, 10}, {0, 0, 10, 10});
    d.on_drag_move(false);
    d.on_press({5, 5, 10, 10}, {5, 5, 10, 10});
    EXPECT_FALSE(d.is_move_detected());
    EXPECT_EQ(d.client_bounds_at_press(), (Rect{5, 5, 10, 10}));
}
