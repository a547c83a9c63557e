#include <gtest/gtest.h>
#include <hostkit/ui_scheduler.hpp>
#include <stdexcept>
#include <vector>

#include "host/event_dispatcher.hpp"

using namespace hostkit;

namespace
{

class FakeContext : public DispatchContext
{
   public:
    Host* dispatch_host() override { return nullptr; }
    bool  is_host_closed() const override { return host_closed; }
    void  set_restore_max_intent(bool value) override { restore_max_intent = value; }
    void  request_focus_gain_async() override { ++focus_requests; }
    void  on_client_focus_gained() override { ++focus_gained; }
    void  on_client_focus_lost() override { ++focus_lost; }
    void  on_closed_event_firing() override { ++closed_firing; }
    void  handle_exception(std::exception_ptr e) override { errors.push_back(e); }
    double now_s() const override { return now; }

    bool   host_closed        = false;
    bool   restore_max_intent = false;
    int    focus_requests     = 0;
    int    focus_gained       = 0;
    int    focus_lost         = 0;
    int    closed_firing      = 0;
    double now                = 0.0;

    std::vector<std::exception_ptr> errors;
};

class StateCheckingClient : public HostClient
{
   public:
    const EventDispatcher* dispatcher = nullptr;
    std::vector<bool>      focused_seen;
    bool                   throw_on_shown = false;

    void on_shown(const WindowEvent&) override
    {
        if (throw_on_shown)
            throw std::runtime_error("listener failed");
    }
    void on_focus_gained(const WindowEvent&) override
    {
        focused_seen.push_back(dispatcher->state().focused);
    }
};

class EventDispatcherTest : public ::testing::Test
{
   protected:
    EventDispatcherTest()
        : enforcer(config),
          paint(scheduler,
                config,
                {.is_showing    = [] { return true; },
                 .can_paint_now = [] { return true; },
                 .paint         = [](const Rect&) {}}),
          client(std::make_shared<StateCheckingClient>()),
          dispatcher(client, config, context, {stability, drag, enforcer, paint})
    {
        client->dispatcher = &dispatcher;
    }

    ManualScheduler                      scheduler;
    HostConfig                           config;
    FakeContext                          context;
    StabilityTracker                     stability;
    DragStabilizer                       drag;
    BoundsEnforcer                       enforcer;
    PaintScheduler                       paint;
    std::shared_ptr<StateCheckingClient> client;
    EventDispatcher                      dispatcher;
};

}   // namespace

TEST(EventDispatcher, NullClientRejected)
{
    ManualScheduler  scheduler;
    HostConfig       config;
    FakeContext      context;
    StabilityTracker stability;
    DragStabilizer   drag;
    BoundsEnforcer   enforcer(config);
    PaintScheduler   paint(scheduler, config, {});

    const EventDispatcher::Parts parts{stability, drag, enforcer, paint};
    EXPECT_THROW(EventDispatcher dispatcher(nullptr, config, context, parts), std::invalid_argument);
}

TEST_F(EventDispatcherTest, StateUpdatedBeforeListener)
{
    dispatcher.fire(WindowEventType::Shown);
    dispatcher.fire(WindowEventType::FocusGained);
    ASSERT_EQ(client->focused_seen.size(), 1u);
    EXPECT_TRUE(client->focused_seen[0]);
    EXPECT_EQ(dispatcher.fired_count(), 2u);
}

TEST_F(EventDispatcherTest, AppliesEveryStateEvent)
{
    dispatcher.fire(WindowEventType::Shown);
    dispatcher.fire(WindowEventType::Maximized);
    dispatcher.fire(WindowEventType::Iconified);
    EXPECT_TRUE(dispatcher.state().showing);
    EXPECT_TRUE(dispatcher.state().maximized);
    EXPECT_TRUE(dispatcher.state().iconified);
    EXPECT_FALSE(dispatcher.state().is_showing_deico());

    dispatcher.fire(WindowEventType::Deiconified);
    dispatcher.fire(WindowEventType::Demaximized);
    dispatcher.fire(WindowEventType::Hidden);
    dispatcher.fire(WindowEventType::Closed);
    EXPECT_FALSE(dispatcher.state().showing);
    EXPECT_FALSE(dispatcher.state().maximized);
    EXPECT_TRUE(dispatcher.state().closed);
    EXPECT_EQ(context.closed_firing, 1);
}

TEST_F(EventDispatcherTest, BoundsEventsClearPendingFlags)
{
    dispatcher.set_move_pending();
    dispatcher.set_resize_pending();
    dispatcher.fire(WindowEventType::Moved);
    EXPECT_FALSE(dispatcher.state().move_pending);
    EXPECT_TRUE(dispatcher.state().resize_pending);
    dispatcher.fire(WindowEventType::Resized);
    EXPECT_FALSE(dispatcher.state().resize_pending);
}

TEST_F(EventDispatcherTest, FiringClearsDetectionAndProgrammaticFlags)
{
    stability.before_programmatic(WindowEventType::Iconified, 0.0);
    stability.gate(WindowEventType::Iconified, 0.0, GateParams{});
    dispatcher.fire(WindowEventType::Shown);
    dispatcher.fire(WindowEventType::Iconified);
    EXPECT_FALSE(stability.direction(WindowEventType::Iconified).detected_not_fired);
    EXPECT_FALSE(stability.is_programmatic_pending(WindowEventType::Iconified));
}

TEST_F(EventDispatcherTest, FocusEventsMarkUnstabilityAndRepaint)
{
    dispatcher.fire(WindowEventType::Shown);
    context.now = 2.5;
    dispatcher.fire(WindowEventType::FocusGained);
    EXPECT_DOUBLE_EQ(stability.newest_unstability_s(), 2.5);
    EXPECT_TRUE(paint.is_paint_pending());
    EXPECT_EQ(paint.dirty_region().peek(), Rect::huge());
    EXPECT_EQ(context.focus_gained, 1);

    context.now = 3.0;
    dispatcher.fire(WindowEventType::FocusLost);
    EXPECT_DOUBLE_EQ(stability.newest_unstability_s(), 3.0);
    EXPECT_EQ(context.focus_lost, 1);
}

TEST_F(EventDispatcherTest, StateChangesCancelDrag)
{
    for (WindowEventType type : {WindowEventType::Hidden,
                                 WindowEventType::FocusLost,
                                 WindowEventType::Iconified,
                                 WindowEventType::Maximized,
                                 WindowEventType::Demaximized})
    {
        drag.on_press({0, 0, 10, 10}, {0, 0, 10, 10});
        dispatcher.fire(type);
        EXPECT_FALSE(drag.is_press_detected()) << to_string(type);
    }
}

TEST_F(EventDispatcherTest, ShownSetsRestoreIntentUnlessIconified)
{
    dispatcher.fire(WindowEventType::Shown);
    EXPECT_TRUE(context.restore_max_intent);

    dispatcher.fire(WindowEventType::Iconified);
    dispatcher.fire(WindowEventType::Hidden);
    context.restore_max_intent = true;
    dispatcher.fire(WindowEventType::Shown);
    EXPECT_FALSE(context.restore_max_intent);
}

TEST_F(EventDispatcherTest, DeiconifiedRequestsFocusAndRestoreIntent)
{
    dispatcher.fire(WindowEventType::Shown);
    dispatcher.fire(WindowEventType::Iconified);
    context.restore_max_intent = false;
    dispatcher.fire(WindowEventType::Deiconified);
    EXPECT_EQ(context.focus_requests, 1);
    EXPECT_TRUE(context.restore_max_intent);
}

TEST_F(EventDispatcherTest, MaximizedArmsEnforcementWhenConfigured)
{
    config.enforce_bounds_on_maximize = true;
    dispatcher.fire(WindowEventType::Shown);
    dispatcher.fire(WindowEventType::Maximized);
    EXPECT_TRUE(enforcer.is_max_pending());
}

TEST_F(EventDispatcherTest, ListenerExceptionsPropagateByDefault)
{
    client->throw_on_shown = true;
    EXPECT_THROW(dispatcher.fire(WindowEventType::Shown), std::runtime_error);
    EXPECT_TRUE(dispatcher.state().showing);
    EXPECT_TRUE(context.errors.empty());
}

TEST_F(EventDispatcherTest, ListenerExceptionsRoutedWhenConfigured)
{
    config.use_exception_handler_for_client = true;
    client->throw_on_shown                  = true;
    EXPECT_NO_THROW(dispatcher.fire(WindowEventType::Shown));
    EXPECT_EQ(context.errors.size(), 1u);
}
