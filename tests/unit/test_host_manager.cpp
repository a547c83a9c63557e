#include <algorithm>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#include "fake_backing_window.hpp"

using namespace hostkit;
using namespace hostkit::test;

using E = WindowEventType;

namespace
{

class LifecycleRecorder : public HostLifecycleListener
{
   public:
    std::vector<std::string> calls;

    void on_host_created(Host& h) override { calls.push_back("created:" + h.title()); }
    void on_host_closing(Host& h) override { calls.push_back("closing:" + h.title()); }
    void on_host_closed_event_firing(Host& h) override { calls.push_back("closed:" + h.title()); }
};

}   // namespace

class HostManagerTest : public HostFixture
{
};

// ─── Creation ────────────────────────────────────────────────────────────────

TEST_F(HostManagerTest, InvalidConfigRejected)
{
    HostConfig bad;
    bad.event_logic_period_s = 0.0;
    EXPECT_THROW(HostManager rejected(scheduler, bad), std::invalid_argument);
}

TEST_F(HostManagerTest, NullArgumentsRejected)
{
    EXPECT_THROW(manager().create_host(nullptr, std::make_shared<RecordingClient>()),
                 std::invalid_argument);
    EXPECT_THROW(manager().create_host(std::make_unique<FakeBackingWindow>(), nullptr),
                 std::invalid_argument);
    EXPECT_EQ(manager().host_count(), 0u);
}

TEST_F(HostManagerTest, RegistryQueries)
{
    auto a = create_host("a");
    auto b = create_host("b");
    EXPECT_EQ(a.host->id(), 1u);
    EXPECT_EQ(b.host->id(), 2u);
    EXPECT_EQ(a.host->title(), "a");
    EXPECT_EQ(&a.host->manager(), &manager());

    EXPECT_EQ(manager().host_count(), 2u);
    EXPECT_EQ(manager().hosts(), (std::vector<Host*>{a.host, b.host}));
    EXPECT_EQ(manager().find_host(2), b.host);
    EXPECT_EQ(manager().find_host(7), nullptr);
    EXPECT_TRUE(manager().any_host_open());
}

TEST_F(HostManagerTest, HostsAreSharedAndOnlyMadeByManager)
{
    static_assert(!std::is_default_constructible_v<Host::ConstructionKey>);

    auto c = create_host();
    const std::shared_ptr<Host> shared = c.host->shared_from_this();
    EXPECT_EQ(shared.get(), c.host);
    EXPECT_GE(shared.use_count(), 2);
}

TEST_F(HostManagerTest, DialogsBelongToOwner)
{
    auto top = create_host("main");
    auto d   = create_dialog(*top.host, "d");
    EXPECT_EQ(d.host->owner(), top.host);
    EXPECT_EQ(top.host->owner(), nullptr);
    EXPECT_EQ(top.host->dialogs(), (std::vector<Host*>{d.host}));
    EXPECT_EQ(manager().host_count(), 2u);

    d.host->close();
    EXPECT_TRUE(top.host->dialogs().empty());
    EXPECT_EQ(manager().hosts(), (std::vector<Host*>{top.host}));
}

TEST_F(HostManagerTest, DialogOfClosedOwnerRejected)
{
    auto top  = create_host("main");
    auto keep = create_host("keep");
    top.host->close();
    // The closed host stays alive until the next periodic run.
    EXPECT_THROW(create_dialog(*top.host), std::logic_error);
    EXPECT_EQ(manager().hosts(), (std::vector<Host*>{keep.host}));
}

TEST_F(HostManagerTest, DialogOfForeignOwnerRejected)
{
    HostManager other(scheduler, config);
    Host* foreign = other.create_host(std::make_unique<FakeBackingWindow>(),
                                      std::make_shared<RecordingClient>());
    EXPECT_THROW(create_dialog(*foreign), std::invalid_argument);
}

TEST_F(HostManagerTest, CreationFromOtherThreadRejected)
{
    manager();
    bool threw = false;
    std::thread other(
        [&]
        {
            try
            {
                manager().create_host(std::make_unique<FakeBackingWindow>(),
                                      std::make_shared<RecordingClient>());
            }
            catch (const std::logic_error&)
            {
                threw = true;
            }
        });
    other.join();
    EXPECT_TRUE(threw);
    EXPECT_EQ(manager().host_count(), 0u);
}

// ─── Lifecycle listener ──────────────────────────────────────────────────────

TEST_F(HostManagerTest, ListenerSeesCreationAndTeardown)
{
    LifecycleRecorder recorder;
    manager().set_lifecycle_listener(&recorder);

    auto c = create_host("main");
    c.host->close();
    EXPECT_EQ(recorder.calls,
              (std::vector<std::string>{"created:main", "closing:main", "closed:main"}));
    EXPECT_EQ(c.client->events, (std::vector<E>{E::Closed}));

    manager().set_lifecycle_listener(nullptr);
}

TEST_F(HostManagerTest, ClosedHostLeavesRegistry)
{
    auto a = create_host("a");
    auto b = create_host("b");
    a.host->close();
    EXPECT_EQ(manager().hosts(), (std::vector<Host*>{b.host}));
    EXPECT_EQ(manager().find_host(1), nullptr);
    EXPECT_TRUE(manager().any_host_open());

    b.host->close();
    EXPECT_EQ(manager().host_count(), 0u);
    EXPECT_FALSE(manager().any_host_open());
    settle();
}

// ─── Focus tracking ──────────────────────────────────────────────────────────

TEST_F(HostManagerTest, TracksHostOfFocusedClient)
{
    EXPECT_EQ(manager().host_of_focused_client(), nullptr);

    auto c = create_shown_focused("main");
    EXPECT_EQ(manager().host_of_focused_client(), c.host);

    c.backing->user_focus(false);
    EXPECT_EQ(manager().host_of_focused_client(), nullptr);

    c.backing->user_focus(true);
    EXPECT_EQ(manager().host_of_focused_client(), c.host);

    c.host->close();
    EXPECT_EQ(manager().host_of_focused_client(), nullptr);
}

// ─── Periodic event logic ────────────────────────────────────────────────────

TEST_F(HostManagerTest, StartAndStop)
{
    EXPECT_TRUE(manager().is_running());
    manager().stop();
    EXPECT_FALSE(manager().is_running());
    manager().start();
    manager().start();
    EXPECT_TRUE(manager().is_running());
}

TEST_F(HostManagerTest, StoppedManagerLeavesUserChangesPending)
{
    auto c = create_shown_focused();
    manager().stop();

    c.backing->user_iconify(true);
    settle();
    EXPECT_TRUE(c.client->events.empty());

    manager().start();
    settle();
    EXPECT_EQ(c.client->events, (std::vector<E>{E::FocusLost, E::Iconified}));
}

TEST_F(HostManagerTest, PeriodicFailureGoesToHandler)
{
    auto a = create_shown_focused("a");
    auto b = create_host("b");
    a.client->on_event = [](const WindowEvent& e)
    {
        if (e.type == WindowEventType::Iconified)
            throw std::runtime_error("client failed");
    };

    a.backing->user_iconify(true);
    b.backing->user_show();
    settle();

    ASSERT_EQ(errors.size(), 1u);
    EXPECT_THROW(std::rethrow_exception(errors[0]), std::runtime_error);
    EXPECT_EQ(a.client->events, (std::vector<E>{E::FocusLost, E::Iconified}));
    EXPECT_EQ(b.client->count(E::Shown), 1u);
}

TEST_F(HostManagerTest, DefaultHandlerLogs)
{
    HostManager plain(scheduler, config);
    EXPECT_NO_THROW(plain.handle_exception(std::make_exception_ptr(std::runtime_error("boom"))));
}

// ─── Shutdown ────────────────────────────────────────────────────────────────

TEST_F(HostManagerTest, ShutdownClosesEverythingDialogsFirst)
{
    std::vector<std::string> log;

    auto top   = create_shown_focused("main");
    auto d     = create_dialog(*top.host, "d");
    auto other = create_host("other");
    d.host->show();
    settle();
    for (auto* client : {top.client.get(), d.client.get(), other.client.get()})
        client->shared_log = &log;

    manager().shutdown();

    EXPECT_TRUE(manager().is_shut_down());
    EXPECT_FALSE(manager().is_running());
    EXPECT_EQ(manager().host_count(), 0u);
    EXPECT_EQ(manager().host_of_focused_client(), nullptr);

    const auto d_closed    = std::find(log.begin(), log.end(), "d:Closed");
    const auto main_closed = std::find(log.begin(), log.end(), "main:Closed");
    ASSERT_NE(d_closed, log.end());
    ASSERT_NE(main_closed, log.end());
    EXPECT_LT(d_closed, main_closed);
    EXPECT_EQ(log.back(), "other:Closed");

    for (auto* client : {top.client.get(), d.client.get(), other.client.get()})
        EXPECT_TRUE(client->violations.empty()) << client->name;
}

TEST_F(HostManagerTest, ShutdownIsFinal)
{
    create_host();
    manager().shutdown();
    manager().shutdown();

    EXPECT_THROW(manager().create_host(std::make_unique<FakeBackingWindow>(),
                                       std::make_shared<RecordingClient>()),
                 std::logic_error);
    EXPECT_THROW(manager().start(), std::logic_error);
    EXPECT_FALSE(manager().any_host_open());
}

TEST_F(HostManagerTest, ShutdownReportsCloseFailures)
{
    auto c = create_shown_focused();
    c.client->on_event = [](const WindowEvent& e)
    {
        if (e.type == WindowEventType::Closed)
            throw std::runtime_error("client failed");
    };

    EXPECT_NO_THROW(manager().shutdown());
    EXPECT_EQ(errors.size(), 1u);
    EXPECT_EQ(manager().host_count(), 0u);
}
