#include <benchmark/benchmark.h>
#include <hostkit/hostkit.hpp>
#include <memory>
#include <string_view>
#include <vector>

#include "fake_backing_window.hpp"
#include "host/reconciler.hpp"

using namespace hostkit;
using hostkit::test::FakeBackingWindow;
using hostkit::test::RecordingClient;

static void BM_ReconcileOnce_Agreed(benchmark::State& state)
{
    FakeBackingWindow backing;
    backing.showing = true;
    backing.focused = true;

    ClientState client;
    client.showing = true;
    client.focused = true;

    StabilityTracker stability;
    HostConfig       config;

    for (auto _ : state)
    {
        ReconcileView view{.backing                     = backing,
                           .client                      = client,
                           .stability                   = stability,
                           .config                      = config,
                           .now_s                       = 1.0,
                           .host_closed                 = false,
                           .restore_max_pending         = false,
                           .other_host_has_client_focus = false};
        std::string_view rule;
        benchmark::DoNotOptimize(reconcile_once(view, &rule));
    }
}
BENCHMARK(BM_ReconcileOnce_Agreed)->Unit(benchmark::kNanosecond);

static void BM_ReconcileOnce_Held(benchmark::State& state)
{
    FakeBackingWindow backing;
    backing.showing   = true;
    backing.maximized = true;

    ClientState client;
    client.showing = true;

    StabilityTracker stability;
    HostConfig       config;

    for (auto _ : state)
    {
        ReconcileView view{.backing                     = backing,
                           .client                      = client,
                           .stability                   = stability,
                           .config                      = config,
                           .now_s                       = 0.0,
                           .host_closed                 = false,
                           .restore_max_pending         = false,
                           .other_host_has_client_focus = false};
        std::string_view rule;
        benchmark::DoNotOptimize(reconcile_once(view, &rule));
    }
}
BENCHMARK(BM_ReconcileOnce_Held)->Unit(benchmark::kNanosecond);

// Periodic event logic over N idle hosts.
static void BM_PeriodicLogic_IdleHosts(benchmark::State& state)
{
    ManualScheduler scheduler;
    HostManager     manager(scheduler);
    const int       count = static_cast<int>(state.range(0));

    std::vector<std::shared_ptr<RecordingClient>> clients;
    for (int i = 0; i < count; ++i)
    {
        clients.push_back(std::make_shared<RecordingClient>());
        Host* host = manager.create_host(std::make_unique<FakeBackingWindow>(), clients.back());
        host->show();
    }
    manager.start();
    scheduler.advance_by(1.0);

    for (auto _ : state)
    {
        scheduler.advance_by(manager.config().event_logic_period_s);
    }
    state.SetItemsProcessed(state.iterations() * count);
}
BENCHMARK(BM_PeriodicLogic_IdleHosts)->Arg(1)->Arg(16)->Arg(128);

// Full iconify/deiconify cycle through the event stream.
static void BM_IconifyCycle(benchmark::State& state)
{
    ManualScheduler    scheduler;
    HostManager        manager(scheduler);
    auto               client  = std::make_shared<RecordingClient>();
    auto               fake    = std::make_unique<FakeBackingWindow>();
    FakeBackingWindow* backing = fake.get();
    Host*              host    = manager.create_host(std::move(fake), client);
    manager.start();
    host->show();
    scheduler.advance_by(0.5);

    for (auto _ : state)
    {
        host->iconify();
        host->deiconify();
        scheduler.advance_by(0.05);
        client->clear();
        client->paints.clear();
        backing->calls.clear();
    }
}
BENCHMARK(BM_IconifyCycle);

BENCHMARK_MAIN();
