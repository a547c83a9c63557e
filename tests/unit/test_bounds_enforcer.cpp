#include <gtest/gtest.h>

#include "host/bounds_enforcer.hpp"

using namespace hostkit;

namespace
{

EnforcementState settled_demax(double now_s)
{
    return {.agreed_showing_deico_max   = false,
            .agreed_showing_deico_demax = true,
            .now_s                      = now_s,
            .newest_unstability_s       = 0.0};
}

EnforcementState settled_max(double now_s)
{
    return {.agreed_showing_deico_max   = true,
            .agreed_showing_deico_demax = false,
            .now_s                      = now_s,
            .newest_unstability_s       = 0.0};
}

const Rect kScreen{0, 0, 1920, 1080};

}   // namespace

// ─── Max ─────────────────────────────────────────────────────────────────────

TEST(BoundsEnforcerMax, NotArmedWithoutConfig)
{
    HostConfig     config;
    BoundsEnforcer e(config);
    e.arm_max_if_configured();
    EXPECT_FALSE(e.is_max_pending());
}

TEST(BoundsEnforcerMax, AppliesScreenBoundsOnceSettled)
{
    HostConfig config;
    config.enforce_bounds_on_maximize = true;
    BoundsEnforcer e(config);
    e.arm_max_if_configured();
    ASSERT_TRUE(e.is_max_pending());

    const auto screen = [] { return kScreen; };
    EXPECT_FALSE(e.poll_max(settled_max(0.04), screen).has_value());
    EXPECT_FALSE(e.poll_max(settled_demax(1.0), screen).has_value());

    const auto applied = e.poll_max(settled_max(0.05), screen);
    ASSERT_TRUE(applied.has_value());
    EXPECT_EQ(*applied, kScreen);
    EXPECT_FALSE(e.is_max_pending());
    EXPECT_FALSE(e.poll_max(settled_max(1.0), screen).has_value());
}

TEST(BoundsEnforcerMax, ClearDisarms)
{
    HostConfig config;
    config.enforce_bounds_on_maximize = true;
    BoundsEnforcer e(config);
    e.arm_max_if_configured();
    e.clear_max();
    EXPECT_FALSE(e.poll_max(settled_max(1.0), [] { return kScreen; }).has_value());
}

// ─── Demax ───────────────────────────────────────────────────────────────────

TEST(BoundsEnforcerDemax, ExplicitTargetAppliedWhenSettled)
{
    HostConfig     config;
    BoundsEnforcer e(config);
    const BoundsTarget target{{10, 10, 200, 100}, BoundsSpace::Window};
    e.set_demax_target(target);
    EXPECT_TRUE(e.is_demax_pending());

    const auto current = [] { return Rect{0, 0, 1, 1}; };
    EXPECT_FALSE(e.poll_demax(settled_max(1.0), current).has_value());
    EXPECT_FALSE(e.poll_demax(settled_demax(0.01), current).has_value());

    const auto applied = e.poll_demax(settled_demax(0.05), current);
    ASSERT_TRUE(applied.has_value());
    EXPECT_EQ(*applied, target);
    EXPECT_FALSE(e.is_demax_pending());
    EXPECT_FALSE(e.demax_target().has_value());
}

TEST(BoundsEnforcerDemax, RecordsSettledBoundsForRestoration)
{
    HostConfig config;
    config.restore_bounds_on_demaximize = true;
    BoundsEnforcer e(config);

    Rect       bounds{50, 60, 640, 480};
    const auto current = [&] { return bounds; };

    // Too early for a full stability delay.
    EXPECT_FALSE(e.poll_demax(settled_demax(0.06), current).has_value());
    EXPECT_FALSE(e.demax_target().has_value());

    EXPECT_FALSE(e.poll_demax(settled_demax(0.2), current).has_value());
    ASSERT_TRUE(e.demax_target().has_value());
    EXPECT_EQ(e.demax_target()->rect, bounds);
    EXPECT_EQ(e.demax_target()->space, BoundsSpace::Client);
    EXPECT_FALSE(e.is_demax_pending());

    bounds = {70, 80, 640, 480};
    e.poll_demax(settled_demax(0.3), current);
    EXPECT_EQ(e.demax_target()->rect, bounds);
}

TEST(BoundsEnforcerDemax, RecordedBoundsRestoredAfterDemaximize)
{
    HostConfig config;
    config.restore_bounds_on_demaximize = true;
    BoundsEnforcer e(config);

    const Rect recorded{50, 60, 640, 480};
    e.poll_demax(settled_demax(0.2), [&] { return recorded; });

    // Demaximized: the window manager put the window elsewhere.
    e.arm_demax_if_configured_and_any();
    ASSERT_TRUE(e.is_demax_pending());
    const auto applied = e.poll_demax(settled_demax(0.3), [] { return Rect{0, 0, 800, 600}; });
    ASSERT_TRUE(applied.has_value());
    EXPECT_EQ(applied->rect, recorded);
}

TEST(BoundsEnforcerDemax, EmptyBoundsNotRecorded)
{
    HostConfig config;
    config.restore_bounds_on_demaximize = true;
    BoundsEnforcer e(config);
    e.poll_demax(settled_demax(1.0), [] { return Rect{}; });
    EXPECT_FALSE(e.demax_target().has_value());
}

TEST(BoundsEnforcerDemax, ArmWithoutTargetDoesNothing)
{
    HostConfig config;
    config.restore_bounds_on_demaximize = true;
    BoundsEnforcer e(config);
    e.arm_demax_if_configured_and_any();
    EXPECT_FALSE(e.is_demax_pending());
}

TEST(BoundsEnforcerDemax, ClearDropsTarget)
{
    HostConfig     config;
    BoundsEnforcer e(config);
    e.set_demax_target({{1, 2, 3, 4}, BoundsSpace::Client});
    e.clear_demax();
    EXPECT_FALSE(e.is_demax_pending());
    EXPECT_FALSE(e.poll_demax(settled_demax(1.0), [] { return Rect{}; }).has_value());
}
